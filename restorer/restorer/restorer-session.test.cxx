#include <restorer/restorer-session.hxx>

#include <restorer/steam/steam-client.test.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <string>
#include <vector>
#include <cassert>
#include <sstream>
#include <algorithm>
#include <exception>
#include <stdexcept>

using namespace std;
using namespace restorer;

namespace asio = boost::asio;

static session_options
fast_options ()
{
  session_options o;
  o.pump_interval = chrono::milliseconds (10);
  o.logoff_grace = chrono::milliseconds (200);
  return o;
}

struct session_run
{
  exception_ptr error;
  bool worked = false;
  session_state state = session_state::disconnected;
  uint64_t steam_id = 0;
  string out;
  string diag;
};

static session_run
run_session (fake_steam_client& c,
             auth_flow& f,
             session_coordinator::work_function w = nullptr)
{
  asio::io_context ioc;
  ostringstream out, diag;

  session_coordinator s (ioc, c, f, out, diag, fast_options ());
  session_run r;

  if (!w)
    w = [&r] (stop_token) -> asio::awaitable<void>
    {
      r.worked = true;
      co_return;
    };

  asio::co_spawn (ioc,
                  s.run (move (w)),
                  [&r] (exception_ptr e) {r.error = e;});
  ioc.run ();

  r.state = s.state ();
  r.steam_id = s.steam_id ();
  r.out = out.str ();
  r.diag = diag.str ();
  return r;
}

static bool
called (fake_steam_client& c, const string& x)
{
  vector<string> cs (c.recorded_calls ());
  return find (cs.begin (), cs.end (), x) != cs.end ();
}

static void
test_success ()
{
  fake_steam_client c;
  scripted_prompter p;
  ostringstream aout;
  qr_auth_flow f (p, aout);

  session_run r (run_session (c, f));

  assert (!r.error);
  assert (r.worked);
  assert (r.state == session_state::disconnected);
  assert (r.steam_id == c.steam_id);

  vector<string> cs (c.recorded_calls ());
  assert ((cs == vector<string> {"connect",
                                 "auth_qr",
                                 "logon:alice:refresh-token",
                                 "logoff"}));

  size_t a (r.out.find ("Connecting to Steam..."));
  size_t b (r.out.find ("Successfully logged on to Steam!"));
  size_t d (r.out.find ("SteamID: " + std::to_string (c.steam_id)));
  size_t e (r.out.find ("Logging off from Steam..."));
  size_t g (r.out.find ("Logged off from Steam: OK"));

  assert (a != string::npos && b != string::npos &&
          d != string::npos && e != string::npos && g != string::npos);
  assert (a < b && b < d && d < e && e < g);

  assert (c.callbacks ().subscriber_count () == 0);
}

// Work runs only after logon, and product info requests are possible from
// it.
//
static void
test_work_after_logon ()
{
  fake_steam_client c;
  scripted_prompter p;
  ostringstream aout;
  qr_auth_flow f (p, aout);

  vector<string> seen;

  session_run r (
    run_session (c, f,
                 [&c, &seen] (stop_token st) -> asio::awaitable<void>
                 {
                   assert (!st.stop_requested ());
                   seen = c.recorded_calls ();
                   co_return;
                 }));

  assert (!r.error);
  assert (!seen.empty ());
  assert (seen.back () == "logon:alice:refresh-token");
}

static void
test_logon_refused ()
{
  fake_steam_client c;
  c.logon_result = eresult::invalid_password;

  scripted_prompter p;
  ostringstream aout;
  credentials_auth_flow f ("alice", "secret", p, aout);

  session_run r (run_session (c, f));

  assert (r.error);
  assert (!r.worked);
  assert (r.state == session_state::failed);
  assert (called (c, "disconnect"));
  assert (!called (c, "logoff"));

  try
  {
    rethrow_exception (r.error);
  }
  catch (const session_error& e)
  {
    assert (string (e.what ()).find ("InvalidPassword") != string::npos);
  }
}

// The extended result is reported when it says more than the result.
//
static void
test_logon_refused_extended ()
{
  fake_steam_client c;
  c.logon_result = eresult::account_logon_denied;
  c.logon_extended_result = eresult::invalid_login_auth_code;

  scripted_prompter p;
  ostringstream aout;
  credentials_auth_flow f ("alice", "secret", p, aout);

  session_run r (run_session (c, f));

  assert (r.error);
  assert (r.state == session_state::failed);

  try
  {
    rethrow_exception (r.error);
  }
  catch (const session_error& e)
  {
    assert (string (e.what ()) ==
            "unable to log on to Steam: " +
            to_string (eresult::account_logon_denied) + " (" +
            to_string (eresult::invalid_login_auth_code) + ")");
  }

  // Not when it's OK.
  //
  fake_steam_client o;
  o.logon_result = eresult::invalid_password;
  o.logon_extended_result = eresult::ok;

  credentials_auth_flow of ("alice", "secret", p, aout);
  r = run_session (o, of);
  assert (r.error);

  try
  {
    rethrow_exception (r.error);
  }
  catch (const session_error& e)
  {
    assert (string (e.what ()) == "unable to log on to Steam: " +
                                  to_string (eresult::invalid_password));
  }
}

// Authentication failure is nested in the session error and no logon is
// attempted.
//
static void
test_auth_failure ()
{
  fake_steam_client c;
  c.auth_result = nullopt;

  scripted_prompter p;
  ostringstream aout;
  qr_auth_flow f (p, aout);

  session_run r (run_session (c, f));

  assert (r.error);
  assert (!r.worked);
  assert (r.state == session_state::failed);

  for (const string& x: c.recorded_calls ())
    assert (x.compare (0, 6, "logon:") != 0);

  bool nested (false);

  try
  {
    rethrow_exception (r.error);
  }
  catch (const session_error& e)
  {
    try
    {
      rethrow_if_nested (e);
    }
    catch (const auth_error&)
    {
      nested = true;
    }
  }

  assert (nested);
}

static void
test_drop_before_logon ()
{
  fake_steam_client c;
  c.drop_after_connect = true;

  scripted_prompter p;
  ostringstream aout;
  qr_auth_flow f (p, aout);

  session_run r (run_session (c, f));

  assert (r.error);
  assert (!r.worked);
  assert (r.state == session_state::failed);
  assert (!called (c, "logoff"));

  try
  {
    rethrow_exception (r.error);
  }
  catch (const session_error& e)
  {
    assert (string (e.what ()).find ("lost before logon") != string::npos);
  }
}

// The work fails: the session is still logged off and the exception comes
// out of run().
//
static void
test_work_failure ()
{
  fake_steam_client c;
  scripted_prompter p;
  ostringstream aout;
  qr_auth_flow f (p, aout);

  session_run r (
    run_session (c, f,
                 [] (stop_token) -> asio::awaitable<void>
                 {
                   throw runtime_error ("boom");
                   co_return;
                 }));

  assert (r.error);
  assert (called (c, "logoff"));
  assert (r.state == session_state::disconnected);

  try
  {
    rethrow_exception (r.error);
  }
  catch (const runtime_error& e)
  {
    assert (string (e.what ()) == "boom");
  }
}

// The connection drops while the work is running: the work sees the stop
// request, no logoff is attempted, and the run still succeeds.
//
static void
test_drop_after_logon ()
{
  fake_steam_client c;
  scripted_prompter p;
  ostringstream aout;
  qr_auth_flow f (p, aout);

  bool stopped (false);

  session_run r (
    run_session (c, f,
                 [&c, &stopped] (stop_token st) -> asio::awaitable<void>
                 {
                   c.callbacks ().post (disconnected_event {false});

                   asio::steady_timer t (co_await asio::this_coro::executor);

                   for (int i (0); i != 500 && !st.stop_requested (); ++i)
                   {
                     t.expires_after (chrono::milliseconds (10));
                     co_await t.async_wait (asio::use_awaitable);
                   }

                   stopped = st.stop_requested ();
                 }));

  assert (!r.error);
  assert (stopped);
  assert (r.state == session_state::failed);
  assert (!called (c, "logoff"));
  assert (r.diag.find ("warning: connection to Steam lost") != string::npos);
}

// No disconnect after logoff: we disconnect ourselves after the grace
// period.
//
static void
test_logoff_grace ()
{
  fake_steam_client c;
  c.answer_logoff = false;

  scripted_prompter p;
  ostringstream aout;
  qr_auth_flow f (p, aout);

  auto start (chrono::steady_clock::now ());
  session_run r (run_session (c, f));

  assert (!r.error);
  assert (chrono::steady_clock::now () - start >= chrono::milliseconds (200));

  vector<string> cs (c.recorded_calls ());
  assert (cs.size () >= 2);
  assert (cs[cs.size () - 2] == "logoff");
  assert (cs.back () == "disconnect");
  assert (r.state == session_state::disconnected);

  // Nobody confirmed the logoff.
  //
  assert (r.out.find ("Logged off from Steam") == string::npos);
}

static void
test_state_names ()
{
  assert (string (to_string (session_state::logged_on)) == "logged_on");
  assert (string (to_string (session_state::failed)) == "failed");
}

int
main ()
{
  test_success ();
  test_work_after_logon ();
  test_logon_refused ();
  test_logon_refused_extended ();
  test_auth_failure ();
  test_drop_before_logon ();
  test_work_failure ();
  test_drop_after_logon ();
  test_logoff_grace ();
  test_state_names ();
}
