#include <restorer/auth/auth-flow.hxx>

#include <restorer/steam/steam-client.test.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <string>
#include <cassert>
#include <sstream>
#include <variant>
#include <optional>
#include <exception>
#include <stdexcept>

using namespace std;
using namespace restorer;

namespace asio = boost::asio;

// Run the flow to completion on a fresh io_context. Return the exception,
// if any, through ep.
//
static optional<auth_credential>
run_flow (auth_flow& f, steam_client& c, exception_ptr& ep)
{
  asio::io_context ioc;
  optional<auth_credential> r;

  asio::co_spawn (ioc,
                  [&f, &c, &r] () -> asio::awaitable<void>
                  {
                    r = co_await f.produce_credential (c);
                  },
                  [&ep] (exception_ptr e) {ep = e;});
  ioc.run ();

  return r;
}

static void
test_qr ()
{
  fake_steam_client c;
  c.qr_urls = {"https://s.team/q/1/a", "https://s.team/q/1/b"};

  scripted_prompter p;
  ostringstream out;
  qr_auth_flow f (p, out);

  exception_ptr ep;
  optional<auth_credential> r (run_flow (f, c, ep));

  assert (!ep);
  assert (r && holds_alternative<device_linked_credential> (*r));
  assert (account_name (*r) == "alice");
  assert (refresh_token (*r) == "refresh-token");

  // Initial challenge plus the rotation.
  //
  assert (p.shown.size () == 2);
  assert (p.shown[0] == "https://s.team/q/1/a");
  assert (p.shown[1] == "https://s.team/q/1/b");
  assert (out.str ().find ("refreshed the challenge URL") != string::npos);
  assert (out.str ().find ("Authenticated as 'alice'") != string::npos);

  logon_details d (make_logon_details (*r));
  assert (d.account_name == "alice");
  assert (d.access_token == "refresh-token");
  assert (!d.should_remember_password);
}

static void
test_qr_failure ()
{
  fake_steam_client c;
  c.auth_result = nullopt;

  scripted_prompter p;
  ostringstream out;
  qr_auth_flow f (p, out);

  exception_ptr ep;
  optional<auth_credential> r (run_flow (f, c, ep));

  assert (!r);
  assert (ep);

  try
  {
    rethrow_exception (ep);
  }
  catch (const auth_error& e)
  {
    assert (string (e.what ()).find ("AccessDenied") != string::npos);
  }
}

static void
test_credentials ()
{
  fake_steam_client c;
  c.ask_device_code = true;
  c.auth_result = auth_poll_result {"bob", "rt", string ("guard-1")};

  scripted_prompter p;
  p.code = "Q2X7K";

  ostringstream out;
  credentials_auth_flow f ("bob", "hunter2", p, out);

  exception_ptr ep;
  optional<auth_credential> r (run_flow (f, c, ep));

  assert (!ep);
  assert (r && holds_alternative<password_credential> (*r));
  assert (get<password_credential> (*r).guard_data == "guard-1");
  assert (f.guard_data () == "guard-1");

  assert (c.credentials.size () == 1);
  assert (c.credentials[0].username == "bob");
  assert (c.credentials[0].password == "hunter2");
  assert (!c.credentials[0].is_persistent_session);
  assert (!c.credentials[0].guard_data);
  assert (c.credentials[0].authenticator == &p);

  assert (c.codes.size () == 1 && c.codes[0] == "Q2X7K");

  // A second attempt in the same process passes the guard data along.
  //
  c.auth_result = auth_poll_result {"bob", "rt2", nullopt};
  r = run_flow (f, c, ep);

  assert (!ep);
  assert (c.credentials.size () == 2);
  assert (c.credentials[1].guard_data == "guard-1");
  assert (f.guard_data () == "guard-1");
}

static void
test_credentials_validation ()
{
  scripted_prompter p;
  ostringstream out;

  auto rejects = [&p, &out] (const char* u, const char* pw)
  {
    try
    {
      credentials_auth_flow f (u, pw, p, out);
    }
    catch (const invalid_argument&)
    {
      return true;
    }

    return false;
  };

  assert (rejects ("", "secret"));
  assert (rejects ("bob", ""));
  assert (!rejects ("bob", "secret"));
}

int
main ()
{
  test_qr ();
  test_qr_failure ();
  test_credentials ();
  test_credentials_validation ();
}
