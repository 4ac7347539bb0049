#include <restorer/restorer-session.hxx>

#include <boost/asio/post.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>

#include <utility>
#include <optional>

using namespace std;

namespace restorer
{
  const char*
  to_string (session_state s) noexcept
  {
    switch (s)
    {
    case session_state::disconnected:   return "disconnected";
    case session_state::connecting:     return "connecting";
    case session_state::connected:      return "connected";
    case session_state::authenticating: return "authenticating";
    case session_state::logged_on:      return "logged_on";
    case session_state::logging_off:    return "logging_off";
    case session_state::failed:         return "failed";
    }

    return "unknown";
  }

  session_coordinator::
  session_coordinator (asio::io_context& ioc,
                       steam_client& c,
                       auth_flow& f,
                       ostream& o,
                       ostream& d,
                       session_options opts)
    : ioc_ (ioc),
      client_ (c),
      flow_ (f),
      out_ (o),
      diag_ (d),
      options_ (move (opts))
  {
  }

  session_coordinator::
  ~session_coordinator ()
  {
    // The pump watches our stop source, not the jthread's own.
    //
    stop_.request_stop ();
  }

  asio::awaitable<void> session_coordinator::
  run (work_function work)
  {
    if (state_.load () != session_state::disconnected || pump_.joinable ())
      throw logic_error ("session is already running");

    logon_ = completion_signal<bool>::create (ioc_);
    disconnected_ = completion_signal<bool>::create (ioc_);
    auth_done_ = completion_signal<bool>::create (ioc_);

    auth_started_ = false;
    auth_running_ = false;
    auth_error_ = nullptr;
    steam_id_.store (0);
    logon_result_.store (eresult::invalid);
    logon_extended_.store (eresult::invalid);
    dropped_.store (false);
    stop_ = stop_source ();

    callback_manager& cb (client_.callbacks ());

    subscriptions_.push_back (
      cb.subscribe<connected_event> (
        [this] (const connected_event&) {on_connected ();}));

    subscriptions_.push_back (
      cb.subscribe<disconnected_event> (
        [this] (const disconnected_event& e) {on_disconnected (e);}));

    subscriptions_.push_back (
      cb.subscribe<logged_on_event> (
        [this] (const logged_on_event& e) {on_logged_on (e);}));

    subscriptions_.push_back (
      cb.subscribe<logged_off_event> (
        [this] (const logged_off_event& e) {on_logged_off (e);}));

    state_.store (session_state::connecting);
    out_ << "Connecting to Steam..." << endl;

    pump_ = jthread ([this, st = stop_.get_token ()] {pump (st);});

    exception_ptr ep;

    try
    {
      client_.connect ();
    }
    catch (const exception&)
    {
      ep = current_exception ();
      dropped_.store (true);
      fail ();
    }

    bool ok (false);

    if (!ep)
      ok = co_await logon_->wait ();

    if (ok)
    {
      out_ << "Successfully logged on to Steam!" << endl
           << "SteamID: " << steam_id_.load () << endl;

      try
      {
        co_await work (stop_.get_token ());
      }
      catch (const exception&)
      {
        ep = current_exception ();
      }

      if (dropped_.load ())
        diag_ << "warning: connection to Steam lost during the session"
              << endl;
    }

    co_await teardown ();

    if (ep)
      rethrow_exception (ep);

    if (!ok)
      throw_logon_failure ();
  }

  void session_coordinator::
  pump (stop_token st)
  {
    callback_manager& cb (client_.callbacks ());

    while (!st.stop_requested ())
      cb.run_wait_callbacks (options_.pump_interval);
  }

  void session_coordinator::
  on_connected ()
  {
    session_state s (session_state::connecting);

    // Authentication may wait for user input so it cannot run here on the
    // pump.
    //
    if (state_.compare_exchange_strong (s, session_state::connected))
      asio::post (ioc_, [this] {start_auth ();});
  }

  void session_coordinator::
  on_disconnected (const disconnected_event&)
  {
    session_state s (state_.load ());
    session_state n;

    for (;;)
    {
      switch (s)
      {
      case session_state::logging_off:    n = session_state::disconnected; break;
      case session_state::disconnected:
      case session_state::failed:         n = s;                           break;
      default:                            n = session_state::failed;       break;
      }

      if (n == s || state_.compare_exchange_weak (s, n))
        break;
    }

    // Anything but the disconnect we asked for is a dropped session.
    //
    if (n == session_state::failed && s != session_state::failed)
    {
      dropped_.store (true);
      stop_.request_stop ();
      logon_->resolve (false);
    }

    disconnected_->resolve (true);
  }

  void session_coordinator::
  on_logged_on (const logged_on_event& e)
  {
    session_state s (session_state::authenticating);

    if (e.result == eresult::ok)
    {
      if (state_.compare_exchange_strong (s, session_state::logged_on))
      {
        steam_id_.store (e.steam_id);
        logon_->resolve (true);
      }
    }
    else
    {
      logon_result_.store (e.result);
      logon_extended_.store (e.extended_result);

      if (state_.compare_exchange_strong (s, session_state::failed))
        logon_->resolve (false);
    }
  }

  void session_coordinator::
  on_logged_off (const logged_off_event& e)
  {
    // Output belongs to the io_context.
    //
    asio::post (ioc_,
                [this, r = e.result]
                {
                  out_ << "Logged off from Steam: " << r << endl;
                });
  }

  void session_coordinator::
  fail ()
  {
    state_.store (session_state::failed);
    logon_->resolve (false);
  }

  void session_coordinator::
  start_auth ()
  {
    session_state s (session_state::connected);

    // Dropped in the meantime.
    //
    if (!state_.compare_exchange_strong (s, session_state::authenticating))
      return;

    auth_started_ = true;

    asio::co_spawn (
      ioc_,
      authenticate (),
      asio::bind_cancellation_slot (
        auth_cancel_.slot (),
        [this, done = auth_done_] (exception_ptr e)
        {
          if (e)
          {
            auth_error_ = e;
            fail ();
          }

          done->resolve (true);
        }));
  }

  asio::awaitable<void> session_coordinator::
  authenticate ()
  {
    optional<auth_credential> c;
    auth_running_ = true;

    try
    {
      c = co_await flow_.produce_credential (client_);
    }
    catch (...)
    {
      auth_running_ = false;
      throw;
    }

    auth_running_ = false;

    // The connection may have dropped while the user was busy approving.
    //
    if (state_.load () != session_state::authenticating)
      co_return;

    client_.log_on (make_logon_details (*c));
  }

  asio::awaitable<void> session_coordinator::
  teardown ()
  {
    session_state s (session_state::logged_on);

    if (state_.compare_exchange_strong (s, session_state::logging_off))
    {
      out_ << "Logging off from Steam..." << endl;

      try
      {
        client_.log_off ();
      }
      catch (const exception& e)
      {
        diag_ << "warning: unable to log off: " << e.what () << endl;
      }

      // Give the client a chance to disconnect on its own.
      //
      if (!co_await disconnected_->wait_for (options_.logoff_grace))
      {
        try
        {
          client_.disconnect ();
        }
        catch (const exception& e)
        {
          diag_ << "warning: unable to disconnect: " << e.what () << endl;
        }
      }
    }
    else if (!dropped_.load ())
    {
      try
      {
        client_.disconnect ();
      }
      catch (const exception& e)
      {
        diag_ << "warning: unable to disconnect: " << e.what () << endl;
      }
    }

    // An authentication still in progress (the session dropped under it)
    // is waiting for events that will never come.
    //
    if (auth_started_)
    {
      if (auth_running_)
        auth_cancel_.emit (asio::cancellation_type::terminal);

      co_await auth_done_->wait ();
    }

    stop_.request_stop ();

    if (pump_.joinable ())
      pump_.join ();

    subscriptions_.clear ();

    // Let through anything the pump posted before it stopped.
    //
    co_await asio::post (ioc_, asio::use_awaitable);

    if (state_.load () != session_state::failed)
      state_.store (session_state::disconnected);
  }

  void session_coordinator::
  throw_logon_failure ()
  {
    if (dropped_.load ())
      throw session_error ("connection to Steam lost before logon");

    if (auth_error_)
    {
      try
      {
        rethrow_exception (auth_error_);
      }
      catch (const exception&)
      {
        throw_with_nested (session_error ("unable to authenticate with Steam"));
      }
    }

    eresult r (logon_result_.load ());

    if (r != eresult::invalid)
    {
      string m ("unable to log on to Steam: " + to_string (r));

      eresult x (logon_extended_.load ());
      if (x != eresult::ok && x != eresult::invalid && x != r)
        m += " (" + to_string (x) + ")";

      throw session_error (m);
    }

    throw session_error ("unable to log on to Steam");
  }
}
