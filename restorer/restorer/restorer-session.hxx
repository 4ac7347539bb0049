#pragma once

#include <restorer/auth/auth-flow.hxx>
#include <restorer/steam/steam-client.hxx>
#include <restorer/steam/steam-callbacks.hxx>
#include <restorer/signal/completion-signal.hxx>

#include <boost/asio/io_context.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include <cstdint>
#include <ostream>
#include <exception>
#include <stdexcept>
#include <functional>
#include <stop_token>

namespace restorer
{
  namespace asio = boost::asio;

  enum class session_state
  {
    disconnected,
    connecting,
    connected,
    authenticating,
    logged_on,
    logging_off,
    failed
  };

  const char*
  to_string (session_state) noexcept;

  // Unable to establish the session: logon refused, authentication failed,
  // or the connection dropped before we were logged on. If the cause is an
  // exception, it is nested.
  //
  class session_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  struct session_options
  {
    // How long the pump waits for events before checking for stop.
    //
    std::chrono::milliseconds pump_interval {1000};

    // How long to wait for the disconnect after logging off before
    // disconnecting explicitly.
    //
    std::chrono::milliseconds logoff_grace {2000};
  };

  // Drive a client session: connect, authenticate, log on, run the work,
  // log off, and disconnect.
  //
  // The client callbacks are pumped on a dedicated thread for the duration
  // of run(). Event handlers only update the state and resolve signals; the
  // authentication flow and the work run as coroutines on the io_context.
  //
  class session_coordinator
  {
  public:
    // The work receives the session stop token which is triggered if the
    // connection drops while it is running.
    //
    using work_function =
      std::function<asio::awaitable<void> (std::stop_token)>;

    session_coordinator (asio::io_context& ioc,
                         steam_client& client,
                         auth_flow& flow,
                         std::ostream& out,
                         std::ostream& diag,
                         session_options options = session_options ());

    ~session_coordinator ();

    session_coordinator (const session_coordinator&) = delete;
    session_coordinator& operator= (const session_coordinator&) = delete;

    // Run the session once. Throw session_error if unable to log on (in
    // which case the work is not called). An exception thrown by the work
    // is propagated after the session has been torn down.
    //
    asio::awaitable<void>
    run (work_function);

    session_state
    state () const noexcept {return state_.load ();}

    std::uint64_t
    steam_id () const noexcept {return steam_id_.load ();}

  private:
    void
    pump (std::stop_token);

    // Event handlers (pump thread).
    //
    void
    on_connected ();

    void
    on_disconnected (const disconnected_event&);

    void
    on_logged_on (const logged_on_event&);

    void
    on_logged_off (const logged_off_event&);

    void
    fail ();

    // Authentication (io_context).
    //
    void
    start_auth ();

    asio::awaitable<void>
    authenticate ();

    asio::awaitable<void>
    teardown ();

    [[noreturn]] void
    throw_logon_failure ();

    asio::io_context& ioc_;
    steam_client& client_;
    auth_flow& flow_;
    std::ostream& out_;
    std::ostream& diag_;
    session_options options_;

    std::atomic<session_state> state_ {session_state::disconnected};
    std::atomic<std::uint64_t> steam_id_ {0};
    std::atomic<eresult> logon_result_ {eresult::invalid};
    std::atomic<eresult> logon_extended_ {eresult::invalid};
    std::atomic<bool> dropped_ {false};

    std::shared_ptr<completion_signal<bool>> logon_;
    std::shared_ptr<completion_signal<bool>> disconnected_;

    // Authentication task state, only touched on the io_context.
    //
    bool auth_started_ = false;
    bool auth_running_ = false; // Suspended in produce_credential().
    std::shared_ptr<completion_signal<bool>> auth_done_;
    std::exception_ptr auth_error_;
    asio::cancellation_signal auth_cancel_;

    std::vector<subscription> subscriptions_;

    // Stops the pump. Its token is also handed to the work.
    //
    std::stop_source stop_;

    // Must be last: joined before the rest is destroyed.
    //
    std::jthread pump_;
  };
}
