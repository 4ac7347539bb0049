#pragma once

#include <restorer/steam/steam-callbacks.hxx>

#include <atomic>

namespace restorer
{
  // Connection lifecycle bookkeeping for a steam_client implementation.
  //
  // Turns the low-level connection notifications (which may arrive on any
  // thread and in any order relative to the caller returning from connect)
  // into the connected/logged_off/disconnected events, guaranteeing exactly
  // one disconnected event per connection attempt.
  //
  class connection_tracker
  {
  public:
    explicit
    connection_tracker (callback_manager& c): callbacks_ (c) {}

    connection_tracker (const connection_tracker&) = delete;
    connection_tracker& operator= (const connection_tracker&) = delete;

    // Call before starting the connection attempt so that even an immediate
    // failure is reported.
    //
    void
    begin ();

    void
    established ();

    // The attempt failed or the connection went away. Posts disconnected
    // (preceded by logged_off if a logoff was requested) unless it was
    // already posted for this attempt.
    //
    void
    closed ();

    void
    request_disconnect () noexcept
    {
      disconnect_requested_ = true;
    }

    void
    request_logoff () noexcept
    {
      logoff_requested_ = true;
    }

    bool
    online () const noexcept
    {
      return online_.load ();
    }

  private:
    callback_manager& callbacks_;

    std::atomic<bool> online_ {false};
    std::atomic<bool> disconnect_requested_ {false};
    std::atomic<bool> logoff_requested_ {false};
  };
}
