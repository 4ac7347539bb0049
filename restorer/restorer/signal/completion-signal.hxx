#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <mutex>
#include <chrono>
#include <memory>
#include <optional>

namespace restorer
{
  namespace asio = boost::asio;

  // Single-fire result slot.
  //
  // The value may be resolved from any thread (typically the event pump)
  // and is awaited by a single coroutine running on the io_context. Only the
  // first resolve() has any effect; later ones are silently ignored.
  //
  // Always held by shared_ptr (see create()) since resolve() has to keep the
  // signal alive until its wake-up reaches the io_context.
  //
  template <typename T>
  class completion_signal:
    public std::enable_shared_from_this<completion_signal<T>>
  {
  public:
    using value_type = T;
    using clock_type = std::chrono::steady_clock;

    static std::shared_ptr<completion_signal>
    create (asio::io_context& ioc)
    {
      return std::shared_ptr<completion_signal> (new completion_signal (ioc));
    }

    completion_signal (const completion_signal&) = delete;
    completion_signal& operator= (const completion_signal&) = delete;

    // Set the value and wake up the waiter. Return false if the signal was
    // already resolved, in which case the value is discarded.
    //
    bool
    resolve (value_type);

    bool
    resolved () const;

    std::optional<value_type>
    value () const;

    // Wait until resolved.
    //
    // Both waits are cancellable with the terminal cancellation of the
    // enclosing coroutine, in which case they throw system_error with
    // operation_aborted.
    //
    asio::awaitable<value_type>
    wait ();

    // Wait until resolved or the timeout expires, whichever comes first.
    // Return std::nullopt on timeout.
    //
    asio::awaitable<std::optional<value_type>>
    wait_for (clock_type::duration);

  private:
    explicit
    completion_signal (asio::io_context& ioc)
      : timer_ (ioc) {}

    asio::awaitable<std::optional<value_type>>
    wait_until (clock_type::time_point);

    mutable std::mutex mutex_;
    std::optional<value_type> value_;

    // Only touched from the io_context. Cancelling it is how the waiter
    // learns about the resolution.
    //
    asio::steady_timer timer_;
  };
}

#include <restorer/signal/completion-signal.txx>
