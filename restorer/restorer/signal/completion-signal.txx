#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/cancellation_type.hpp>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace restorer
{
  template <typename T>
  bool completion_signal<T>::
  resolve (value_type v)
  {
    {
      std::lock_guard<std::mutex> l (mutex_);

      if (value_)
        return false;

      value_ = std::move (v);
    }

    // The timer is not thread-safe so cancel it from the io_context. Note
    // that the waiter re-checks the value after every wake-up, so it does
    // not matter whether the cancel finds a pending wait or not.
    //
    asio::post (timer_.get_executor (),
                [self = this->shared_from_this ()] ()
                {
                  self->timer_.cancel ();
                });

    return true;
  }

  template <typename T>
  bool completion_signal<T>::
  resolved () const
  {
    std::lock_guard<std::mutex> l (mutex_);
    return value_.has_value ();
  }

  template <typename T>
  std::optional<T> completion_signal<T>::
  value () const
  {
    std::lock_guard<std::mutex> l (mutex_);
    return value_;
  }

  template <typename T>
  asio::awaitable<std::optional<T>> completion_signal<T>::
  wait_until (clock_type::time_point deadline)
  {
    // Keep ourselves alive for the duration of the wait.
    //
    auto self (this->shared_from_this ());

    for (;;)
    {
      if (std::optional<value_type> v = value ())
        co_return v;

      // Someone above us gave up on the whole operation (as opposed to our
      // own timer cancellation from resolve()).
      //
      if ((co_await asio::this_coro::cancellation_state).cancelled () !=
          asio::cancellation_type::none)
        throw boost::system::system_error (asio::error::operation_aborted);

      if (clock_type::now () >= deadline)
        co_return std::nullopt;

      timer_.expires_at (deadline);

      // Cancellation (operation_aborted) is the normal wake-up so we don't
      // care about the error code.
      //
      boost::system::error_code ec;
      co_await timer_.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));
    }
  }

  template <typename T>
  asio::awaitable<T> completion_signal<T>::
  wait ()
  {
    std::optional<value_type> v (co_await wait_until (clock_type::time_point::max ()));
    co_return std::move (*v);
  }

  template <typename T>
  asio::awaitable<std::optional<T>> completion_signal<T>::
  wait_for (clock_type::duration d)
  {
    co_return co_await wait_until (clock_type::now () + d);
  }
}
