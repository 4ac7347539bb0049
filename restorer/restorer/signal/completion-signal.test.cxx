#include <restorer/signal/completion-signal.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>

#include <boost/system/system_error.hpp>

#include <chrono>
#include <thread>
#include <string>
#include <cassert>
#include <optional>
#include <exception>

using namespace std;
using namespace restorer;

namespace asio = boost::asio;

static void
test_resolve_once ()
{
  asio::io_context ioc;
  auto s (completion_signal<int>::create (ioc));

  assert (!s->resolved ());
  assert (!s->value ());

  assert (s->resolve (1));
  assert (!s->resolve (2));
  assert (!s->resolve (3));

  assert (s->resolved ());
  assert (*s->value () == 1);

  // Resolved before anyone waits.
  //
  optional<int> r;
  asio::co_spawn (ioc,
                  [s, &r] () -> asio::awaitable<void>
                  {
                    r = co_await s->wait ();
                  },
                  asio::detached);
  ioc.run ();

  assert (r && *r == 1);
}

static void
test_timeout ()
{
  asio::io_context ioc;
  auto s (completion_signal<string>::create (ioc));

  bool done (false);
  optional<string> r ("unset");

  auto start (chrono::steady_clock::now ());

  asio::co_spawn (ioc,
                  [s, &r, &done] () -> asio::awaitable<void>
                  {
                    r = co_await s->wait_for (chrono::milliseconds (50));
                    done = true;
                  },
                  asio::detached);
  ioc.run ();

  assert (done);
  assert (!r);
  assert (chrono::steady_clock::now () - start >= chrono::milliseconds (50));

  // Late resolution is still accepted but nobody is listening.
  //
  assert (s->resolve ("late"));
}

// Resolve from another thread while the io_context thread is waiting.
//
static void
test_cross_thread ()
{
  asio::io_context ioc;
  auto s (completion_signal<bool>::create (ioc));

  optional<bool> r;

  asio::co_spawn (ioc,
                  [s, &r] () -> asio::awaitable<void>
                  {
                    r = co_await s->wait_for (chrono::seconds (30));
                  },
                  asio::detached);

  jthread t ([s] ()
             {
               this_thread::sleep_for (chrono::milliseconds (20));
               s->resolve (true);
               s->resolve (false);
             });

  auto start (chrono::steady_clock::now ());
  ioc.run ();

  assert (r && *r == true);
  assert (chrono::steady_clock::now () - start < chrono::seconds (30));
}

// Terminal cancellation of the waiting coroutine ends the wait.
//
static void
test_cancel ()
{
  asio::io_context ioc;
  auto s (completion_signal<int>::create (ioc));

  asio::cancellation_signal cs;
  exception_ptr ep;
  bool done (false);

  asio::co_spawn (ioc,
                  [s] () -> asio::awaitable<void>
                  {
                    co_await s->wait ();
                  },
                  asio::bind_cancellation_slot (
                    cs.slot (),
                    [&ep, &done] (exception_ptr e)
                    {
                      ep = e;
                      done = true;
                    }));

  asio::co_spawn (ioc,
                  [&cs] () -> asio::awaitable<void>
                  {
                    asio::steady_timer t (co_await asio::this_coro::executor);
                    t.expires_after (chrono::milliseconds (20));
                    co_await t.async_wait (asio::use_awaitable);
                    cs.emit (asio::cancellation_type::terminal);
                  },
                  asio::detached);

  ioc.run ();

  assert (done);
  assert (ep);

  try
  {
    rethrow_exception (ep);
  }
  catch (const boost::system::system_error& e)
  {
    assert (e.code () == asio::error::operation_aborted);
  }

  assert (!s->resolved ());
}

int
main ()
{
  test_resolve_once ();
  test_timeout ();
  test_cross_thread ();
  test_cancel ();
}
