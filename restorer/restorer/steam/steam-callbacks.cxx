#include <restorer/steam/steam-callbacks.hxx>

#include <ostream>
#include <exception>
#include <algorithm>

using namespace std;

namespace restorer
{
  const char*
  event_name (const steam_event& e) noexcept
  {
    switch (e.index ())
    {
    case 0: return "connected";
    case 1: return "disconnected";
    case 2: return "logged_on";
    case 3: return "logged_off";
    case 4: return "product_info";
    case 5: return "auth_challenge";
    case 6: return "auth_prompt";
    case 7: return "auth_result";
    }

    return "unknown";
  }

  // subscription
  //
  subscription::
  subscription (subscription&& x) noexcept
    : entry_ (move (x.entry_))
  {
  }

  subscription& subscription::
  operator= (subscription&& x) noexcept
  {
    if (this != &x)
    {
      release ();
      entry_ = move (x.entry_);
    }

    return *this;
  }

  void subscription::
  release () noexcept
  {
    if (entry_ != nullptr)
    {
      entry_->active.store (false, memory_order_release);
      entry_.reset ();
    }
  }

  bool subscription::
  active () const noexcept
  {
    return entry_ != nullptr && entry_->active.load (memory_order_acquire);
  }

  // callback_manager
  //
  callback_manager::
  callback_manager (ostream& diag)
    : diag_ (diag)
  {
  }

  void callback_manager::
  post (steam_event e)
  {
    {
      lock_guard<mutex> l (mutex_);
      queue_.push_back (move (e));
    }

    cv_.notify_one ();
  }

  subscription callback_manager::
  add (function<void (const steam_event&)> h)
  {
    auto e (make_shared<subscription::entry> (move (h)));

    lock_guard<mutex> l (mutex_);
    subscribers_.push_back (e);

    return subscription (move (e));
  }

  size_t callback_manager::
  subscriber_count () const
  {
    lock_guard<mutex> l (mutex_);

    return static_cast<size_t> (
      count_if (subscribers_.begin (), subscribers_.end (),
                [] (const shared_ptr<subscription::entry>& e)
                {
                  return e->active.load (memory_order_acquire);
                }));
  }

  void callback_manager::
  dispatch (const steam_event& ev)
  {
    // Take a snapshot of the live subscribers, dropping the released ones
    // while at it. Handlers are free to (un)subscribe so we can't hold the
    // lock while calling them.
    //
    vector<shared_ptr<subscription::entry>> ss;
    {
      lock_guard<mutex> l (mutex_);

      subscribers_.erase (
        remove_if (subscribers_.begin (), subscribers_.end (),
                   [] (const shared_ptr<subscription::entry>& e)
                   {
                     return !e->active.load (memory_order_acquire);
                   }),
        subscribers_.end ());

      ss = subscribers_;
    }

    for (const shared_ptr<subscription::entry>& e: ss)
    {
      // An earlier handler may have released this one.
      //
      if (!e->active.load (memory_order_acquire))
        continue;

      // There is nobody to propagate to on the pump thread so report and
      // carry on with the remaining subscribers.
      //
      try
      {
        e->handler (ev);
      }
      catch (const exception& x)
      {
        diag_ << "warning: event handler failed: " << x.what () << endl;
      }
    }
  }

  size_t callback_manager::
  run_callbacks ()
  {
    size_t n (0);

    for (;;)
    {
      steam_event e;
      {
        lock_guard<mutex> l (mutex_);

        if (queue_.empty ())
          break;

        e = move (queue_.front ());
        queue_.pop_front ();
      }

      dispatch (e);
      ++n;
    }

    return n;
  }

  size_t callback_manager::
  run_wait_callbacks (duration t)
  {
    {
      unique_lock<mutex> l (mutex_);

      if (!cv_.wait_for (l, t, [this] {return !queue_.empty ();}))
        return 0;
    }

    return run_callbacks ();
  }
}
