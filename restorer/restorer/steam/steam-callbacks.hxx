#pragma once

#include <restorer/steam/steam-types.hxx>

#include <restorer/kv/kv-document.hxx>

#include <map>
#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <optional>
#include <functional>
#include <condition_variable>

namespace restorer
{
  // Client events.
  //
  // These are delivered by the client's callback manager on whatever thread
  // pumps it (see callback_manager::run_wait_callbacks()).
  //
  struct connected_event {};

  struct disconnected_event
  {
    bool user_initiated = false;
  };

  struct logged_on_event
  {
    eresult result = eresult::invalid;
    eresult extended_result = eresult::invalid;
    std::uint64_t steam_id = 0;
  };

  struct logged_off_event
  {
    eresult result = eresult::invalid;
  };

  // Product info (PICS) response. Each app is the root of its KeyValues
  // section (named after the app id) with common, extended, etc. as
  // children.
  //
  struct product_info_event
  {
    std::uint64_t job = 0;
    std::map<std::uint32_t, kv_node> apps;
  };

  // Authentication session events. The session id ties them to the auth
  // session that was started with the client.
  //
  struct auth_challenge_event
  {
    std::uint64_t session = 0;
    std::string url;
  };

  enum class auth_prompt_kind
  {
    device_code,        // Code from the authenticator app.
    email_code,         // Code sent by email.
    device_confirmation // Approve in the mobile app.
  };

  struct auth_prompt_event
  {
    std::uint64_t session = 0;
    auth_prompt_kind kind = auth_prompt_kind::device_code;
    std::string email;
    bool previous_incorrect = false;
  };

  // Either the tokens or, if authentication failed, the error.
  //
  struct auth_result_event
  {
    std::uint64_t session = 0;
    std::string account_name;
    std::string refresh_token;
    std::optional<std::string> new_guard_data;
    std::optional<std::string> error;
  };

  using steam_event = std::variant<connected_event,
                                   disconnected_event,
                                   logged_on_event,
                                   logged_off_event,
                                   product_info_event,
                                   auth_challenge_event,
                                   auth_prompt_event,
                                   auth_result_event>;

  // Event name for diagnostics.
  //
  const char*
  event_name (const steam_event&) noexcept;

  class callback_manager;

  // Subscription handle.
  //
  // Releasing (explicitly or by destruction) guarantees that the handler is
  // not invoked for events dispatched afterwards. A dispatch that is already
  // in progress on the pump thread may still complete, so handlers should
  // only capture state they share ownership of.
  //
  class subscription
  {
  public:
    subscription () = default;
    ~subscription () {release ();}

    subscription (subscription&&) noexcept;
    subscription& operator= (subscription&&) noexcept;

    subscription (const subscription&) = delete;
    subscription& operator= (const subscription&) = delete;

    void
    release () noexcept;

    bool
    active () const noexcept;

  private:
    friend class callback_manager;

    struct entry
    {
      std::function<void (const steam_event&)> handler;
      std::atomic<bool> active {true};

      explicit
      entry (std::function<void (const steam_event&)> h)
        : handler (std::move (h)) {}
    };

    explicit
    subscription (std::shared_ptr<entry> e): entry_ (std::move (e)) {}

    std::shared_ptr<entry> entry_;
  };

  // Thread-safe event queue with subscriber dispatch.
  //
  // Any thread may post events. Dispatch happens on the thread calling
  // run_callbacks() or run_wait_callbacks(), in posting order, one event at
  // a time. Handlers run without the internal lock held, so they may
  // subscribe, release, and post.
  //
  class callback_manager
  {
  public:
    using duration = std::chrono::steady_clock::duration;

    explicit
    callback_manager (std::ostream& diag);

    callback_manager (const callback_manager&) = delete;
    callback_manager& operator= (const callback_manager&) = delete;

    void
    post (steam_event);

    // Subscribe to events of type E.
    //
    template <typename E>
    [[nodiscard]] subscription
    subscribe (std::function<void (const E&)>);

    // Dispatch all queued events without waiting. Return the number of
    // events dispatched.
    //
    std::size_t
    run_callbacks ();

    // Wait up to the timeout for at least one event, then dispatch all the
    // queued ones.
    //
    std::size_t
    run_wait_callbacks (duration timeout);

    // Number of live subscriptions (mostly for testing).
    //
    std::size_t
    subscriber_count () const;

  private:
    subscription
    add (std::function<void (const steam_event&)>);

    void
    dispatch (const steam_event&);

    std::ostream& diag_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<steam_event> queue_;
    std::vector<std::shared_ptr<subscription::entry>> subscribers_;
  };
}

#include <restorer/steam/steam-callbacks.txx>
