#pragma once

#include <restorer/steam/steam-types.hxx>
#include <restorer/steam/steam-callbacks.hxx>

#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <functional>

namespace restorer
{
  namespace asio = boost::asio;

  // Authentication failure (rejected credentials, expired or cancelled
  // session, etc).
  //
  class auth_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  struct logon_details
  {
    std::string account_name;
    std::string access_token;
    bool should_remember_password = false;
  };

  // Interactive side of a credentials authentication. Called on the
  // io_context thread.
  //
  class auth_prompter
  {
  public:
    virtual
    ~auth_prompter () = default;

    // Code from the authenticator app.
    //
    virtual asio::awaitable<std::string>
    device_code (bool previous_incorrect) = 0;

    // Code that was sent to the specified email address.
    //
    virtual asio::awaitable<std::string>
    email_code (const std::string& email, bool previous_incorrect) = 0;

    // Ask the user to approve the login in the mobile app. Return false if
    // the user would rather enter a code.
    //
    virtual asio::awaitable<bool>
    confirm_device () = 0;

    // Present a QR challenge URL (initial or refreshed).
    //
    virtual void
    show_challenge (const std::string& url) = 0;
  };

  struct qr_auth_details
  {
    std::string device_friendly_name;
  };

  struct credentials_auth_details
  {
    std::string username;
    std::string password;
    bool is_persistent_session = false;
    std::optional<std::string> guard_data;
    auth_prompter* authenticator = nullptr;
  };

  struct auth_poll_result
  {
    std::string account_name;
    std::string refresh_token;
    std::optional<std::string> new_guard_data;
  };

  class auth_session
  {
  public:
    virtual
    ~auth_session () = default;

    // Wait (without any local timeout) until the session is approved or
    // fails. Throw auth_error in the latter case.
    //
    virtual asio::awaitable<auth_poll_result>
    wait_for_result () = 0;
  };

  class qr_auth_session: public auth_session
  {
  public:
    virtual const std::string&
    challenge_url () const = 0;

    // Called (on the io_context thread) whenever the challenge URL is
    // rotated.
    //
    std::function<void (const std::string&)> on_challenge_url_changed;
  };

  // Steam network client.
  //
  // Commands are fire-and-forget; their outcome is delivered as events
  // through callbacks(). Product info requests are tagged with a job id so
  // that the response can be matched to the request.
  //
  class steam_client
  {
  public:
    using job_id = std::uint64_t;

    virtual
    ~steam_client () = default;

    virtual void
    connect () = 0;

    virtual void
    disconnect () = 0;

    virtual void
    log_on (const logon_details&) = 0;

    virtual void
    log_off () = 0;

    virtual void
    request_product_info (job_id, std::uint32_t appid) = 0;

    virtual asio::awaitable<std::unique_ptr<qr_auth_session>>
    begin_auth_via_qr (const qr_auth_details&) = 0;

    virtual asio::awaitable<std::unique_ptr<auth_session>>
    begin_auth_via_credentials (const credentials_auth_details&) = 0;

    virtual callback_manager&
    callbacks () = 0;

    // Allocate a new job id, unique for this client.
    //
    job_id
    make_job_id () noexcept
    {
      return next_job_.fetch_add (1, std::memory_order_relaxed);
    }

  private:
    std::atomic<job_id> next_job_ {1};
  };
}
