#pragma once

#include <restorer/steam/steam-client.hxx>
#include <restorer/steam/steam-callbacks.hxx>
#include <restorer/steam/steam-connection.hxx>

#include <boost/asio/io_context.hpp>

#include <tek-steamclient/base.h>
#include <tek-steamclient/cm.h>
#include <tek-steamclient/error.h>

#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <ostream>
#include <cstdint>

namespace restorer
{
  namespace asio = boost::asio;

  struct cm_client_options
  {
    // Applies to connecting, signing in, and the initial response of each
    // authentication and product info request.
    //
    std::chrono::milliseconds request_timeout {30000};

    bool verbose = false;
  };

  // Human-readable description of a tek-steamclient error.
  //
  std::string
  describe (const tek_sc_err&);

  // Steam client on top of the tek-steamclient CM client.
  //
  // The library invokes its callbacks on its own event loop thread; they
  // only translate the outcome into events posted to callbacks(), so nothing
  // is dispatched until someone pumps the callback manager.
  //
  // Auth prompts are answered on the io_context via the prompter passed
  // with the credentials.
  //
  class cm_client: public steam_client
  {
  public:
    explicit
    cm_client (asio::io_context& ioc,
               std::ostream& diag,
               cm_client_options = cm_client_options ());

    ~cm_client () override;

    cm_client (const cm_client&) = delete;
    cm_client& operator= (const cm_client&) = delete;

    void
    connect () override;

    void
    disconnect () override;

    void
    log_on (const logon_details&) override;

    void
    log_off () override;

    void
    request_product_info (job_id, std::uint32_t appid) override;

    asio::awaitable<std::unique_ptr<qr_auth_session>>
    begin_auth_via_qr (const qr_auth_details&) override;

    asio::awaitable<std::unique_ptr<auth_session>>
    begin_auth_via_credentials (const credentials_auth_details&) override;

    callback_manager&
    callbacks () override {return callbacks_;}

    // Send the second factor code of the current credentials session. Throw
    // auth_error if it can't be sent.
    //
    void
    submit_code (auth_prompt_kind, const std::string& code);

    // Stop routing the library's auth callbacks to the session.
    //
    void
    end_auth (std::uint64_t session) noexcept;

    asio::io_context&
    context () {return ioc_;}

    std::ostream&
    diag () {return diag_;}

  private:
    static void
    connection_cb (tek_sc_cm_client*, void* data, void* user);

    static void
    disconnection_cb (tek_sc_cm_client*, void* data, void* user);

    static void
    sign_in_cb (tek_sc_cm_client*, void* data, void* user);

    static void
    auth_cb (tek_sc_cm_client*, void* data, void* user);

    static void
    product_info_cb (tek_sc_cm_client*, void* data, void* user);

    std::uint64_t
    begin_auth (std::string account_name);

    long
    timeout_ms () const noexcept;

    // Single app product info request. The library writes the results into
    // it so it must stay put until the callback.
    //
    struct pics_request
    {
      job_id job;
      tek_sc_cm_pics_entry app;
      tek_sc_cm_data_pics data;
    };

    asio::io_context& ioc_;
    std::ostream& diag_;
    cm_client_options options_;

    callback_manager callbacks_;
    connection_tracker connection_;

    std::mutex mutex_;
    std::map<const tek_sc_cm_data_pics*, std::unique_ptr<pics_request>> pics_;

    // Current auth session (0 if none) and the account it's for.
    //
    std::atomic<std::uint64_t> auth_session_ {0};
    std::uint64_t next_session_ = 1;
    std::string auth_account_;

    // Steam id of the token we are signing in with.
    //
    std::atomic<std::uint64_t> steam_id_ {0};

    tek_sc_lib_ctx* lib_ = nullptr;
    tek_sc_cm_client* client_ = nullptr;
  };
}
