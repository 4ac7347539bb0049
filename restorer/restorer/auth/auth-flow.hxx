#pragma once

#include <restorer/steam/steam-client.hxx>

#include <boost/asio/awaitable.hpp>

#include <string>
#include <ostream>
#include <variant>
#include <optional>

namespace restorer
{
  namespace asio = boost::asio;

  // Credential material produced by a successful authentication. Held in
  // memory for the duration of the run only.
  //
  struct device_linked_credential
  {
    std::string account_name;
    std::string refresh_token;
  };

  struct password_credential
  {
    std::string account_name;
    std::string refresh_token;
    std::optional<std::string> guard_data;
  };

  using auth_credential = std::variant<device_linked_credential,
                                       password_credential>;

  const std::string&
  account_name (const auth_credential&);

  const std::string&
  refresh_token (const auth_credential&);

  // Logon details for the client given the credential.
  //
  logon_details
  make_logon_details (const auth_credential&);

  // Authentication flow.
  //
  // Runs on the io_context once the client is connected and produces the
  // credential to log on with. Throws auth_error if authentication fails.
  //
  class auth_flow
  {
  public:
    virtual
    ~auth_flow () = default;

    virtual asio::awaitable<auth_credential>
    produce_credential (steam_client&) = 0;
  };

  // Device-linked flow: the user scans a QR challenge with the mobile app.
  //
  class qr_auth_flow: public auth_flow
  {
  public:
    qr_auth_flow (auth_prompter& prompter, std::ostream& out);

    asio::awaitable<auth_credential>
    produce_credential (steam_client&) override;

  private:
    auth_prompter& prompter_;
    std::ostream& out_;
  };

  // Username and password, with the second factor challenges answered by
  // the prompter.
  //
  class credentials_auth_flow: public auth_flow
  {
  public:
    // Throw std::invalid_argument if the username or password is empty.
    //
    credentials_auth_flow (std::string username,
                           std::string password,
                           auth_prompter& prompter,
                           std::ostream& out);

    asio::awaitable<auth_credential>
    produce_credential (steam_client&) override;

    // Guard data from the last successful attempt (in this process).
    //
    const std::optional<std::string>&
    guard_data () const {return guard_data_;}

  private:
    std::string username_;
    std::string password_;
    auth_prompter& prompter_;
    std::ostream& out_;
    std::optional<std::string> guard_data_;
  };
}
