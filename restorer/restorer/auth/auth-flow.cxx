#include <restorer/auth/auth-flow.hxx>

#include <memory>
#include <utility>
#include <stdexcept>

using namespace std;

namespace restorer
{
  const string&
  account_name (const auth_credential& c)
  {
    return visit ([] (const auto& x) -> const string& {return x.account_name;},
                  c);
  }

  const string&
  refresh_token (const auth_credential& c)
  {
    return visit ([] (const auto& x) -> const string& {return x.refresh_token;},
                  c);
  }

  logon_details
  make_logon_details (const auth_credential& c)
  {
    logon_details d;
    d.account_name = account_name (c);
    d.access_token = refresh_token (c);
    d.should_remember_password = false;
    return d;
  }

  // qr_auth_flow
  //
  qr_auth_flow::
  qr_auth_flow (auth_prompter& p, ostream& o)
    : prompter_ (p), out_ (o)
  {
  }

  asio::awaitable<auth_credential> qr_auth_flow::
  produce_credential (steam_client& c)
  {
    qr_auth_details d;
    d.device_friendly_name = "Steam Icon Restorer";

    unique_ptr<qr_auth_session> s (co_await c.begin_auth_via_qr (d));

    s->on_challenge_url_changed = [this] (const string& u)
    {
      out_ << endl << "Steam has refreshed the challenge URL" << endl;
      prompter_.show_challenge (u);
    };

    prompter_.show_challenge (s->challenge_url ());

    // Wait for the user to approve it in the mobile app. There is no local
    // timeout here: the session expires on the Steam side.
    //
    auth_poll_result r (co_await s->wait_for_result ());

    out_ << "Authenticated as '" << r.account_name << "'" << endl;

    co_return device_linked_credential {move (r.account_name),
                                        move (r.refresh_token)};
  }

  // credentials_auth_flow
  //
  credentials_auth_flow::
  credentials_auth_flow (string u, string p, auth_prompter& a, ostream& o)
    : username_ (move (u)),
      password_ (move (p)),
      prompter_ (a),
      out_ (o)
  {
    if (username_.empty () || password_.empty ())
      throw invalid_argument (
        "username and password are required for credential authentication");
  }

  asio::awaitable<auth_credential> credentials_auth_flow::
  produce_credential (steam_client& c)
  {
    credentials_auth_details d;
    d.username = username_;
    d.password = password_;
    d.is_persistent_session = false;
    d.guard_data = guard_data_;
    d.authenticator = &prompter_;

    unique_ptr<auth_session> s (co_await c.begin_auth_via_credentials (d));

    auth_poll_result r (co_await s->wait_for_result ());

    // Keep the new guard data around in case we need to authenticate again
    // during this run. It is never written anywhere.
    //
    if (r.new_guard_data)
      guard_data_ = r.new_guard_data;

    out_ << "Authenticated as '" << r.account_name << "'" << endl;

    co_return password_credential {move (r.account_name),
                                   move (r.refresh_token),
                                   guard_data_};
  }
}
