#include <restorer/steam/steam-cm-client.hxx>

#include <restorer/kv/kv-document.hxx>
#include <restorer/signal/completion-signal.hxx>

#include <boost/asio/post.hpp>
#include <boost/asio/co_spawn.hpp>

#include <cstdlib>
#include <iostream>
#include <exception>
#include <stdexcept>

using namespace std;

namespace restorer
{
  string
  describe (const tek_sc_err& e)
  {
    string r ("tek-steamclient error " +
              std::to_string (static_cast<int> (e.primary)));

    if (e.auxiliary != 0)
      r += " (" + std::to_string (static_cast<int> (e.auxiliary)) + ')';

    if (e.extra != 0)
      r += ", extra " + std::to_string (static_cast<int> (e.extra));

    if (e.uri != nullptr)
      r += string (" for ") + e.uri;

    return r;
  }

  // Common part of the CM auth sessions.
  //
  // Handlers run on the pump thread and may outlive the session so they
  // only capture the shared signal and the client (which outlives all its
  // sessions).
  //
  class cm_session_base
  {
  public:
    cm_session_base (cm_client& c, uint64_t id)
      : client_ (c),
        id_ (id),
        result_ (completion_signal<auth_result_event>::create (c.context ()))
    {
      auto r (result_);
      results_ = c.callbacks ().subscribe<auth_result_event> (
        [r, id] (const auth_result_event& e)
        {
          if (e.session == id)
            r->resolve (e);
        });
    }

    ~cm_session_base ()
    {
      client_.end_auth (id_);
    }

    cm_session_base (const cm_session_base&) = delete;
    cm_session_base& operator= (const cm_session_base&) = delete;

  protected:
    asio::awaitable<auth_poll_result>
    result ()
    {
      auth_result_event e (co_await result_->wait ());

      if (e.error)
        throw auth_error ("authentication failed: " + *e.error);

      co_return auth_poll_result {move (e.account_name),
                                  move (e.refresh_token),
                                  move (e.new_guard_data)};
    }

    cm_client& client_;
    uint64_t id_;
    shared_ptr<completion_signal<auth_result_event>> result_;
    subscription results_;
  };

  class cm_qr_session: public qr_auth_session,
                       private cm_session_base
  {
  public:
    cm_qr_session (cm_client& c, uint64_t id)
        : cm_session_base (c, id),
          first_url_ (completion_signal<string>::create (c.context ())),
          alive_ (make_shared<bool> (true))
    {
      // The first challenge completes the session start, later ones are
      // rotations that we forward to the hook on the io_context. An early
      // result (typically an error) also ends the start wait.
      //
      auto f (first_url_);
      weak_ptr<bool> a (alive_);
      asio::io_context& ioc (c.context ());

      challenges_ = c.callbacks ().subscribe<auth_challenge_event> (
        [f, a, id, &ioc, this] (const auth_challenge_event& e)
        {
          if (e.session != id || f->resolve (e.url))
            return;

          asio::post (ioc,
                      [a, this, u = e.url] ()
                      {
                        if (a.lock ())
                          rotate (u);
                      });
        });

      failures_ = c.callbacks ().subscribe<auth_result_event> (
        [f, id] (const auth_result_event& e)
        {
          if (e.session == id)
            f->resolve (string ());
        });
    }

    // Wait for the initial challenge URL. Throw auth_error if the session
    // failed before producing one.
    //
    asio::awaitable<void>
    start ()
    {
      url_ = co_await first_url_->wait ();

      if (url_.empty ())
        co_await result ();

      if (url_.empty ())
        throw auth_error ("authentication session ended without a challenge");
    }

    const string&
    challenge_url () const override
    {
      return url_;
    }

    asio::awaitable<auth_poll_result>
    wait_for_result () override
    {
      co_return co_await result ();
    }

  private:
    void
    rotate (const string& u)
    {
      url_ = u;

      if (on_challenge_url_changed)
        on_challenge_url_changed (url_);
    }

    shared_ptr<completion_signal<string>> first_url_;
    shared_ptr<bool> alive_;
    string url_;
    subscription challenges_;
    subscription failures_;
  };

  class cm_credentials_session: public auth_session,
                                private cm_session_base
  {
  public:
    cm_credentials_session (cm_client& c, uint64_t id, auth_prompter* p)
        : cm_session_base (c, id)
    {
      auto r (result_);

      prompts_ = c.callbacks ().subscribe<auth_prompt_event> (
        [&c, p, id, r] (const auth_prompt_event& e)
        {
          if (e.session != id)
            return;

          // A failure to answer ends the session: the library would keep
          // polling a session nobody is going to approve.
          //
          asio::co_spawn (c.context (),
                          answer (c, p, e),
                          [r, id] (exception_ptr ep)
                          {
                            if (!ep)
                              return;

                            auth_result_event f;
                            f.session = id;

                            try
                            {
                              rethrow_exception (ep);
                            }
                            catch (const exception& x)
                            {
                              f.error = string ("unable to answer "
                                                "authentication prompt: ") +
                                        x.what ();
                            }

                            r->resolve (move (f));
                          });
        });
    }

    asio::awaitable<auth_poll_result>
    wait_for_result () override
    {
      co_return co_await result ();
    }

  private:
    static asio::awaitable<void>
    answer (cm_client& c, auth_prompter* p, auth_prompt_event e)
    {
      if (p == nullptr)
        throw auth_error ("second factor required but no authenticator "
                          "available");

      switch (e.kind)
      {
      case auth_prompt_kind::device_code:
        {
          string code (co_await p->device_code (e.previous_incorrect));
          c.submit_code (e.kind, code);
          break;
        }
      case auth_prompt_kind::email_code:
        {
          string code (co_await p->email_code (e.email, e.previous_incorrect));
          c.submit_code (e.kind, code);
          break;
        }
      case auth_prompt_kind::device_confirmation:
        {
          // The library keeps polling until the login is approved in the
          // app. If the user would rather type the code, send that too.
          //
          if (!co_await p->confirm_device ())
          {
            string code (co_await p->device_code (false));
            c.submit_code (auth_prompt_kind::device_code, code);
          }
          break;
        }
      }
    }

    subscription prompts_;
  };

  // cm_client
  //
  cm_client::
  cm_client (asio::io_context& ioc, ostream& diag, cm_client_options o)
    : ioc_ (ioc),
      diag_ (diag),
      options_ (move (o)),
      callbacks_ (diag),
      connection_ (callbacks_)
  {
    lib_ = tek_sc_lib_init (false, !options_.verbose);

    if (lib_ == nullptr)
      throw runtime_error ("unable to initialize tek-steamclient");

    client_ = tek_sc_cm_client_create (lib_, this);

    if (client_ == nullptr)
    {
      tek_sc_lib_cleanup (lib_);
      throw runtime_error ("unable to create Steam CM client");
    }
  }

  cm_client::
  ~cm_client ()
  {
    // No callbacks are invoked once the client is destroyed so whatever
    // product info requests are still in flight can go with it.
    //
    tek_sc_cm_client_destroy (client_);
    tek_sc_lib_cleanup (lib_);

    for (auto& p: pics_)
      free (p.second->app.data);
  }

  long cm_client::
  timeout_ms () const noexcept
  {
    return static_cast<long> (options_.request_timeout.count ());
  }

  void cm_client::
  connection_cb (tek_sc_cm_client*, void* data, void* user)
  {
    cm_client& self (*static_cast<cm_client*> (user));
    const tek_sc_err& e (*static_cast<const tek_sc_err*> (data));

    if (tek_sc_err_success (&e))
    {
      self.connection_.established ();
      return;
    }

    self.diag_ << "warning: unable to connect to Steam: " << describe (e)
               << endl;

    self.connection_.closed ();
  }

  void cm_client::
  disconnection_cb (tek_sc_cm_client*, void* data, void* user)
  {
    cm_client& self (*static_cast<cm_client*> (user));
    const tek_sc_err& e (*static_cast<const tek_sc_err*> (data));

    if (self.options_.verbose && !tek_sc_err_success (&e))
      self.diag_ << "Steam connection closed: " << describe (e) << endl;

    self.connection_.closed ();
  }

  void cm_client::
  connect ()
  {
    connection_.begin ();
    tek_sc_cm_connect (client_, &connection_cb, timeout_ms (), &disconnection_cb);
  }

  void cm_client::
  disconnect ()
  {
    connection_.request_disconnect ();
    tek_sc_cm_disconnect (client_);
  }

  void cm_client::
  sign_in_cb (tek_sc_cm_client*, void* data, void* user)
  {
    cm_client& self (*static_cast<cm_client*> (user));
    const tek_sc_err& e (*static_cast<const tek_sc_err*> (data));

    logged_on_event r;

    if (tek_sc_err_success (&e))
    {
      r.result = eresult::ok;
      r.extended_result = eresult::ok;
      r.steam_id = self.steam_id_.load ();
    }
    else
    {
      self.diag_ << "warning: Steam sign-in failed: " << describe (e) << endl;
      r.result = eresult::fail;
    }

    self.callbacks_.post (move (r));
  }

  void cm_client::
  log_on (const logon_details& d)
  {
    // The refresh token carries the account's Steam id.
    //
    steam_id_ = tek_sc_cm_parse_auth_token (d.access_token.c_str ()).steam_id;

    if (options_.verbose)
      diag_ << "signing in to Steam as " << d.account_name << endl;

    tek_sc_cm_sign_in (client_, d.access_token.c_str (), &sign_in_cb,
                       timeout_ms ());
  }

  void cm_client::
  log_off ()
  {
    // There is no separate logoff message: the CM signs the account out when
    // the connection is closed.
    //
    connection_.request_logoff ();
    tek_sc_cm_disconnect (client_);
  }

  void cm_client::
  product_info_cb (tek_sc_cm_client*, void* data, void* user)
  {
    cm_client& self (*static_cast<cm_client*> (user));
    const tek_sc_cm_data_pics* d (static_cast<const tek_sc_cm_data_pics*> (data));

    unique_ptr<pics_request> r;
    {
      lock_guard<mutex> l (self.mutex_);

      auto i (self.pics_.find (d));
      if (i == self.pics_.end ())
        return;

      r = move (i->second);
      self.pics_.erase (i);
    }

    product_info_event pe;
    pe.job = r->job;

    tek_sc_cm_pics_entry& a (r->app);

    if (!tek_sc_err_success (&r->data.result))
      self.diag_ << "warning: product info request for AppID " << a.id
                 << " failed: " << describe (r->data.result) << endl;
    else if (!tek_sc_err_success (&a.result))
      self.diag_ << "warning: no product info for AppID " << a.id << ": "
                 << describe (a.result) << endl;
    else if (a.data != nullptr)
    {
      // App info is KeyValues text, normally with a trailing NUL.
      //
      string t (static_cast<const char*> (a.data),
                static_cast<size_t> (a.data_size));

      while (!t.empty () && t.back () == '\0')
        t.pop_back ();

      try
      {
        pe.apps.emplace (a.id, kv_parser::parse (t));
      }
      catch (const kv_parse_error& x)
      {
        self.diag_ << "warning: invalid product info for AppID " << a.id
                   << ": " << x.what () << endl;
      }
    }

    free (a.data);
    a.data = nullptr;

    // Posted even if empty so that the request completes without waiting
    // for the timeout.
    //
    self.callbacks_.post (move (pe));
  }

  void cm_client::
  request_product_info (job_id j, uint32_t appid)
  {
    auto r (make_unique<pics_request> ());
    r->job = j;
    r->app = tek_sc_cm_pics_entry {};
    r->app.id = appid;
    r->data = tek_sc_cm_data_pics {};
    r->data.app_entries = &r->app;
    r->data.num_app_entries = 1;
    r->data.timeout_ms = timeout_ms ();

    tek_sc_cm_data_pics* d (&r->data);
    {
      lock_guard<mutex> l (mutex_);
      pics_.emplace (d, move (r));
    }

    // Errors are reported through the callback as well.
    //
    tek_sc_cm_get_product_info (client_, d, &product_info_cb, timeout_ms ());
  }

  uint64_t cm_client::
  begin_auth (string account_name)
  {
    lock_guard<mutex> l (mutex_);

    uint64_t id (next_session_++);
    auth_account_ = move (account_name);
    auth_session_ = id;
    return id;
  }

  void cm_client::
  end_auth (uint64_t session) noexcept
  {
    uint64_t s (session);
    auth_session_.compare_exchange_strong (s, 0);
  }

  void cm_client::
  auth_cb (tek_sc_cm_client*, void* data, void* user)
  {
    cm_client& self (*static_cast<cm_client*> (user));
    const tek_sc_cm_data_auth_polling& d (
      *static_cast<const tek_sc_cm_data_auth_polling*> (data));

    uint64_t id (self.auth_session_.load ());
    if (id == 0)
      return;

    switch (d.status)
    {
    case TEK_SC_CM_AUTH_STATUS_new_url:
      {
        self.callbacks_.post (auth_challenge_event {id, string (d.url)});
        break;
      }
    case TEK_SC_CM_AUTH_STATUS_awaiting_confirmation:
      {
        int t (static_cast<int> (d.confirmation_types));

        auto allowed = [t] (tek_sc_cm_auth_confirmation_type c)
        {
          return (t & static_cast<int> (c)) != 0;
        };

        // Prefer approving in the app, then the authenticator code.
        //
        auth_prompt_event p;
        p.session = id;

        if (allowed (TEK_SC_CM_AUTH_CONFIRMATION_TYPE_device))
          p.kind = auth_prompt_kind::device_confirmation;
        else if (allowed (TEK_SC_CM_AUTH_CONFIRMATION_TYPE_guard_code))
          p.kind = auth_prompt_kind::device_code;
        else if (allowed (TEK_SC_CM_AUTH_CONFIRMATION_TYPE_email))
          p.kind = auth_prompt_kind::email_code;
        else
          break; // Nothing to confirm, the library keeps polling.

        self.callbacks_.post (move (p));
        break;
      }
    case TEK_SC_CM_AUTH_STATUS_completed:
      {
        auth_result_event r;
        r.session = id;

        if (!tek_sc_err_success (&d.result))
          r.error = describe (d.result);
        else if (d.token == nullptr)
          r.error = "no refresh token in the response";
        else
        {
          lock_guard<mutex> l (self.mutex_);
          r.account_name = self.auth_account_;
          r.refresh_token = d.token;
        }

        self.end_auth (id);
        self.callbacks_.post (move (r));
        break;
      }
    }
  }

  asio::awaitable<unique_ptr<qr_auth_session>> cm_client::
  begin_auth_via_qr (const qr_auth_details& d)
  {
    uint64_t id (begin_auth (string ()));

    // Subscribe before asking so that we can't miss the challenge.
    //
    auto s (make_unique<cm_qr_session> (*this, id));
    tek_sc_cm_auth_qr (client_, d.device_friendly_name.c_str (), &auth_cb,
                       timeout_ms ());

    co_await s->start ();
    co_return move (s);
  }

  asio::awaitable<unique_ptr<auth_session>> cm_client::
  begin_auth_via_credentials (const credentials_auth_details& d)
  {
    uint64_t id (begin_auth (d.username));

    auto s (make_unique<cm_credentials_session> (*this, id, d.authenticator));
    tek_sc_cm_auth_credentials (client_,
                                "Steam Icon Restorer",
                                d.username.c_str (),
                                d.password.c_str (),
                                &auth_cb,
                                timeout_ms ());

    co_return move (s);
  }

  void cm_client::
  submit_code (auth_prompt_kind k, const string& code)
  {
    tek_sc_cm_auth_confirmation_type t (
      k == auth_prompt_kind::email_code
      ? TEK_SC_CM_AUTH_CONFIRMATION_TYPE_email
      : TEK_SC_CM_AUTH_CONFIRMATION_TYPE_guard_code);

    tek_sc_err e (tek_sc_cm_auth_submit_code (client_, t, code.c_str ()));

    if (!tek_sc_err_success (&e))
      throw auth_error ("unable to submit Steam Guard code: " + describe (e));
  }
}
