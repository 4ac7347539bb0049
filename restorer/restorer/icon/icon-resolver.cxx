#include <restorer/icon/icon-resolver.hxx>

#include <restorer/signal/completion-signal.hxx>

using namespace std;

namespace restorer
{
  optional<string>
  extract_client_icon (const kv_node& app)
  {
    const kv_node* c (app.find ("common"));

    if (c == nullptr)
      return nullopt;

    optional<string> r (c->get_string ("clienticon"));

    if (!r || r->empty ())
      return nullopt;

    return r;
  }

  icon_resolver::
  icon_resolver (asio::io_context& ioc,
                 steam_client& c,
                 ostream& o,
                 duration t)
    : ioc_ (ioc), client_ (c), out_ (o), timeout_ (t)
  {
  }

  asio::awaitable<optional<string>> icon_resolver::
  resolve (uint32_t appid)
  {
    using result_type = optional<string>;

    steam_client::job_id job (client_.make_job_id ());
    auto sig (completion_signal<result_type>::create (ioc_));

    // Subscribe before sending the request so that we can't miss a quick
    // answer. Answers to other requests (including late answers to the ones
    // we gave up on) carry a different job id.
    //
    subscription s (
      client_.callbacks ().subscribe<product_info_event> (
        [sig, job, appid] (const product_info_event& e)
        {
          if (e.job != job)
            return;

          auto i (e.apps.find (appid));
          sig->resolve (i != e.apps.end ()
                        ? extract_client_icon (i->second)
                        : result_type ());
        }));

    client_.request_product_info (job, appid);

    optional<result_type> r (co_await sig->wait_for (timeout_));

    if (!r)
    {
      out_ << "Timeout waiting for app info for AppID " << appid << endl;
      co_return nullopt;
    }

    co_return move (*r);
  }
}
