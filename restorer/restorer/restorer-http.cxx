#include <restorer/restorer-http.hxx>

#include <sstream>

using namespace std;

namespace restorer
{
  string
  format_http_error (const http_response& r)
  {
    ostringstream o;
    o << "HTTP " << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    // Cap the body, CDN error pages are full HTML documents.
    //
    if (!r.body.empty ())
    {
      const size_t m (200);

      if (r.body.size () <= m)
        o << ": " << r.body;
      else
        o << ": " << r.body.substr (0, m) << "...";
    }

    return o.str ();
  }

  http_coordinator::
  http_coordinator (asio::io_context& i, http_client_options o)
    : client_ (make_unique<http_client> (i, move (o)))
  {
  }

  asio::awaitable<string> http_coordinator::
  get (const string& u)
  {
    http_response r (co_await client_->get (u));

    if (!r.successful ())
      throw http_error (r.status, format_http_error (r));

    co_return move (r.body);
  }
}
