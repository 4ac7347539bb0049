#include <restorer/http/http-client.hxx>

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <exception>
#include <stdexcept>

using namespace std;

namespace restorer
{
  namespace beast = boost::beast;
  using tcp = asio::ip::tcp;

  http_client::
  http_client (asio::io_context& ioc, http_client_options o)
    : ioc_ (ioc),
      options_ (move (o)),
      ssl_ctx_ (ssl::context::tls_client)
  {
    configure_ssl ();
  }

  void http_client::
  configure_ssl ()
  {
    ssl_ctx_.set_default_verify_paths ();
    ssl_ctx_.set_verify_mode (options_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  asio::awaitable<http_response> http_client::
  get (const string& url)
  {
    using namespace asio::experimental;

    // One deadline for the whole exchange, redirects included. Whichever
    // of the two finishes first cancels the other.
    //
    asio::steady_timer t (ioc_, options_.timeout);

    auto [ord, ex, r, ec] =
      co_await make_parallel_group (
        asio::co_spawn (ioc_, fetch (url), asio::deferred),
        t.async_wait (asio::deferred)
      ).async_wait (wait_for_one (), asio::use_awaitable);

    if (ord[0] == 1)
      throw beast::system_error (beast::error_code (asio::error::timed_out),
                                 "timed out fetching " + url);

    if (ex)
      rethrow_exception (ex);

    co_return move (r);
  }

  asio::awaitable<http_response> http_client::
  fetch (const string& url)
  {
    url_parts u (parse_url (url));

    for (uint8_t n (0);; ++n)
    {
      http_response r (co_await get_once (u));

      if (!r.redirection () || options_.max_redirects == 0)
        co_return r;

      optional<string> l (r.header ("Location"));

      if (!l || l->empty ())
        co_return r;

      if (n == options_.max_redirects)
        throw runtime_error ("too many redirects fetching " + url);

      u = resolve_location (u, *l);
    }
  }

  asio::awaitable<http_response> http_client::
  get_once (const url_parts& u)
  {
    tcp::resolver rv (ioc_);

    if (!u.secure ())
    {
      beast::tcp_stream s (ioc_);

      auto es (co_await rv.async_resolve (u.host, u.port, asio::use_awaitable));
      co_await s.async_connect (es, asio::use_awaitable);

      http_response r (co_await exchange (s, u));

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }

    beast::ssl_stream<beast::tcp_stream> s (ioc_, ssl_ctx_);
    auto& l (beast::get_lowest_layer (s));

    // Most CDNs (Cloudflare in particular) refuse the handshake without SNI.
    // Beast doesn't wrap it so go through OpenSSL directly.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());
      throw beast::system_error (ec, "unable to set SNI hostname");
    }

    if (options_.verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (u.host));

    auto es (co_await rv.async_resolve (u.host, u.port, asio::use_awaitable));
    co_await l.async_connect (es, asio::use_awaitable);
    co_await s.async_handshake (ssl::stream_base::client, asio::use_awaitable);

    http_response r (co_await exchange (s, u));

    // Skip the TLS shutdown: plenty of servers just drop the connection
    // after the response and waiting for close_notify can stall until the
    // timeout.
    //
    beast::error_code ec;
    l.socket ().shutdown (tcp::socket::shutdown_both, ec);
    co_return r;
  }
}
