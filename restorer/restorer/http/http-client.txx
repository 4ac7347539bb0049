#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace restorer
{
  // Write the request and read the whole response over an already
  // established stream (plain TCP or TLS).
  //
  template <typename S>
  asio::awaitable<http_response> http_client::
  exchange (S& s, const url_parts& u)
  {
    namespace beast = boost::beast;
    namespace http  = boost::beast::http;

    http::request<http::empty_body> rq (http::verb::get, u.target, 11);
    rq.set (http::field::host, u.host);
    rq.set (http::field::accept, "*/*");
    rq.set (http::field::connection, "close");

    if (!options_.user_agent.empty ())
      rq.set (http::field::user_agent, options_.user_agent);

    co_await http::async_write (s, rq, asio::use_awaitable);

    beast::flat_buffer b;
    http::response<http::string_body> rs;
    co_await http::async_read (s, b, rs, asio::use_awaitable);

    http_response r;
    r.status = static_cast<std::uint16_t> (rs.result_int ());
    r.reason = std::string (rs.reason ());

    for (const auto& f: rs)
      r.headers.push_back (http_header {std::string (f.name_string ()),
                                        std::string (f.value ())});

    r.body = std::move (rs.body ());
    co_return r;
  }
}
