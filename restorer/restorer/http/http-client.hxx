#pragma once

#include <restorer/http/http-types.hxx>

#include <boost/asio/io_context.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <string>
#include <cstdint>

namespace restorer
{
  namespace asio = boost::asio;
  namespace ssl  = boost::asio::ssl;

  // HTTP client configuration.
  //
  struct http_client_options
  {
    // Overall time allowed for a request, from resolving the host to
    // reading the last byte of the final response (redirects included).
    //
    std::chrono::milliseconds timeout {30000};

    // Maximum number of redirects to follow (0 = don't follow).
    //
    std::uint8_t max_redirects = 10;

    // Verify the server certificate against the system trust store.
    //
    bool verify_ssl = true;

    std::string user_agent;
  };

  // Minimal HTTP/1.1 client on top of Boost.Beast.
  //
  // One connection per request, no keep-alive. The whole response is
  // buffered in memory, which is fine for the small files we fetch.
  //
  class http_client
  {
  public:
    explicit
    http_client (asio::io_context& ioc,
                 http_client_options options = http_client_options ());

    http_client (const http_client&) = delete;
    http_client& operator= (const http_client&) = delete;

    // Perform a GET request following redirects. Network errors and
    // timeouts (asio::error::timed_out) are thrown as
    // boost::system::system_error; the response is returned whatever its
    // status.
    //
    asio::awaitable<http_response>
    get (const std::string& url);

    const http_client_options&
    options () const noexcept {return options_;}

  private:
    asio::awaitable<http_response>
    fetch (const std::string& url);

    asio::awaitable<http_response>
    get_once (const url_parts&);

    template <typename S>
    asio::awaitable<http_response>
    exchange (S& stream, const url_parts&);

    void
    configure_ssl ();

    asio::io_context& ioc_;
    http_client_options options_;
    ssl::context ssl_ctx_;
  };
}

#include <restorer/http/http-client.txx>
