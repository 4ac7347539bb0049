#pragma once

#include <restorer/http/http-client.hxx>

#include <boost/asio/io_context.hpp>
#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string>

namespace restorer
{
  namespace asio = boost::asio;

  class http_coordinator
  {
  public:
    explicit
    http_coordinator (asio::io_context& ioc,
                      http_client_options options = http_client_options ());

    http_coordinator (const http_coordinator&) = delete;
    http_coordinator& operator= (const http_coordinator&) = delete;

    // GET request returning the body.
    //
    // Throws http_error on a non-2xx status and boost::system::system_error
    // on network failure or timeout.
    //
    asio::awaitable<std::string>
    get (const std::string& url);

    http_client&
    client () noexcept {return *client_;}

  private:
    std::unique_ptr<http_client> client_;
  };

  // Format an HTTP error message from the response status line and the
  // beginning of its body.
  //
  std::string
  format_http_error (const http_response&);
}
