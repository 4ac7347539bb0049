#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace restorer
{
  // URL components.
  //
  // Only what we need for talking to a CDN: http and https with an optional
  // port. IPv6 literals and user info are not supported.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool
    secure () const noexcept {return scheme == "https";}

    std::string
    str () const;
  };

  // Parse an absolute URL. Throw std::invalid_argument if the scheme is not
  // http or https or the host is missing.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a Location header value against the URL it came from. Handles
  // absolute URLs, scheme-relative (//host/path), and absolute-path
  // references.
  //
  url_parts
  resolve_location (const url_parts& base, const std::string& location);

  struct http_header
  {
    std::string name;
    std::string value;
  };

  struct http_response
  {
    std::uint16_t status = 0;
    std::string reason;
    std::vector<http_header> headers;
    std::string body;

    bool
    successful () const noexcept {return status >= 200 && status < 300;}

    bool
    redirection () const noexcept {return status >= 300 && status < 400;}

    // Case-insensitive lookup of the first header with this name.
    //
    std::optional<std::string>
    header (const std::string& name) const;
  };

  // Unsuccessful HTTP status.
  //
  class http_error: public std::runtime_error
  {
  public:
    http_error (std::uint16_t status, const std::string& what)
      : std::runtime_error (what), status_ (status) {}

    std::uint16_t
    status () const noexcept {return status_;}

  private:
    std::uint16_t status_;
  };
}
