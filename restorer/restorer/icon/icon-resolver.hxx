#pragma once

#include <restorer/steam/steam-client.hxx>

#include <restorer/kv/kv-document.hxx>

#include <boost/asio/io_context.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <string>
#include <cstdint>
#include <ostream>
#include <optional>

namespace restorer
{
  namespace asio = boost::asio;

  // Extract the client icon token from an app's product info section.
  //
  // The token is the common/clienticon scalar. Return std::nullopt if there
  // is no common section, no clienticon in it, or it is empty.
  //
  std::optional<std::string>
  extract_client_icon (const kv_node& app);

  // Resolve client icon tokens through product info requests.
  //
  class icon_resolver
  {
  public:
    using duration = std::chrono::steady_clock::duration;

    static constexpr std::chrono::seconds default_timeout {10};

    icon_resolver (asio::io_context& ioc,
                   steam_client& client,
                   std::ostream& out,
                   duration timeout = default_timeout);

    icon_resolver (const icon_resolver&) = delete;
    icon_resolver& operator= (const icon_resolver&) = delete;

    // Request product info for the app and wait for the answer up to the
    // timeout. Return std::nullopt if the app has no icon or the answer
    // didn't come in time (in which case it is ignored if it comes later).
    //
    // The callbacks must be pumped by someone else while this is waiting.
    //
    asio::awaitable<std::optional<std::string>>
    resolve (std::uint32_t appid);

    duration
    timeout () const {return timeout_;}

  private:
    asio::io_context& ioc_;
    steam_client& client_;
    std::ostream& out_;
    duration timeout_;
  };
}
