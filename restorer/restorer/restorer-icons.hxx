#pragma once

#include <restorer/steam/steam-types.hxx>
#include <restorer/icon/icon-resolver.hxx>

#include <boost/asio/awaitable.hpp>

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <optional>
#include <functional>
#include <filesystem>
#include <stop_token>

namespace restorer
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Fetch the URL and return the body. Throws on any failure.
  //
  using fetch_function =
    std::function<asio::awaitable<std::string> (const std::string& url)>;

  // Return the CDN URL of the client icon.
  //
  std::string
  icon_url (std::uint32_t appid, const std::string& token);

  // Return true if the token can be used as a file name as is (no path
  // separators, no . or .., nothing but [0-9A-Za-z_-] really).
  //
  bool
  valid_icon_token (const std::string&);

  enum class icon_status
  {
    ok,
    skipped, // No icon token.
    failed   // Metadata, download, or write failure.
  };

  struct icon_outcome
  {
    std::uint32_t appid = 0;
    icon_status status = icon_status::failed;
    std::optional<std::string> message;
    std::string failure {"download error"}; // Short reason if failed.
    fs::path file; // Written icon if status is ok.
  };

  struct restore_summary
  {
    std::size_t successful = 0;
    std::size_t failed = 0; // Including skipped.
    std::size_t total = 0;

    std::vector<icon_outcome> outcomes;
  };

  void
  print_summary (std::ostream&, const restore_summary&);

  // Resolve, download, and store client icons for a list of games.
  //
  class icon_restorer
  {
  public:
    icon_restorer (icon_resolver& resolver,
                   fetch_function fetch,
                   fs::path icons_dir,
                   std::ostream& out,
                   std::ostream& diag);

    icon_restorer (const icon_restorer&) = delete;
    icon_restorer& operator= (const icon_restorer&) = delete;

    // Process a single game. Never throws for per-game problems, these end
    // up in the outcome.
    //
    asio::awaitable<icon_outcome>
    restore (const game_record&);

    // Write the icon to the icons directory, returning its path.
    //
    fs::path
    store (const std::string& token, const std::string& data) const;

    // Process the games in order printing a progress line for each. Stop
    // early if stop is requested; the remaining games are not counted.
    //
    asio::awaitable<restore_summary>
    restore_all (const std::vector<game_record>&,
                 std::stop_token = std::stop_token ());

    const fs::path&
    icons_directory () const {return icons_;}

  private:
    icon_resolver& resolver_;
    fetch_function fetch_;
    fs::path icons_;
    std::ostream& out_;
    std::ostream& diag_;
  };
}
