#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <filesystem>

namespace restorer
{
  namespace fs = std::filesystem;

  // Steam library folder.
  //
  struct steam_library
  {
    fs::path path;     // Library root (contains steamapps/).
    std::string label; // User-assigned label, usually empty.

    steam_library () = default;

    explicit
    steam_library (fs::path p, std::string l = std::string ())
      : path (std::move (p)), label (std::move (l)) {}
  };

  // Installed game as recorded by its appmanifest_*.acf file.
  //
  struct game_record
  {
    std::uint32_t appid = 0;
    std::string name;
    fs::path manifest;

    game_record () = default;

    game_record (std::uint32_t i, std::string n, fs::path m)
      : appid (i), name (std::move (n)), manifest (std::move (m)) {}
  };

  // Placeholder name for manifests that don't record one.
  //
  std::string
  unknown_game_name (std::uint32_t appid);

  // Steam configuration paths derived from the installation root.
  //
  struct steam_config_paths
  {
    fs::path steam_root;         // Main Steam installation directory
    fs::path steamapps;          // steamapps directory
    fs::path libraryfolders_vdf; // libraryfolders.vdf location
    fs::path icons;              // steam/games (client icon cache)

    explicit
    steam_config_paths (const fs::path& root);
  };

  // Steam result codes (EResult).
  //
  // Only the codes we are likely to see during logon are named; anything
  // else is still carried through and printed numerically.
  //
  enum class eresult: std::int32_t
  {
    invalid                    = 0,
    ok                         = 1,
    fail                       = 2,
    no_connection              = 3,
    invalid_password           = 5,
    logged_in_elsewhere        = 6,
    invalid_protocol_version   = 7,
    invalid_param              = 8,
    busy                       = 10,
    invalid_state              = 11,
    access_denied              = 15,
    timeout                    = 16,
    banned                     = 17,
    account_not_found          = 18,
    service_unavailable        = 20,
    not_logged_on              = 21,
    rate_limit_exceeded        = 84,
    account_login_denied_need_two_factor = 85,
    expired                    = 27,
    try_another_cm             = 48,
    account_logon_denied       = 63,
    invalid_login_auth_code    = 65,
    account_disabled           = 43,
    two_factor_code_mismatch   = 88
  };

  std::string
  to_string (eresult);

  inline std::ostream&
  operator<< (std::ostream& o, eresult r)
  {
    return o << to_string (r);
  }

  // Fatal configuration problem (missing or malformed Steam files, bad
  // install path, missing credentials).
  //
  class config_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };
}
