#pragma once

#include <restorer/steam/steam-types.hxx>

#include <restorer/kv/kv-document.hxx>

#include <string>
#include <vector>
#include <ostream>
#include <optional>

namespace restorer
{
  class steam_library_manager
  {
  public:
    // Constructor.
    //
    // The root is the main Steam installation directory, either specified
    // by the user or found with detect_steam_path().
    //
    explicit
    steam_library_manager (fs::path steam_root);

    steam_library_manager (const steam_library_manager&) = delete;
    steam_library_manager& operator= (const steam_library_manager&) = delete;

    // Detect Steam installation path for the current platform.
    //
    // Returns the main Steam installation directory, or std::nullopt if
    // Steam is not installed or cannot be found.
    //
    static std::optional<fs::path>
    detect_steam_path ();

    // Validate that a path is a valid Steam library.
    //
    // Checks if the specified path contains the expected Steam library
    // structure (steamapps directory).
    //
    static bool
    validate_library_path (const fs::path& path);

    const fs::path&
    steam_root () const {return root_;}

    steam_config_paths
    config_paths () const {return steam_config_paths (root_);}

    // Load all Steam library folders.
    //
    // Reads and parses the libraryfolders.vdf file. Folders whose path does
    // not exist are left out; the rest keep the order of the file.
    //
    // Throw config_error (with the underlying cause nested) if the file is
    // missing, can't be parsed, or is not a library folders document.
    //
    const std::vector<steam_library>&
    load_libraries ();

    // Get all installed games across all libraries.
    //
    // Libraries are visited in load_libraries() order and manifests within
    // a library in file name order. Manifests that can't be read are
    // reported to the diagnostics stream and skipped. Note that the same
    // app found in two libraries is reported twice.
    //
    std::vector<game_record>
    load_games (std::ostream& diag);

    // Scan a single library for app manifests.
    //
    static std::vector<game_record>
    scan_library (const steam_library&, std::ostream& diag);

    // Read a single appmanifest_*.acf file.
    //
    // Return std::nullopt if the manifest doesn't carry a valid app id.
    // Throw kv_parse_error if the file can't be read or parsed.
    //
    static std::optional<game_record>
    read_app_manifest (const fs::path&);

    // Extract library folders from a parsed libraryfolders.vdf root.
    //
    // Throw config_error if the root is not named libraryfolders.
    //
    static std::vector<steam_library>
    parse_library_folders (const kv_node& root);

  private:
    static std::optional<fs::path>
    detect_steam_path_linux ();

    static std::optional<fs::path>
    detect_steam_path_windows ();

    static std::optional<fs::path>
    detect_steam_path_macos ();

    fs::path root_;

    // Cached libraries.
    //
    std::vector<steam_library> libraries_;
    bool libraries_loaded_;
  };
}
