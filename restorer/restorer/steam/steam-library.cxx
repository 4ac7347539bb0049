#include <restorer/steam/steam-library.hxx>

#include <cstdlib>
#include <charconv>
#include <exception>
#include <algorithm>
#include <system_error>

#ifdef _WIN32
#  include <cstring>
#  include <windows.h>
#endif

using namespace std;

namespace restorer
{
#ifdef _WIN32
  // Detect if we're running under Wine by checking for wine_get_version in
  // ntdll.dll.
  //
  static bool
  is_wine ()
  {
    static const bool r (
      [] ()
      {
        HMODULE ntdll (GetModuleHandleA ("ntdll.dll"));
        return ntdll != nullptr &&
               GetProcAddress (ntdll, "wine_get_version") != nullptr;
      } ());

    return r;
  }
#endif

  // Return true if p is an existing directory. Unlike fs::is_directory()
  // this never throws, which is what we want when probing candidates.
  //
  static bool
  directory_exists (const fs::path& p)
  {
    error_code ec;
    return fs::is_directory (p, ec);
  }

  steam_library_manager::
  steam_library_manager (fs::path r)
    : root_ (move (r)),
      libraries_loaded_ (false)
  {
  }

  optional<fs::path> steam_library_manager::
  detect_steam_path ()
  {
#ifdef _WIN32
    // Under Wine Steam is most likely installed on the host.
    //
    if (is_wine ())
      return detect_steam_path_linux ();

    return detect_steam_path_windows ();
#elif defined(__APPLE__)
    return detect_steam_path_macos ();
#else
    return detect_steam_path_linux ();
#endif
  }

  // On Linux Steam normally lives in the user's home directory, either under
  // .steam or .local, but there are also the system-wide locations and the
  // Flatpak sandbox data directory.
  //
  optional<fs::path> steam_library_manager::
  detect_steam_path_linux ()
  {
    vector<fs::path> cs;

    const char* home (getenv ("HOME"));
    fs::path h (home != nullptr ? home : "");

#ifdef _WIN32
    // Under Wine HOME is usually unset so try Z:\home\<user>.
    //
    if (h.empty ())
    {
      const char* u (getenv ("USER"));
      if (u == nullptr)
        u = getenv ("USERNAME");

      if (u != nullptr)
      {
        fs::path p ("Z:\\home");
        p /= u;

        if (directory_exists (p))
          h = move (p);
      }
    }
#endif

    if (!h.empty ())
    {
      cs.push_back (h / ".steam" / "steam");
      cs.push_back (h / ".local" / "share" / "Steam");
      cs.push_back (
        h / ".var" / "app" / "com.valvesoftware.Steam" / "data" / "Steam");
    }

#ifdef _WIN32
    cs.push_back ("Z:\\usr\\share\\steam");
    cs.push_back ("Z:\\usr\\local\\share\\steam");
#else
    cs.push_back ("/usr/share/steam");
    cs.push_back ("/usr/local/share/steam");
#endif

    if (const char* xdg = getenv ("XDG_DATA_HOME"))
      cs.push_back (fs::path (xdg) / "Steam");

    for (const fs::path& p: cs)
    {
      if (validate_library_path (p))
        return p;
    }

    return nullopt;
  }

  // On Windows the registry is the most reliable source. If that fails (for
  // example, portable installations), fall back to Program Files.
  //
  optional<fs::path> steam_library_manager::
  detect_steam_path_windows ()
  {
#ifdef _WIN32
    HKEY key;
    if (RegOpenKeyExA (HKEY_CURRENT_USER,
                       "Software\\Valve\\Steam",
                       0,
                       KEY_READ,
                       &key) == ERROR_SUCCESS)
    {
      char buf[MAX_PATH];
      DWORD size (sizeof (buf));

      LONG r (RegQueryValueExA (key,
                                "SteamPath",
                                nullptr,
                                nullptr,
                                reinterpret_cast<LPBYTE> (buf),
                                &size));
      RegCloseKey (key);

      if (r == ERROR_SUCCESS && size != 0)
      {
        fs::path p (string (buf, strnlen (buf, size)));

        if (directory_exists (p))
          return p.make_preferred ();
      }
    }

    for (const char* p: {"C:\\Program Files (x86)\\Steam",
                         "C:\\Program Files\\Steam"})
    {
      if (directory_exists (p))
        return fs::path (p);
    }
#endif

    return nullopt;
  }

  optional<fs::path> steam_library_manager::
  detect_steam_path_macos ()
  {
    if (const char* home = getenv ("HOME"))
    {
      fs::path p (fs::path (home) / "Library" / "Application Support" / "Steam");

      if (validate_library_path (p))
        return p;
    }

    return nullopt;
  }

  bool steam_library_manager::
  validate_library_path (const fs::path& p)
  {
    return directory_exists (p) && directory_exists (p / "steamapps");
  }

  vector<steam_library> steam_library_manager::
  parse_library_folders (const kv_node& root)
  {
    if (root.name != "libraryfolders")
      throw config_error ("invalid library folders file format: root key is '" +
                          root.name + "', expected 'libraryfolders'");

    vector<steam_library> r;

    // Each child is keyed by its index ("0", "1", ...) and is a block with
    // at least the path. Entries pointing to folders that are gone (for
    // example, unplugged external drives) are not libraries we can use.
    //
    for (const kv_node& c: root.children)
    {
      optional<string> p (c.get_string ("path"));

      if (!p || p->empty ())
        continue;

      fs::path lp (*p);

      if (!directory_exists (lp))
        continue;

      r.emplace_back (lp.make_preferred (), c.get_string ("label").value_or (""));
    }

    return r;
  }

  const vector<steam_library>& steam_library_manager::
  load_libraries ()
  {
    if (libraries_loaded_)
      return libraries_;

    const fs::path f (config_paths ().libraryfolders_vdf);

    error_code ec;
    if (!fs::is_regular_file (f, ec))
      throw config_error ("library folders file not found at " + f.string ());

    try
    {
      libraries_ = parse_library_folders (kv_parser::parse_file (f));
    }
    catch (const kv_parse_error&)
    {
      throw_with_nested (
        config_error ("failed to read library folders file " + f.string ()));
    }

    libraries_loaded_ = true;
    return libraries_;
  }

  optional<game_record> steam_library_manager::
  read_app_manifest (const fs::path& f)
  {
    kv_node m (kv_parser::parse_file (f));

    optional<string> id (m.get_string ("appid"));

    if (!id || id->empty ())
      return nullopt;

    uint32_t appid (0);
    const char* b (id->data ());
    const char* e (b + id->size ());

    auto [p, ec] = from_chars (b, e, appid);

    if (ec != errc () || p != e)
      return nullopt;

    optional<string> n (m.get_string ("name"));

    return game_record (appid,
                        n ? move (*n) : unknown_game_name (appid),
                        f);
  }

  vector<game_record> steam_library_manager::
  scan_library (const steam_library& lib, ostream& diag)
  {
    vector<game_record> r;

    fs::path sa (lib.path / "steamapps");

    if (!directory_exists (sa))
      return r;

    // Collect the appmanifest_*.acf files first so that we can visit them in
    // a stable order. Directory iteration order is up to the filesystem.
    //
    vector<fs::path> ms;
    {
      error_code ec;
      for (fs::directory_iterator i (sa, ec), e; !ec && i != e; i.increment (ec))
      {
        const fs::path& p (i->path ());
        string n (p.filename ().string ());

        if (n.size () > 16                     &&
            n.compare (0, 12, "appmanifest_") == 0 &&
            n.compare (n.size () - 4, 4, ".acf") == 0)
          ms.push_back (p);
      }

      if (ec)
      {
        diag << "warning: unable to list " << sa.string () << ": "
             << ec.message () << endl;
      }
    }

    sort (ms.begin (), ms.end (),
          [] (const fs::path& x, const fs::path& y)
          {
            return x.filename ().string () < y.filename ().string ();
          });

    for (const fs::path& m: ms)
    {
      try
      {
        if (optional<game_record> g = read_app_manifest (m))
          r.push_back (move (*g));
      }
      catch (const kv_parse_error& e)
      {
        diag << "warning: failed to read manifest file " << m.string ()
             << ": " << e.what () << endl;
      }
    }

    return r;
  }

  vector<game_record> steam_library_manager::
  load_games (ostream& diag)
  {
    vector<game_record> r;

    for (const steam_library& lib: load_libraries ())
    {
      vector<game_record> gs (scan_library (lib, diag));
      r.insert (r.end (),
                make_move_iterator (gs.begin ()),
                make_move_iterator (gs.end ()));
    }

    return r;
  }
}
