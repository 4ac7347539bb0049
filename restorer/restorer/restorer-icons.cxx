#include <restorer/restorer-icons.hxx>

#include <fstream>
#include <utility>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace restorer
{
  string
  icon_url (uint32_t appid, const string& t)
  {
    return "https://cdn.cloudflare.steamstatic.com/steamcommunity/public/"
           "images/apps/" + std::to_string (appid) + '/' + t + ".ico";
  }

  bool
  valid_icon_token (const string& t)
  {
    if (t.empty () || t.size () > 128)
      return false;

    for (char c: t)
    {
      if (!((c >= '0' && c <= '9') ||
            (c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            c == '_' || c == '-'))
        return false;
    }

    return true;
  }

  void
  print_summary (ostream& o, const restore_summary& s)
  {
    const string rule (60, '=');

    o << endl
      << rule << endl
      << "Icon restoration complete:" << endl
      << "  Successful: " << s.successful << endl
      << "  Failed/Skipped: " << s.failed << endl
      << "  Total: " << s.total << endl
      << rule << endl;
  }

  icon_restorer::
  icon_restorer (icon_resolver& r,
                 fetch_function f,
                 fs::path d,
                 ostream& o,
                 ostream& e)
    : resolver_ (r),
      fetch_ (move (f)),
      icons_ (move (d)),
      out_ (o),
      diag_ (e)
  {
  }

  fs::path icon_restorer::
  store (const string& t, const string& data) const
  {
    error_code ec;
    fs::create_directories (icons_, ec);

    if (ec)
      throw runtime_error ("unable to create " + icons_.string () + ": " +
                           ec.message ());

    fs::path p (icons_ / (t + ".ico"));

    ofstream ofs (p, ios::binary | ios::trunc);
    if (!ofs)
      throw runtime_error ("unable to open " + p.string () + " for writing");

    ofs.write (data.data (), static_cast<streamsize> (data.size ()));
    ofs.close ();

    if (!ofs)
      throw runtime_error ("unable to write " + p.string ());

    return p;
  }

  asio::awaitable<icon_outcome> icon_restorer::
  restore (const game_record& g)
  {
    icon_outcome r;
    r.appid = g.appid;

    // The client may refuse the request outright (not connected, etc).
    //
    optional<string> t;
    try
    {
      t = co_await resolver_.resolve (g.appid);
    }
    catch (const exception& e)
    {
      r.message = "failed to request product info for AppID " +
                  std::to_string (g.appid) + ": " + e.what ();
      r.failure = "metadata error";
      co_return r;
    }

    if (!t)
    {
      r.status = icon_status::skipped;
      co_return r;
    }

    if (!valid_icon_token (*t))
    {
      r.message = "invalid icon token '" + *t + "'";
      co_return r;
    }

    // Fetch first so that a failed download doesn't leave anything behind.
    //
    string data;
    try
    {
      data = co_await fetch_ (icon_url (g.appid, *t));
    }
    catch (const exception& e)
    {
      r.message = "failed to download icon for AppID " +
                  std::to_string (g.appid) + ": " + e.what ();
      co_return r;
    }

    try
    {
      r.file = store (*t, data);
      r.status = icon_status::ok;
    }
    catch (const exception& e)
    {
      r.message = "failed to save icon for AppID " +
                  std::to_string (g.appid) + ": " + e.what ();
    }

    co_return r;
  }

  asio::awaitable<restore_summary> icon_restorer::
  restore_all (const vector<game_record>& gs, stop_token st)
  {
    restore_summary s;

    const size_t n (gs.size ());
    size_t i (0);

    for (const game_record& g: gs)
    {
      if (st.stop_requested ())
      {
        diag_ << "warning: connection to Steam lost, stopping after "
              << i << " of " << n << " games" << endl;
        break;
      }

      ++i;
      out_ << '[' << i << '/' << n << "] " << g.name
           << " (AppID: " << g.appid << ")... " << flush;

      icon_outcome r (co_await restore (g));

      switch (r.status)
      {
      case icon_status::ok:
        {
          out_ << "[OK]" << endl;
          ++s.successful;
          break;
        }
      case icon_status::failed:
        {
          out_ << "[FAILED - " << r.failure << ']' << endl;
          ++s.failed;
          break;
        }
      case icon_status::skipped:
        {
          out_ << "[SKIPPED - no icon available]" << endl;
          ++s.failed;
          break;
        }
      }

      if (r.message)
        diag_ << "warning: " << *r.message << endl;

      ++s.total;
      s.outcomes.push_back (move (r));
    }

    co_return s;
  }
}
