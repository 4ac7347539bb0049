#include <restorer/restorer-shell.hxx>

#ifdef _WIN32
#  include <chrono>
#  include <system_error>

#  include <boost/process.hpp>
#endif

using namespace std;

namespace restorer
{
  bool
  shell_refresh_supported () noexcept
  {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
  }

#ifdef _WIN32
  bool
  refresh_shell (ostream& out, ostream& diag)
  {
    namespace bp = boost::process;

    out << "Restarting Windows Explorer to refresh icons..." << endl;

    try
    {
      // Explorer is not our child so go through taskkill. A non-zero exit
      // (not running) is fine; we start it anyway.
      //
      bp::child k (bp::search_path ("taskkill"),
                   "/f", "/im", "explorer.exe",
                   bp::std_out > bp::null,
                   bp::std_err > bp::null);

      error_code ec;
      if (!k.wait_for (chrono::seconds (5), ec))
        k.terminate (ec);

      bp::child e (bp::search_path ("explorer"));
      e.detach ();

      out << "Explorer restarted successfully." << endl;
      return true;
    }
    catch (const exception& e)
    {
      diag << "warning: failed to restart Explorer: " << e.what () << endl
           << "  info: you may need to restart Explorer manually for icons "
           << "to refresh" << endl;
      return false;
    }
  }
#else
  bool
  refresh_shell (ostream&, ostream& diag)
  {
    diag << "warning: shell refresh is not supported on this platform"
         << endl;
    return false;
  }
#endif
}
