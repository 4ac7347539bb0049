#pragma once

#include <ostream>

namespace restorer
{
  // Return true if the desktop shell can be refreshed on this platform
  // (currently only Windows, where Explorer caches shortcut icons).
  //
  bool
  shell_refresh_supported () noexcept;

  // Restart the desktop shell so that it picks up the new icons. Return
  // false (after printing a warning) if that didn't work out; this is never
  // fatal.
  //
  bool
  refresh_shell (std::ostream& out, std::ostream& diag);
}
