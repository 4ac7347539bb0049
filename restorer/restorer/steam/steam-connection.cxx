#include <restorer/steam/steam-connection.hxx>

using namespace std;

namespace restorer
{
  void connection_tracker::
  begin ()
  {
    disconnect_requested_ = false;
    logoff_requested_ = false;
    online_ = true;
  }

  void connection_tracker::
  established ()
  {
    if (online_)
      callbacks_.post (connected_event {});
  }

  void connection_tracker::
  closed ()
  {
    if (!online_.exchange (false))
      return;

    // Logging off is done by dropping the connection so the logoff is only
    // confirmed when it goes away.
    //
    bool u (disconnect_requested_ || logoff_requested_);

    if (logoff_requested_)
      callbacks_.post (logged_off_event {eresult::ok});

    callbacks_.post (disconnected_event {u});
  }
}
