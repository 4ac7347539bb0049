#include <restorer/steam/steam-connection.hxx>

#include <string>
#include <thread>
#include <vector>
#include <cassert>
#include <sstream>

using namespace std;
using namespace restorer;

// Record the lifecycle events in the order they are dispatched.
//
struct recorder
{
  vector<string> events;
  vector<subscription> subs;

  explicit
  recorder (callback_manager& m)
  {
    subs.push_back (m.subscribe<connected_event> (
                      [this] (const connected_event&)
                      {
                        events.push_back ("connected");
                      }));

    subs.push_back (m.subscribe<logged_off_event> (
                      [this] (const logged_off_event& e)
                      {
                        events.push_back ("logged_off:" + to_string (e.result));
                      }));

    subs.push_back (m.subscribe<disconnected_event> (
                      [this] (const disconnected_event& e)
                      {
                        events.push_back (e.user_initiated
                                          ? "disconnected:user"
                                          : "disconnected:dropped");
                      }));
  }
};

static void
test_lifecycle ()
{
  ostringstream diag;
  callback_manager m (diag);
  recorder r (m);
  connection_tracker t (m);

  assert (!t.online ());

  t.begin ();
  t.established ();
  assert (t.online ());

  t.request_disconnect ();
  t.closed ();
  assert (!t.online ());

  m.run_callbacks ();
  assert ((r.events == vector<string> {"connected", "disconnected:user"}));
}

// A connection that fails before the caller even gets control back must
// still produce the disconnected event.
//
static void
test_immediate_failure ()
{
  ostringstream diag;
  callback_manager m (diag);
  recorder r (m);
  connection_tracker t (m);

  t.begin ();
  jthread ([&t] () {t.closed ();}).join ();

  // Late notifications for the same attempt are dropped.
  //
  t.established ();
  t.closed ();

  m.run_callbacks ();
  assert ((r.events == vector<string> {"disconnected:dropped"}));
}

static void
test_logoff ()
{
  ostringstream diag;
  callback_manager m (diag);
  recorder r (m);
  connection_tracker t (m);

  t.begin ();
  t.established ();
  t.request_logoff ();
  t.closed ();

  m.run_callbacks ();
  assert ((r.events == vector<string> {"connected",
                                       "logged_off:OK",
                                       "disconnected:user"}));

  // The next attempt starts clean.
  //
  r.events.clear ();
  t.begin ();
  t.closed ();

  m.run_callbacks ();
  assert ((r.events == vector<string> {"disconnected:dropped"}));
}

int
main ()
{
  test_lifecycle ();
  test_immediate_failure ();
  test_logoff ();
}
