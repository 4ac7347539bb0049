#include <restorer/restorer-prompt.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <ios>
#include <string>
#include <vector>
#include <cassert>
#include <sstream>

using namespace std;
using namespace restorer;

namespace asio = boost::asio;

static void
test_read_line ()
{
  istringstream is ("  /home/user/.steam/steam \r\n");
  ostringstream os;

  assert (read_line (is, os, "Path: ") == "/home/user/.steam/steam");
  assert (os.str () == "Path: ");

  // Closed input.
  //
  bool thrown (false);
  try
  {
    read_line (is, os, "Again: ");
  }
  catch (const ios_base::failure&)
  {
    thrown = true;
  }
  assert (thrown);
}

static void
test_confirm ()
{
  {
    istringstream is ("\n");
    ostringstream os;
    assert (confirm_action (is, os, "Use this path? (Y/n):", 'y'));
  }

  {
    istringstream is ("maybe\nN\n");
    ostringstream os;
    assert (!confirm_action (is, os, "Use this path? (Y/n):", 'y'));

    // Asked twice.
    //
    string o (os.str ());
    assert (o.find ("Use this path?") != o.rfind ("Use this path?"));
  }

  // No default: an empty answer is asked again.
  //
  {
    istringstream is ("\ny\n");
    ostringstream os;
    assert (confirm_action (is, os, "Continue?"));
  }
}

static void
test_console_prompter ()
{
  istringstream is ("12345\n ABCDE \n");
  ostringstream os, diag;
  console_prompter p (is, os, diag);

  string dc, ec;
  bool ok (false);

  asio::io_context ioc;
  asio::co_spawn (ioc,
                  [&] () -> asio::awaitable<void>
                  {
                    dc = co_await p.device_code (false);
                    ec = co_await p.email_code ("a***@example.com", true);
                    ok = co_await p.confirm_device ();
                  },
                  asio::detached);
  ioc.run ();

  assert (dc == "12345");
  assert (ec == "ABCDE");
  assert (ok);

  string o (os.str ());
  assert (o.find ("Enter 2FA code from your authenticator app: ") !=
          string::npos);
  assert (o.find ("Enter the code sent to a***@example.com: ") !=
          string::npos);
  assert (o.find ("confirm this login") != string::npos);
  assert (diag.str ().find ("previous code was incorrect") != string::npos);

  ostringstream qs;
  console_prompter q (is, qs, diag);
  q.show_challenge ("https://s.team/q/1/abc");

  string c (qs.str ());
  assert (c.find ("Challenge URL: https://s.team/q/1/abc") != string::npos);
  assert (c.find (render_qr ("https://s.team/q/1/abc")) != string::npos);
  assert (c.find ("Scan this QR code") < c.find ("Challenge URL:"));
}

static void
test_render_qr ()
{
  const string full ("\u2588");

  string r (render_qr ("https://s.team/q/1/0123456789"));

  vector<string> ls;
  for (size_t b (0), e; (e = r.find ('\n', b)) != string::npos; b = e + 1)
    ls.push_back (r.substr (b, e - b));

  // The quiet zone makes the first line solid. Each block character is
  // three bytes in UTF-8.
  //
  assert (!ls.empty ());
  const string& top (ls.front ());
  assert (top.size () % full.size () == 0);

  size_t n (top.size () / full.size ());
  assert (n >= 21 + 4); // At least a version 1 symbol.

  for (size_t i (0); i != n; ++i)
    assert (top.compare (i * full.size (), full.size (), full) == 0);

  // Two module rows per line.
  //
  assert (ls.size () == (n + 1) / 2);

  // The finder patterns show up as blank (dark) modules.
  //
  assert (ls[1].find (' ') != string::npos);

  // Deterministic.
  //
  assert (render_qr ("https://s.team/q/1/0123456789") == r);
}

int
main ()
{
  test_read_line ();
  test_confirm ();
  test_console_prompter ();
  test_render_qr ();
}
