#include <restorer/restorer-prompt.hxx>

#include <memory>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <qrencode.h>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <termios.h>
#endif

using namespace std;

namespace restorer
{
  static string
  trim (const string& s)
  {
    const char* ws (" \t\r\n");

    size_t b (s.find_first_not_of (ws));
    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (ws));
    return s.substr (b, e - b + 1);
  }

  string
  read_line (istream& is, ostream& os, const string& prompt)
  {
    os << prompt << flush;

    string l;
    if (!getline (is, l))
    {
      // Force a newline out so that whatever comes next doesn't end up on
      // the prompt line.
      //
      os << endl;
      throw ios_base::failure ("unable to read answer from stdin");
    }

    return trim (l);
  }

  bool
  confirm_action (istream& is, ostream& os, const string& prompt, char def)
  {
    string a;
    do
    {
      a = read_line (is, os, prompt + ' ');

      if (a.empty () && def != '\0')
        a = def;
    }
    while (a != "y" && a != "Y" && a != "n" && a != "N");

    return a == "y" || a == "Y";
  }

  // Disable terminal echo for the lifetime of the object.
  //
  namespace
  {
    class echo_guard
    {
    public:
      echo_guard ()
      {
#ifdef _WIN32
        h_ = GetStdHandle (STD_INPUT_HANDLE);
        active_ = h_ != INVALID_HANDLE_VALUE && GetConsoleMode (h_, &mode_) &&
                  SetConsoleMode (h_, mode_ & ~ENABLE_ECHO_INPUT);
#else
        active_ = isatty (STDIN_FILENO) && tcgetattr (STDIN_FILENO, &mode_) == 0;

        if (active_)
        {
          termios t (mode_);
          t.c_lflag &= ~ECHO;
          active_ = tcsetattr (STDIN_FILENO, TCSAFLUSH, &t) == 0;
        }
#endif
      }

      ~echo_guard ()
      {
        if (!active_)
          return;

#ifdef _WIN32
        SetConsoleMode (h_, mode_);
#else
        tcsetattr (STDIN_FILENO, TCSAFLUSH, &mode_);
#endif
      }

      echo_guard (const echo_guard&) = delete;
      echo_guard& operator= (const echo_guard&) = delete;

      bool
      active () const {return active_;}

    private:
      bool active_ = false;
#ifdef _WIN32
      HANDLE h_;
      DWORD mode_ = 0;
#else
      termios mode_ {};
#endif
    };
  }

  string
  read_password (ostream& os, const string& prompt)
  {
    string r;
    {
      echo_guard g;

      // Don't trim: leading/trailing spaces can be part of a password.
      //
      os << prompt << flush;

      if (!getline (cin, r))
      {
        os << endl;
        throw ios_base::failure ("unable to read password from stdin");
      }

      if (!r.empty () && r.back () == '\r')
        r.pop_back ();

      // The newline the user typed was not echoed.
      //
      if (g.active ())
        os << endl;
    }

    return r;
  }

  // console_prompter
  //
  asio::awaitable<string> console_prompter::
  device_code (bool previous_incorrect)
  {
    if (previous_incorrect)
      diag_ << "error: the previous code was incorrect" << endl;

    co_return read_line (in_, out_,
                         "Enter 2FA code from your authenticator app: ");
  }

  asio::awaitable<string> console_prompter::
  email_code (const string& email, bool previous_incorrect)
  {
    if (previous_incorrect)
      diag_ << "error: the previous code was incorrect" << endl;

    co_return read_line (in_, out_,
                         "Enter the code sent to " +
                         (email.empty () ? string ("your email") : email) +
                         ": ");
  }

  asio::awaitable<bool> console_prompter::
  confirm_device ()
  {
    out_ << "Please confirm this login in your Steam Mobile App..." << endl;
    co_return true;
  }

  string
  render_qr (const string& text)
  {
    unique_ptr<QRcode, decltype (&QRcode_free)> q (
      QRcode_encodeString (text.c_str (), 0, QR_ECLEVEL_L, QR_MODE_8, 1),
      QRcode_free);

    if (q == nullptr)
      throw runtime_error (string ("unable to encode QR code: ") +
                           strerror (errno));

    const int quiet (2);
    const int w (q->width);
    const int n (w + 2 * quiet);

    // Bit 0 of each module byte is set for dark modules.
    //
    auto dark = [&q, w, quiet] (int x, int y)
    {
      x -= quiet;
      y -= quiet;

      return x >= 0 && y >= 0 && x < w && y < w &&
             (q->data[y * w + x] & 1) != 0;
    };

    string r;
    for (int y (0); y < n; y += 2)
    {
      for (int x (0); x != n; ++x)
      {
        bool t (!dark (x, y));
        bool b (y + 1 < n && !dark (x, y + 1));

        r += t && b ? "\u2588" : t ? "\u2580" : b ? "\u2584" : " ";
      }

      r += '\n';
    }

    return r;
  }

  void console_prompter::
  show_challenge (const string& url)
  {
    out_ << "Scan this QR code with the Steam Mobile App:" << endl
         << endl;

    try
    {
      out_ << render_qr (url);
    }
    catch (const runtime_error& e)
    {
      diag_ << "warning: " << e.what () << endl;
    }

    out_ << endl
         << "Challenge URL: " << url << endl
         << endl
         << "If the code doesn't scan, open the URL on a device signed in to "
         << "the Steam" << endl
         << "Mobile App." << endl
         << endl;
  }
}
