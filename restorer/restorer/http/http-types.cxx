#include <restorer/http/http-types.hxx>

#include <cctype>
#include <algorithm>

using namespace std;

namespace restorer
{
  static string
  lower (string s)
  {
    transform (s.begin (), s.end (), s.begin (),
               [] (unsigned char c) {return static_cast<char> (tolower (c));});
    return s;
  }

  string url_parts::
  str () const
  {
    string r (scheme + "://" + host);

    if (port != (secure () ? "443" : "80"))
      r += ':' + port;

    return r + target;
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;

    size_t p (url.find ("://"));
    if (p == string::npos)
      throw invalid_argument ("invalid URL '" + url + "': no scheme");

    r.scheme = lower (url.substr (0, p));

    if (r.scheme != "http" && r.scheme != "https")
      throw invalid_argument ("invalid URL '" + url + "': unsupported scheme");

    p += 3;

    // The authority ends at the start of the path or query.
    //
    size_t e (url.find_first_of ("/?#", p));
    if (e == string::npos)
      e = url.size ();

    string a (url.substr (p, e - p));
    size_t c (a.rfind (':'));

    if (c != string::npos)
    {
      r.host = a.substr (0, c);
      r.port = a.substr (c + 1);
    }
    else
    {
      r.host = a;
      r.port = r.secure () ? "443" : "80";
    }

    if (r.host.empty () || r.port.empty ())
      throw invalid_argument ("invalid URL '" + url + "': no host");

    // Drop the fragment; it is never sent.
    //
    string t (url.substr (e));
    if (size_t f = t.find ('#'); f != string::npos)
      t.resize (f);

    if (t.empty () || t[0] != '/')
      t.insert (0, 1, '/');

    r.target = move (t);
    return r;
  }

  url_parts
  resolve_location (const url_parts& b, const string& l)
  {
    if (l.find ("://") != string::npos)
      return parse_url (l);

    if (l.compare (0, 2, "//") == 0)
      return parse_url (b.scheme + ":" + l);

    url_parts r (b);

    if (!l.empty () && l[0] == '/')
      r.target = l;
    else
    {
      // Relative to the directory of the current target.
      //
      string d (b.target.substr (0, b.target.find ('?')));
      d.resize (d.rfind ('/') + 1);
      r.target = d + l;
    }

    return r;
  }

  optional<string> http_response::
  header (const string& n) const
  {
    string ln (lower (n));

    for (const http_header& h: headers)
    {
      if (lower (h.name) == ln)
        return h.value;
    }

    return nullopt;
  }
}
