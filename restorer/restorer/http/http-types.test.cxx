#include <restorer/http/http-types.hxx>

#include <string>
#include <cassert>
#include <stdexcept>

using namespace std;
using namespace restorer;

static void
test_parse ()
{
  {
    url_parts u (parse_url ("https://cdn.example.com/a/b.ico?x=1#frag"));
    assert (u.scheme == "https");
    assert (u.host == "cdn.example.com");
    assert (u.port == "443");
    assert (u.target == "/a/b.ico?x=1");
    assert (u.secure ());
    assert (u.str () == "https://cdn.example.com/a/b.ico?x=1");
  }

  {
    url_parts u (parse_url ("HTTP://localhost:8080"));
    assert (u.scheme == "http");
    assert (u.host == "localhost");
    assert (u.port == "8080");
    assert (u.target == "/");
    assert (!u.secure ());
    assert (u.str () == "http://localhost:8080/");
  }

  auto bad = [] (const string& s)
  {
    try
    {
      parse_url (s);
      return false;
    }
    catch (const invalid_argument&)
    {
      return true;
    }
  };

  assert (bad ("cdn.example.com/a"));
  assert (bad ("ftp://example.com/a"));
  assert (bad ("https:///a"));
  assert (bad ("https://example.com:/a"));
}

static void
test_location ()
{
  url_parts b (parse_url ("https://a.example.com/dir/file.ico?q=1"));

  assert (resolve_location (b, "http://b.example.com/x").str () ==
          "http://b.example.com/x");
  assert (resolve_location (b, "//c.example.com/y").str () ==
          "https://c.example.com/y");
  assert (resolve_location (b, "/root.ico").str () ==
          "https://a.example.com/root.ico");
  assert (resolve_location (b, "other.ico").str () ==
          "https://a.example.com/dir/other.ico");
}

static void
test_response ()
{
  http_response r;
  r.status = 302;
  r.headers.push_back ({"Content-Type", "text/html"});
  r.headers.push_back ({"location", "/moved"});

  assert (r.redirection ());
  assert (!r.successful ());
  assert (r.header ("Location") == "/moved");
  assert (r.header ("CONTENT-TYPE") == "text/html");
  assert (!r.header ("Content-Length"));

  r.status = 204;
  assert (r.successful ());

  http_error e (404, "HTTP 404 Not Found");
  assert (e.status () == 404);
  assert (string (e.what ()) == "HTTP 404 Not Found");
}

int
main ()
{
  test_parse ();
  test_location ();
  test_response ();
}
