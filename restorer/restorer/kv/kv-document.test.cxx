#include <restorer/kv/kv-document.hxx>

#include <cassert>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

using namespace std;
using namespace restorer;

namespace fs = std::filesystem;

// Return true if parsing the string throws kv_parse_error.
//
static bool
rejects (const string& s)
{
  try
  {
    kv_parser::parse (s);
  }
  catch (const kv_parse_error&)
  {
    return true;
  }

  return false;
}

static void
test_basic ()
{
  // Scalar root.
  //
  {
    auto n (kv_parser::parse (R"("key" "value")"));

    assert (n.name == "key");
    assert (n.is_scalar ());
    assert (*n.value == "value");
  }

  // Nested.
  //
  {
    auto n (kv_parser::parse (R"(
      "root"
      {
        "child" "value"
        "inner"
        {
          "x" "1"
        }
      }
    )"));

    assert (n.name == "root");
    assert (!n.is_scalar ());
    assert (n.children.size () == 2);
    assert (n.get_string ("child") == "value");

    const kv_node* i (n.find ("inner"));
    assert (i != nullptr);
    assert (!i->is_scalar ());
    assert (i->get_string ("x") == "1");

    // A block is not a scalar, so get_string() gives nothing for it.
    //
    assert (!n.get_string ("inner"));
    assert (n.find ("missing") == nullptr);
  }

  // Bare tokens.
  //
  {
    auto n (kv_parser::parse ("AppState { appid 10 name Alpha }"));

    assert (n.name == "AppState");
    assert (n.get_string ("appid") == "10");
    assert (n.get_string ("name") == "Alpha");
  }
}

// Siblings may repeat and the first one wins for lookups.
//
static void
test_order ()
{
  auto n (kv_parser::parse (R"(
    "r"
    {
      "a" "1"
      "b" "2"
      "a" "3"
    }
  )"));

  assert (n.children.size () == 3);
  assert (n.children[0].name == "a");
  assert (n.children[1].name == "b");
  assert (n.children[2].name == "a");
  assert (*n.children[2].value == "3");
  assert (n.get_string ("a") == "1");
}

// Lookups ignore ASCII case while the stored names keep theirs.
//
static void
test_case ()
{
  auto n (kv_parser::parse (R"(
    "AppState"
    {
      "AppID"      "10"
      "common"
      {
        "ClientIcon" "abc123"
      }
    }
  )"));

  assert (n.get_string ("appid") == "10");
  assert (n.get_string ("APPID") == "10");
  assert (n.children[0].name == "AppID");

  const kv_node* c (n.find ("Common"));
  assert (c != nullptr);
  assert (c->get_string ("clienticon") == "abc123");

  assert (n.find ("appid0") == nullptr);
  assert (n.find ("app") == nullptr);
}

static void
test_escapes ()
{
  {
    auto n (kv_parser::parse (R"("r" { "path" "C:\\Program Files\\Steam" })"));
    assert (n.get_string ("path") == "C:\\Program Files\\Steam");
  }

  {
    auto n (kv_parser::parse (R"("r" { "t" "a\nb\tc\"d" })"));
    assert (n.get_string ("t") == "a\nb\tc\"d");
  }
}

static void
test_comments_conditionals ()
{
  auto n (kv_parser::parse (R"(
    // leading comment
    "r"
    {
      "a" "1" // trailing
      "b" "2" [$WIN32]
      "c" [$LINUX]
      {
        "d" "4"
      }
    }
  )"));

  assert (n.get_string ("a") == "1");
  assert (n.get_string ("b") == "2");
  assert (n.find ("c") != nullptr);
  assert (n.find ("c")->get_string ("d") == "4");
}

static void
test_errors ()
{
  // Unbalanced braces either way.
  //
  assert (rejects (R"("r" { "a" "1")"));
  assert (rejects (R"("r" { "a" "1" } })"));
  assert (rejects (R"("r" { "a" { "b" "2" })"));

  // Unterminated string.
  //
  assert (rejects (R"("r" { "a" "1 })"));

  // Missing value.
  //
  assert (rejects (R"("r" { "a" })"));

  // Empty input and comment-only input.
  //
  assert (rejects (""));
  assert (rejects ("   // nothing here\n"));

  // Check that the position makes it into the error.
  //
  try
  {
    kv_parser::parse ("\"r\"\n{\n  \"a\" \"1\"\n");
    assert (false);
  }
  catch (const kv_parse_error& e)
  {
    assert (e.line () == 4);
    assert (string (e.what ()).find ("line 4") != string::npos);
  }
}

static void
test_file ()
{
  fs::path d (fs::temp_directory_path () / "restorer-kv-test");
  fs::remove_all (d);
  fs::create_directories (d);

  fs::path f (d / "appmanifest_10.acf");
  {
    ofstream o (f);
    o << "\"AppState\"\n{\n\t\"appid\"\t\t\"10\"\n\t\"name\"\t\t\"Alpha\"\n}\n";
  }

  auto n (kv_parser::parse_file (f));
  assert (n.name == "AppState");
  assert (n.get_string ("appid") == "10");

  // Unreadable file.
  //
  try
  {
    kv_parser::parse_file (d / "missing.acf");
    assert (false);
  }
  catch (const kv_parse_error& e)
  {
    assert (string (e.what ()).find ("missing.acf") != string::npos);
  }

  // Stream interface.
  //
  istringstream is ("\"r\" { \"k\" \"v\" }");
  assert (kv_parser::parse_stream (is).get_string ("k") == "v");

  fs::remove_all (d);
}

int
main ()
{
  test_basic ();
  test_order ();
  test_case ();
  test_escapes ();
  test_comments_conditionals ();
  test_errors ();
  test_file ();
}
