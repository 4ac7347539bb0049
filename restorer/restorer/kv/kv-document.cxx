#include <restorer/kv/kv-document.hxx>

#include <cctype>
#include <fstream>
#include <sstream>

using namespace std;

namespace restorer
{
  // Nesting deeper than this is certainly not something Steam wrote.
  //
  static const size_t max_depth (128);

  kv_parse_error::
  kv_parse_error (const string& w, size_t l, size_t c)
    : runtime_error (l != 0
                     ? w + " at line " + std::to_string (l) + ", column " +
                       std::to_string (c)
                     : w),
      line_ (l),
      column_ (c)
  {
  }

  // ASCII case-insensitive comparison, which is what Steam does for keys.
  //
  static bool
  name_equal (const string& x, const string& y)
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  // kv_node
  //
  const kv_node* kv_node::
  find (const string& n) const
  {
    for (const kv_node& c: children)
    {
      if (name_equal (c.name, n))
        return &c;
    }

    return nullptr;
  }

  optional<string> kv_node::
  get_string (const string& n) const
  {
    const kv_node* c (find (n));

    if (c != nullptr && c->value)
      return c->value;

    return nullopt;
  }

  // kv_parser
  //
  void kv_parser::
  fail (const state& s, const string& m)
  {
    throw kv_parse_error (m, s.line, s.column);
  }

  void kv_parser::
  advance (state& s)
  {
    if (*s.cur == '\n')
    {
      ++s.line;
      s.column = 1;
    }
    else
      ++s.column;

    ++s.cur;
  }

  // Skip whitespace and // comments, both of which may appear between any
  // two tokens.
  //
  void kv_parser::
  skip_space (state& s)
  {
    while (s.cur < s.end)
    {
      char c (*s.cur);

      if (isspace (static_cast<unsigned char> (c)))
      {
        advance (s);
        continue;
      }

      if (c == '/' && s.cur + 1 < s.end && s.cur[1] == '/')
      {
        while (s.cur < s.end && *s.cur != '\n')
          advance (s);

        continue;
      }

      break;
    }
  }

  char kv_parser::
  peek (state& s)
  {
    skip_space (s);
    return s.cur < s.end ? *s.cur : '\0';
  }

  // Parse a quoted or bare token.
  //
  string kv_parser::
  parse_token (state& s)
  {
    char c (peek (s));

    if (c == '\0')
      fail (s, "unexpected end of input");

    if (c == '{' || c == '}')
      fail (s, string ("unexpected '") + c + "'");

    string r;

    if (c == '"')
    {
      advance (s);

      for (;;)
      {
        if (s.cur == s.end)
          fail (s, "unterminated string");

        c = *s.cur;

        if (c == '"')
        {
          advance (s);
          break;
        }

        if (c == '\\' && s.cur + 1 < s.end)
        {
          advance (s);

          switch (char e = *s.cur)
          {
          case 'n':  r += '\n'; break;
          case 't':  r += '\t'; break;
          case 'r':  r += '\r'; break;
          case '\\': r += '\\'; break;
          case '"':  r += '"';  break;
          default:   r += '\\'; r += e; break;
          }

          advance (s);
          continue;
        }

        r += c;
        advance (s);
      }
    }
    else
    {
      while (s.cur < s.end)
      {
        c = *s.cur;

        if (isspace (static_cast<unsigned char> (c)) ||
            c == '{' || c == '}' || c == '"')
          break;

        r += c;
        advance (s);
      }
    }

    return r;
  }

  // Platform conditionals like [$WIN32] may follow a value or a block
  // opening key. We don't evaluate them.
  //
  void kv_parser::
  skip_conditional (state& s)
  {
    if (peek (s) != '[')
      return;

    while (s.cur < s.end && *s.cur != ']' && *s.cur != '\n')
      advance (s);

    if (s.cur == s.end || *s.cur != ']')
      fail (s, "unterminated conditional");

    advance (s);
  }

  kv_node kv_parser::
  parse_pair (state& s, size_t depth)
  {
    if (depth > max_depth)
      fail (s, "nesting too deep");

    kv_node n (parse_token (s));
    skip_conditional (s);

    char c (peek (s));

    if (c == '{')
    {
      advance (s);
      parse_block (s, n, depth + 1);
    }
    else if (c == '}' || c == '\0')
      fail (s, "missing value for key '" + n.name + "'");
    else
    {
      n.value = parse_token (s);
      skip_conditional (s);
    }

    return n;
  }

  // Parse pairs until the closing brace, which is consumed.
  //
  void kv_parser::
  parse_block (state& s, kv_node& n, size_t depth)
  {
    for (;;)
    {
      char c (peek (s));

      if (c == '\0')
        fail (s, "unbalanced braces: expected '}' to close '" + n.name + "'");

      if (c == '}')
      {
        advance (s);
        return;
      }

      n.children.push_back (parse_pair (s, depth));
    }
  }

  kv_node kv_parser::
  parse (const string& str)
  {
    state s (str);

    if (peek (s) == '\0')
      fail (s, "empty document");

    kv_node r (parse_pair (s, 0));

    // A stray closing brace here means the braces don't balance. Anything
    // else after the root is equally not ours to guess about.
    //
    if (char c = peek (s); c != '\0')
    {
      if (c == '}')
        fail (s, "unbalanced braces: unexpected '}'");
      else
        fail (s, "unexpected data after root key '" + r.name + "'");
    }

    return r;
  }

  kv_node kv_parser::
  parse_stream (istream& is)
  {
    ostringstream os;
    os << is.rdbuf ();

    if (is.bad ())
      throw kv_parse_error ("unable to read input");

    return parse (os.str ());
  }

  kv_node kv_parser::
  parse_file (const fs::path& f)
  {
    ifstream ifs (f, ios::binary);

    if (!ifs)
      throw kv_parse_error ("unable to open " + f.string ());

    try
    {
      return parse_stream (ifs);
    }
    catch (const kv_parse_error& e)
    {
      throw kv_parse_error (f.string () + ": " + e.what ());
    }
  }
}
