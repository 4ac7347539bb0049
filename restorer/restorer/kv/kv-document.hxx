#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <filesystem>

namespace restorer
{
  namespace fs = std::filesystem;

  // KeyValues parse error.
  //
  // Carries the position (1-based) where the parser gave up. For errors that
  // are not tied to a position (e.g., unreadable file), both are 0.
  //
  class kv_parse_error: public std::runtime_error
  {
  public:
    kv_parse_error (const std::string& what,
                    std::size_t line = 0,
                    std::size_t column = 0);

    std::size_t
    line () const noexcept {return line_;}

    std::size_t
    column () const noexcept {return column_;}

  private:
    std::size_t line_;
    std::size_t column_;
  };

  // Node in the KeyValues tree.
  //
  // A node either carries a scalar value or a (possibly empty) list of child
  // nodes. Children keep the order in which they appear in the source and
  // may repeat the same name.
  //
  struct kv_node
  {
    std::string name;
    std::optional<std::string> value;
    std::vector<kv_node> children;

    kv_node () = default;

    explicit
    kv_node (std::string n): name (std::move (n)) {}

    kv_node (std::string n, std::string v)
      : name (std::move (n)), value (std::move (v)) {}

    bool
    is_scalar () const noexcept {return value.has_value ();}

    // Return the first child with the specified name or NULL if there is
    // none. Names are compared ASCII case-insensitively (Steam writes both
    // "AppState" and "appstate", for example).
    //
    const kv_node*
    find (const std::string& name) const;

    // Return the value of the first child with the specified name if that
    // child exists and is a scalar.
    //
    std::optional<std::string>
    get_string (const std::string& name) const;
  };

  // Parser for the Valve KeyValues text format (.vdf, .acf).
  //
  // The document is a single root pair. The returned node is that root,
  // named after the root key.
  //
  class kv_parser
  {
  public:
    static kv_node
    parse (const std::string&);

    static kv_node
    parse_stream (std::istream&);

    static kv_node
    parse_file (const fs::path&);

  private:
    struct state
    {
      const char* cur;
      const char* end;
      std::size_t line;
      std::size_t column;

      explicit
      state (const std::string& s)
        : cur (s.data ()), end (s.data () + s.size ()), line (1), column (1) {}
    };

    static void
    skip_space (state&);

    static char
    peek (state&);

    static void
    advance (state&);

    static std::string
    parse_token (state&);

    static void
    skip_conditional (state&);

    static kv_node
    parse_pair (state&, std::size_t depth);

    static void
    parse_block (state&, kv_node&, std::size_t depth);

    [[noreturn]] static void
    fail (const state&, const std::string&);
  };
}
