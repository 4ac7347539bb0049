#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <iostream>
#include <exception>
#include <stdexcept>
#include <filesystem>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <restorer/auth/auth-flow.hxx>
#include <restorer/icon/icon-resolver.hxx>
#include <restorer/steam/steam-cm-client.hxx>
#include <restorer/steam/steam-library.hxx>

#include <restorer/restorer-http.hxx>
#include <restorer/restorer-icons.hxx>
#include <restorer/restorer-shell.hxx>
#include <restorer/restorer-prompt.hxx>
#include <restorer/restorer-options.hxx>
#include <restorer/restorer-session.hxx>

#include <restorer/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace restorer
{
  // Everything derived from the command line (or the interactive prompts)
  // that the run needs.
  //
  struct runtime_context
  {
    fs::path         install_location;
    bool             use_qr_code = false;
    string           username;
    string           password;
    chrono::seconds  steam_timeout {30};
    chrono::seconds  metadata_timeout {10};
    chrono::seconds  download_timeout {30};
    bool             shell_refresh = true;
    bool             verbose = false;
  };

  static void
  print_header (ostream& o)
  {
    const string rule (40, '=');

    o << endl
      << rule << endl
      << "     Steam Icon Restorer v" << RESTORER_VERSION_ID << endl
      << rule << endl
      << endl;
  }

  // Print the error and, in the verbose mode, the chain of nested causes.
  //
  static void
  print_error (const exception& e, bool verbose, bool cause = false)
  {
    if (!cause)
      cerr << "error: " << e.what () << endl;
    else
      cerr << "  info: caused by: " << e.what () << endl;

    if (!verbose)
      return;

    try
    {
      rethrow_if_nested (e);
    }
    catch (const exception& n)
    {
      print_error (n, verbose, true);
    }
  }

  static void
  validate_install_location (const fs::path& p)
  {
    error_code ec;
    if (p.empty () || !fs::is_directory (p, ec))
      throw config_error ("Steam installation path does not exist: '" +
                          p.string () + "'");
  }

  // Fill the settings shared by both modes.
  //
  static void
  apply_options (const options& o, runtime_context& c)
  {
    c.verbose = o.verbose ();
    c.shell_refresh = !o.no_shell_refresh ();

    if (o.metadata_timeout () == 0)
      throw config_error ("--metadata-timeout must be greater than zero");

    if (o.download_timeout () == 0)
      throw config_error ("--download-timeout must be greater than zero");

    if (o.steam_timeout () == 0)
      throw config_error ("--steam-timeout must be greater than zero");

    c.metadata_timeout = chrono::seconds (o.metadata_timeout ());
    c.download_timeout = chrono::seconds (o.download_timeout ());
    c.steam_timeout = chrono::seconds (o.steam_timeout ());
  }

  static runtime_context
  command_line_context (const options& o)
  {
    runtime_context c;
    apply_options (o, c);

    if (o.steam_install_path_specified ())
      c.install_location = o.steam_install_path ();
    else
    {
      cout << "Steam installation path not specified. "
           << "Attempting auto-detection..." << endl;

      optional<fs::path> p (steam_library_manager::detect_steam_path ());

      if (!p)
        throw config_error ("could not auto-detect Steam installation path, "
                            "specify it with --steam-install-path");

      cout << "Found Steam at: " << p->string () << endl;
      c.install_location = move (*p);
    }

    validate_install_location (c.install_location);

    c.use_qr_code = o.use_qr_code ();
    c.username = o.username ();
    c.password = o.password ();

    if (!c.use_qr_code && (c.username.empty () || c.password.empty ()))
      throw config_error (
        "username and password are required when not using QR code "
        "authentication (use --use-qr-code, or specify --username and "
        "--password)");

    return c;
  }

  static runtime_context
  interactive_context (const options& o)
  {
    runtime_context c;
    apply_options (o, c);

    cout << "Running in interactive mode..." << endl << endl;

    optional<fs::path> d (steam_library_manager::detect_steam_path ());

    if (d)
    {
      cout << "Detected Steam installation at: " << d->string () << endl;

      if (confirm_action (cin, cout, "Use this path? (Y/n):", 'y'))
        c.install_location = *d;
      else
        c.install_location =
          read_line (cin, cout, "Enter Steam installation path: ");
    }
    else
    {
      cout << "Could not auto-detect Steam installation." << endl;
      c.install_location =
        read_line (cin, cout, "Enter Steam installation path: ");
    }

    validate_install_location (c.install_location);

    cout << endl
         << "Authentication Methods:" << endl
         << "  1. QR Code" << endl
         << "  2. Username & Password" << endl;

    string m (read_line (cin, cout, "Choose method (1 or 2): "));
    c.use_qr_code = m != "2";

    if (!c.use_qr_code)
    {
      c.username = read_line (cin, cout, "Username: ");
      c.password = read_password (cout, "Password: ");

      if (c.username.empty () || c.password.empty ())
        throw config_error ("username and password are required");
    }

    cout << endl << "Starting icon restoration process..." << endl << endl;
    return c;
  }

  static int
  execute (const runtime_context& ctx)
  {
    // Read the library folders before connecting anywhere: a broken Steam
    // installation is fatal and there is no reason to bother the user with
    // authentication first.
    //
    steam_library_manager libraries (ctx.install_location);
    libraries.load_libraries ();

    console_prompter prompter (cin, cout, cerr);
    unique_ptr<auth_flow> flow;

    if (ctx.use_qr_code)
      flow = make_unique<qr_auth_flow> (prompter, cout);
    else
      flow = make_unique<credentials_auth_flow> (ctx.username,
                                                 ctx.password,
                                                 prompter,
                                                 cout);

    asio::io_context ioc;

    cm_client_options co;
    co.request_timeout = ctx.steam_timeout;
    co.verbose = ctx.verbose;

    cm_client client (ioc, cerr, move (co));

    http_client_options ho;
    ho.timeout = ctx.download_timeout;
    ho.user_agent = "steam-icon-restorer/" RESTORER_VERSION_ID;

    http_coordinator http (ioc, move (ho));

    icon_resolver resolver (ioc, client, cout, ctx.metadata_timeout);
    icon_restorer icons (resolver,
                         [&http] (const string& u) {return http.get (u);},
                         libraries.config_paths ().icons,
                         cout,
                         cerr);

    session_coordinator session (ioc, client, *flow, cout, cerr);

    restore_summary summary;
    exception_ptr error;

    asio::co_spawn (
      ioc,
      session.run (
        [&libraries, &icons, &summary] (stop_token st) -> asio::awaitable<void>
        {
          cout << endl << "Discovering installed games..." << endl;

          vector<game_record> games (libraries.load_games (cerr));

          cout << "Found " << games.size () << " installed games." << endl
               << endl;

          summary = co_await icons.restore_all (games, move (st));
        }),
      [&error, &ioc] (exception_ptr e)
      {
        error = e;
        ioc.stop ();
      });

    ioc.run ();

    if (error)
      rethrow_exception (error);

    print_summary (cout, summary);

    if (summary.successful != 0 && ctx.shell_refresh && shell_refresh_supported ())
      refresh_shell (cout, cerr);

    cout << "Done!" << endl;
    return 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace restorer;

  bool verbose (false);

  try
  {
    // No arguments at all means interactive mode.
    //
    bool bare (argc == 1);

    options opt (argc, argv);
    verbose = opt.verbose ();

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "Steam Icon Restorer " << RESTORER_VERSION_ID << endl;
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: restorer [options]" << "\n"
        << "options:"                  << "\n";

      opt.print_usage (o);
      return 0;
    }

    print_header (cout);

    runtime_context ctx (opt.interactive () || bare
                         ? interactive_context (opt)
                         : command_line_context (opt));

    return execute (ctx);
  }
  catch (const cli::exception& e)
  {
    cerr << "error: " << e << endl;
    return 1;
  }
  catch (const exception& e)
  {
    print_error (e, verbose);
    return 1;
  }
}
