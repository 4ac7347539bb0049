#pragma once

#include <restorer/steam/steam-client.hxx>

#include <boost/asio/awaitable.hpp>

#include <string>
#include <istream>
#include <ostream>

namespace restorer
{
  namespace asio = boost::asio;

  // Print the prompt and read a line, trimming surrounding whitespace.
  // Throw std::ios_base::failure if nothing can be read (closed stdin).
  //
  std::string
  read_line (std::istream&, std::ostream&, const std::string& prompt);

  // Prompt the user for a Yes/No answer.
  //
  // An empty answer selects the default, if any. Anything but y/n
  // (case-insensitive) is asked again.
  //
  bool
  confirm_action (std::istream&,
                  std::ostream&,
                  const std::string& prompt,
                  char def = '\0');

  // Read a password from the terminal with echo disabled. If stdin is not a
  // terminal, read a plain line.
  //
  std::string
  read_password (std::ostream&, const std::string& prompt);

  // Render the text as a QR code for the terminal.
  //
  // Two module rows per line using the Unicode half blocks, light modules
  // drawn and dark ones left blank (so it scans on the usual dark terminal
  // background), with a quiet zone around it. Throw std::runtime_error if
  // the text can't be encoded.
  //
  std::string
  render_qr (const std::string& text);

  // Interactive authenticator on the console.
  //
  // The answers are read synchronously: nothing else needs to happen on the
  // io_context while we are waiting for the user.
  //
  class console_prompter: public auth_prompter
  {
  public:
    console_prompter (std::istream& in, std::ostream& out, std::ostream& diag)
      : in_ (in), out_ (out), diag_ (diag) {}

    asio::awaitable<std::string>
    device_code (bool previous_incorrect) override;

    asio::awaitable<std::string>
    email_code (const std::string& email, bool previous_incorrect) override;

    asio::awaitable<bool>
    confirm_device () override;

    void
    show_challenge (const std::string& url) override;

  private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& diag_;
  };
}
