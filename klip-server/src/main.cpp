/**
 * @file main.cpp
 * @brief klip MCP server entry point
 *
 * Serves the clipboard tools over stdin/stdout until the client closes
 * its end of the pipe.
 */

#include <klip/klip.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <fmt/format.h>
#include <getopt.h>

namespace {

void print_usage(std::FILE *stream) {
  fmt::print(stream,
             "Usage: klip [OPTIONS]\n"
             "\n"
             "Cross-platform MCP server for clipboard operations.\n"
             "Speaks JSON-RPC on stdin/stdout; logs go to stderr.\n"
             "\n"
             "Options:\n"
             "  -h, --help       Print help\n"
             "  -V, --version    Print version\n"
             "\n"
             "Environment:\n"
             "  {:<24}maximum text size in bytes (default {})\n"
             "  {:<24}clipboard operation timeout in seconds (default {})\n"
             "  {:<24}maximum inbound message size in bytes (default {})\n"
             "  {:<24}expose clipboard_get (default 1)\n"
             "  {:<24}auto, wayland or x11 (default auto)\n"
             "  {:<24}debug, info, warn, error or off (default info)\n",
             klip::ENV_MAX_TEXT_BYTES, klip::DEFAULT_MAX_TEXT_BYTES,
             klip::ENV_TIMEOUT_SECS, klip::DEFAULT_OPERATION_TIMEOUT.count(),
             klip::ENV_MAX_MESSAGE_BYTES, klip::DEFAULT_MAX_MESSAGE_BYTES,
             klip::ENV_ENABLE_GET, klip::ENV_CLIPBOARD_BACKEND, klip::ENV_LOG);
}

/// Returns an exit status if the process should stop here
int parse_args(int argc, char *argv[]) {
  // clang-format off
  static const struct option opts[] = {
      {"help",    no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, 'V'},
      {nullptr,   0,           nullptr, 0}
  };
  // clang-format on

  int opt;
  while ((opt = getopt_long(argc, argv, "hV", opts, nullptr)) != -1) {
    switch (opt) {
    case 'h':
      print_usage(stdout);
      return EXIT_SUCCESS;
    case 'V': {
      auto version = klip::get_version();
      fmt::print("klip {} (MCP {})\n", version.version_string,
                 version.mcp_protocol_version);
      return EXIT_SUCCESS;
    }
    default:
      print_usage(stderr);
      return 2;
    }
  }

  if (optind < argc) {
    fmt::print(stderr, "klip: unexpected argument '{}'\n", argv[optind]);
    print_usage(stderr);
    return 2;
  }

  return -1;
}

} // namespace

int main(int argc, char *argv[]) {
  int status = parse_args(argc, argv);
  if (status >= 0) {
    return status;
  }

  auto config = klip::ServerConfig::from_env();
  if (config.is_error()) {
    fmt::print(stderr, "klip: invalid configuration: {}\n",
               config.error().message);
    return 2;
  }
  klip::set_log_level(config.value().log_level);

  // Clipboard tools are fed through pipes; a tool that exits early must
  // not take the server down with it
  std::signal(SIGPIPE, SIG_IGN);

  klip::log_info("starting klip {} (max text {} bytes, timeout {} ms)",
                 klip::VERSION_STRING, config.value().max_text_bytes,
                 config.value().operation_timeout.count());

  auto backend = klip::open_system_clipboard(config.value());
  if (backend.is_error()) {
    fmt::print(stderr, "klip: failed to acquire the clipboard: {}\n",
               backend.error().message);
    return EXIT_FAILURE;
  }

  klip::ClipboardGateway gateway(std::move(backend).value(),
                                 config.value().operation_timeout);
  klip::ToolDispatcher dispatcher(gateway, config.value());
  klip::Session session(dispatcher, config.value(), std::cin, std::cout);

  klip::log_info("klip MCP server initialized and ready");

  auto served = session.run();
  if (served.is_error()) {
    klip::log_error("session ended with error: {}", served.error().to_string());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
