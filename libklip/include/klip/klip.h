/**
 * @file klip.h
 * @brief Main klip API header
 *
 * klip - clipboard access for AI agents over the Model Context Protocol.
 *
 * The library exposes the pieces the `klip` server wires together:
 * - Payload validation (validator.h)
 * - Exclusive, timeout-bounded clipboard access (clipboard.h)
 * - Tool catalog and dispatch (dispatcher.h)
 * - JSON-RPC framing and the session loop (protocol.h, session.h)
 *
 * Quick Start:
 * @code
 *   #include <klip/klip.h>
 *
 *   auto config = klip::ServerConfig::from_env().value();
 *   auto backend = klip::open_system_clipboard(config);
 *   klip::ClipboardGateway gateway(std::move(backend).value(),
 *                                  config.operation_timeout);
 *   klip::ToolDispatcher dispatcher(gateway, config);
 *   klip::Session session(dispatcher, config, std::cin, std::cout);
 *   session.run();
 * @endcode
 */

#ifndef KLIP_KLIP_H
#define KLIP_KLIP_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"

// Feature modules (in dependency order)
#include "clipboard.h"
#include "config.h"
#include "dispatcher.h"
#include "log.h"
#include "protocol.h"
#include "session.h"
#include "validator.h"

namespace klip {

// ============================================================================
// Version Information
// ============================================================================

/// klip major version
constexpr int VERSION_MAJOR = 0;

/// klip minor version
constexpr int VERSION_MINOR = 1;

/// klip patch version
constexpr int VERSION_PATCH = 0;

/// klip version string
constexpr const char *VERSION_STRING = "0.1.0";

/// Name reported in the MCP handshake
constexpr const char *SERVER_NAME = "klip";

/// Instructions reported in the MCP handshake
constexpr const char *SERVER_INSTRUCTIONS =
    "A clipboard management server that allows copying text to the system "
    "clipboard";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *mcp_protocol_version = MCP_PROTOCOL_VERSION;
  const char *build_date = __DATE__;
};

KLIP_API VersionInfo get_version();

} // namespace klip

#endif // KLIP_KLIP_H
