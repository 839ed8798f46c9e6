// geminet umbrella header
//
// Include this single header to pull in the public Gemini server API:
//   - GeminiServer, ServerConfig and ListenAndServe
//   - GeminiRequest / GeminiResponse and the request parsing result types
//   - Gemini status codes and protocol limits
//   - Uri parsing, MimeType lookups, SignalHandler and version
//
// The lower level system wrappers (sockets, transports, buffered writer) are not re-exported, include them
// directly if needed.
#pragma once

// IWYU pragma: begin_exports
#include "geminet/gemini-constants.hpp"
#include "geminet/gemini-request.hpp"
#include "geminet/gemini-response.hpp"
#include "geminet/gemini-server.hpp"
#include "geminet/gemini-status-code.hpp"
#include "geminet/mime-type.hpp"
#include "geminet/server-config.hpp"
#include "geminet/signal-handler.hpp"
#include "geminet/uri.hpp"
#include "geminet/version.hpp"
// IWYU pragma: end_exports
