#pragma once

#include <string>
#include <string_view>

#include "geminet/buffered-writer.hpp"
#include "geminet/gemini-status-code.hpp"
#include "geminet/mime-type.hpp"
#include "geminet/transport.hpp"

namespace geminet {

// Response to a single Gemini request: <STATUS><SPACE><META><CR><LF>[BODY].
// Exactly one terminal write (writeHeader or flush) may happen per response, after which isFlushed() is true.
// Any further mutation is a programming error reported with std::logic_error.
// Transport failures are reported with std::system_error; isFlushed() stays false in that case.
//
// Not thread safe: owned by the thread serving the connection.
class GeminiResponse {
 public:
  explicit GeminiResponse(ITransport& transport) noexcept : _writer(transport) {}

  GeminiResponse(const GeminiResponse&) = delete;
  GeminiResponse(GeminiResponse&&) noexcept = delete;
  GeminiResponse& operator=(const GeminiResponse&) = delete;
  GeminiResponse& operator=(GeminiResponse&&) noexcept = delete;

  ~GeminiResponse() = default;

  // Sends a header only response with a non success status, and flushes it immediately.
  // Preconditions: not flushed, no bytes pending in bufferedWriter(), status valid and not 2x,
  // meta at most 1024 bytes without CR or LF.
  void writeHeader(gemini::StatusCode status, std::string_view meta);

  // Sends the header with the current status (which must be 2x) and mimeType as META, followed by the body.
  // Preconditions: not flushed, no bytes pending in bufferedWriter().
  void flush(MimeType mimeType = MimeType{});

  // Same as above with an arbitrary content type, i.e. "text/gemini; lang=fr".
  void flush(std::string_view mimeType);

  // Sets the status used by flush(), or by the automatic flush of the server.
  GeminiResponse& status(gemini::StatusCode status);

  [[nodiscard]] gemini::StatusCode status() const noexcept { return _status; }

  GeminiResponse& appendBody(std::string_view data);

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] bool isFlushed() const noexcept { return _isFlushed; }

  // Low level access to the connection. Bytes written here must form a valid Gemini response by themselves,
  // and must be flushed by the caller: flush() and writeHeader() refuse to run while some are pending.
  BufferedWriter& bufferedWriter() noexcept { return _writer; }

 private:
  void ensureNotFlushed(std::string_view operation) const;

  void sendHeader(gemini::StatusCode status, std::string_view meta, std::string_view body);

  BufferedWriter _writer;
  std::string _body;
  gemini::StatusCode _status{gemini::StatusCodeSuccess};
  bool _isFlushed{false};
};

}  // namespace geminet
