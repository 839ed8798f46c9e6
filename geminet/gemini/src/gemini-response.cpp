#include "geminet/gemini-response.hpp"

#include <array>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include "geminet/gemini-constants.hpp"
#include "geminet/gemini-status-code.hpp"
#include "geminet/mime-type.hpp"

namespace geminet {

namespace {

using HeaderBuffer = std::array<char, gemini::kMaxHeaderSize>;

void CheckMeta(std::string_view meta) {
  if (meta.size() > gemini::kMaxMetaSize) {
    throw std::logic_error(std::string("META exceeds ") + std::to_string(gemini::kMaxMetaSize) + " bytes");
  }
  if (meta.find_first_of(gemini::CRLF) != std::string_view::npos) {
    throw std::logic_error("META cannot contain CR or LF");
  }
}

// Composes <STATUS><SPACE><META><CR><LF> into buf. meta must have been checked.
std::string_view ComposeHeader(HeaderBuffer& buf, gemini::StatusCode status, std::string_view meta) {
  char* out = buf.data();
  *out++ = static_cast<char>('0' + (status / 10));
  *out++ = static_cast<char>('0' + (status % 10));
  *out++ = ' ';
  std::memcpy(out, meta.data(), meta.size());
  out += meta.size();
  std::memcpy(out, gemini::CRLF.data(), gemini::CRLF.size());
  out += gemini::CRLF.size();
  return {buf.data(), static_cast<std::size_t>(out - buf.data())};
}

}  // namespace

void GeminiResponse::ensureNotFlushed(std::string_view operation) const {
  if (_isFlushed) {
    throw std::logic_error(std::string("Cannot ") + std::string(operation) + " on an already flushed response");
  }
}

void GeminiResponse::writeHeader(gemini::StatusCode status, std::string_view meta) {
  ensureNotFlushed("writeHeader");
  if (!gemini::IsValidStatusCode(status)) {
    throw std::logic_error("Invalid Gemini status code " + std::to_string(status));
  }
  if (gemini::IsSuccess(status)) {
    throw std::logic_error("A success status requires a body, use flush()");
  }
  CheckMeta(meta);
  sendHeader(status, meta, {});
}

void GeminiResponse::flush(MimeType mimeType) { flush(mimeType.str()); }

void GeminiResponse::flush(std::string_view mimeType) {
  ensureNotFlushed("flush");
  if (!gemini::IsSuccess(_status)) {
    throw std::logic_error("Only a success status can be flushed with a body, use writeHeader()");
  }
  CheckMeta(mimeType);
  sendHeader(_status, mimeType, _body);
}

void GeminiResponse::sendHeader(gemini::StatusCode status, std::string_view meta, std::string_view body) {
  if (_writer.pendingBytes() != 0) {
    throw std::logic_error("Bytes are pending in the buffered writer");
  }
  HeaderBuffer buf;
  _writer.write(ComposeHeader(buf, status, meta));
  if (!body.empty()) {
    _writer.write(body);
  }
  _writer.flush();
  _isFlushed = true;
}

GeminiResponse& GeminiResponse::status(gemini::StatusCode status) {
  ensureNotFlushed("set status");
  if (!gemini::IsValidStatusCode(status)) {
    throw std::logic_error("Invalid Gemini status code " + std::to_string(status));
  }
  _status = status;
  return *this;
}

GeminiResponse& GeminiResponse::appendBody(std::string_view data) {
  ensureNotFlushed("append body");
  _body.append(data);
  return *this;
}

}  // namespace geminet
