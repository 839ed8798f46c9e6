#pragma once

#include <cstdint>
#include <string_view>

namespace geminet::gemini {

// Two digit Gemini status code. The enumeration is open: any value in [10, 69] may be sent, its
// category being given by the first digit.
using StatusCode = uint8_t;

inline constexpr StatusCode StatusCodeInput = 10;
inline constexpr StatusCode StatusCodeSensitiveInput = 11;

inline constexpr StatusCode StatusCodeSuccess = 20;

inline constexpr StatusCode StatusCodeRedirectTemporary = 30;
inline constexpr StatusCode StatusCodeRedirectPermanent = 31;

inline constexpr StatusCode StatusCodeTemporaryFailure = 40;
inline constexpr StatusCode StatusCodeServerUnavailable = 41;
inline constexpr StatusCode StatusCodeCGIError = 42;
inline constexpr StatusCode StatusCodeProxyError = 43;
inline constexpr StatusCode StatusCodeSlowDown = 44;

inline constexpr StatusCode StatusCodePermanentFailure = 50;
inline constexpr StatusCode StatusCodeNotFound = 51;
inline constexpr StatusCode StatusCodeGone = 52;
inline constexpr StatusCode StatusCodeProxyRequestRefused = 53;
inline constexpr StatusCode StatusCodeBadRequest = 59;

inline constexpr StatusCode StatusCodeClientCertificateRequired = 60;
inline constexpr StatusCode StatusCodeCertificateNotAuthorised = 61;
inline constexpr StatusCode StatusCodeCertificateNotValid = 62;

enum class StatusCategory : uint8_t {
  Input = 1,
  Success = 2,
  Redirect = 3,
  TemporaryFailure = 4,
  PermanentFailure = 5,
  ClientCertificate = 6,
};

constexpr bool IsValidStatusCode(StatusCode code) noexcept { return code >= 10 && code <= 69; }

// Only meaningful for a valid status code.
constexpr StatusCategory CategoryOf(StatusCode code) noexcept { return static_cast<StatusCategory>(code / 10); }

constexpr bool IsSuccess(StatusCode code) noexcept {
  return IsValidStatusCode(code) && CategoryOf(code) == StatusCategory::Success;
}

// Default META sent along a non success status when the handler did not provide one.
// Unknown codes fall back on their category.
constexpr std::string_view DefaultMeta(StatusCode code) noexcept {
  switch (code) {
    case StatusCodeInput:
      return "Input required";
    case StatusCodeSensitiveInput:
      return "Sensitive input required";
    case StatusCodeSuccess:
      return "Success";
    case StatusCodeRedirectTemporary:
      return "Temporary redirect";
    case StatusCodeRedirectPermanent:
      return "Permanent redirect";
    case StatusCodeTemporaryFailure:
      return "Temporary failure";
    case StatusCodeServerUnavailable:
      return "Server unavailable";
    case StatusCodeCGIError:
      return "CGI error";
    case StatusCodeProxyError:
      return "Proxy error";
    case StatusCodeSlowDown:
      // META of 44 is the number of seconds the client must wait
      return "1";
    case StatusCodePermanentFailure:
      return "Permanent failure";
    case StatusCodeNotFound:
      return "Not found";
    case StatusCodeGone:
      return "Gone";
    case StatusCodeProxyRequestRefused:
      return "Proxy request refused";
    case StatusCodeBadRequest:
      return "Bad request";
    case StatusCodeClientCertificateRequired:
      return "Client certificate required";
    case StatusCodeCertificateNotAuthorised:
      return "Certificate not authorised";
    case StatusCodeCertificateNotValid:
      return "Certificate not valid";
    default:
      break;
  }
  if (!IsValidStatusCode(code)) {
    return "";
  }
  switch (CategoryOf(code)) {
    case StatusCategory::Input:
      return "Input required";
    case StatusCategory::Success:
      return "Success";
    case StatusCategory::Redirect:
      return "Redirect";
    case StatusCategory::TemporaryFailure:
      return "Temporary failure";
    case StatusCategory::PermanentFailure:
      return "Permanent failure";
    case StatusCategory::ClientCertificate:
      return "Client certificate required";
  }
  return "";
}

}  // namespace geminet::gemini
