#include "geminet/gemini-status-code.hpp"

#include <gtest/gtest.h>

#include "geminet/gemini-constants.hpp"

namespace geminet::gemini {

TEST(GeminiStatusCode, Validity) {
  EXPECT_FALSE(IsValidStatusCode(0));
  EXPECT_FALSE(IsValidStatusCode(9));
  EXPECT_TRUE(IsValidStatusCode(10));
  EXPECT_TRUE(IsValidStatusCode(StatusCodeBadRequest));
  EXPECT_TRUE(IsValidStatusCode(69));
  EXPECT_FALSE(IsValidStatusCode(70));
  EXPECT_FALSE(IsValidStatusCode(200));
}

TEST(GeminiStatusCode, CategoryFromLeadingDigit) {
  EXPECT_EQ(CategoryOf(StatusCodeSensitiveInput), StatusCategory::Input);
  EXPECT_EQ(CategoryOf(StatusCodeSuccess), StatusCategory::Success);
  EXPECT_EQ(CategoryOf(StatusCodeRedirectPermanent), StatusCategory::Redirect);
  EXPECT_EQ(CategoryOf(StatusCodeSlowDown), StatusCategory::TemporaryFailure);
  EXPECT_EQ(CategoryOf(StatusCodeNotFound), StatusCategory::PermanentFailure);
  EXPECT_EQ(CategoryOf(StatusCodeCertificateNotValid), StatusCategory::ClientCertificate);
  // Open enumeration: unassigned codes still belong to a category.
  EXPECT_EQ(CategoryOf(57), StatusCategory::PermanentFailure);
  EXPECT_TRUE(IsSuccess(21));
  EXPECT_FALSE(IsSuccess(StatusCodeRedirectTemporary));
}

TEST(GeminiStatusCode, DefaultMeta) {
  EXPECT_EQ(DefaultMeta(StatusCodeNotFound), "Not found");
  EXPECT_EQ(DefaultMeta(StatusCodeBadRequest), "Bad request");
  EXPECT_EQ(DefaultMeta(StatusCodeSlowDown), "1");
  EXPECT_EQ(DefaultMeta(48), "Temporary failure");
  EXPECT_EQ(DefaultMeta(65), "Client certificate required");
  EXPECT_EQ(DefaultMeta(99), "");
}

TEST(GeminiConstants, Sizes) {
  EXPECT_EQ(kMaxRequestLineSize, 1026U);
  EXPECT_EQ(kMaxHeaderSize, 1029U);
  static_assert(kMaxHeaderSize == kStatusCodeSize + 1 + kMaxMetaSize + CRLF.size());
}

}  // namespace geminet::gemini
