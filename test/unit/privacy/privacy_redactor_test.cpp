#include <gtest/gtest.h>
#include "tiermem/privacy/privacy_redactor.h"

namespace tiermem {
namespace privacy {
namespace test {

class PrivacyRedactorTest : public ::testing::Test {
protected:
    static bool has_kind(const std::vector<PiiSpan>& spans, PiiKind kind) {
        for (const auto& span : spans) {
            if (span.kind == kind) return true;
        }
        return false;
    }

    PrivacyRedactor redactor_;
};

TEST_F(PrivacyRedactorTest, DetectsEmail) {
    const std::string text = "write to alice.smith@example.org please";
    auto spans = redactor_.detect(text);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].kind, PiiKind::EMAIL);
    EXPECT_EQ(text.substr(spans[0].offset, spans[0].length), "alice.smith@example.org");
}

TEST_F(PrivacyRedactorTest, DetectsPhoneNumbers) {
    EXPECT_TRUE(has_kind(redactor_.detect("call 555-123-4567 now"), PiiKind::PHONE_NUMBER));
    EXPECT_TRUE(has_kind(redactor_.detect("call (555) 123-4567 now"), PiiKind::PHONE_NUMBER));
    EXPECT_TRUE(has_kind(redactor_.detect("call +1 555.123.4567"), PiiKind::PHONE_NUMBER));
}

TEST_F(PrivacyRedactorTest, DetectsNationalIdAndCard) {
    auto ssn = redactor_.detect("ssn 123-45-6789.");
    ASSERT_EQ(ssn.size(), 1u);
    EXPECT_EQ(ssn[0].kind, PiiKind::NATIONAL_ID);

    const std::string text = "card 4111 1111 1111 1111 expires";
    auto card = redactor_.detect(text);
    ASSERT_EQ(card.size(), 1u);
    EXPECT_EQ(text.substr(card[0].offset, card[0].length), "4111 1111 1111 1111");
}

TEST_F(PrivacyRedactorTest, DetectsIpAddress) {
    auto spans = redactor_.detect("server at 192.168.10.20 is down");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].kind, PiiKind::IP_ADDRESS);
}

TEST_F(PrivacyRedactorTest, PlainTextHasNoPii) {
    EXPECT_FALSE(redactor_.contains_pii("Let's talk about the quarterly roadmap at 3pm"));
    EXPECT_TRUE(redactor_.detect("").empty());
}

TEST_F(PrivacyRedactorTest, SpansAreOrderedAndDisjoint) {
    auto spans = redactor_.detect("a@b.io then 10.0.0.1 then c@d.io");
    ASSERT_EQ(spans.size(), 3u);
    for (size_t i = 1; i < spans.size(); ++i) {
        EXPECT_GE(spans[i].offset, spans[i - 1].offset + spans[i - 1].length);
    }
}

TEST_F(PrivacyRedactorTest, FlaggedTermsCaseInsensitive) {
    core::PrivacyConfig config = core::PrivacyConfig::Default();
    config.flagged_terms = {"Nightingale"};
    PrivacyRedactor redactor(config);

    auto spans = redactor.detect("project NIGHTINGALE and nightingale again");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].kind, PiiKind::FLAGGED_TERM);
    EXPECT_EQ(spans[0].offset, 8u);
}

TEST_F(PrivacyRedactorTest, ExtraTermsApplyPerCall) {
    EXPECT_EQ(redactor_.detect("meet Dr. Ortega", {"ortega"}).size(), 1u);
    EXPECT_TRUE(redactor_.detect("meet Dr. Ortega").empty());
}

TEST_F(PrivacyRedactorTest, RedactReplacesSpans) {
    EXPECT_EQ(redactor_.redact("mail bob@example.com or call 555-123-4567"),
              "mail [REDACTED] or call [REDACTED]");
    EXPECT_EQ(redactor_.redact("nothing here"), "nothing here");
}

TEST_F(PrivacyRedactorTest, DetectorsCanBeDisabled) {
    core::PrivacyConfig config = core::PrivacyConfig::Default();
    config.detect_emails = false;
    config.placeholder = "***";
    PrivacyRedactor redactor(config);
    EXPECT_FALSE(redactor.contains_pii("bob@example.com"));
    EXPECT_EQ(redactor.redact("ip 10.1.2.3"), "ip ***");
}

TEST_F(PrivacyRedactorTest, EmptyPlaceholderThrows) {
    core::PrivacyConfig config = core::PrivacyConfig::Default();
    config.placeholder.clear();
    EXPECT_THROW(PrivacyRedactor redactor(config), core::InvalidArgumentError);
}

TEST_F(PrivacyRedactorTest, KindNames) {
    EXPECT_STREQ(pii_kind_name(PiiKind::EMAIL), "email");
    EXPECT_STREQ(pii_kind_name(PiiKind::FLAGGED_TERM), "flagged_term");
}

} // namespace test
} // namespace privacy
} // namespace tiermem
