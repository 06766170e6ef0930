#include <gtest/gtest.h>
#include "tiermem/memory/turn_codec.h"

namespace tiermem {
namespace memory {
namespace test {

TEST(TurnCodecTest, EncodeLayout) {
    core::MemoryContent content;
    content.text = "Let's plan the offsite";
    content.entities = {"Alice", "Bob"};
    content.topics = {"offsite"};
    EXPECT_EQ(encode_turn(content),
              "entities: Alice, Bob\ntopics: offsite\n\nLet's plan the offsite");
}

TEST(TurnCodecTest, DecodeRestoresContent) {
    core::MemoryContent content;
    content.text = "line one\nline two";
    content.entities = {"Alice"};
    content.topics = {"career", "growth"};

    auto decoded = decode_turn(encode_turn(content));
    EXPECT_EQ(decoded.text, content.text);
    EXPECT_EQ(decoded.entities, content.entities);
    EXPECT_EQ(decoded.topics, content.topics);
}

TEST(TurnCodecTest, EmptyLabelLists) {
    core::MemoryContent content;
    content.text = "just text";
    auto decoded = decode_turn(encode_turn(content));
    EXPECT_TRUE(decoded.entities.empty());
    EXPECT_TRUE(decoded.topics.empty());
    EXPECT_EQ(decoded.text, "just text");
}

TEST(TurnCodecTest, PayloadWithoutHeaderIsText) {
    auto decoded = decode_turn("[REDACTED]");
    EXPECT_EQ(decoded.text, "[REDACTED]");
    EXPECT_TRUE(decoded.entities.empty());
}

TEST(TurnCodecTest, RedactedHeaderStillParses) {
    auto decoded = decode_turn("entities: [REDACTED], Bob\ntopics: hr\n\nmasked");
    EXPECT_EQ(decoded.entities, (std::vector<std::string>{"[REDACTED]", "Bob"}));
    EXPECT_EQ(decoded.topics, std::vector<std::string>{"hr"});
    EXPECT_EQ(decoded.text, "masked");
}

} // namespace test
} // namespace memory
} // namespace tiermem
