#include <gtest/gtest.h>

#include "embedding_sanitizer.hpp"

using mdchunk::sanitize_for_embedding;

TEST(EmbeddingSanitizer, ArrowsAndMarks) {
    EXPECT_EQ(sanitize_for_embedding("A \xE2\x86\x92 B"), "A > B");                  // →
    EXPECT_EQ(sanitize_for_embedding("\xE2\x86\x90 back"), "< back");                 // ←
    EXPECT_EQ(sanitize_for_embedding("\xE2\x9C\x93 done \xE2\x9C\x97 failed"), "Y done X failed");
}

TEST(EmbeddingSanitizer, BoxDrawing) {
    // ┌──┐ / │ x │ / └──┘
    EXPECT_EQ(sanitize_for_embedding("\xE2\x94\x8C\xE2\x94\x80\xE2\x94\x80\xE2\x94\x90"), "+--+");
    EXPECT_EQ(sanitize_for_embedding("\xE2\x94\x82 x \xE2\x94\x82"), "| x |");
    EXPECT_EQ(sanitize_for_embedding("\xE2\x94\x94\xE2\x94\x80\xE2\x94\x80\xE2\x94\x98"), "+--+");
    // ╔═╗
    EXPECT_EQ(sanitize_for_embedding("\xE2\x95\x94\xE2\x95\x90\xE2\x95\x97"), "+-+");
}

TEST(EmbeddingSanitizer, QuotesDashesEllipsis) {
    EXPECT_EQ(sanitize_for_embedding("\xE2\x80\x9Cquoted\xE2\x80\x9D \xE2\x80\x94 it\xE2\x80\x99s\xE2\x80\xA6"),
              "\"quoted\" - it's.");
    EXPECT_EQ(sanitize_for_embedding("\xE2\x80\xA2 item"), "- item");
}

TEST(EmbeddingSanitizer, StatusEmojiBecomeSingleSpace) {
    EXPECT_EQ(sanitize_for_embedding("\xE2\x9C\x85 Passed"), " Passed");              // ✅
    EXPECT_EQ(sanitize_for_embedding("Ship \xF0\x9F\x9A\x80 now"), "Ship now");        // 🚀
}

TEST(EmbeddingSanitizer, CollapsesSpaceRuns) {
    EXPECT_EQ(sanitize_for_embedding("a    b"), "a b");
    EXPECT_EQ(sanitize_for_embedding("line\n\nnext"), "line\n\nnext");
}

TEST(EmbeddingSanitizer, KeepsOtherText) {
    EXPECT_EQ(sanitize_for_embedding("plain ascii text"), "plain ascii text");
    EXPECT_EQ(sanitize_for_embedding("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E"), "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");
    EXPECT_EQ(sanitize_for_embedding(""), "");
}

TEST(EmbeddingSanitizer, InvalidBytesPassThrough) {
    EXPECT_EQ(sanitize_for_embedding("a\xFF" "b"), "a\xFF" "b");
}

TEST(EmbeddingSanitizer, Idempotent) {
    const std::string once = sanitize_for_embedding(
        "\xE2\x94\x8C\xE2\x94\x80\xE2\x94\x90 \xE2\x86\x92 \xE2\x9C\x85  done\xE2\x80\xA6");
    EXPECT_EQ(sanitize_for_embedding(once), once);
}

TEST(EmbeddingSanitizer, AsciiReplacementLookup) {
    EXPECT_EQ(mdchunk::ascii_replacement(U'→'), '>');
    EXPECT_EQ(mdchunk::ascii_replacement(U'┼'), '+');
    EXPECT_FALSE(mdchunk::ascii_replacement(U'a').has_value());
    EXPECT_FALSE(mdchunk::ascii_replacement(U'日').has_value());
}
