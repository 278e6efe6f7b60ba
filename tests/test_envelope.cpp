/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "certrun/envelope.hpp"

using namespace certrun;

TEST(GzipTest, RoundTrip) {
    std::string text = "{\"version\": 6}\n";
    for (int i = 0; i < 200; ++i) {
        text += "line " + std::to_string(i) + "\n";
    }

    auto compressed = gzipCompress(text);
    ASSERT_TRUE(compressed);
    ASSERT_GE(compressed->size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>((*compressed)[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>((*compressed)[1]), 0x8b);
    EXPECT_LT(compressed->size(), text.size());

    auto restored = gzipDecompress(*compressed);
    ASSERT_TRUE(restored);
    EXPECT_EQ(*restored, text);
}

TEST(GzipTest, EmptyInputRoundTrips) {
    auto compressed = gzipCompress("");
    ASSERT_TRUE(compressed);
    auto restored = gzipDecompress(*compressed);
    ASSERT_TRUE(restored);
    EXPECT_TRUE(restored->empty());
}

TEST(GzipTest, RejectsGarbageAndTruncation) {
    EXPECT_FALSE(gzipDecompress("this is not gzip"));

    auto compressed = gzipCompress(std::string(1000, 'x'));
    ASSERT_TRUE(compressed);
    EXPECT_FALSE(gzipDecompress(compressed->substr(0, compressed->size() / 2)));
}

TEST(Base64Test, EncodesStandardVectors) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodesStandardVectors) {
    EXPECT_EQ(base64Decode(""), std::optional<std::string>(""));
    EXPECT_EQ(base64Decode("Zg=="), std::optional<std::string>("f"));
    EXPECT_EQ(base64Decode("Zm8="), std::optional<std::string>("fo"));
    EXPECT_EQ(base64Decode("Zm9vYmFy"), std::optional<std::string>("foobar"));

    std::string binary("\x00\xff\x10\x80", 4);
    EXPECT_EQ(base64Decode(base64Encode(binary)), std::optional<std::string>(binary));
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(base64Decode("Zm9"));
    EXPECT_FALSE(base64Decode("Zm=v"));
    EXPECT_FALSE(base64Decode("@@@@"));
}
