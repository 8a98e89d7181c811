// ═══════════════════════════════════════════════════════════════════
//  test_compress.cpp — Tests for raw deflate and CRC-32
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <forgepp/compress.h>

using namespace forgepp::compress;

TEST(CompressTest, DeflateAndInflate) {
    std::string original = "type Query { id: ID }\n"
                           "type Query { id: ID }\n"
                           "type Query { id: ID }\n";

    auto compressed = deflateRaw(original);
    EXPECT_FALSE(compressed.empty());
    EXPECT_LT(compressed.size(), original.size());
    EXPECT_EQ(inflateRaw(compressed), original);
}

TEST(CompressTest, EmptyInput) {
    auto compressed = deflateRaw("");
    EXPECT_FALSE(compressed.empty()); // final empty block
    EXPECT_EQ(inflateRaw(compressed), "");
}

TEST(CompressTest, BinaryData) {
    std::string binary;
    for (int i = 0; i < 256; i++) {
        binary += static_cast<char>(i);
    }
    binary += binary;

    EXPECT_EQ(inflateRaw(deflateRaw(binary)), binary);
}

TEST(CompressTest, LargeDataSpansInflateBuffer) {
    std::string large(200000, 'A');
    auto compressed = deflateRaw(large);
    EXPECT_LT(compressed.size(), large.size());
    EXPECT_EQ(inflateRaw(compressed), large);
}

TEST(CompressTest, CompressionLevels) {
    std::string data(10000, 'X');
    EXPECT_EQ(inflateRaw(deflateRaw(data, 1)), data);
    EXPECT_EQ(inflateRaw(deflateRaw(data, 9)), data);
}

TEST(CompressTest, InflateRejectsGarbage) {
    EXPECT_THROW(inflateRaw(std::string("\xff\xff\xff\xff", 4)), std::runtime_error);
}

TEST(Crc32Test, KnownValues) {
    EXPECT_EQ(crc32(""), 0u);
    EXPECT_EQ(crc32("123456789"), 0xCBF43926u);
    EXPECT_EQ(crc32("The quick brown fox jumps over the lazy dog"), 0x414FA339u);
}
