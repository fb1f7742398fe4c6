// Charset name resolution and strict encoding for the write path.
#include <gtest/gtest.h>
#include "remotefs/TextEncoding.hpp"

using namespace remotefs;

namespace {

class TextEncodingTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { ASSERT_TRUE(initEncodingSupport()); }
};

} // namespace

TEST_F(TextEncodingTest, InitIsIdempotent) {
    std::string err;
    EXPECT_TRUE(initEncodingSupport(&err));
    EXPECT_TRUE(initEncodingSupport(&err));
    EXPECT_TRUE(err.empty());
}

TEST_F(TextEncodingTest, CanonicalNames) {
    EXPECT_EQ(canonicalEncodingName("UTF8").value(), "utf-8");
    EXPECT_EQ(canonicalEncodingName("utf-8").value(), "utf-8");
    EXPECT_EQ(canonicalEncodingName("latin1").value(), "iso-8859-1");
    EXPECT_FALSE(canonicalEncodingName("no-such-charset").has_value());
    EXPECT_FALSE(canonicalEncodingName("  ").has_value());
}

TEST_F(TextEncodingTest, EncodeDefaultsToUtf8WithoutBom) {
    ByteBuffer out;
    std::string used;
    std::string err;
    ASSERT_TRUE(encodeText("caf\xC3\xA9", "", out, used, err)) << err;
    EXPECT_EQ(used, "utf-8");
    EXPECT_EQ(out, (ByteBuffer{'c', 'a', 'f', 0xC3, 0xA9}));
}

TEST_F(TextEncodingTest, EncodeLatin1) {
    ByteBuffer out;
    std::string used;
    std::string err;
    ASSERT_TRUE(encodeText("caf\xC3\xA9", "ISO-8859-1", out, used, err)) << err;
    EXPECT_EQ(used, "iso-8859-1");
    EXPECT_EQ(out, (ByteBuffer{'c', 'a', 'f', 0xE9}));
}

TEST_F(TextEncodingTest, EncodeUnmappableCharacterFails) {
    ByteBuffer out;
    std::string used;
    std::string err;
    // EURO SIGN has no ISO-8859-1 code point.
    EXPECT_FALSE(encodeText("\xE2\x82\xAC", "iso-8859-1", out, used, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(TextEncodingTest, EncodeUnknownEncodingFails) {
    ByteBuffer out;
    std::string used;
    std::string err;
    EXPECT_FALSE(encodeText("x", "no-such-charset", out, used, err));
    EXPECT_NE(err.find("no-such-charset"), std::string::npos);
}

TEST_F(TextEncodingTest, ConvertStrictEmptyInput) {
    std::string out = "stale";
    std::string err;
    EXPECT_TRUE(convertStrict("UTF-8", "UTF-16LE", "", 0, out, err));
    EXPECT_TRUE(out.empty());
}

TEST_F(TextEncodingTest, ConvertStrictLargeInput) {
    // Larger than the internal conversion buffers.
    std::string big(100000, 'a');
    std::string out;
    std::string err;
    ASSERT_TRUE(convertStrict("UTF-8", "UTF-16LE", big.data(), big.size(), out, err)) << err;
    EXPECT_EQ(out.size(), big.size() * 2);
}
