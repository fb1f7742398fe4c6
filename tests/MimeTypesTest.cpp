// MIME lookup by extension and the text override.
#include <gtest/gtest.h>
#include "remotefs/MimeTypes.hpp"

using namespace remotefs;

TEST(MimeTypes, KnownExtensions) {
    EXPECT_EQ(mimeTypeForPath("/a/b/photo.png"), "image/png");
    EXPECT_EQ(mimeTypeForPath("/docs/report.PDF"), "application/pdf");
    EXPECT_EQ(mimeTypeForPath("notes.txt"), "text/plain");
    EXPECT_EQ(mimeTypeForPath("/x/archive.tar.gz"), "application/gzip");
    EXPECT_EQ(mimeTypeForPath("data.json"), "application/json");
}

TEST(MimeTypes, UnknownOrMissingExtension) {
    EXPECT_EQ(mimeTypeForPath("/bin/tool"), kGenericBinaryMime);
    EXPECT_EQ(mimeTypeForPath("/data/blob.xyz123"), kGenericBinaryMime);
    EXPECT_EQ(mimeTypeForPath("/home/.bashrc"), kGenericBinaryMime);
    EXPECT_EQ(mimeTypeForPath("/dir.d/file"), kGenericBinaryMime);
}

TEST(MimeTypes, TextOverridesGenericBinary) {
    EXPECT_EQ(effectiveMimeType("/etc/hosts", true), kPlainTextMime);
    EXPECT_EQ(effectiveMimeType("/etc/hosts", false), kGenericBinaryMime);
    // A specific type is kept even for text content.
    EXPECT_EQ(effectiveMimeType("/site/index.html", true), "text/html");
    EXPECT_EQ(effectiveMimeType("/img/logo.svg", true), "image/svg+xml");
}
