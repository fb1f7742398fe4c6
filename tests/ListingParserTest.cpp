// Whole-listing parsing: line splitting, ordering and mixed dialects.
#include <gtest/gtest.h>
#include "remotefs/ListingDate.hpp"
#include "remotefs/ListingParser.hpp"

using namespace remotefs;

TEST(SplitListingLines, AllTerminators) {
    auto lines = splitListingLines("a\r\nb\nc\rd");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
    EXPECT_EQ(lines[3], "d");
}

TEST(SplitListingLines, DropsOnlyOneTrailingEmptyLine) {
    EXPECT_TRUE(splitListingLines("").empty());
    EXPECT_EQ(splitListingLines("a\n").size(), 1u);
    EXPECT_EQ(splitListingLines("a\n\n").size(), 2u);
    EXPECT_EQ(splitListingLines("\n").size(), 1u);
    EXPECT_EQ(splitListingLines("a\n\nb").size(), 3u);
}

TEST(ParseListing, EmptyInput) {
    EXPECT_TRUE(parseListing("", 2024).empty());
}

TEST(ParseListing, MixedDialectsInOrder) {
    const std::string text =
        "drwxr-xr-x 2 u g 4096 Jan 10 10:00 folder\r\n"
        "01-10-23  02:14PM  <DIR>  archive\r\n"
        "total 12\r\n"
        "-rw-r--r-- 1 u g 1234 Jan 20 2023 my file.txt\r\n";
    auto entries = parseListing(text, 2024);
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_EQ(entries[0].name, "folder");
    EXPECT_TRUE(entries[0].isDirectory);
    EXPECT_TRUE(entries[0].permissions.has_value());

    EXPECT_EQ(entries[1].name, "archive");
    EXPECT_TRUE(entries[1].isDirectory);
    EXPECT_FALSE(entries[1].permissions.has_value());

    // Summary lines are not dropped; they come back as plain entries.
    EXPECT_EQ(entries[2].name, "total 12");
    EXPECT_FALSE(entries[2].modified.has_value());

    EXPECT_EQ(entries[3].name, "my file.txt");
    EXPECT_EQ(*entries[3].size, 1234u);
}

TEST(ParseListing, EntryCountMatchesLineCount) {
    const std::string samples[] = {
        "x",
        "x\n",
        "x\n\n",
        "\n\n\n",
        "one\rtwo\r\nthree\nfour",
        "drwxr-xr-x 2 u g 4096 Jan 10 10:00 folder\n\n01-10-23  02:14PM  <DIR>  archive\n",
    };
    for (const auto& text : samples) {
        EXPECT_EQ(parseListing(text, 2024).size(), splitListingLines(text).size()) << text;
    }
    EXPECT_EQ(parseListing("\n\n\n", 2024).size(), 3u);
}

TEST(ParseListing, RawLinesArePreservedVerbatim) {
    const std::string text = "  padded line  \n-rw-r--r-- 1 u g 1 Jan 1 2020 a\n";
    auto entries = parseListing(text, 2024);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].rawLine, "  padded line  ");
    EXPECT_EQ(entries[1].rawLine, "-rw-r--r-- 1 u g 1 Jan 1 2020 a");
}

TEST(ParseListing, ReferenceYearAppliesToTimeOfDay) {
    auto a = parseListing("-rw-r--r-- 1 u g 1 Jun 01 12:30 a", 2019);
    auto b = parseListing("-rw-r--r-- 1 u g 1 Jun 01 12:30 a", 2021);
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(formatUtcTimestamp(*a[0].modified), "2019-06-01T12:30:00Z");
    EXPECT_EQ(formatUtcTimestamp(*b[0].modified), "2021-06-01T12:30:00Z");
}

TEST(ParseListing, DefaultReferenceYearIsCurrent) {
    auto entries = parseListing("-rw-r--r-- 1 u g 1 Jan 01 00:00 a");
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_TRUE(entries[0].modified.has_value());
    EXPECT_EQ(formatUtcTimestamp(*entries[0].modified).substr(0, 4), std::to_string(currentUtcYear()));
}
