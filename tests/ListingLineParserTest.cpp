// Per-line dialect parsing: Unix ls -l, DOS/IIS and the fallback entry.
#include <gtest/gtest.h>
#include "remotefs/ListingDate.hpp"
#include "remotefs/ListingParser.hpp"

using namespace remotefs;

namespace {
constexpr int kYear = 2024;
}

TEST(UnixListingLine, DirectoryWithTimeOfDay) {
    const std::string line = "drwxr-xr-x 2 u g 4096 Jan 10 10:00 folder";
    auto e = parseUnixListingLine(line, kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "folder");
    EXPECT_TRUE(e->isDirectory);
    ASSERT_TRUE(e->size.has_value());
    EXPECT_EQ(*e->size, 4096u);
    ASSERT_TRUE(e->permissions.has_value());
    EXPECT_EQ(*e->permissions, "drwxr-xr-x");
    ASSERT_TRUE(e->modified.has_value());
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "2024-01-10T10:00:00Z");
    EXPECT_EQ(e->rawLine, line);
}

TEST(UnixListingLine, FileNameWithSpacesAndYear) {
    auto e = parseUnixListingLine("-rw-r--r-- 1 u g 1234 Jan 20 2023 my file.txt", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "my file.txt");
    EXPECT_FALSE(e->isDirectory);
    ASSERT_TRUE(e->size.has_value());
    EXPECT_EQ(*e->size, 1234u);
    ASSERT_TRUE(e->modified.has_value());
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "2023-01-20T00:00:00Z");
}

TEST(UnixListingLine, PadsAndWideColumns) {
    auto e = parseUnixListingLine("-rw-r--r--    1 owner    group      9876543210 Dec  3 07:05 big.iso", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "big.iso");
    EXPECT_EQ(*e->size, 9876543210ULL);
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "2024-12-03T07:05:00Z");
}

TEST(UnixListingLine, AclMarkerAfterMode) {
    auto e = parseUnixListingLine("drwxr-xr-x+ 3 u g 512 Feb 29 23:59 shared", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(*e->permissions, "drwxr-xr-x");
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "2024-02-29T23:59:00Z");
}

TEST(UnixListingLine, UnparseableDateKeepsEntry) {
    // Feb 30 does not exist; the rest of the line is still usable.
    auto e = parseUnixListingLine("-rw-r--r-- 1 u g 10 Feb 30 12:00 odd.txt", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_FALSE(e->modified.has_value());
    EXPECT_EQ(*e->size, 10u);
    EXPECT_EQ(e->name, "odd.txt");
}

TEST(UnixListingLine, MissingLinkCount) {
    auto e = parseUnixListingLine("-rw-r--r-- owner group 77 Mar 01 2022 nolinks.txt", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "nolinks.txt");
    EXPECT_EQ(*e->size, 77u);
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "2022-03-01T00:00:00Z");
}

TEST(UnixListingLine, RejectsNonListingText) {
    EXPECT_FALSE(parseUnixListingLine("not a listing line at all", kYear).has_value());
    EXPECT_FALSE(parseUnixListingLine("drwxr-xr-x", kYear).has_value());
    EXPECT_FALSE(parseUnixListingLine("dancing-queen 1 2 3 4 5 6 7", kYear).has_value());
    EXPECT_FALSE(parseUnixListingLine("drwxr-xr-xfoo 2 u g 4096 Jan 10 10:00 x", kYear).has_value());
    EXPECT_FALSE(parseUnixListingLine("-rw-r--r-- 1 u g 10", kYear).has_value());
    EXPECT_FALSE(parseUnixListingLine("", kYear).has_value());
    // Only directories and plain files carry the Unix shape.
    EXPECT_FALSE(parseUnixListingLine("lrwxrwxrwx 1 root root 7 Apr  5 2021 bin -> usr/bin", kYear).has_value());
}

TEST(UnixListingLine, ReparseOfRawLineIsIdentical) {
    const std::string lines[] = {
        "drwxr-xr-x 2 u g 4096 Jan 10 10:00 folder",
        "-rw-r--r-- 1 u g 1234 Jan 20 2023 my file.txt",
        "drwxrwxrwt 12 root root 4096 Apr  5 2021 tmp",
        "-rwsr-xr-x 1 root root 54256 Nov  1 08:30 passwd",
    };
    for (const auto& line : lines) {
        auto first = parseUnixListingLine(line, kYear);
        ASSERT_TRUE(first.has_value()) << line;
        auto second = parseUnixListingLine(first->rawLine, kYear);
        ASSERT_TRUE(second.has_value()) << line;
        EXPECT_EQ(*first, *second) << line;
    }
}

TEST(DosListingLine, Directory) {
    auto e = parseDosListingLine("01-10-23  02:14PM  <DIR>  archive", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "archive");
    EXPECT_TRUE(e->isDirectory);
    EXPECT_FALSE(e->size.has_value());
    EXPECT_FALSE(e->permissions.has_value());
    ASSERT_TRUE(e->modified.has_value());
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "2023-01-10T14:14:00Z");
}

TEST(DosListingLine, FileWithSizeAndSpacedName) {
    auto e = parseDosListingLine("12-31-1999  11:59AM        20480 end  of year.doc", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_FALSE(e->isDirectory);
    ASSERT_TRUE(e->size.has_value());
    EXPECT_EQ(*e->size, 20480u);
    EXPECT_EQ(e->name, "end  of year.doc");
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "1999-12-31T11:59:00Z");
}

TEST(DosListingLine, IsoDateAnd24HourClock) {
    auto e = parseDosListingLine("2023-06-15  18:45  <dir>  logs", kYear);
    ASSERT_TRUE(e.has_value());
    EXPECT_TRUE(e->isDirectory);
    EXPECT_EQ(formatUtcTimestamp(*e->modified), "2023-06-15T18:45:00Z");
}

TEST(DosListingLine, MidnightAndNoon) {
    auto midnight = parseDosListingLine("01-01-24  12:00AM  <DIR>  a", kYear);
    auto noon = parseDosListingLine("01-01-24  12:00PM  <DIR>  b", kYear);
    ASSERT_TRUE(midnight && noon);
    EXPECT_EQ(formatUtcTimestamp(*midnight->modified), "2024-01-01T00:00:00Z");
    EXPECT_EQ(formatUtcTimestamp(*noon->modified), "2024-01-01T12:00:00Z");
}

TEST(DosListingLine, RejectsWithoutDate) {
    EXPECT_FALSE(parseDosListingLine("not a listing line at all", kYear).has_value());
    EXPECT_FALSE(parseDosListingLine("13-40-23  02:14PM  <DIR>  bad", kYear).has_value());
    EXPECT_FALSE(parseDosListingLine("01-10-23  02:14PM  <DIR>", kYear).has_value());
}

TEST(ListingLine, FallbackKeepsTrimmedLine) {
    auto e = parseListingLine("  not a listing line at all  ", kYear);
    EXPECT_EQ(e.name, "not a listing line at all");
    EXPECT_FALSE(e.isDirectory);
    EXPECT_FALSE(e.size.has_value());
    EXPECT_FALSE(e.modified.has_value());
    EXPECT_FALSE(e.permissions.has_value());
    EXPECT_EQ(e.rawLine, "  not a listing line at all  ");
}

TEST(ListingLine, UnixWinsOverDos) {
    auto e = parseListingLine("-rw-r--r-- 1 u g 5 Jan 10 2020 01-10-23", kYear);
    EXPECT_TRUE(e.permissions.has_value());
    EXPECT_EQ(e.name, "01-10-23");
}

TEST(ListingLine, EmptyLineGivesEmptyFallback) {
    auto e = parseListingLine("", kYear);
    EXPECT_EQ(e.name, "");
    EXPECT_EQ(e.rawLine, "");
    EXPECT_FALSE(e.isDirectory);
}
