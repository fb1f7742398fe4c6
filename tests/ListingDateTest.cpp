// Listing date parsing and UTC timestamp formatting.
#include <gtest/gtest.h>
#include "remotefs/ListingDate.hpp"

using namespace remotefs;

TEST(ListingDate, MakeUtcTimestampKnownValues) {
    EXPECT_EQ(makeUtcTimestamp(1970, 1, 1).value(), 0);
    EXPECT_EQ(makeUtcTimestamp(2000, 3, 1).value(), 951868800);
    EXPECT_EQ(makeUtcTimestamp(2023, 11, 14, 22, 13, 20).value(), 1700000000);
}

TEST(ListingDate, MakeUtcTimestampRejectsInvalidFields) {
    EXPECT_FALSE(makeUtcTimestamp(2023, 2, 29).has_value());
    EXPECT_TRUE(makeUtcTimestamp(2024, 2, 29).has_value());
    EXPECT_FALSE(makeUtcTimestamp(1900, 2, 29).has_value());
    EXPECT_TRUE(makeUtcTimestamp(2000, 2, 29).has_value());
    EXPECT_FALSE(makeUtcTimestamp(2023, 13, 1).has_value());
    EXPECT_FALSE(makeUtcTimestamp(2023, 4, 31).has_value());
    EXPECT_FALSE(makeUtcTimestamp(2023, 1, 1, 24, 0, 0).has_value());
    EXPECT_FALSE(makeUtcTimestamp(2023, 1, 1, 0, 60, 0).has_value());
}

TEST(ListingDate, ParseMonthNamesAndNumbers) {
    EXPECT_EQ(parseMonth("Jan").value(), 1);
    EXPECT_EQ(parseMonth("FEB").value(), 2);
    EXPECT_EQ(parseMonth("september").value(), 9);
    EXPECT_EQ(parseMonth("Sept").value(), 9);
    EXPECT_EQ(parseMonth("12").value(), 12);
    EXPECT_FALSE(parseMonth("13").has_value());
    EXPECT_FALSE(parseMonth("Ja").has_value());
    EXPECT_FALSE(parseMonth("").has_value());
}

TEST(ListingDate, UnixDateForms) {
    EXPECT_EQ(formatUtcTimestamp(parseUnixListingDate("Jan", "10", "10:00", 2024).value()),
              "2024-01-10T10:00:00Z");
    EXPECT_EQ(formatUtcTimestamp(parseUnixListingDate("Jan", "20", "2023", 2024).value()),
              "2023-01-20T00:00:00Z");
    EXPECT_EQ(formatUtcTimestamp(parseUnixListingDate("Mar", "5", "08:09:10", 2022).value()),
              "2022-03-05T08:09:10Z");
    EXPECT_FALSE(parseUnixListingDate("Foo", "10", "10:00", 2024).has_value());
    EXPECT_FALSE(parseUnixListingDate("Jan", "x", "10:00", 2024).has_value());
    EXPECT_FALSE(parseUnixListingDate("Jan", "10", "10:0", 2024).has_value());
    EXPECT_FALSE(parseUnixListingDate("Jan", "10", "23", 2024).has_value());
}

TEST(ListingDate, DosDateForms) {
    EXPECT_EQ(formatUtcTimestamp(parseDosListingDate("01-10-23", "02:14PM").value()),
              "2023-01-10T14:14:00Z");
    EXPECT_EQ(formatUtcTimestamp(parseDosListingDate("01/10/2023", "14:14").value()),
              "2023-01-10T14:14:00Z");
    EXPECT_EQ(formatUtcTimestamp(parseDosListingDate("2023-01-10", "02:14am").value()),
              "2023-01-10T02:14:00Z");
    // Two-digit years pivot at 50.
    EXPECT_EQ(formatUtcTimestamp(parseDosListingDate("07-04-76", "09:00AM").value()),
              "1976-07-04T09:00:00Z");
    EXPECT_FALSE(parseDosListingDate("01-10-23", "13:00PM").has_value());
    EXPECT_FALSE(parseDosListingDate("01-10", "10:00").has_value());
    EXPECT_FALSE(parseDosListingDate("01-10-123", "10:00").has_value());
}

TEST(ListingDate, FormatHandlesEpochAndPreEpoch) {
    EXPECT_EQ(formatUtcTimestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatUtcTimestamp(-1), "1969-12-31T23:59:59Z");
    EXPECT_EQ(formatUtcTimestamp(1700000000), "2023-11-14T22:13:20Z");
}
