// Calendar helpers for the timestamps found in directory listings.
// Listing times carry no zone; they are read as UTC wall-clock values.
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace remotefs {

// Seconds since the epoch for a proleptic Gregorian date/time, or nullopt
// when a field is out of range (Feb 30, 24:00, month 13, ...).
std::optional<std::int64_t> makeUtcTimestamp(int year, int month, int day,
                                             int hour = 0, int minute = 0, int second = 0);

// "Jan"/"january"/"01" -> 1 .. 12 (case-insensitive English names).
std::optional<int> parseMonth(const std::string& token);

// Unix listing date: "Jan 10 10:00" (referenceYear) or "Jan 20 2023" (midnight).
std::optional<std::int64_t> parseUnixListingDate(const std::string& month,
                                                 const std::string& day,
                                                 const std::string& timeOrYear,
                                                 int referenceYear);

// DOS listing date/time: "01-10-23" + "02:14PM", also "2023-01-10" and "01/10/2023".
std::optional<std::int64_t> parseDosListingDate(const std::string& date,
                                                const std::string& time);

// ISO-8601 "YYYY-MM-DDTHH:MM:SSZ" rendering of an epoch timestamp.
std::string formatUtcTimestamp(std::int64_t epochSeconds);

int currentUtcYear();

} // namespace remotefs
