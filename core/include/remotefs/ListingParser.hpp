// Directory-listing parser: raw LIST text -> DirectoryEntry records.
//
// Listings have no single grammar. Each line is offered to a fixed, ordered
// list of dialect parsers (Unix "ls -l", then DOS/IIS); the first one that
// recognizes the line wins. A line no dialect recognizes still produces an
// entry whose name is the trimmed line, so no input line is ever dropped.
#pragma once
#include "RemoteTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace remotefs {

// A dialect either recognizes a whole line or returns nullopt.
using ListingDialect = std::optional<DirectoryEntry> (*)(const std::string& line, int referenceYear);

// "drwxr-xr-x  2 owner group  4096 Jan 10 10:00 name"
// Times without a year ("10:00") are placed in referenceYear.
std::optional<DirectoryEntry> parseUnixListingLine(const std::string& line, int referenceYear);

// "01-10-23  02:14PM  <DIR>  name" or "01-10-23  02:14PM  1234 name"
std::optional<DirectoryEntry> parseDosListingLine(const std::string& line, int referenceYear);

// Entry for a line no dialect recognized.
DirectoryEntry fallbackListingEntry(const std::string& line);

// Tries every dialect in order, then falls back. Never fails.
DirectoryEntry parseListingLine(const std::string& line, int referenceYear);
DirectoryEntry parseListingLine(const std::string& line);

// Splits on "\r\n", "\n" or "\r". A single trailing empty line left by a
// final terminator is dropped; every other line is kept, empty or not.
std::vector<std::string> splitListingLines(const std::string& text);

// One entry per line of text, in order.
std::vector<DirectoryEntry> parseListing(const std::string& text, int referenceYear);
std::vector<DirectoryEntry> parseListing(const std::string& text);

} // namespace remotefs
