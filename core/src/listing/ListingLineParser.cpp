// Per-line dialect parsers for directory listings.
#include "remotefs/ListingParser.hpp"
#include "remotefs/ListingDate.hpp"
#include <cctype>
#include <cstring>
#include <limits>

namespace remotefs {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> splitWhitespace(const std::string& s, std::size_t from = 0) {
    std::vector<std::string> tokens;
    std::size_t i = from;
    while (i < s.size()) {
        while (i < s.size() && isSpace(s[i])) ++i;
        if (i >= s.size()) break;
        std::size_t start = i;
        while (i < s.size() && !isSpace(s[i])) ++i;
        tokens.push_back(s.substr(start, i - start));
    }
    return tokens;
}

std::optional<std::uint64_t> parseUnsigned(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::uint64_t v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return std::nullopt;
        v = v * 10 + digit;
    }
    return v;
}

bool isPermissionChar(char c) {
    return c != '\0' && std::strchr("rwxsStTlL-", c) != nullptr;
}

// ACL ('+'), extended attributes ('@') or SELinux context ('.') markers
// that some servers glue to the mode string.
bool isModeSuffix(char c) {
    return c == '+' || c == '@' || c == '.';
}

// Offset of the first character after the first `count` whitespace-delimited
// tokens and the whitespace that follows them; npos if the line ends first.
std::size_t offsetAfterTokens(const std::string& s, int count) {
    std::size_t i = 0;
    int seen = 0;
    while (i < s.size()) {
        while (i < s.size() && isSpace(s[i])) ++i;
        if (i >= s.size()) break;
        while (i < s.size() && !isSpace(s[i])) ++i;
        if (++seen >= count) {
            while (i < s.size() && isSpace(s[i])) ++i;
            return i < s.size() ? i : std::string::npos;
        }
    }
    return std::string::npos;
}

bool equalsIgnoreCase(const std::string& a, const char* b) {
    const std::size_t n = std::strlen(b);
    if (a.size() != n) return false;
    for (std::size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// Link count, owner, group, size, month, day, time-or-year.
constexpr std::size_t kUnixMinTokens = 7;

constexpr ListingDialect kDialects[] = {
    &parseUnixListingLine,
    &parseDosListingLine,
};

} // namespace

std::optional<DirectoryEntry> parseUnixListingLine(const std::string& line, int referenceYear) {
    if (line.size() < 10) return std::nullopt;
    if (line[0] != 'd' && line[0] != '-') return std::nullopt;
    for (std::size_t i = 1; i < 10; ++i) {
        if (!isPermissionChar(line[i])) return std::nullopt;
    }
    std::size_t pos = 10;
    if (pos < line.size() && isModeSuffix(line[pos])) ++pos;
    if (pos < line.size() && !isSpace(line[pos])) return std::nullopt;

    const auto tokens = splitWhitespace(line, pos);
    if (tokens.size() < kUnixMinTokens) return std::nullopt;

    DirectoryEntry e;
    e.rawLine = line;
    e.permissions = line.substr(0, 10);
    e.isDirectory = (line[0] == 'd');

    std::size_t idx = 0;
    // Link count is optional; when absent the first token is already the owner.
    if (parseUnsigned(tokens[idx])) ++idx;
    idx += 2; // owner, group

    if (auto size = parseUnsigned(tokens[idx])) {
        e.size = size;
        ++idx;
    }

    if (idx + 2 < tokens.size()) {
        const std::string& month = tokens[idx++];
        const std::string& day = tokens[idx++];
        const std::string& timeOrYear = tokens[idx++];
        e.modified = parseUnixListingDate(month, day, timeOrYear, referenceYear);
    }

    // Names may contain spaces, so rejoin everything after the consumed fields.
    std::string name;
    for (std::size_t i = idx; i < tokens.size(); ++i) {
        if (!name.empty()) name += ' ';
        name += tokens[i];
    }
    if (name.empty()) name = tokens.back();
    e.name = trim(name);

    if (e.name.empty()) return std::nullopt;
    return e;
}

std::optional<DirectoryEntry> parseDosListingLine(const std::string& line, int referenceYear) {
    (void)referenceYear; // DOS dates always carry their year
    const auto tokens = splitWhitespace(line);
    if (tokens.size() < 4) return std::nullopt;

    auto modified = parseDosListingDate(tokens[0], tokens[1]);
    if (!modified) return std::nullopt;

    DirectoryEntry e;
    e.rawLine = line;
    e.modified = modified;
    if (equalsIgnoreCase(tokens[2], "<DIR>")) {
        e.isDirectory = true;
    } else {
        e.isDirectory = false;
        e.size = parseUnsigned(tokens[2]);
    }

    // Cut from the source line so runs of spaces inside the name survive.
    const std::size_t nameStart = offsetAfterTokens(line, 3);
    e.name = (nameStart != std::string::npos) ? trim(line.substr(nameStart)) : tokens[3];

    if (e.name.empty()) return std::nullopt;
    return e;
}

DirectoryEntry fallbackListingEntry(const std::string& line) {
    DirectoryEntry e;
    e.name = trim(line);
    e.isDirectory = false;
    e.rawLine = line;
    return e;
}

DirectoryEntry parseListingLine(const std::string& line, int referenceYear) {
    for (ListingDialect dialect : kDialects) {
        if (auto entry = dialect(line, referenceYear)) return *entry;
    }
    return fallbackListingEntry(line);
}

DirectoryEntry parseListingLine(const std::string& line) {
    return parseListingLine(line, currentUtcYear());
}

} // namespace remotefs
