// Whole-listing parser: line splitting plus per-line dialect parsing.
#include "remotefs/ListingParser.hpp"
#include "remotefs/ListingDate.hpp"
#include "remotefs/Log.hpp"

namespace remotefs {

std::vector<std::string> splitListingLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(cur);
            cur.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            cur += c;
        }
    }
    lines.push_back(cur);
    if (lines.back().empty()) lines.pop_back();
    return lines;
}

std::vector<DirectoryEntry> parseListing(const std::string& text, int referenceYear) {
    const auto lines = splitListingLines(text);
    std::vector<DirectoryEntry> out;
    out.reserve(lines.size());
    std::size_t unparsed = 0;
    for (const auto& line : lines) {
        out.push_back(parseListingLine(line, referenceYear));
        if (!out.back().permissions && !out.back().modified) ++unparsed;
    }
    if (unparsed > 0) {
        LOGD("listing: %zu of %zu lines matched no dialect", unparsed, lines.size());
    }
    return out;
}

std::vector<DirectoryEntry> parseListing(const std::string& text) {
    return parseListing(text, currentUtcYear());
}

} // namespace remotefs
