#include "fetchsync/ListingParser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace fetchsync {

namespace {

std::vector<std::string> splitWhitespace(const std::string &line) {
    std::vector<std::string> out;
    std::istringstream in(line);
    std::string tok;
    while (in >> tok)
        out.push_back(tok);
    return out;
}

bool allDigits(const std::string &s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

// Size column; 0 when it is not a number or does not fit.
std::uint64_t parseSize(const std::string &s) {
    if (!allDigits(s))
        return 0;
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
    return errno == ERANGE ? 0 : static_cast<std::uint64_t>(v);
}

// MM-DD-YY or YYYY-MM-DD at the start of the line.
bool startsWithDosDate(const std::string &line) {
    auto digitsAt = [&line](std::size_t pos, std::size_t n) {
        if (line.size() < pos + n)
            return false;
        for (std::size_t i = pos; i < pos + n; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(line[i])))
                return false;
        }
        return true;
    };
    if (digitsAt(0, 4) && line.size() >= 10 && line[4] == '-' &&
        digitsAt(5, 2) && line[7] == '-' && digitsAt(8, 2))
        return true;
    return digitsAt(0, 2) && line.size() >= 8 && line[2] == '-' &&
           digitsAt(3, 2) && line[5] == '-' && digitsAt(6, 2);
}

std::string stripLineEnd(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    return line;
}

} // namespace

bool parseListingLine(const std::string &rawLine, RemoteEntry &entry) {
    const std::string line = stripLineEnd(rawLine);
    const auto tokens = splitWhitespace(line);
    if (tokens.size() < 2)
        return false;

    EntryType type;
    std::uint64_t size = 0;
    const char lead = line.front();
    if (lead == 'd' || lead == '-' || lead == 'l') {
        type = lead == 'd' ? EntryType::Directory
               : lead == '-' ? EntryType::File
                             : EntryType::Other;
        // perms links owner group size month day time name
        if (tokens.size() >= 9)
            size = parseSize(tokens[4]);
    } else if (startsWithDosDate(line)) {
        type = line.find("<DIR>") != std::string::npos ? EntryType::Directory
                                                      : EntryType::File;
        if (type == EntryType::File && tokens.size() >= 4)
            size = parseSize(tokens[2]);
    } else {
        return false;
    }

    entry.name = tokens.back();
    entry.longname = line;
    entry.type = type;
    entry.size = size;
    return true;
}

std::vector<RemoteEntry> parseListing(const std::string &text,
                                      const std::string &dir) {
    std::vector<RemoteEntry> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        RemoteEntry e;
        if (!parseListingLine(line, e))
            continue;
        if (e.name == "." || e.name == "..")
            continue;
        e.directory = dir;
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace fetchsync
