// Parser for textual directory listing lines (Unix "ls -l" and MS-DOS/IIS
// styles) as returned by FTP LIST and SFTP longnames.
#pragma once
#include "RemoteTypes.hpp"
#include <string>
#include <vector>

namespace fetchsync {

// Fill entry.name/type/longname (and size when the line has one) from a
// listing line. Returns false for lines that do not describe an entry, such
// as "total 42" or blank lines.
bool parseListingLine(const std::string &line, RemoteEntry &entry);

// Split a LIST response into entries for directory dir. CR/LF line endings
// are both accepted; "." and ".." are dropped.
std::vector<RemoteEntry> parseListing(const std::string &text,
                                      const std::string &dir);

} // namespace fetchsync
