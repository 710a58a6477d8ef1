#pragma once
#include "Connector.hpp"
#include <vector>

namespace ferry {

// Lists path (relative to the profile's base path when not absolute) over
// whichever mode the connection is bound to. Returns true on partial success
// with err.kind == PartialParseWarning. Entries are sorted directories first,
// then by case-insensitive name.
bool listRemote(Connection& conn,
                const std::string& path,
                std::vector<RemoteEntry>& out,
                ListError& err);

void sortEntries(std::vector<RemoteEntry>& entries);

} // namespace ferry
