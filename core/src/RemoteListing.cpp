#include "ferry/RemoteListing.hpp"
#include "ferry/Log.hpp"
#include <algorithm>
#include <cctype>

namespace ferry {

static int compareNoCase(const std::string& a, const std::string& b) {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int ca = std::tolower((unsigned char)a[i]);
        const int cb = std::tolower((unsigned char)b[i]);
        if (ca != cb) return ca < cb ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

void sortEntries(std::vector<RemoteEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const RemoteEntry& a, const RemoteEntry& b) {
        if (a.is_dir != b.is_dir) return a.is_dir; // directories first
        const int c = compareNoCase(a.name, b.name);
        if (c != 0) return c < 0;
        return a.name < b.name;
    });
}

bool listRemote(Connection& conn,
                const std::string& path,
                std::vector<RemoteEntry>& out,
                ListError& err) {
    err.clear();
    const std::string resolved = conn.resolvePath(path);
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(conn.mutex());
        ok = conn.transfer().list(resolved, out, err);
    }
    if (!ok) {
        LOGI("List %s failed (%s): %s", resolved.c_str(), toString(err.kind), err.message.c_str());
        out.clear();
        return false;
    }
    if (err.isWarning()) {
        LOGW("List %s: %zu entries, %zu unparsed (%s mode)", resolved.c_str(), err.goodEntries,
             err.badLines, toString(conn.mode()));
    }
    sortEntries(out);
    return true;
}

} // namespace ferry
