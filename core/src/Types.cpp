// Helpers on the shared types: names, permission strings and POSIX remote paths.
#include "ferry/Types.hpp"
#include <vector>

namespace ferry {

const char* toString(TransportMode m) {
    switch (m) {
        case TransportMode::Library: return "library";
        case TransportMode::NativeTool: return "native";
    }
    return "?";
}

const char* toString(TransferDirection d) {
    return d == TransferDirection::Upload ? "upload" : "download";
}

std::string permissionString(std::uint32_t mode) {
    std::string s(10, '-');
    switch (mode & 0170000) {
        case 0040000: s[0] = 'd'; break;
        case 0120000: s[0] = 'l'; break;
        case 0020000: s[0] = 'c'; break;
        case 0060000: s[0] = 'b'; break;
        case 0010000: s[0] = 'p'; break;
        case 0140000: s[0] = 's'; break;
        default: break;
    }
    const char rwx[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (0400u >> i)) s[(size_t)i + 1] = rwx[i];
    }
    if (mode & 04000) s[3] = (mode & 0100) ? 's' : 'S';
    if (mode & 02000) s[6] = (mode & 0010) ? 's' : 'S';
    if (mode & 01000) s[9] = (mode & 0001) ? 't' : 'T';
    return s;
}

std::string normalizeRemotePath(const std::string& path) {
    if (path.empty()) return path;
    const bool absolute = path[0] == '/';
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= path.size()) {
        std::size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        std::string seg = path.substr(i, j - i);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!parts.empty() && parts.back() != "..") parts.pop_back();
            else if (!absolute) parts.push_back(seg);
        } else {
            parts.push_back(seg);
        }
        i = j + 1;
    }
    std::string out = absolute ? "/" : "";
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k) out += '/';
        out += parts[k];
    }
    if (out.empty()) out = ".";
    return out;
}

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string remoteParent(const std::string& path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return std::string();
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

} // namespace ferry
