// Parsing of ls listings and transfer progress meters. Every rule here is
// tolerant: a line we do not understand is counted, never fatal.
#include "ferry/NativeOutput.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

namespace ferry {

namespace {

struct Token {
    std::size_t pos;
    std::size_t len;
};

std::vector<Token> tokenize(const std::string& line, std::size_t maxTokens) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < line.size() && out.size() < maxTokens) {
        while (i < line.size() && std::isspace((unsigned char)line[i])) ++i;
        if (i >= line.size()) break;
        std::size_t j = i;
        while (j < line.size() && !std::isspace((unsigned char)line[j])) ++j;
        out.push_back({i, j - i});
        i = j;
    }
    return out;
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!std::isdigit((unsigned char)c)) return false;
    return true;
}

bool parseUnsigned(const std::string& s, std::uint64_t& v) {
    if (!allDigits(s)) return false;
    v = std::strtoull(s.c_str(), nullptr, 10);
    return true;
}

// "-rwxr-xr-x", optionally followed by an ACL/xattr marker (+ . @).
bool parsePermissions(const std::string& p, std::uint32_t& mode) {
    if (p.size() < 10 || p.size() > 11) return false;
    if (p.size() == 11 && p[10] != '+' && p[10] != '.' && p[10] != '@') return false;
    switch (p[0]) {
        case '-': mode = S_IFREG; break;
        case 'd': mode = S_IFDIR; break;
        case 'l': mode = S_IFLNK; break;
        case 'c': mode = S_IFCHR; break;
        case 'b': mode = S_IFBLK; break;
        case 'p': mode = S_IFIFO; break;
        case 's': mode = S_IFSOCK; break;
        default: return false;
    }
    static const char expect[9] = {'r', 'w', 'x', 'r', 'w', 'x', 'r', 'w', 'x'};
    static const std::uint32_t bits[9] = {S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP,
                                          S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH};
    for (int i = 0; i < 9; ++i) {
        const char c = p[1 + i];
        if (c == '-') continue;
        if (c == expect[i]) {
            mode |= bits[i];
            continue;
        }
        const bool execSlot = (i % 3) == 2;
        if (!execSlot) return false;
        const std::uint32_t special = (i == 2) ? S_ISUID : (i == 5) ? S_ISGID : S_ISVTX;
        const char lower = (i == 8) ? 't' : 's';
        const char upper = (i == 8) ? 'T' : 'S';
        if (c == lower) mode |= special | bits[i];
        else if (c == upper) mode |= special;
        else return false;
    }
    return true;
}

int monthIndex(const std::string& m) {
    static const char* names[12] = {"jan", "feb", "mar", "apr", "may", "jun",
                                    "jul", "aug", "sep", "oct", "nov", "dec"};
    if (m.size() != 3) return -1;
    char low[4] = {(char)std::tolower((unsigned char)m[0]), (char)std::tolower((unsigned char)m[1]),
                   (char)std::tolower((unsigned char)m[2]), 0};
    for (int i = 0; i < 12; ++i)
        if (std::strcmp(low, names[i]) == 0) return i;
    return -1;
}

bool parseClock(const std::string& s, int& hh, int& mm) {
    // HH:MM or HH:MM:SS(.frac)
    if (s.size() < 5 || s[2] != ':') return false;
    if (!std::isdigit((unsigned char)s[0]) || !std::isdigit((unsigned char)s[1]) ||
        !std::isdigit((unsigned char)s[3]) || !std::isdigit((unsigned char)s[4])) {
        return false;
    }
    hh = (s[0] - '0') * 10 + (s[1] - '0');
    mm = (s[3] - '0') * 10 + (s[4] - '0');
    return hh < 24 && mm < 60;
}

std::uint64_t toEpoch(int year, int mon, int day, int hh, int mm) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon;
    tm.tm_mday = day;
    tm.tm_hour = hh;
    tm.tm_min = mm;
    const std::time_t t = ::timegm(&tm);
    return t < 0 ? 0 : (std::uint64_t)t;
}

// Consumes the date tokens starting at idx. On success idx points at the name.
bool parseDate(const std::string& line, const std::vector<Token>& tok, std::size_t& idx,
               std::time_t now, std::uint64_t& mtime) {
    auto at = [&](std::size_t i) { return line.substr(tok[i].pos, tok[i].len); };
    if (idx >= tok.size()) return false;
    const std::string first = at(idx);

    // long-iso: 2024-01-15 10:30
    if (first.size() == 10 && first[4] == '-' && first[7] == '-') {
        if (idx + 1 >= tok.size()) return false;
        const std::string ys = first.substr(0, 4), ms = first.substr(5, 2), ds = first.substr(8, 2);
        if (!allDigits(ys) || !allDigits(ms) || !allDigits(ds)) return false;
        int hh = 0, mm = 0;
        if (!parseClock(at(idx + 1), hh, mm)) return false;
        mtime = toEpoch(std::atoi(ys.c_str()), std::atoi(ms.c_str()) - 1, std::atoi(ds.c_str()), hh, mm);
        idx += 2;
        return true;
    }

    // default: Jan 15 10:30 | Jan 15 2023
    const int mon = monthIndex(first);
    if (mon < 0 || idx + 2 >= tok.size()) return false;
    const std::string dayStr = at(idx + 1);
    if (!allDigits(dayStr) || dayStr.size() > 2) return false;
    const int day = std::atoi(dayStr.c_str());
    const std::string third = at(idx + 2);
    std::tm nowTm{};
    ::gmtime_r(&now, &nowTm);
    int hh = 0, mm = 0;
    if (parseClock(third, hh, mm)) {
        int year = nowTm.tm_year + 1900;
        // ls prints a clock only for recent files; a date ahead of now is last year.
        if (toEpoch(year, mon, day, hh, mm) > (std::uint64_t)now + 86400) --year;
        mtime = toEpoch(year, mon, day, hh, mm);
    } else if (third.size() == 4 && allDigits(third)) {
        mtime = toEpoch(std::atoi(third.c_str()), mon, day, 0, 0);
    } else {
        return false;
    }
    idx += 3;
    return true;
}

std::string trimRight(const std::string& s) {
    std::size_t e = s.size();
    while (e > 0 && (s[e - 1] == '\r' || s[e - 1] == '\n' || s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(0, e);
}

} // namespace

LsLine parseLsLine(const std::string& rawLine, RemoteEntry& out, std::time_t now) {
    const std::string line = trimRight(rawLine);
    const auto tok = tokenize(line, 16);
    if (tok.empty()) return LsLine::Ignored;
    auto at = [&](std::size_t i) { return line.substr(tok[i].pos, tok[i].len); };
    if (at(0) == "total" && tok.size() == 2) return LsLine::Ignored;

    RemoteEntry e;
    if (!parsePermissions(at(0), e.mode)) return LsLine::Malformed;
    e.permissions = at(0).substr(0, 10);
    if (tok.size() < 6) return LsLine::Malformed;

    std::uint64_t links = 0;
    if (!parseUnsigned(at(1), links)) return LsLine::Malformed;

    // Size column: after owner and group. BusyBox and some BSDs may omit the
    // group, device nodes print "major, minor". Find the first token after the
    // owner that is followed by a parseable date.
    std::size_t idx = 0;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0;
    bool found = false;
    for (std::size_t s = 3; s <= 5 && s < tok.size() && !found; ++s) {
        std::string sz = at(s);
        std::size_t next = s + 1;
        if (!sz.empty() && sz.back() == ',' && next < tok.size()) {
            // device node: "8, 1"; report size 0
            if (!allDigits(sz.substr(0, sz.size() - 1)) || !allDigits(at(next))) continue;
            sz = "0";
            ++next;
        }
        if (!parseUnsigned(sz, size)) continue;
        std::size_t d = next;
        if (parseDate(line, tok, d, now, mtime)) {
            idx = d;
            found = true;
        }
    }
    if (!found || idx >= tok.size()) return LsLine::Malformed;

    std::string name = line.substr(tok[idx].pos);
    e.is_link = S_ISLNK(e.mode);
    if (e.is_link) {
        const auto arrow = name.find(" -> ");
        if (arrow != std::string::npos) {
            e.link_target = name.substr(arrow + 4);
            name = name.substr(0, arrow);
        }
    }
    // "ls -la /some/dir" prints bare names; "ls -ld /a/b" prints the path.
    if (name.size() > 1 && name.back() == '/') name.pop_back();
    if (name.empty()) return LsLine::Malformed;
    if (name == "." || name == "..") return LsLine::Ignored;

    e.name = name;
    e.is_dir = S_ISDIR(e.mode);
    if (!e.is_dir) e.size = size;
    e.mtime = mtime;
    out = std::move(e);
    return LsLine::Entry;
}

LsParseResult parseLsListing(const std::string& output, std::time_t now) {
    LsParseResult res;
    std::size_t start = 0;
    while (start <= output.size()) {
        std::size_t end = output.find('\n', start);
        if (end == std::string::npos) end = output.size();
        const std::string line = output.substr(start, end - start);
        start = end + 1;
        RemoteEntry e;
        switch (parseLsLine(line, e, now)) {
            case LsLine::Entry: res.entries.push_back(std::move(e)); break;
            case LsLine::Ignored: break;
            case LsLine::Malformed:
                ++res.badLines;
                if (res.badSamples.size() < 3) res.badSamples.push_back(trimRight(line));
                break;
        }
        if (end == output.size()) break;
    }
    return res;
}

// ---- ProgressParser ----

namespace {

// "450KB", "1.2MB", "12" (bytes) -> byte estimate
bool parseAmount(const std::string& tok, std::uint64_t& bytes) {
    std::size_t i = 0;
    while (i < tok.size() && (std::isdigit((unsigned char)tok[i]) || tok[i] == '.')) ++i;
    if (i == 0) return false;
    const double value = std::strtod(tok.substr(0, i).c_str(), nullptr);
    const std::string unit = tok.substr(i);
    double mul = 1;
    if (unit.empty() || unit == "B") mul = 1;
    else if (unit == "KB" || unit == "K" || unit == "kB") mul = 1024.0;
    else if (unit == "MB" || unit == "M") mul = 1024.0 * 1024.0;
    else if (unit == "GB" || unit == "G") mul = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "TB" || unit == "T") mul = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else return false;
    bytes = (std::uint64_t)(value * mul);
    return true;
}

bool parsePercent(const std::string& tok, int& pct) {
    if (tok.size() < 2 || tok.back() != '%') return false;
    const std::string digits = tok.substr(0, tok.size() - 1);
    if (!allDigits(digits) || digits.size() > 3) return false;
    pct = std::atoi(digits.c_str());
    return pct <= 100;
}

std::string stripCommas(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        if (c != ',') out += c;
    return out;
}

} // namespace

void ProgressParser::feed(const std::string& chunk) {
    pending_ += chunk;
    std::size_t start = 0;
    for (std::size_t i = 0; i < pending_.size(); ++i) {
        if (pending_[i] == '\r' || pending_[i] == '\n') {
            if (i > start) parseLine(pending_.substr(start, i - start));
            start = i + 1;
        }
    }
    pending_.erase(0, start);
    // Never let an unterminated stream grow without bound.
    if (pending_.size() > 4096) pending_.erase(0, pending_.size() - 4096);
}

void ProgressParser::parseLine(const std::string& line) {
    const auto tok = tokenize(line, 32);
    std::vector<std::string> words;
    words.reserve(tok.size());
    for (const auto& t : tok) words.push_back(line.substr(t.pos, t.len));

    for (std::size_t i = 0; i < words.size(); ++i) {
        int pct = 0;
        if (!parsePercent(words[i], pct)) continue;
        // rsync: "  1,234,567  45%  1.23MB/s    0:00:01"
        if (i > 0) {
            std::uint64_t exact = 0;
            const std::string prev = stripCommas(words[i - 1]);
            if (parseUnsigned(prev, exact) && words[i - 1].find(',') != std::string::npos) {
                format_ = Format::RsyncMeter;
                percent_ = pct;
                bytes_ = exact;
                haveBytes_ = true;
                return;
            }
        }
        // scp: "file.bin   45%  450KB 450.0KB/s   00:01 ETA"
        format_ = (format_ == Format::Unknown) ? Format::ScpMeter : format_;
        percent_ = pct;
        std::uint64_t amount = 0;
        if (i + 1 < words.size() && words[i + 1].find('/') == std::string::npos &&
            parseAmount(words[i + 1], amount)) {
            bytes_ = amount;
            haveBytes_ = true;
        } else {
            haveBytes_ = false;
        }
        return;
    }
    ++unrecognized_;
}

bool ProgressParser::bytesDone(std::uint64_t total, std::uint64_t& done) const {
    if (format_ == Format::Unknown || percent_ < 0) return false;
    std::uint64_t v = 0;
    if (total > 0) {
        const std::uint64_t fromPct = total / 100 * (std::uint64_t)percent_ + (total % 100) * (std::uint64_t)percent_ / 100;
        // Unit-rounded byte amounts are coarse; trust the percentage unless the
        // amount is exact (rsync) or the file is small enough for raw bytes.
        v = (haveBytes_ && (format_ == Format::RsyncMeter || bytes_ < 1024)) ? bytes_ : fromPct;
        if (v > total) v = total;
    } else if (haveBytes_) {
        v = bytes_;
    } else {
        return false;
    }
    done = v;
    return true;
}

} // namespace ferry
