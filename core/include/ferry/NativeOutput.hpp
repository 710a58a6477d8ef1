// Tolerant parsers for the text output of native tools (ls listings, scp/rsync
// progress meters). Nothing here throws: unknown input is skipped or reported as
// indeterminate.
#pragma once
#include "Types.hpp"
#include <string>
#include <vector>
#include <ctime>

namespace ferry {

struct LsParseResult {
    std::vector<RemoteEntry> entries;
    std::size_t badLines = 0;
    std::vector<std::string> badSamples; // first few offending lines, for logs
};

enum class LsLine { Entry, Ignored, Malformed };

// Parses one line of "ls -la" output. GNU --time-style=long-iso
// ("2024-01-15 10:30") and the default BSD/BusyBox dates ("Jan 15 10:30",
// "Jan 15  2023") are accepted. "total", blank, "." and ".." lines are Ignored.
// now is used to pick the year of dates printed without one.
LsLine parseLsLine(const std::string& line, RemoteEntry& out, std::time_t now = std::time(nullptr));

// Parses a whole listing, counting malformed lines instead of failing.
LsParseResult parseLsListing(const std::string& output, std::time_t now = std::time(nullptr));

// Incremental parser for progress meters printed by scp (and rsync --progress).
// Output may arrive in arbitrary chunks; updates are separated by '\r' or '\n'.
class ProgressParser {
public:
    enum class Format { Unknown, ScpMeter, RsyncMeter };

    void feed(const std::string& chunk);

    // Latest byte estimate, clamped to total when total is known. Returns false
    // while no progress line has been recognized (indeterminate progress).
    bool bytesDone(std::uint64_t total, std::uint64_t& done) const;

    Format format() const { return format_; }
    int percent() const { return percent_; }
    std::size_t unrecognizedLines() const { return unrecognized_; }

private:
    void parseLine(const std::string& line);

    std::string pending_;
    Format format_ = Format::Unknown;
    int percent_ = -1;
    std::uint64_t bytes_ = 0;
    bool haveBytes_ = false;
    std::size_t unrecognized_ = 0;
};

} // namespace ferry
