// Rate limiter for progress callbacks: forwards an update once enough bytes or
// enough time accumulated since the previous one, whichever comes first.
#pragma once
#include "Types.hpp"
#include <chrono>

namespace ferry {

class ProgressGate {
public:
    ProgressGate(ProgressFn sink, std::uint64_t thresholdBytes, int intervalMs);

    // Reports (done, total) if due. Values lower than the last reported are ignored.
    void update(std::uint64_t done, std::uint64_t total);
    // Reports the final value unless it was already the last one reported.
    void finish(std::uint64_t done, std::uint64_t total);

    std::uint64_t lastReported() const { return lastDone_; }

private:
    using clock = std::chrono::steady_clock;

    void emit(std::uint64_t done, std::uint64_t total);

    ProgressFn sink_;
    std::uint64_t threshold_;
    std::chrono::milliseconds interval_;
    std::uint64_t lastDone_ = 0;
    bool emitted_ = false;
    clock::time_point lastTick_;
};

} // namespace ferry
