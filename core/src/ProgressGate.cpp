#include "ferry/ProgressGate.hpp"
#include <utility>

namespace ferry {

ProgressGate::ProgressGate(ProgressFn sink, std::uint64_t thresholdBytes, int intervalMs)
    : sink_(std::move(sink)),
      threshold_(thresholdBytes ? thresholdBytes : 1),
      interval_(intervalMs > 0 ? intervalMs : 1),
      lastTick_(clock::now()) {}

void ProgressGate::emit(std::uint64_t done, std::uint64_t total) {
    lastDone_ = done;
    lastTick_ = clock::now();
    emitted_ = true;
    if (sink_) sink_(done, total);
}

void ProgressGate::update(std::uint64_t done, std::uint64_t total) {
    if (!emitted_) {
        emit(done, total);
        return;
    }
    if (done <= lastDone_) return;
    if (done - lastDone_ >= threshold_ || clock::now() - lastTick_ >= interval_) {
        emit(done, total);
    }
}

void ProgressGate::finish(std::uint64_t done, std::uint64_t total) {
    if (emitted_ && done <= lastDone_) return;
    emit(done, total);
}

} // namespace ferry
