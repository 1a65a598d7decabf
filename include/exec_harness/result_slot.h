#pragma once

#include <cstddef>
#include <optional>

#include "result.h"

namespace exec_harness {

/// Single-entry result channel shared across fork(). Backed by an anonymous
/// MAP_SHARED mapping created before the fork, so the worker's write is
/// visible to the supervisor without any reader running concurrently.
///
/// The worker publishes at most once; the supervisor takes the entry only
/// after the worker has stopped. A publish interrupted by a kill leaves the
/// slot empty.
class ResultSlot {
public:
    /// Bytes available for error kind, detail and offending line together.
    static constexpr size_t kPayloadCapacity = 60 * 1024;
    static constexpr size_t kMaxErrorKind = 256;
    static constexpr size_t kMaxOffendingLine = 4096;

    ResultSlot();
    ~ResultSlot();

    ResultSlot(const ResultSlot&) = delete;
    ResultSlot& operator=(const ResultSlot&) = delete;

    /// Write the result. Returns false if the slot was already written.
    /// Oversized strings are truncated to fit.
    bool publish(const ExecutionResult& result);

    /// The published result, or nothing if no complete publish happened.
    std::optional<ExecutionResult> take() const;

private:
    struct Layout;
    Layout* layout_;
};

} // namespace exec_harness
