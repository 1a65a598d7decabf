#include "exec_harness/result_slot.h"
#include "exec_harness/errors.h"

#include <sys/mman.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <new>
#include <string>

namespace exec_harness {

namespace {

enum SlotState : uint32_t {
    kEmpty = 0,
    kWriting = 1,
    kReady = 2,
};

// Longest prefix of `text` no longer than `limit` bytes that does not end
// inside a UTF-8 sequence.
size_t utf8_prefix(const std::string& text, size_t limit) {
    if (text.size() <= limit) return text.size();
    size_t n = limit;
    while (n > 0 && (static_cast<unsigned char>(text[n]) & 0xC0) == 0x80) --n;
    return n;
}

} // anonymous namespace

struct ResultSlot::Layout {
    std::atomic<uint32_t> state;
    int32_t outcome;
    int32_t line_number;
    uint32_t has_offending_line;
    uint32_t kind_len;
    uint32_t detail_len;
    uint32_t line_len;
    char payload[kPayloadCapacity];   // kind, then detail, then offending line
};

static_assert(std::atomic<uint32_t>::is_always_lock_free,
              "slot state must be usable across processes");

ResultSlot::ResultSlot() {
    void* mem = mmap(nullptr, sizeof(Layout), PROT_READ | PROT_WRITE,
                     MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (mem == MAP_FAILED) {
        throw SetupError(std::string("mmap of result slot failed: ") + strerror(errno));
    }
    layout_ = new (mem) Layout();
    layout_->state.store(kEmpty, std::memory_order_relaxed);
}

ResultSlot::~ResultSlot() {
    layout_->~Layout();
    munmap(layout_, sizeof(Layout));
}

bool ResultSlot::publish(const ExecutionResult& result) {
    uint32_t expected = kEmpty;
    if (!layout_->state.compare_exchange_strong(expected, kWriting, std::memory_order_acq_rel)) {
        return false;
    }

    size_t kind_len = utf8_prefix(result.error_kind, kMaxErrorKind);
    size_t line_len = result.offending_line
        ? utf8_prefix(*result.offending_line, kMaxOffendingLine)
        : 0;
    size_t detail_len = utf8_prefix(result.detail, kPayloadCapacity - kind_len - line_len);

    char* out = layout_->payload;
    std::memcpy(out, result.error_kind.data(), kind_len);
    out += kind_len;
    std::memcpy(out, result.detail.data(), detail_len);
    out += detail_len;
    if (result.offending_line) {
        std::memcpy(out, result.offending_line->data(), line_len);
    }

    layout_->outcome = static_cast<int32_t>(result.outcome);
    layout_->line_number = result.line_number;
    layout_->has_offending_line = result.offending_line ? 1 : 0;
    layout_->kind_len = static_cast<uint32_t>(kind_len);
    layout_->detail_len = static_cast<uint32_t>(detail_len);
    layout_->line_len = static_cast<uint32_t>(line_len);

    layout_->state.store(kReady, std::memory_order_release);
    return true;
}

std::optional<ExecutionResult> ResultSlot::take() const {
    if (layout_->state.load(std::memory_order_acquire) != kReady) {
        return std::nullopt;
    }

    ExecutionResult result;
    result.outcome = static_cast<Outcome>(layout_->outcome);
    result.line_number = layout_->line_number;

    const char* in = layout_->payload;
    result.error_kind.assign(in, layout_->kind_len);
    in += layout_->kind_len;
    result.detail.assign(in, layout_->detail_len);
    in += layout_->detail_len;
    if (layout_->has_offending_line) {
        result.offending_line = std::string(in, layout_->line_len);
    }
    return result;
}

} // namespace exec_harness
