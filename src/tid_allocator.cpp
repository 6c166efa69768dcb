// ============================================================================
// tid_allocator.cpp: implementation for tid_allocator.hpp
// ============================================================================

#include "xmmrpc/tid_allocator.hpp"

namespace xmmrpc {

std::optional<uint8_t> TidAllocator::allocate(const std::function<bool(uint8_t)>& is_busy) {
    uint8_t candidate = last_;
    for (int tries = 0; tries < LAST; ++tries) {
        candidate = (candidate == LAST) ? FIRST : static_cast<uint8_t>(candidate + 1);
        if (!is_busy(candidate)) {
            last_ = candidate;
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace xmmrpc
