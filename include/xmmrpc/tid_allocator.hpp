#pragma once
/**
 * @file tid_allocator.hpp
 * @brief Cyclic transaction id source over 1..255 that never hands out a busy id.
 *
 * @details
 * The channel tag has one byte for the transaction id and 0 means "no id", so
 * only 255 ids exist. Ids are issued in order 1, 2, ..., 255, 1, ... and an id
 * whose previous call is still pending is skipped. When all 255 are pending the
 * allocation fails and the caller reports "ids_exhausted".
 *
 * Not thread-safe on its own; the dispatcher calls it under its table lock.
 */

#include <cstdint>
#include <functional>
#include <optional>

namespace xmmrpc {

class TidAllocator {
public:
    static constexpr uint8_t FIRST = 1;
    static constexpr uint8_t LAST  = 255;

    /// @param is_busy returns true for ids that must not be issued yet.
    std::optional<uint8_t> allocate(const std::function<bool(uint8_t)>& is_busy);

    /// Id issued most recently (0 before the first allocation).
    uint8_t last() const { return last_; }

private:
    uint8_t last_{0};
};

} // namespace xmmrpc
