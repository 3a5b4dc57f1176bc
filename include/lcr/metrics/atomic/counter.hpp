#pragma once

#include <atomic>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing event counter (relaxed ordering)
//
// Counters are observed from other threads for diagnostics only; they never
// synchronize program state.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct counter {
    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}
    // Identity-bound: a counter is never copied or moved
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;
    counter(counter&&) noexcept = delete;
    counter& operator=(counter&&) noexcept = delete;

    // Snapshot into another counter
    void copy_to(counter& other) const noexcept {
        other.value_.store(value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }

    [[nodiscard]] inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

    // "  <label> : <value>" line used by telemetry dumps
    inline void dump(std::ostream& os, std::string_view label) const {
        os << "  " << label << " : " << load() << '\n';
    }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
