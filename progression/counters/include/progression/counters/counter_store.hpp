#pragma once

#include <string>
#include <unordered_map>
#include <cstdint>
#include <limits>

namespace progression::counters {

// Counter key incremented once per newly collected collection item
inline constexpr const char* ITEMS_COLLECTED_KEY = "items_collected";

// a + b for non-negative operands, clamped to INT64_MAX
inline int64_t saturating_add(int64_t a, int64_t b) {
    if (a > std::numeric_limits<int64_t>::max() - b) {
        return std::numeric_limits<int64_t>::max();
    }
    return a + b;
}

// ============================================================================
// CounterStore
// ============================================================================
//
// Maps progress keys to non-negative values. Unknown keys read as zero and
// are created on first write. Monotonicity is not enforced: set() may lower a
// value, and achievements that already unlocked stay unlocked.

class CounterStore {
public:
    using Snapshot = std::unordered_map<std::string, int64_t>;

    // Adds delta (>= 0) and returns the new value. Saturates at INT64_MAX.
    int64_t increment(const std::string& key, int64_t delta);

    // Sets an absolute value (>= 0) and returns the previous value
    int64_t set(const std::string& key, int64_t value);

    int64_t get(const std::string& key) const;
    bool contains(const std::string& key) const;

    size_t size() const { return m_values.size(); }
    const Snapshot& snapshot() const { return m_values; }

    // Replace all values, dropping negative entries
    void restore(const Snapshot& values);
    void clear();

private:
    Snapshot m_values;
};

} // namespace progression::counters
