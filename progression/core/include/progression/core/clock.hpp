#pragma once

#include <cstdint>

namespace progression::core {

// ============================================================================
// IClock - Wall clock used for unlock/collect timestamps
// ============================================================================

class IClock {
public:
    virtual ~IClock() = default;

    // Seconds since the Unix epoch
    virtual uint64_t now() const = 0;
};

// Reads std::chrono::system_clock
class SystemClock : public IClock {
public:
    uint64_t now() const override;
};

// Manually advanced clock for tests and replays
class ManualClock : public IClock {
public:
    explicit ManualClock(uint64_t start = 0) : m_now(start) {}

    uint64_t now() const override { return m_now; }

    void set(uint64_t timestamp) { m_now = timestamp; }
    void advance(uint64_t seconds) { m_now += seconds; }

private:
    uint64_t m_now;
};

// Process-wide system clock instance
IClock& system_clock();

} // namespace progression::core
