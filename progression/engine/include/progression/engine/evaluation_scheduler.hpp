#pragma once

#include <progression/engine/config.hpp>
#include <functional>
#include <string>
#include <deque>
#include <cstdint>

namespace progression::engine {

enum class EvaluationReason : uint8_t {
    Mutation,   // A counter changed; only its dependents need evaluating
    Sweep       // Re-evaluate everything
};

const char* to_string(EvaluationReason reason);

// ============================================================================
// EvaluationScheduler
// ============================================================================
//
// Runs evaluation passes through a single callback. Mutations trigger a pass
// immediately; update(dt) adds a sweep every interval. A trigger raised while
// a pass is running is queued and runs after it, never recursively.

class EvaluationScheduler {
public:
    using EvaluateCallback = std::function<void(EvaluationReason reason, const std::string& counter_key)>;

    explicit EvaluationScheduler(float interval_seconds = DEFAULT_SWEEP_INTERVAL);

    EvaluationScheduler(const EvaluationScheduler&) = delete;
    EvaluationScheduler& operator=(const EvaluationScheduler&) = delete;

    void set_callback(EvaluateCallback callback) { m_callback = std::move(callback); }

    // Run a pass now, or after the current one when called from inside it
    void trigger(EvaluationReason reason, const std::string& counter_key = "");

    // Advance the sweep timer; fires at most one sweep per call
    void update(float dt);

    void set_interval(float seconds);
    float get_interval() const { return m_interval; }
    float time_until_sweep() const;
    void reset_timer() { m_timer = 0.0f; }

    bool is_evaluating() const { return m_evaluating; }
    size_t pending_count() const { return m_pending.size(); }
    uint64_t get_sweep_count() const { return m_sweep_count; }
    uint64_t get_pass_count() const { return m_pass_count; }

private:
    struct Request {
        EvaluationReason reason;
        std::string counter_key;
    };

    void run(const Request& request);

    EvaluateCallback m_callback;
    std::deque<Request> m_pending;

    float m_interval;
    float m_timer = 0.0f;
    bool m_evaluating = false;

    uint64_t m_sweep_count = 0;
    uint64_t m_pass_count = 0;
};

} // namespace progression::engine
