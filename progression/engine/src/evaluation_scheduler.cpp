#include <progression/engine/evaluation_scheduler.hpp>
#include <progression/core/log.hpp>
#include <algorithm>

namespace progression::engine {

const char* to_string(EvaluationReason reason) {
    switch (reason) {
        case EvaluationReason::Mutation: return "Mutation";
        case EvaluationReason::Sweep: return "Sweep";
    }
    return "Unknown";
}

EvaluationScheduler::EvaluationScheduler(float interval_seconds)
    : m_interval(interval_seconds > 0.0f ? interval_seconds : DEFAULT_SWEEP_INTERVAL) {
}

void EvaluationScheduler::trigger(EvaluationReason reason, const std::string& counter_key) {
    Request request{reason, counter_key};

    if (m_evaluating) {
        m_pending.push_back(std::move(request));
        return;
    }

    // Clears m_evaluating however the drain loop exits
    struct EvaluatingGuard {
        bool& flag;
        explicit EvaluatingGuard(bool& f) : flag(f) { flag = true; }
        ~EvaluatingGuard() { flag = false; }
    } guard(m_evaluating);

    run(request);

    // Drain triggers raised by collaborators during the pass
    while (!m_pending.empty()) {
        Request next = std::move(m_pending.front());
        m_pending.pop_front();
        run(next);
    }
}

void EvaluationScheduler::update(float dt) {
    if (dt <= 0.0f) return;

    m_timer += dt;
    if (m_timer >= m_interval) {
        m_timer = 0.0f;
        trigger(EvaluationReason::Sweep);
    }
}

void EvaluationScheduler::set_interval(float seconds) {
    if (seconds <= 0.0f) {
        core::log_warning("scheduler", "Ignoring non-positive sweep interval {}", seconds);
        return;
    }
    m_interval = seconds;
}

float EvaluationScheduler::time_until_sweep() const {
    return std::max(0.0f, m_interval - m_timer);
}

void EvaluationScheduler::run(const Request& request) {
    if (request.reason == EvaluationReason::Sweep) {
        ++m_sweep_count;
    }
    ++m_pass_count;

    if (!m_callback) return;

    try {
        m_callback(request.reason, request.counter_key);
    } catch (const std::exception& e) {
        core::log_error("scheduler", "{} pass failed: {}", to_string(request.reason), e.what());
    } catch (...) {
        core::log_error("scheduler", "{} pass failed: unknown exception", to_string(request.reason));
    }
}

} // namespace progression::engine
