#include <progression/counters/counter_store.hpp>
#include <progression/core/log.hpp>

namespace progression::counters {

int64_t CounterStore::increment(const std::string& key, int64_t delta) {
    if (delta < 0) {
        core::log_debug("counters", "Ignoring negative increment {} for '{}'", delta, key);
        return get(key);
    }

    int64_t& value = m_values[key];
    value = saturating_add(value, delta);
    return value;
}

int64_t CounterStore::set(const std::string& key, int64_t value) {
    if (value < 0) {
        core::log_debug("counters", "Ignoring negative value {} for '{}'", value, key);
        return get(key);
    }

    int64_t& slot = m_values[key];
    int64_t previous = slot;
    slot = value;
    return previous;
}

int64_t CounterStore::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return 0;
}

bool CounterStore::contains(const std::string& key) const {
    return m_values.contains(key);
}

void CounterStore::restore(const Snapshot& values) {
    m_values.clear();
    for (const auto& [key, value] : values) {
        if (value < 0) {
            core::log_warning("counters", "Dropping negative counter '{}' ({})", key, value);
            continue;
        }
        m_values[key] = value;
    }
}

void CounterStore::clear() {
    m_values.clear();
}

} // namespace progression::counters
