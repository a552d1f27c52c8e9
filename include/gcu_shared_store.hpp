/*
 * ============================================================================
 * GCU SHARED STORE
 * ============================================================================
 *
 * Most-recent measurement per key, written by the acquisition workers and
 * read by the scheduler (CSV rows, PID input, interlocks, gauges).
 *
 * KEYS:
 *   - register address as decimal string  ("1030")
 *   - analog channel id                   ("P9_40")
 *   - named BMS field                     ("bms_soc")
 *
 * CONCURRENCY:
 *   - the key map is guarded by a shared_mutex taken exclusively only to
 *     insert a new key (keys are never removed)
 *   - each entry has its own mutex held for the duration of one read/write
 *   - snapshot() copies entry by entry: no torn value for any single key,
 *     but no cross-key transaction either
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_SHARED_STORE_HPP
#define GCU_SHARED_STORE_HPP

#include "gcu_interfaces.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace gcu {

using MeasurementKey = std::string;

inline MeasurementKey register_key(uint32_t address) {
    return std::to_string(address);
}

struct MeasurementSample {
    std::optional<double> value;
    double updated_at_s = -1.0;    // monotonic, -1 = never written
    double published_at_s = -1.0;  // monotonic, -1 = never logged
};

class SharedStore {
public:
    using Snapshot = std::map<MeasurementKey, MeasurementSample>;

    SharedStore() : clock_(default_clock_) {}
    explicit SharedStore(const ITimeSource& clock) : clock_(clock) {}

    SharedStore(const SharedStore&) = delete;
    SharedStore& operator=(const SharedStore&) = delete;

    // Create an absent entry; no-op if the key already exists
    void register_key(const MeasurementKey& key) {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        entries_.emplace(key, std::make_unique<Entry>());
    }

    void set(const MeasurementKey& key, std::optional<double> value) {
        Entry& e = entry_for_write(key);
        const double now = clock_.now_seconds();
        std::lock_guard<std::mutex> lk(e.mutex);
        e.sample.value = value;
        e.sample.updated_at_s = now;
    }

    std::optional<double> get(const MeasurementKey& key) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        std::lock_guard<std::mutex> lk(it->second->mutex);
        return it->second->sample.value;
    }

    std::optional<MeasurementSample> sample(const MeasurementKey& key) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        std::lock_guard<std::mutex> lk(it->second->mutex);
        return it->second->sample;
    }

    bool contains(const MeasurementKey& key) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        return entries_.count(key) != 0;
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        return entries_.size();
    }

    Snapshot snapshot() const {
        Snapshot out;
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        for (const auto& kv : entries_) {
            std::lock_guard<std::mutex> lk(kv.second->mutex);
            out.emplace(kv.first, kv.second->sample);
        }
        return out;
    }

    // Record that the current value of key was written to the telemetry log
    void mark_published(const MeasurementKey& key) {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return;
        const double now = clock_.now_seconds();
        std::lock_guard<std::mutex> lk(it->second->mutex);
        it->second->sample.published_at_s = now;
    }

    bool updated_since_published(const MeasurementKey& key) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return false;
        std::lock_guard<std::mutex> lk(it->second->mutex);
        const MeasurementSample& s = it->second->sample;
        return s.updated_at_s >= 0.0 && s.updated_at_s > s.published_at_s;
    }

private:
    struct Entry {
        mutable std::mutex mutex;
        MeasurementSample sample;
    };

    Entry& entry_for_write(const MeasurementKey& key) {
        {
            std::shared_lock<std::shared_mutex> lock(map_mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) return *it->second;
        }
        // Entries are heap-allocated and never erased, so the reference
        // stays valid after the map lock is dropped.
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        auto result = entries_.emplace(key, std::make_unique<Entry>());
        return *result.first->second;
    }

    SteadyTimeSource default_clock_;
    const ITimeSource& clock_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<MeasurementKey, std::unique_ptr<Entry>> entries_;
};

} // namespace gcu

#endif // GCU_SHARED_STORE_HPP
