#ifndef GCU_LINE_QUEUE_HPP
#define GCU_LINE_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace gcu {

// ============================================================================
// BOUNDED LINE QUEUE
// ============================================================================
//
// Carries CSV telemetry rows and raw BMS lines from producers to the file
// writer thread. push() never blocks: a full queue is reported to the caller,
// which decides whether that is fatal (telemetry) or a dropped line (BMS).
//
class LineQueue {
public:
    explicit LineQueue(std::size_t capacity) : capacity_(capacity) {}

    LineQueue(const LineQueue&) = delete;
    LineQueue& operator=(const LineQueue&) = delete;

    bool push(std::string line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lines_.size() >= capacity_) {
            return false;
        }
        lines_.push_back(std::move(line));
        return true;
    }

    std::optional<std::string> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }

    bool empty() const { return size() == 0; }
    std::size_t capacity() const { return capacity_; }

private:
    std::optional<std::string> pop_locked() {
        if (lines_.empty()) return std::nullopt;
        std::string line = std::move(lines_.front());
        lines_.pop_front();
        return line;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
};

} // namespace gcu

#endif // GCU_LINE_QUEUE_HPP
