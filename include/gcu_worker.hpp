/*
 * ============================================================================
 * GCU WORKER
 * ============================================================================
 *
 * Base class for every polling thread (register client, BMS client, analog
 * acquisition, PID loop, file writer).
 *
 * LIFECYCLE:
 *   start()  -> spawns the thread, which calls poll_once() until cancelled
 *   cancel() -> advisory stop; wakes an idle wait, never interrupts poll_once()
 *   join()   -> blocks until the thread returned (no timeout)
 *
 * FAILURE CONTAINMENT (catch-log-continue):
 *   - TransientError   : logged at WARNING, loop continues
 *   - std::exception   : logged at ERROR with its type, loop continues
 *   - anything else    : logged at ERROR, loop continues
 *   - FatalError       : logged at CRITICAL, loop ends, alive() turns false
 *
 * Final subclasses must call stop() from their destructor: poll_once() is
 * virtual and must not run while the derived part is being destroyed.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_WORKER_HPP
#define GCU_WORKER_HPP

#include "gcu_errors.hpp"
#include "gcu_logging.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace gcu {

class Worker {
public:
    Worker(std::string name, ILogger& logger, double idle_interval_s)
        : logger_(logger),
          name_(std::move(name)),
          idle_interval_s_(idle_interval_s),
          cancel_requested_(false),
          alive_(false) {}

    virtual ~Worker() {
        stop();
    }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    bool start() {
        if (thread_.joinable()) {
            return false;  // Already started
        }
        cancel_requested_.store(false);
        alive_.store(true);
        thread_ = std::thread(&Worker::run_loop, this);
        return true;
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            cancel_requested_.store(true);
        }
        wake_.notify_all();
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void stop() {
        cancel();
        join();
    }

    bool cancelled() const { return cancel_requested_.load(); }
    bool alive() const { return alive_.load(); }
    const std::string& name() const { return name_; }

protected:
    // One iteration of the polling body
    virtual void poll_once() = 0;

    // Cancellable sleep. Returns false if cancel() arrived while waiting.
    bool wait_for(double seconds) {
        std::unique_lock<std::mutex> lock(wake_mutex_);
        return !wake_.wait_for(lock,
                               std::chrono::duration<double>(seconds),
                               [this] { return cancel_requested_.load(); });
    }

    ILogger& logger_;

private:
    void run_loop() {
        while (!cancel_requested_.load()) {
            try {
                poll_once();
            } catch (const FatalError& e) {
                logger_.critical(name_, std::string("Fatal error, stopping thread: ") + e.what());
                break;
            } catch (const TransientError& e) {
                logger_.warning(name_, e.what());
            } catch (const std::exception& e) {
                log_exception(logger_, name_ + " thread", e);
            } catch (...) {
                // Not a std::exception: nothing to report but the fact
                logger_.error(name_, "Unknown exception in " + name_ + " thread");
            }

            if (idle_interval_s_ > 0.0) {
                wait_for(idle_interval_s_);
            }
        }
        alive_.store(false);
    }

    std::string name_;
    double idle_interval_s_;

    std::atomic<bool> cancel_requested_;
    std::atomic<bool> alive_;

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

} // namespace gcu

#endif // GCU_WORKER_HPP
