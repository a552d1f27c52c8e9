/*
 * ============================================================================
 * GCU REGISTER CLIENT (genset controller)
 * ============================================================================
 *
 * Polls holding registers from the genset controller over Modbus RTU or TCP
 * and publishes scaled values into the SharedStore under the register
 * address ("1030").
 *
 * POLLING:
 *   - every descriptor has its own period; a pass reads only those due
 *   - a failed read keeps the previous value and its timestamp; the
 *     descriptor is next tried one period after the failed attempt
 *
 * HOT RELOAD:
 *   reload_measurements() swaps the poll list. The CSV columns stay those of
 *   the list the client was built with, so an open log file keeps a
 *   consistent header. A watched descriptor file is checked once a second
 *   and reloaded when its modification time changes; a bad file is logged
 *   and the running list is kept.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_REGISTER_CLIENT_HPP
#define GCU_REGISTER_CLIENT_HPP

#include "gcu_config.hpp"
#include "gcu_data_source.hpp"
#include "gcu_errors.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_logging.hpp"
#include "gcu_measurement.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_worker.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

namespace gcu {

/* ================= CONFIGURATION ================= */

struct RegisterClientConfig {
    std::string mode = "rtu";   // "rtu" or "tcp"

    // RTU
    std::string dev;
    long baudrate = 9600;
    int unit_id = 10;

    // TCP
    std::string host;
    int port = 502;
    double tcp_timeout_s = 1.0;

    std::string mlistfile;

    void validate() const {
        if (mlistfile.empty()) throw ConfigError("Missing mlistfile, required for modbus");
        if (mode == "rtu") {
            if (dev.empty()) throw ConfigError("Missing dev, required for rtu");
            if (baudrate <= 0) throw ConfigError("Invalid baudrate for rtu");
            if (unit_id < 0 || unit_id > 247) throw ConfigError("Invalid id for rtu");
        } else if (mode == "tcp") {
            if (host.empty()) throw ConfigError("Missing host, required for tcp");
            if (port <= 0 || port > 65535) throw ConfigError("Invalid port for tcp");
            if (tcp_timeout_s <= 0.0) throw ConfigError("Invalid timeout for tcp");
        } else {
            throw ConfigError("Mode must be 'tcp' or 'rtu'");
        }
    }

    // Reads "<section>.mode", "<section>.dev", ... Presence of the keys the
    // selected mode needs is checked here, ranges in validate().
    static RegisterClientConfig from_key_values(const KeyValueConfig& kv,
                                                const std::string& section = "deepsea") {
        const std::string p = section + ".";
        RegisterClientConfig c;
        if (!kv.has(p + "mode")) throw ConfigError("Missing mode, required for modbus");
        if (!kv.has(p + "mlistfile")) throw ConfigError("Missing mlistfile, required for modbus");
        c.mode = kv.require_string(p + "mode");
        c.mlistfile = kv.require_string(p + "mlistfile");

        if (c.mode == "rtu") {
            for (const char* key : {"dev", "baudrate", "id"}) {
                if (!kv.has(p + key)) throw ConfigError(std::string("Missing ") + key + ", required for rtu");
            }
            c.dev = kv.require_string(p + "dev");
            c.baudrate = kv.require_int(p + "baudrate");
            c.unit_id = static_cast<int>(kv.require_int(p + "id"));
        } else if (c.mode == "tcp") {
            for (const char* key : {"host", "port"}) {
                if (!kv.has(p + key)) throw ConfigError(std::string("Missing ") + key + ", required for tcp");
            }
            c.host = kv.require_string(p + "host");
            c.port = static_cast<int>(kv.require_int(p + "port"));
            c.unit_id = static_cast<int>(kv.get_int(p + "id", 255));
            c.tcp_timeout_s = kv.get_double(p + "timeout", c.tcp_timeout_s);
        }
        c.validate();
        return c;
    }
};

/* ================= CLIENT ================= */

class RegisterClient final : public Worker, public IDataSource {
public:
    static constexpr double IDLE_INTERVAL_S = 0.01;

    RegisterClient(IRegisterTransport& transport,
                   uint8_t unit_id,
                   MeasurementList measurements,
                   SharedStore& store,
                   ILogger& logger,
                   const ITimeSource& clock)
        : Worker("deepsea", logger, IDLE_INTERVAL_S),
          transport_(transport),
          unit_id_(unit_id),
          store_(store),
          clock_(clock),
          measurements_(add_mandatory_measurements(std::move(measurements))),
          columns_(measurements_)
    {
        for (const auto& m : measurements_) {
            store_.register_key(register_key(m.address));
            last_poll_[m.address] = NEVER_POLLED;
        }
        logger_.info(name(), "Started deepsea client with " +
                             std::to_string(measurements_.size()) + " measurements");
    }

    ~RegisterClient() override {
        stop();
    }

    // One pass over the poll list, reading every descriptor that is due
    void poll_measurements() {
        const MeasurementList list = measurements();
        for (const auto& m : list) {
            const double now = clock_.now_seconds();
            if (!due(m, now)) continue;
            {
                // A failed attempt waits a full period like a successful one
                std::lock_guard<std::mutex> lock(mutex_);
                last_poll_[m.address] = now;
            }

            try {
                const auto words = transport_.read_holding_registers(unit_id_, m.address, m.length);
                const double value = m.scale(decode_registers(m, words));
                store_.set(register_key(m.address), value);
            } catch (const TimeoutError& e) {
                logger_.debug(name(), std::string("Timeout reading ") + m.name + ": " + e.what());
            } catch (const ProtocolError& e) {
                logger_.debug(name(), std::string("Controller returned an error for ") + m.name + ": " + e.what());
            } catch (const TransportError& e) {
                logger_.debug(name(), std::string("Transport error reading ") + m.name + ": " + e.what());
            }
        }
    }

    void reload_measurements(MeasurementList measurements) {
        MeasurementList next = add_mandatory_measurements(std::move(measurements));
        for (const auto& m : next) {
            store_.register_key(register_key(m.address));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::map<uint16_t, double> polls;
        for (const auto& m : next) {
            auto it = last_poll_.find(m.address);
            polls[m.address] = (it != last_poll_.end()) ? it->second : NEVER_POLLED;
        }
        last_poll_.swap(polls);
        measurements_.swap(next);
        logger_.info(name(), "Reloaded measurement list, " +
                             std::to_string(measurements_.size()) + " measurements");
    }

    void watch_measurement_file(const std::string& path) {
        watched_file_ = path;
        watched_mtime_ = modification_time(path);
        last_file_check_ = clock_.now_seconds();
    }

    // Returns true when the file changed and its list was loaded
    bool check_measurement_file() {
        if (watched_file_.empty()) return false;
        last_file_check_ = clock_.now_seconds();

        const auto mtime = modification_time(watched_file_);
        if (!mtime || mtime == watched_mtime_) return false;
        watched_mtime_ = mtime;

        try {
            reload_measurements(read_measurement_description(watched_file_));
        } catch (const ConfigError& e) {
            logger_.error(name(), std::string("Keeping measurement list: ") + e.what());
            return false;
        }
        return true;
    }

    MeasurementList measurements() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return measurements_;
    }

    /* ===================== DATA SOURCE ===================== */

    std::string csv_header() const override {
        std::vector<std::string> names;
        for (const auto& m : columns_) names.push_back(m.name);
        return join_csv(names);
    }

    std::string csv_line(const SharedStore::Snapshot& snapshot) override {
        std::vector<std::string> values;
        for (const auto& m : columns_) {
            const MeasurementKey key = register_key(m.address);
            values.push_back(format_csv_value(lookup(snapshot, key)));
            // published_at tracks the first row that carried the current value
            if (store_.updated_since_published(key)) store_.mark_published(key);
        }
        return join_csv(values);
    }

    void print_data(std::ostream& out, const SharedStore::Snapshot& snapshot) const override {
        for (const auto& m : measurements()) {
            const auto value = lookup(snapshot, register_key(m.address));
            if (value && m.unit == "sec") {
                std::time_t t = static_cast<std::time_t>(*value);
                std::tm tm_buf{};
                gmtime_r(&t, &tm_buf);
                char date[32];
                std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
                char row[128];
                std::snprintf(row, sizeof(row), "%20s %21s", m.name.c_str(), date);
                out << row << "\n";
            } else {
                out << format_status_row(m.name, value, m.unit) << "\n";
            }
        }
    }

protected:
    void poll_once() override {
        poll_measurements();
        if (clock_.now_seconds() - last_file_check_ >= FILE_CHECK_INTERVAL_S) {
            check_measurement_file();
        }
    }

private:
    static constexpr double NEVER_POLLED = -1.0e9;
    static constexpr double FILE_CHECK_INTERVAL_S = 1.0;

    static std::optional<std::filesystem::file_time_type> modification_time(const std::string& path) {
        std::error_code ec;
        const auto t = std::filesystem::last_write_time(path, ec);
        if (ec) return std::nullopt;
        return t;
    }

    bool due(const MeasurementDescriptor& m, double now) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_poll_.find(m.address);
        const double last = (it != last_poll_.end()) ? it->second : NEVER_POLLED;
        return now - last >= m.period_s;
    }

    IRegisterTransport& transport_;
    const uint8_t unit_id_;
    SharedStore& store_;
    const ITimeSource& clock_;

    mutable std::mutex mutex_;
    MeasurementList measurements_;
    std::map<uint16_t, double> last_poll_;

    const MeasurementList columns_;

    std::string watched_file_;
    std::optional<std::filesystem::file_time_type> watched_mtime_;
    double last_file_check_ = 0.0;
};

} // namespace gcu

#endif // GCU_REGISTER_CLIENT_HPP
