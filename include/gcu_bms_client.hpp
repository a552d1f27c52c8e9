/*
 * ============================================================================
 * GCU BMS CLIENT
 * ============================================================================
 *
 * Reads the battery management system's serial reports line by line.
 *
 * PER LINE:
 *   1. checksum check (short line / bad hex / mismatch -> dropped, DEBUG)
 *   2. archive "YYYY-MM-DD HH:MM:SS,<line>" to the raw BMS queue
 *      (full queue -> line dropped)
 *   3. parse into BmsStatus under the client mutex
 *   4. string status -> republish bms_soc, bms_voltage, bms_current,
 *      bms_temperature into the SharedStore
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_BMS_CLIENT_HPP
#define GCU_BMS_CLIENT_HPP

#include "gcu_bms_protocol.hpp"
#include "gcu_config.hpp"
#include "gcu_data_source.hpp"
#include "gcu_errors.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_line_queue.hpp"
#include "gcu_logging.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_worker.hpp"

#include <cstdio>
#include <ctime>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace gcu {

namespace bms_keys {

inline const MeasurementKey SOC = "bms_soc";
inline const MeasurementKey VOLTAGE = "bms_voltage";
inline const MeasurementKey CURRENT = "bms_current";
inline const MeasurementKey TEMPERATURE = "bms_temperature";

} // namespace bms_keys

struct BmsClientConfig {
    std::string dev;
    long baudrate = 115200;
    double line_timeout_s = 1.0;

    void validate() const {
        if (dev.empty()) throw ConfigError("Missing dev, required for BMS");
        if (baudrate <= 0) throw ConfigError("Invalid baudrate for BMS");
        if (line_timeout_s <= 0.0) throw ConfigError("Invalid line timeout for BMS");
    }

    static BmsClientConfig from_key_values(const KeyValueConfig& kv, const std::string& section = "bms") {
        const std::string p = section + ".";
        for (const char* key : {"dev", "baudrate"}) {
            if (!kv.has(p + key)) throw ConfigError(std::string("Missing ") + key + ", required for BMS");
        }
        BmsClientConfig c;
        c.dev = kv.require_string(p + "dev");
        c.baudrate = kv.require_int(p + "baudrate");
        c.line_timeout_s = kv.get_double(p + "timeout", c.line_timeout_s);
        c.validate();
        return c;
    }
};

class BmsClient final : public Worker, public IDataSource {
public:
    static constexpr double RECONNECT_WAIT_S = 1.0;

    // archive may be null when no raw log is kept
    BmsClient(ILineSource& source,
              LineQueue* archive,
              SharedStore& store,
              ILogger& logger,
              const ITimeSource& clock)
        : Worker("bms", logger, 0.0),
          source_(source),
          archive_(archive),
          store_(store),
          clock_(clock)
    {
        store_.register_key(bms_keys::SOC);
        store_.register_key(bms_keys::VOLTAGE);
        store_.register_key(bms_keys::CURRENT);
        store_.register_key(bms_keys::TEMPERATURE);
        logger_.info(name(), "Started BmsClient");
    }

    ~BmsClient() override {
        stop();
    }

    // Process one received line. Returns true if it updated the status.
    bool handle_line(const std::string& raw) {
        const std::string line = bms::strip_line_ending(raw);
        if (!bms::checksum_ok(line)) {
            logger_.debug(name(), "Dropped line with bad checksum (" +
                                  std::to_string(line.size()) + " chars)");
            return false;
        }

        if (archive_ != nullptr && !archive_->push(archive_prefix() + "," + line)) {
            logger_.debug(name(), "Archive queue full, raw line dropped");
        }

        char type = '\0';
        bms::BmsStatus copy;
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            type = status_.update(line);
            copy = status_;
        } catch (const ProtocolError& e) {
            logger_.debug(name(), std::string("Dropped report: ") + e.what());
            return false;
        }

        if (type == 'S') {
            store_.set(bms_keys::SOC, to_value(copy.soc));
            store_.set(bms_keys::VOLTAGE, copy.voltage);
            store_.set(bms_keys::CURRENT, copy.current);
            store_.set(bms_keys::TEMPERATURE, to_value(copy.temperature));
        }
        return true;
    }

    bms::BmsStatus status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    /* ===================== DATA SOURCE ===================== */

    std::string csv_header() const override {
        return "SoC (%),BMS Voltage,Current (A)";
    }

    std::string csv_line(const SharedStore::Snapshot&) override {
        const bms::BmsStatus s = status();
        if (!s.soc || !s.voltage || !s.current) {
            return ",,";
        }
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%d,%f,%.1f", *s.soc, *s.voltage, *s.current);
        return buf;
    }

    void print_data(std::ostream& out, const SharedStore::Snapshot&) const override {
        const bms::BmsStatus s = status();
        out << format_status_row("State of Charge", to_value(s.soc), "%") << "\n";
        out << format_status_row("Battery Voltage", s.voltage, "V") << "\n";
        out << format_status_row("Battery Current", s.current, "A") << "\n";
    }

protected:
    void poll_once() override {
        std::optional<std::string> line;
        try {
            line = source_.read_line();
        } catch (const TransportError& e) {
            logger_.warning(name(), std::string("BMS not connected: ") + e.what());
            wait_for(RECONNECT_WAIT_S);
            return;
        }
        if (line) {
            handle_line(*line);
        }
    }

private:
    static std::optional<double> to_value(const std::optional<int>& v) {
        if (!v) return std::nullopt;
        return static_cast<double>(*v);
    }

    std::string archive_prefix() const {
        std::time_t now = static_cast<std::time_t>(clock_.unix_seconds());
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
        return buf;
    }

    ILineSource& source_;
    LineQueue* archive_;
    SharedStore& store_;
    const ITimeSource& clock_;

    mutable std::mutex mutex_;
    bms::BmsStatus status_;
};

} // namespace gcu

#endif // GCU_BMS_CLIENT_HPP
