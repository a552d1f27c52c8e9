/*
 * ============================================================================
 * GCU FILE WRITER
 * ============================================================================
 *
 * Drains the telemetry and raw BMS queues into two files:
 *
 *   <base>/<log_directory>/data.csv   CSV header once, then one row per line
 *   <base>/<log_directory>/bms.csv    raw timestamped BMS reports
 *
 * <base> is the USB drive mount point when one is mounted, the fallback
 * directory otherwise. Mount and eject requests come from the scheduler
 * and are served on this thread between two drains.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_FILE_WRITER_HPP
#define GCU_FILE_WRITER_HPP

#include "gcu_config.hpp"
#include "gcu_errors.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_line_queue.hpp"
#include "gcu_logging.hpp"
#include "gcu_worker.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace gcu {

struct FileWriterConfig {
    std::string log_directory;                  // relative to the drive / fallback
    std::string fallback_directory = "/home/gcu";
    std::string data_file = "data.csv";
    std::string bms_file = "bms.csv";

    void validate() const {
        if (log_directory.empty()) throw ConfigError("Missing required config value: ldir");
        if (fallback_directory.empty()) throw ConfigError("Missing required config value: fallback");
    }

    static FileWriterConfig from_key_values(const KeyValueConfig& kv,
                                            const std::string& section = "filewriter") {
        const std::string p = section + ".";
        FileWriterConfig c;
        if (!kv.has(p + "ldir")) throw ConfigError("Missing required config value: ldir");
        c.log_directory = kv.require_string(p + "ldir");
        c.fallback_directory = kv.get_string(p + "fallback", c.fallback_directory);
        c.validate();
        return c;
    }
};

class CsvFileWriter final : public Worker, public IFileWriterControl {
public:
    CsvFileWriter(const FileWriterConfig& config,
                  LineQueue& telemetry,
                  LineQueue* bms_archive,
                  std::string csv_header,
                  IUsbDrive* usb,
                  IDigitalOutput* safe_to_remove_led,
                  ILogger& logger)
        : Worker("filewriter", logger, 0.1),
          config_(config),
          telemetry_(telemetry),
          bms_archive_(bms_archive),
          csv_header_(std::move(csv_header)),
          usb_(usb),
          safe_led_(safe_to_remove_led),
          eject_requested_(false),
          safe_to_remove_(false)
    {
        config_.validate();
        base_directory_ = config_.fallback_directory;
        if (usb_ != nullptr) {
            if (auto mp = usb_->mount_point()) base_directory_ = *mp;
        }
        set_safe_to_remove(false);
        logger_.info(name(), "Logging to " + log_directory());
    }

    ~CsvFileWriter() override {
        stop();
    }

    /* ===================== CONTROL (scheduler thread) ===================== */

    void request_mount(const std::string& device) override {
        std::lock_guard<std::mutex> lock(request_mutex_);
        mount_request_ = device;
    }

    void request_eject() override {
        eject_requested_.store(true);
    }

    void set_safe_to_remove(bool safe) override {
        safe_to_remove_.store(safe);
        if (safe_led_ != nullptr) {
            safe_led_->write(safe);
        }
    }

    bool safe_to_remove() const { return safe_to_remove_.load(); }

    std::string log_directory() const {
        std::lock_guard<std::mutex> lock(request_mutex_);
        return (std::filesystem::path(base_directory_) / config_.log_directory).string();
    }

    // Serve pending requests, then write every queued line
    void drain() {
        std::optional<std::string> mount;
        {
            std::lock_guard<std::mutex> lock(request_mutex_);
            mount.swap(mount_request_);
        }

        if (mount) {
            switch_to_drive(*mount);
        } else if (eject_requested_.exchange(false)) {
            eject();
        }

        if (!data_.is_open()) {
            open_files();
        }

        write_all(telemetry_, data_);
        if (bms_archive_ != nullptr) {
            write_all(*bms_archive_, bms_);
        }
    }

protected:
    void poll_once() override {
        drain();
    }

private:
    void switch_to_drive(const std::string& device) {
        close_files();
        std::optional<std::string> mp;
        if (usb_ != nullptr) {
            mp = usb_->mount(device);
        }
        if (mp) {
            set_base(*mp);
            logger_.info(name(), "Mounted " + device + " at " + *mp);
        } else {
            logger_.error(name(), "Could not mount " + device);
        }
        open_files();
    }

    void eject() {
        close_files();
        if (usb_ != nullptr && !usb_->unmount_mounted()) {
            logger_.error(name(), "Could not unmount the log drive");
        }
        set_safe_to_remove(true);
        set_base(config_.fallback_directory);
        logger_.info(name(), "Drive ejected, logging to " + log_directory());
        open_files();
    }

    void set_base(const std::string& base) {
        std::lock_guard<std::mutex> lock(request_mutex_);
        base_directory_ = base;
    }

    void open_files() {
        const std::filesystem::path dir = log_directory();
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw TransportError("Cannot create log directory " + dir.string() + ": " + ec.message());
        }

        const std::filesystem::path data_path = dir / config_.data_file;
        const bool needs_header = !std::filesystem::exists(data_path, ec) ||
                                  std::filesystem::file_size(data_path, ec) == 0;

        data_.open(data_path, std::ios::out | std::ios::app);
        if (!data_) {
            throw TransportError("Cannot open " + data_path.string());
        }
        if (needs_header) {
            write_line(data_, csv_header_);
        }

        const std::filesystem::path bms_path = dir / config_.bms_file;
        bms_.open(bms_path, std::ios::out | std::ios::app);
        if (!bms_) {
            data_.close();
            throw TransportError("Cannot open " + bms_path.string());
        }
    }

    void close_files() {
        if (data_.is_open()) data_.close();
        if (bms_.is_open()) bms_.close();
    }

    void write_all(LineQueue& queue, std::ofstream& file) {
        while (auto line = queue.try_pop()) {
            write_line(file, *line);
        }
        file.flush();
    }

    void write_line(std::ofstream& file, const std::string& line) {
        file << line;
        if (line.empty() || line.back() != '\n') file << '\n';
        if (!file) {
            logger_.error(name(), "Could not write to log file");
            file.clear();
        }
    }

    FileWriterConfig config_;
    LineQueue& telemetry_;
    LineQueue* bms_archive_;
    const std::string csv_header_;
    IUsbDrive* usb_;
    IDigitalOutput* safe_led_;

    mutable std::mutex request_mutex_;
    std::optional<std::string> mount_request_;
    std::string base_directory_;
    std::atomic<bool> eject_requested_;
    std::atomic<bool> safe_to_remove_;

    std::ofstream data_;
    std::ofstream bms_;
};

} // namespace gcu

#endif // GCU_FILE_WRITER_HPP
