#pragma once
/*
 * ============================================================================
 * GCU Linux Adapters – BeagleBone / embedded Linux implementation
 * ============================================================================
 *
 * PURPOSE:
 *   Bridges the GCU core interfaces to the board:
 *     - libmodbus RTU and TCP links to the genset controller
 *     - termios serial port for the BMS stream
 *     - sysfs IIO ADC, PWM and GPIO
 *     - /dev/watchdog, poweroff, USB drive mount/unmount
 *
 * TIMEOUTS:
 *   Every blocking read has an explicit timeout (poll() for the BMS line,
 *   the libmodbus response timeout for registers) so a silent device never
 *   hangs a worker beyond one iteration.
 *
 * ERRORS:
 *   I/O failures throw TransportError (TimeoutError for silence); bad
 *   wiring in the configuration throws ConfigError at construction.
 *
 * ============================================================================
 */

#include "gcu_config.hpp"
#include "gcu_errors.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_logging.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <map>
#include <modbus/modbus.h>
#include <optional>
#include <poll.h>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <termios.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace gcu_plugin {

using gcu::ConfigError;
using gcu::TimeoutError;
using gcu::TransportError;

inline std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

/* ============================================================================
 * FILE DESCRIPTOR OWNER
 * ============================================================================
 */

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

// Wait until fd is readable. Returns false on timeout.
inline bool wait_readable(int fd, double timeout_s) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int timeout_ms = static_cast<int>(std::ceil(timeout_s * 1000.0));
    while (true) {
        const int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc > 0) {
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                if (!(pfd.revents & POLLIN)) throw TransportError("Device hung up");
            }
            return true;
        }
        if (rc == 0) return false;
        if (errno != EINTR) throw TransportError(errno_text("poll failed"));
    }
}

inline void write_all(int fd, const uint8_t* data, std::size_t size) {
    std::size_t sent = 0;
    while (sent < size) {
        const ssize_t n = ::write(fd, data + sent, size - sent);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_text("write failed"));
        }
        sent += static_cast<std::size_t>(n);
    }
}

/* ============================================================================
 * SERIAL PORT (termios, 8N1, raw, read only: BMS stream)
 * ============================================================================
 */

class SerialPort {
public:
    SerialPort(const std::string& device, long baudrate) : device_(device) {
        FileDescriptor fd(::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK));
        if (!fd.valid()) {
            throw TransportError(errno_text("Cannot open serial port " + device));
        }

        termios tty{};
        if (::tcgetattr(fd.get(), &tty) != 0) {
            throw TransportError(errno_text("tcgetattr failed on " + device));
        }
        ::cfmakeraw(&tty);
        tty.c_cflag |= (CLOCAL | CREAD);
        tty.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        const speed_t speed = to_speed(baudrate);
        ::cfsetispeed(&tty, speed);
        ::cfsetospeed(&tty, speed);
        if (::tcsetattr(fd.get(), TCSANOW, &tty) != 0) {
            throw TransportError(errno_text("tcsetattr failed on " + device));
        }
        ::tcflush(fd.get(), TCIOFLUSH);
        fd_ = std::move(fd);
    }

    // Read whatever is available within timeout; empty vector on timeout
    std::vector<uint8_t> read_some(double timeout_s) {
        if (!wait_readable(fd_.get(), timeout_s)) return {};
        uint8_t buf[256];
        while (true) {
            const ssize_t n = ::read(fd_.get(), buf, sizeof(buf));
            if (n > 0) return std::vector<uint8_t>(buf, buf + n);
            if (n == 0) return {};
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return {};
            throw TransportError(errno_text("read failed on " + device_));
        }
    }

    const std::string& device() const { return device_; }

private:
    static speed_t to_speed(long baudrate) {
        switch (baudrate) {
            case 1200:   return B1200;
            case 2400:   return B2400;
            case 4800:   return B4800;
            case 9600:   return B9600;
            case 19200:  return B19200;
            case 38400:  return B38400;
            case 57600:  return B57600;
            case 115200: return B115200;
            case 230400: return B230400;
            default: break;
        }
        throw ConfigError("Unsupported baudrate " + std::to_string(baudrate));
    }

    std::string device_;
    FileDescriptor fd_;
};

/* ============================================================================
 * MODBUS TRANSPORTS (libmodbus)
 * ============================================================================
 * One libmodbus context per link. The context connects lazily and is closed
 * after a link failure; the next read reconnects. A timeout or an exception
 * reply from the controller leaves the link open.
 */

// Raise the exception matching a libmodbus errno
inline void throw_modbus_error(int err, const std::string& what) {
    const std::string text = what + ": " + modbus_strerror(err);
    if (err == ETIMEDOUT) throw TimeoutError(text);
    if (err > MODBUS_ENOBASE) throw gcu::ProtocolError(text);   // EMBX* and framing errors
    throw TransportError(text);
}

class ModbusTransport : public gcu::IRegisterTransport {
public:
    ~ModbusTransport() override {
        if (connected_) modbus_close(ctx_);
        modbus_free(ctx_);
    }

    ModbusTransport(const ModbusTransport&) = delete;
    ModbusTransport& operator=(const ModbusTransport&) = delete;

    std::vector<uint16_t> read_holding_registers(uint8_t unit_id,
                                                 uint16_t address,
                                                 uint16_t count) override {
        if (count == 0 || count > MODBUS_MAX_READ_REGISTERS) {
            throw gcu::ProtocolError("Cannot read " + std::to_string(count) + " registers");
        }
        if (!connected_) connect();

        if (modbus_set_slave(ctx_, unit_id) == -1) {
            throw_modbus_error(errno, "Invalid unit id " + std::to_string(unit_id));
        }

        std::vector<uint16_t> words(count);
        const int n = modbus_read_registers(ctx_, address, count, words.data());
        if (n == -1) {
            const int err = errno;
            if (err != ETIMEDOUT && err <= MODBUS_ENOBASE) disconnect();
            throw_modbus_error(err, "Reading register " + std::to_string(address) + " from " + peer_);
        }
        if (n != count) {
            throw gcu::ProtocolError("Short reply for register " + std::to_string(address));
        }
        return words;
    }

    bool connected() const { return connected_; }

protected:
    ModbusTransport(modbus_t* ctx, std::string peer, double response_timeout_s)
        : ctx_(ctx), peer_(std::move(peer))
    {
        if (ctx_ == nullptr) {
            throw ConfigError(errno_text("Cannot create Modbus context for " + peer_));
        }
        const double whole = std::floor(response_timeout_s);
        const auto sec = static_cast<uint32_t>(whole);
        const auto usec = static_cast<uint32_t>((response_timeout_s - whole) * 1e6);
        if (modbus_set_response_timeout(ctx_, sec, usec) == -1) {
            const int err = errno;
            modbus_free(ctx_);
            throw ConfigError("Invalid Modbus response timeout for " + peer_ + ": " + modbus_strerror(err));
        }
    }

private:
    void connect() {
        if (modbus_connect(ctx_) == -1) {
            throw_modbus_error(errno, "Cannot connect to " + peer_);
        }
        connected_ = true;
    }

    void disconnect() {
        modbus_close(ctx_);
        connected_ = false;
    }

    modbus_t* ctx_;
    std::string peer_;
    bool connected_ = false;
};

// Serial RTU link, 8N1
class ModbusRtuTransport final : public ModbusTransport {
public:
    ModbusRtuTransport(const std::string& device, long baudrate, double response_timeout_s = 0.1)
        : ModbusTransport(modbus_new_rtu(device.c_str(), static_cast<int>(baudrate), 'N', 8, 1),
                          device, response_timeout_s) {}
};

class ModbusTcpTransport final : public ModbusTransport {
public:
    ModbusTcpTransport(const std::string& host, int port, double timeout_s)
        : ModbusTransport(modbus_new_tcp(host.c_str(), port),
                          host + ":" + std::to_string(port), timeout_s) {}
};

/* ============================================================================
 * SERIAL LINE SOURCE (BMS)
 * ============================================================================
 */

class SerialLineSource final : public gcu::ILineSource {
public:
    SerialLineSource(SerialPort& port, double timeout_s = 1.0)
        : port_(port), timeout_s_(timeout_s) {}

    std::optional<std::string> read_line() override {
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::duration<double>(timeout_s_);
        while (true) {
            const auto nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer_.substr(0, nl + 1);
                buffer_.erase(0, nl + 1);
                return line;
            }
            const double left = std::chrono::duration<double>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0.0) return std::nullopt;

            const auto chunk = port_.read_some(left);
            buffer_.append(chunk.begin(), chunk.end());
            if (buffer_.size() > MAX_LINE) {
                buffer_.clear();  // no terminator in sight, resynchronise
            }
        }
    }

private:
    static constexpr std::size_t MAX_LINE = 4096;

    SerialPort& port_;
    double timeout_s_;
    std::string buffer_;
};

/* ============================================================================
 * SYSFS HELPERS
 * ============================================================================
 */

inline std::string read_text_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw TransportError("Cannot read " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void write_text_file(const std::string& path, const std::string& value) {
    std::ofstream out(path);
    if (!out) throw TransportError("Cannot open " + path + " for writing");
    out << value;
    out.flush();
    if (!out) throw TransportError("Cannot write " + path);
}

inline bool path_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

/* ============================================================================
 * IIO ADC (BeagleBone AIN0..AIN6, 12 bit, 1.8 V full scale)
 * ============================================================================
 */

class SysfsAdc final : public gcu::IAnalogInput {
public:
    static constexpr double FULL_SCALE_V = 1.8;
    static constexpr double MAX_RAW = 4095.0;

    explicit SysfsAdc(std::string iio_device) : iio_device_(std::move(iio_device)) {
        if (!path_exists(iio_device_)) {
            throw ConfigError("ADC device not found: " + iio_device_);
        }
    }

    double read_volts(const std::string& channel) override {
        const int ain = ain_index(channel);
        const std::string path = iio_device_ + "/in_voltage" + std::to_string(ain) + "_raw";
        const std::string text = read_text_file(path);
        const auto raw = gcu::parse_double(text);
        if (!raw) throw TransportError("Bad ADC reading from " + path);
        return *raw * FULL_SCALE_V / MAX_RAW;
    }

    static int ain_index(const std::string& channel) {
        static const std::map<std::string, int> pins = {
            {"P9_39", 0}, {"P9_40", 1}, {"P9_37", 2}, {"P9_38", 3},
            {"P9_33", 4}, {"P9_36", 5}, {"P9_35", 6},
            {"AIN0", 0}, {"AIN1", 1}, {"AIN2", 2}, {"AIN3", 3},
            {"AIN4", 4}, {"AIN5", 5}, {"AIN6", 6},
        };
        auto it = pins.find(channel);
        if (it == pins.end()) throw ConfigError("Invalid AIN or pin name: " + channel);
        return it->second;
    }

private:
    std::string iio_device_;
};

/* ============================================================================
 * SYSFS PWM
 * ============================================================================
 */

class SysfsPwm final : public gcu::IActuatorOutput {
public:
    SysfsPwm(const std::string& chip, unsigned channel, double frequency_hz)
        : dir_(chip + "/pwm" + std::to_string(channel))
    {
        if (!path_exists(dir_)) {
            write_text_file(chip + "/export", std::to_string(channel));
            // udev may take a moment to create the channel directory
            for (int i = 0; i < 50 && !path_exists(dir_); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!path_exists(dir_)) throw TransportError("PWM channel did not appear: " + dir_);
        }
        period_ns_ = static_cast<long>(std::lround(1.0e9 / frequency_hz));
        write_text_file(dir_ + "/duty_cycle", "0");
        write_text_file(dir_ + "/period", std::to_string(period_ns_));
        write_text_file(dir_ + "/enable", "1");
    }

    void write_percent(double duty_percent) override {
        const double pct = std::min(100.0, std::max(0.0, duty_percent));
        const long duty_ns = static_cast<long>(std::lround(period_ns_ * pct / 100.0));
        if (duty_ns == last_duty_ns_) return;
        write_text_file(dir_ + "/duty_cycle", std::to_string(duty_ns));
        last_duty_ns_ = duty_ns;
    }

private:
    std::string dir_;
    long period_ns_ = 0;
    long last_duty_ns_ = -1;
};

/* ============================================================================
 * SYSFS GPIO
 * ============================================================================
 */

inline int beaglebone_gpio(const std::string& pin) {
    static const std::map<std::string, int> gpios = {
        {"P8_7", 66},  {"P8_8", 67},  {"P8_9", 69},  {"P8_10", 68},
        {"P8_11", 45}, {"P8_12", 44}, {"P8_14", 26}, {"P8_15", 47},
        {"P8_16", 46}, {"P8_17", 27}, {"P8_18", 65}, {"P8_26", 61},
        {"P9_12", 60}, {"P9_15", 48}, {"P9_23", 49}, {"P9_27", 115},
        {"P9_41", 20},
    };
    auto it = gpios.find(pin);
    if (it == gpios.end()) throw ConfigError("Unknown GPIO pin: " + pin);
    return it->second;
}

class SysfsGpio {
public:
    SysfsGpio(const std::string& pin, const char* direction)
        : dir_("/sys/class/gpio/gpio" + std::to_string(beaglebone_gpio(pin)))
    {
        if (!path_exists(dir_)) {
            write_text_file("/sys/class/gpio/export", std::to_string(beaglebone_gpio(pin)));
        }
        write_text_file(dir_ + "/direction", direction);
    }

protected:
    std::string dir_;
};

class SysfsGpioInput final : public SysfsGpio, public gcu::IDigitalInput {
public:
    explicit SysfsGpioInput(const std::string& pin) : SysfsGpio(pin, "in") {}

    bool read() override {
        const std::string v = gcu::trim(read_text_file(dir_ + "/value"));
        if (v == "1") return true;
        if (v == "0") return false;
        throw TransportError("Unexpected GPIO value '" + v + "' in " + dir_);
    }
};

class SysfsGpioOutput final : public SysfsGpio, public gcu::IDigitalOutput {
public:
    explicit SysfsGpioOutput(const std::string& pin) : SysfsGpio(pin, "out") {}

    void write(bool high) override {
        write_text_file(dir_ + "/value", high ? "1" : "0");
    }
};

/* ============================================================================
 * SYSTEM SERVICES
 * ============================================================================
 */

// Opening the device arms the watchdog; every write restarts its timer
class DevWatchdog final : public gcu::IWatchdog {
public:
    explicit DevWatchdog(std::string device = "/dev/watchdog") : device_(std::move(device)) {}

    void kick() override {
        FileDescriptor fd(::open(device_.c_str(), O_WRONLY));
        if (!fd.valid()) throw TransportError(errno_text("Cannot open " + device_));
        const uint8_t nl = '\n';
        write_all(fd.get(), &nl, 1);
    }

private:
    std::string device_;
};

class SystemPowerControl final : public gcu::IPowerControl {
public:
    explicit SystemPowerControl(gcu::ILogger& logger) : logger_(logger) {}

    void power_off() override {
        const int rc = std::system("poweroff");
        if (rc != 0) {
            logger_.error("power", "poweroff returned " + std::to_string(rc));
        }
    }

private:
    gcu::ILogger& logger_;
};

/* ============================================================================
 * USB DRIVE (pmount / pumount, /proc/mounts, /sys/block)
 * ============================================================================
 */

class LinuxUsbDrive final : public gcu::IUsbDrive {
public:
    explicit LinuxUsbDrive(gcu::ILogger& logger) : logger_(logger) {}

    // First partition of the first sd* disk, e.g. "/dev/sda1"
    std::optional<std::string> plugged() override {
        for (const auto& disk : list_dir("/sys/block")) {
            if (disk.rfind("sd", 0) != 0) continue;
            for (const auto& entry : list_dir("/sys/block/" + disk)) {
                if (entry.rfind(disk, 0) == 0 && entry.size() > disk.size()) {
                    const std::string dev = "/dev/" + entry;
                    if (path_exists(dev)) return dev;
                }
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> mounted() override {
        auto m = find_mount();
        if (!m) return std::nullopt;
        return m->first;
    }

    std::optional<std::string> mount_point() override {
        auto m = find_mount();
        if (!m) return std::nullopt;
        return m->second;
    }

    std::optional<std::string> mount(const std::string& device) override {
        if (auto m = find_mount()) {
            if (m->first == device) return m->second;
            if (!unmount_mounted()) return std::nullopt;
        }
        const std::string name = basename(device);
        const int rc = std::system(("pmount " + name).c_str());
        if (rc != 0) {
            logger_.error("usb", "pmount " + name + " returned " + std::to_string(rc));
            return std::nullopt;
        }
        return mount_point();
    }

    bool unmount_mounted() override {
        auto dev = mounted();
        if (!dev) return true;
        const std::string cmd = "pumount " + basename(*dev);
        for (int tries = 0; tries < 100; ++tries) {
            if (std::system(cmd.c_str()) == 0) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        logger_.error("usb", "Could not unmount " + *dev);
        return false;
    }

private:
    static std::string basename(const std::string& path) {
        const auto slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    static std::vector<std::string> list_dir(const std::string& path) {
        std::vector<std::string> out;
        DIR* dir = ::opendir(path.c_str());
        if (dir == nullptr) return out;
        while (dirent* e = ::readdir(dir)) {
            const std::string name = e->d_name;
            if (name != "." && name != "..") out.push_back(name);
        }
        ::closedir(dir);
        std::sort(out.begin(), out.end());
        return out;
    }

    // (device, mount point) of the first mounted /dev/sd* partition
    static std::optional<std::pair<std::string, std::string>> find_mount() {
        std::ifstream mounts("/proc/mounts");
        std::string line;
        while (std::getline(mounts, line)) {
            std::istringstream iss(line);
            std::string device, dir;
            if (!(iss >> device >> dir)) continue;
            if (device.rfind("/dev/sd", 0) == 0) {
                return std::make_pair(device, dir);
            }
        }
        return std::nullopt;
    }

    gcu::ILogger& logger_;
};

/* ============================================================================
 * GAUGE
 * ============================================================================
 * The front panel LED bars are not wired on every unit; this gauge records
 * the level it would show in the log.
 */

class LoggingGauge final : public gcu::IGauge {
public:
    LoggingGauge(std::string name, gcu::ILogger& logger)
        : name_(std::move(name)), logger_(logger) {}

    void set_level(double level) override {
        const int bars = static_cast<int>(std::lround(std::min(10.0, std::max(0.0, level))));
        if (bars == last_) return;
        last_ = bars;
        logger_.info("gauge", name_ + " gauge at " + std::to_string(bars) + "/10");
    }

private:
    std::string name_;
    gcu::ILogger& logger_;
    int last_ = -1;
};

} // namespace gcu_plugin
