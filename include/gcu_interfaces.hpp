#ifndef GCU_INTERFACES_HPP
#define GCU_INTERFACES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gcu {

/*
 * ============================================================================
 * HARDWARE ABSTRACTION INTERFACES
 * ============================================================================
 * These interfaces decouple the GCU core from:
 *  - serial / TCP register transports
 *  - sysfs GPIO, PWM and ADC drivers
 *  - USB drive handling and the log file writer
 *  - test fakes
 *
 * NO LOGIC. CONTRACTS ONLY.
 * ============================================================================
 */

/* ================= TIME SOURCE ================= */

class ITimeSource {
public:
    virtual ~ITimeSource() = default;
    virtual double now_seconds() const = 0;   // monotonic
    virtual double unix_seconds() const = 0;  // wall clock, for telemetry rows
};

class SteadyTimeSource final : public ITimeSource {
public:
    double now_seconds() const override {
        using namespace std::chrono;
        return duration<double>(steady_clock::now().time_since_epoch()).count();
    }

    double unix_seconds() const override {
        using namespace std::chrono;
        return duration<double>(system_clock::now().time_since_epoch()).count();
    }
};

/* ================= REGISTER TRANSPORT ================= */

// Function code 0x03. Throws TransportError / TimeoutError / ProtocolError.
class IRegisterTransport {
public:
    virtual ~IRegisterTransport() = default;

    virtual std::vector<uint16_t> read_holding_registers(uint8_t unit_id,
                                                         uint16_t address,
                                                         uint16_t count) = 0;
};

/* ================= LINE SOURCE (BMS serial) ================= */

class ILineSource {
public:
    virtual ~ILineSource() = default;

    // Returns std::nullopt when no full line arrived before the timeout.
    // Throws TransportError when the device is gone.
    virtual std::optional<std::string> read_line() = 0;
};

/* ================= ANALOG INPUT ================= */

class IAnalogInput {
public:
    virtual ~IAnalogInput() = default;
    virtual double read_volts(const std::string& channel) = 0;
};

/* ================= ACTUATOR / DIGITAL IO ================= */

class IActuatorOutput {
public:
    virtual ~IActuatorOutput() = default;
    virtual void write_percent(double duty_percent) = 0;  // 0..100
};

class IDigitalInput {
public:
    virtual ~IDigitalInput() = default;
    virtual bool read() = 0;  // raw logic level, true = high
};

class IDigitalOutput {
public:
    virtual ~IDigitalOutput() = default;
    virtual void write(bool high) = 0;
};

/* ================= OPERATOR DISPLAY ================= */

class IGauge {
public:
    virtual ~IGauge() = default;
    virtual void set_level(double level) = 0;  // 0..10 bars
};

/* ================= SYSTEM SERVICES ================= */

class IWatchdog {
public:
    virtual ~IWatchdog() = default;
    virtual void kick() = 0;
};

class IPowerControl {
public:
    virtual ~IPowerControl() = default;
    virtual void power_off() = 0;
};

class IUsbDrive {
public:
    virtual ~IUsbDrive() = default;

    // Device path of a plugged drive partition, if any
    virtual std::optional<std::string> plugged() = 0;

    // Device path currently mounted as the log drive, if any
    virtual std::optional<std::string> mounted() = 0;

    // Directory the mounted drive is reachable under, if any
    virtual std::optional<std::string> mount_point() = 0;

    // Returns the mount point, std::nullopt on failure
    virtual std::optional<std::string> mount(const std::string& device) = 0;
    virtual bool unmount_mounted() = 0;
};

class IFileWriterControl {
public:
    virtual ~IFileWriterControl() = default;

    virtual void request_mount(const std::string& device) = 0;
    virtual void request_eject() = 0;
    virtual void set_safe_to_remove(bool safe) = 0;
};

} // namespace gcu

#endif // GCU_INTERFACES_HPP
