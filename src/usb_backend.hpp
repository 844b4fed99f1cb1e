// =============================================================================
// SmartScreen - USB Backend Interface
// =============================================================================
// Narrow seam between the transport layer and the USB stack. The production
// implementation is LibusbBackend; tests substitute an in-memory backend.
// =============================================================================
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "result.hpp"

namespace smartscreen {

// One physical panel as seen at enumeration time
struct DeviceIdentity {
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    std::string serial;          // serial descriptor, or "bus%03u:%03u" fallback
    uint8_t bus = 0;
    uint8_t address = 0;
    std::string port_path;       // "bus-port.port..." topology path
    std::string product;         // product string descriptor ("" if unreadable)
    uint16_t bcd_device = 0;     // firmware revision, BCD

    std::string bus_address() const;
    std::string firmware_version() const;  // "1.02" style, from bcd_device
    std::string describe() const;          // for log lines
};

// Claimed interface on an opened device. Destruction releases it.
class UsbLink {
public:
    virtual ~UsbLink() = default;

    // Whole buffer or error (short transfers are Io errors)
    virtual Result<void> bulk_write(const uint8_t* data, size_t len, unsigned timeout_ms) = 0;

    // Bytes read, Timeout if nothing arrived in time
    virtual Result<size_t> bulk_read(uint8_t* data, size_t len, unsigned timeout_ms) = 0;

    // Release the interface and close the handle; safe to call repeatedly
    virtual void release() = 0;
};

class UsbBackend {
public:
    virtual ~UsbBackend() = default;

    // All attached devices with the given VID/PID, in bus order
    virtual Result<std::vector<DeviceIdentity>> scan(uint16_t vid, uint16_t pid) = 0;

    // Open and claim the panel interface. A claim refused because another
    // handle still holds the interface is reported as DeviceBusy.
    virtual Result<std::unique_ptr<UsbLink>> open(const DeviceIdentity& identity) = 0;
};

} // namespace smartscreen
