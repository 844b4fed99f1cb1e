#pragma once
#include <memory>
#include <string>
#include <vector>
#include "device_session.hpp"
#include "result.hpp"
#include "screen_protocol.hpp"
#include "usb_backend.hpp"

namespace smartscreen {

/**
 * Panel discovery and selector resolution.
 *
 * Indices are a transient view over the current scan sorted by serial; they
 * are recomputed on every call and never stored. Callers that need a stable
 * key across runs should use the serial.
 *
 * Selector grammar:
 *   ""          first device
 *   "<digits>"  index into the sorted list
 *   otherwise   exact serial, then unique serial prefix
 */
class DeviceEnumerator {
public:
    explicit DeviceEnumerator(UsbBackend& backend,
                              uint16_t vid = protocol::PANEL_VID,
                              uint16_t pid = protocol::PANEL_PID)
        : backend_(backend), vid_(vid), pid_(pid) {}

    // Attached panels, sorted ascending by serial
    Result<std::vector<DeviceIdentity>> list() const;

    // NotFound / Ambiguous on failure
    Result<DeviceIdentity> resolve(const std::string& selector) const;

    // resolve + DeviceSession::open
    Result<std::unique_ptr<DeviceSession>> open(const std::string& selector,
                                                const SessionOptions& options = {}) const;

    UsbBackend& backend() const { return backend_; }

private:
    UsbBackend& backend_;
    uint16_t vid_;
    uint16_t pid_;
};

// Pure selector resolution over an already sorted list
Result<DeviceIdentity> resolve_selector(const std::vector<DeviceIdentity>& sorted,
                                        const std::string& selector);

} // namespace smartscreen
