#include "usb_backend.hpp"
#include <cstdio>

namespace smartscreen {

std::string DeviceIdentity::bus_address() const {
    char buf[16];
    snprintf(buf, sizeof(buf), "%03u:%03u", bus, address);
    return buf;
}

std::string DeviceIdentity::firmware_version() const {
    char buf[16];
    snprintf(buf, sizeof(buf), "%u.%02u", (bcd_device >> 8) & 0xFF, bcd_device & 0xFF);
    return buf;
}

std::string DeviceIdentity::describe() const {
    return "device serial=" + serial + " (bus:addr=" + bus_address() + ")";
}

} // namespace smartscreen
