#include "device_enumerator.hpp"
#include <algorithm>
#include <cctype>
#include "screen_log.hpp"

namespace smartscreen {

namespace {

bool is_index(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // anonymous namespace

Result<std::vector<DeviceIdentity>> DeviceEnumerator::list() const {
    auto scanned = backend_.scan(vid_, pid_);
    if (!scanned) return scanned.error();

    std::vector<DeviceIdentity> devices = std::move(scanned).value();
    // Ties (duplicate serials) fall back to topology so the order stays stable
    std::sort(devices.begin(), devices.end(), [](const DeviceIdentity& a, const DeviceIdentity& b) {
        if (a.serial != b.serial) return a.serial < b.serial;
        if (a.bus != b.bus) return a.bus < b.bus;
        return a.port_path < b.port_path;
    });
    return devices;
}

Result<DeviceIdentity> resolve_selector(const std::vector<DeviceIdentity>& sorted,
                                        const std::string& selector) {
    if (sorted.empty()) {
        return Error(ErrorKind::NotFound, "No SmartScreen devices found");
    }

    if (selector.empty()) {
        return sorted.front();
    }

    if (is_index(selector)) {
        unsigned long long index = 0;
        if (selector.size() <= 9) index = std::stoull(selector);
        else index = sorted.size();  // too long to be a real index
        if (index >= sorted.size()) {
            return Error(ErrorKind::NotFound,
                         "Device index " + selector + " out of range (0-" +
                         std::to_string(sorted.size() - 1) + ")");
        }
        return sorted[static_cast<size_t>(index)];
    }

    std::vector<const DeviceIdentity*> matches;
    for (const auto& dev : sorted) {
        if (dev.serial == selector) return dev;
        if (dev.serial.compare(0, selector.size(), selector) == 0) {
            matches.push_back(&dev);
        }
    }

    if (matches.size() == 1) return *matches.front();

    if (matches.size() > 1) {
        std::string serials;
        for (const auto* dev : matches) {
            if (!serials.empty()) serials += ", ";
            serials += dev->serial;
        }
        return Error(ErrorKind::Ambiguous,
                     "Ambiguous serial prefix '" + selector + "' matches: " + serials);
    }

    return Error(ErrorKind::NotFound, "No device found matching '" + selector + "'");
}

Result<DeviceIdentity> DeviceEnumerator::resolve(const std::string& selector) const {
    auto devices = list();
    if (!devices) return devices.error();

    auto resolved = resolve_selector(devices.value(), selector);
    if (resolved) {
        SLOG_DEBUG("enum", "Selector '%s' -> %s", selector.c_str(),
                   resolved.value().describe().c_str());
    } else {
        SLOG_WARN("enum", "%s", resolved.error().message.c_str());
    }
    return resolved;
}

Result<std::unique_ptr<DeviceSession>> DeviceEnumerator::open(const std::string& selector,
                                                              const SessionOptions& options) const {
    auto identity = resolve(selector);
    if (!identity) return identity.error();
    return DeviceSession::open(backend_, identity.value(), options);
}

} // namespace smartscreen
