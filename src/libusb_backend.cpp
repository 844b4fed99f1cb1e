#include "libusb_backend.hpp"
#include <cstdio>
#include <cstring>
#include "screen_log.hpp"
#include "screen_protocol.hpp"

using namespace smartscreen::protocol;

namespace smartscreen {

namespace {

std::string read_string_descriptor(libusb_device_handle* handle, uint8_t index) {
    if (index == 0 || !handle) return "";

    char buf[256] = {0};
    int ret = libusb_get_string_descriptor_ascii(handle, index,
                                                 reinterpret_cast<unsigned char*>(buf),
                                                 sizeof(buf) - 1);
    if (ret > 0) {
        return std::string(buf, static_cast<size_t>(ret));
    }
    return "";
}

std::string make_port_path(libusb_device* dev) {
    uint8_t ports[8];
    int n = libusb_get_port_numbers(dev, ports, sizeof(ports));
    std::string path = std::to_string(libusb_get_bus_number(dev));
    if (n <= 0) return path;
    path += "-";
    for (int i = 0; i < n; i++) {
        if (i > 0) path += ".";
        path += std::to_string(ports[i]);
    }
    return path;
}

ErrorKind kind_for_transfer(int ret) {
    return ret == LIBUSB_ERROR_TIMEOUT ? ErrorKind::Timeout : ErrorKind::Io;
}

} // anonymous namespace

// =============================================================================
// LibusbBackend
// =============================================================================

Result<std::unique_ptr<LibusbBackend>> LibusbBackend::create() {
    libusb_context* ctx = nullptr;
    int ret = libusb_init(&ctx);
    if (ret != LIBUSB_SUCCESS) {
        SLOG_ERROR("usb", "Failed to init libusb: %s", libusb_error_name(ret));
        return Error(ErrorKind::Io, std::string("libusb init failed: ") + libusb_error_name(ret), ret);
    }

#if LIBUSB_API_VERSION >= 0x01000106
    libusb_set_option(ctx, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_WARNING);
#endif

    return std::unique_ptr<LibusbBackend>(new LibusbBackend(ctx));
}

LibusbBackend::~LibusbBackend() {
    if (ctx_) {
        libusb_exit(ctx_);
        ctx_ = nullptr;
    }
}

DeviceIdentity LibusbBackend::describe_device(libusb_device* dev,
                                              const libusb_device_descriptor& desc) {
    DeviceIdentity id;
    id.vendor_id = desc.idVendor;
    id.product_id = desc.idProduct;
    id.bus = libusb_get_bus_number(dev);
    id.address = libusb_get_device_address(dev);
    id.port_path = make_port_path(dev);
    id.bcd_device = desc.bcdDevice;

    // String descriptors need a handle; a device we cannot open still gets
    // listed under its bus:address fallback serial.
    libusb_device_handle* handle = nullptr;
    int ret = libusb_open(dev, &handle);
    if (ret == LIBUSB_SUCCESS) {
        id.serial = read_string_descriptor(handle, desc.iSerialNumber);
        id.product = read_string_descriptor(handle, desc.iProduct);
        libusb_close(handle);
    } else {
        SLOG_DEBUG("usb", "Cannot open %03u:%03u for descriptors: %s",
                   id.bus, id.address, libusb_error_name(ret));
    }

    if (id.serial.empty()) {
        char fallback[32];
        snprintf(fallback, sizeof(fallback), "bus%03u:%03u", id.bus, id.address);
        id.serial = fallback;
    }
    return id;
}

Result<std::vector<DeviceIdentity>> LibusbBackend::scan(uint16_t vid, uint16_t pid) {
    libusb_device** devs = nullptr;
    ssize_t cnt = libusb_get_device_list(ctx_, &devs);
    if (cnt < 0) {
        SLOG_ERROR("usb", "libusb_get_device_list failed: %s",
                   libusb_error_name(static_cast<int>(cnt)));
        return Error(ErrorKind::Io, "device list failed", static_cast<int>(cnt));
    }

    std::vector<DeviceIdentity> found;
    for (ssize_t i = 0; i < cnt; i++) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devs[i], &desc) != 0) continue;
        if (desc.idVendor != vid || desc.idProduct != pid) continue;
        found.push_back(describe_device(devs[i], desc));
    }

    libusb_free_device_list(devs, 1);
    SLOG_DEBUG("usb", "Scan %04x:%04x found %zu device(s)", vid, pid, found.size());
    return found;
}

Result<std::unique_ptr<UsbLink>> LibusbBackend::open(const DeviceIdentity& identity) {
    libusb_device** devs = nullptr;
    ssize_t cnt = libusb_get_device_list(ctx_, &devs);
    if (cnt < 0) {
        return Error(ErrorKind::Io, "device list failed", static_cast<int>(cnt));
    }

    libusb_device* target = nullptr;
    for (ssize_t i = 0; i < cnt; i++) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devs[i], &desc) != 0) continue;
        if (desc.idVendor == identity.vendor_id && desc.idProduct == identity.product_id &&
            libusb_get_bus_number(devs[i]) == identity.bus &&
            libusb_get_device_address(devs[i]) == identity.address) {
            target = libusb_ref_device(devs[i]);
            break;
        }
    }
    libusb_free_device_list(devs, 1);

    if (!target) {
        return Error(ErrorKind::NotFound, "device " + identity.describe() + " is gone");
    }

    libusb_device_handle* handle = nullptr;
    int ret = libusb_open(target, &handle);
    if (ret != LIBUSB_SUCCESS) {
        libusb_unref_device(target);
        SLOG_ERROR("usb", "Failed to open %s: %s", identity.describe().c_str(),
                   libusb_error_name(ret));
        if (ret == LIBUSB_ERROR_ACCESS) {
            SLOG_INFO("usb", "Hint: add a udev rule granting access to %04x:%04x",
                      identity.vendor_id, identity.product_id);
        }
        ErrorKind kind = (ret == LIBUSB_ERROR_BUSY) ? ErrorKind::DeviceBusy
                       : (ret == LIBUSB_ERROR_NO_DEVICE) ? ErrorKind::NotFound
                       : ErrorKind::Io;
        return Error(kind, std::string("open failed: ") + libusb_error_name(ret), ret);
    }

    // Kernel driver detach is Linux-only
    ret = libusb_set_auto_detach_kernel_driver(handle, 1);
    if (ret != LIBUSB_SUCCESS) {
        SLOG_DEBUG("usb", "Auto-detach unavailable: %s", libusb_error_name(ret));
    }

    ret = libusb_claim_interface(handle, PANEL_INTERFACE);
    if (ret != LIBUSB_SUCCESS) {
        libusb_close(handle);
        libusb_unref_device(target);
        if (ret == LIBUSB_ERROR_BUSY) {
            SLOG_DEBUG("usb", "Interface busy on %s", identity.describe().c_str());
            return Error(ErrorKind::DeviceBusy, "Resource busy", ret);
        }
        SLOG_ERROR("usb", "Failed to claim interface for %s: %s",
                   identity.describe().c_str(), libusb_error_name(ret));
        return Error(ErrorKind::Io, std::string("claim failed: ") + libusb_error_name(ret), ret);
    }

    // Find bulk endpoints
    struct libusb_config_descriptor* config = nullptr;
    ret = libusb_get_active_config_descriptor(target, &config);
    libusb_unref_device(target);
    if (ret != LIBUSB_SUCCESS) {
        SLOG_ERROR("usb", "Failed to get config descriptor for %s", identity.describe().c_str());
        libusb_release_interface(handle, PANEL_INTERFACE);
        libusb_close(handle);
        return Error(ErrorKind::Io, "no active configuration", ret);
    }

    uint8_t ep_out = 0, ep_in = 0;
    const auto& alt = config->interface[PANEL_INTERFACE].altsetting[0];
    for (int i = 0; i < alt.bNumEndpoints; i++) {
        const struct libusb_endpoint_descriptor* ep = &alt.endpoint[i];
        if ((ep->bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK) continue;
        if ((ep->bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_OUT) {
            if (ep_out == 0) ep_out = ep->bEndpointAddress;
        } else {
            if (ep_in == 0) ep_in = ep->bEndpointAddress;
        }
    }
    libusb_free_config_descriptor(config);

    if (ep_out == 0 || ep_in == 0) {
        SLOG_ERROR("usb", "Unable to locate bulk endpoints on %s", identity.describe().c_str());
        libusb_release_interface(handle, PANEL_INTERFACE);
        libusb_close(handle);
        return Error(ErrorKind::Io, "bulk endpoints not found");
    }

    SLOG_INFO("usb", "Opened %s (ep_out=0x%02x, ep_in=0x%02x)",
              identity.describe().c_str(), ep_out, ep_in);
    return std::unique_ptr<UsbLink>(new LibusbLink(handle, ep_out, ep_in, identity.serial));
}

// =============================================================================
// LibusbLink
// =============================================================================

Result<void> LibusbLink::bulk_write(const uint8_t* data, size_t len, unsigned timeout_ms) {
    if (!handle_) return Error(ErrorKind::Io, "link closed");

    int transferred = 0;
    int ret = libusb_bulk_transfer(handle_, ep_out_, const_cast<uint8_t*>(data),
                                   static_cast<int>(len), &transferred, timeout_ms);
    if (ret != LIBUSB_SUCCESS) {
        SLOG_ERROR("usb", "[%s] USB write error: %s", name_.c_str(), libusb_error_name(ret));
        return Error(kind_for_transfer(ret), std::string("write: ") + libusb_error_name(ret), ret);
    }
    if (transferred != static_cast<int>(len)) {
        SLOG_ERROR("usb", "[%s] Partial write: %d of %zu bytes", name_.c_str(), transferred, len);
        return Error(ErrorKind::Io, "short write of " + std::to_string(transferred) + " bytes");
    }
    return Ok();
}

Result<size_t> LibusbLink::bulk_read(uint8_t* data, size_t len, unsigned timeout_ms) {
    if (!handle_) return Error(ErrorKind::Io, "link closed");

    int transferred = 0;
    int ret = libusb_bulk_transfer(handle_, ep_in_, data, static_cast<int>(len),
                                   &transferred, timeout_ms);
    if (ret != LIBUSB_SUCCESS) {
        if (ret != LIBUSB_ERROR_TIMEOUT) {
            SLOG_ERROR("usb", "[%s] USB read error: %s", name_.c_str(), libusb_error_name(ret));
        }
        return Error(kind_for_transfer(ret), std::string("read: ") + libusb_error_name(ret), ret);
    }
    return static_cast<size_t>(transferred);
}

void LibusbLink::release() {
    if (!handle_) return;

    int ret = libusb_release_interface(handle_, PANEL_INTERFACE);
    if (ret != LIBUSB_SUCCESS && ret != LIBUSB_ERROR_NOT_FOUND && ret != LIBUSB_ERROR_NO_DEVICE) {
        SLOG_WARN("usb", "[%s] release_interface failed: %s", name_.c_str(), libusb_error_name(ret));
    }
    libusb_close(handle_);
    handle_ = nullptr;
    SLOG_DEBUG("usb", "[%s] Released", name_.c_str());
}

} // namespace smartscreen
