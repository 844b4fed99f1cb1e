#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <libusb-1.0/libusb.h>
#include "usb_backend.hpp"

namespace smartscreen {

/**
 * libusb-1.0 implementation of UsbBackend.
 *
 * Owns one libusb context for its lifetime. Each open() returns a LibusbLink
 * holding its own handle with interface 0 claimed and the bulk endpoints
 * resolved; the link releases the interface and closes the handle when
 * destroyed.
 *
 * Error mapping:
 * - LIBUSB_ERROR_BUSY on claim           -> DeviceBusy
 * - LIBUSB_ERROR_TIMEOUT on transfer     -> Timeout
 * - LIBUSB_ERROR_NO_DEVICE / NOT_FOUND   -> NotFound (open) / Io (transfer)
 * - anything else                        -> Io
 */
class LibusbBackend : public UsbBackend {
public:
    static Result<std::unique_ptr<LibusbBackend>> create();
    ~LibusbBackend() override;

    LibusbBackend(const LibusbBackend&) = delete;
    LibusbBackend& operator=(const LibusbBackend&) = delete;

    Result<std::vector<DeviceIdentity>> scan(uint16_t vid, uint16_t pid) override;
    Result<std::unique_ptr<UsbLink>> open(const DeviceIdentity& identity) override;

private:
    explicit LibusbBackend(libusb_context* ctx) : ctx_(ctx) {}

    DeviceIdentity describe_device(libusb_device* dev, const libusb_device_descriptor& desc);

    libusb_context* ctx_ = nullptr;
};

class LibusbLink : public UsbLink {
public:
    LibusbLink(libusb_device_handle* handle, uint8_t ep_out, uint8_t ep_in, std::string name)
        : handle_(handle), ep_out_(ep_out), ep_in_(ep_in), name_(std::move(name)) {}
    ~LibusbLink() override { release(); }

    LibusbLink(const LibusbLink&) = delete;
    LibusbLink& operator=(const LibusbLink&) = delete;

    Result<void> bulk_write(const uint8_t* data, size_t len, unsigned timeout_ms) override;
    Result<size_t> bulk_read(uint8_t* data, size_t len, unsigned timeout_ms) override;
    void release() override;

private:
    libusb_device_handle* handle_ = nullptr;
    uint8_t ep_out_ = 0;
    uint8_t ep_in_ = 0;
    std::string name_;
};

} // namespace smartscreen
