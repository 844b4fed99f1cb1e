// =============================================================================
// In-memory UsbBackend for unit tests
// =============================================================================
// Scripted busy claims, recorded writes, one reply per written frame and
// injected write failures. No hardware or libusb needed.
// =============================================================================
#pragma once
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include "frame_codec.hpp"
#include "retry.hpp"
#include "usb_backend.hpp"

namespace smartscreen::fakes {

struct FakeDevice {
    DeviceIdentity identity;

    // Script
    int busy_claims = 0;        // next N opens fail with DeviceBusy
    bool fail_open = false;     // opens fail with Io
    long fail_write_at = -1;    // write number (0-based, over the device lifetime) that fails
    bool respond = true;        // false: every read times out
    bool corrupt_reply = false; // replies carry a broken trailer
    int stale_replies = 0;      // next N reads return a leftover Sync reply first

    // Observed
    std::vector<codec::Frame> writes;
    int open_calls = 0;
    int releases = 0;
    int reads = 0;
    bool claimed = false;
    bool reply_pending = false;

    std::vector<codec::DecodedFrame> decoded_writes() const {
        std::vector<codec::DecodedFrame> out;
        for (const auto& f : writes) {
            auto d = codec::decode_frame(f);
            if (d) out.push_back(d.value());
        }
        return out;
    }
};

class FakeLink : public UsbLink {
public:
    explicit FakeLink(std::shared_ptr<FakeDevice> dev) : dev_(std::move(dev)) {}
    ~FakeLink() override { release(); }

    Result<void> bulk_write(const uint8_t* data, size_t len, unsigned) override {
        if (released_) return Error(ErrorKind::Io, "link released");
        if (dev_->fail_write_at >= 0 &&
            static_cast<long>(dev_->writes.size()) == dev_->fail_write_at) {
            return Error(ErrorKind::Io, "injected write failure", -1);
        }
        if (len != protocol::FRAME_SIZE) {
            return Error(ErrorKind::Io, "short write of " + std::to_string(len) + " bytes");
        }
        codec::Frame frame;
        memcpy(frame.data(), data, len);
        dev_->writes.push_back(frame);
        dev_->reply_pending = true;
        return Ok();
    }

    Result<size_t> bulk_read(uint8_t* data, size_t len, unsigned) override {
        dev_->reads++;
        if (released_) return Error(ErrorKind::Io, "link released");
        if (!dev_->respond || !dev_->reply_pending) {
            return Error(ErrorKind::Timeout, "bulk read timed out", -7);
        }
        // Echo the command id of the last frame written
        auto last = codec::decode_frame(dev_->writes.back());
        auto cmd = last ? static_cast<protocol::CommandId>(last.value().command_id)
                        : protocol::CommandId::Sync;
        if (dev_->stale_replies > 0) {
            dev_->stale_replies--;
            cmd = protocol::CommandId::Sync;
        } else {
            dev_->reply_pending = false;
        }
        auto reply = codec::encode_frame(cmd, nullptr, 0, 0);
        if (!reply) return reply.error();
        codec::Frame frame = reply.value();
        if (dev_->corrupt_reply) frame[protocol::OFF_TRAILER] = 0x00;

        size_t n = len < frame.size() ? len : frame.size();
        memcpy(data, frame.data(), n);
        return n;
    }

    void release() override {
        if (released_) return;
        released_ = true;
        dev_->claimed = false;
        dev_->releases++;
    }

private:
    std::shared_ptr<FakeDevice> dev_;
    bool released_ = false;
};

class FakeUsbBackend : public UsbBackend {
public:
    FakeDevice& add(const std::string& serial, uint8_t bus = 1, uint8_t address = 0) {
        auto dev = std::make_shared<FakeDevice>();
        dev->identity.vendor_id = protocol::PANEL_VID;
        dev->identity.product_id = protocol::PANEL_PID;
        dev->identity.serial = serial;
        dev->identity.bus = bus;
        dev->identity.address = address ? address : static_cast<uint8_t>(devices_.size() + 2);
        dev->identity.port_path = std::to_string(bus) + "-" + std::to_string(devices_.size() + 1);
        dev->identity.product = "USB35INCHIPSV2";
        dev->identity.bcd_device = 0x0102;
        devices_.push_back(dev);
        return *dev;
    }

    FakeDevice& device(const std::string& serial) {
        for (auto& d : devices_) {
            if (d->identity.serial == serial) return *d;
        }
        return *devices_.front();
    }

    bool fail_scan = false;
    int scan_calls = 0;

    Result<std::vector<DeviceIdentity>> scan(uint16_t vid, uint16_t pid) override {
        scan_calls++;
        if (fail_scan) return Error(ErrorKind::Io, "injected scan failure", -1);
        std::vector<DeviceIdentity> out;
        for (const auto& d : devices_) {
            if (d->identity.vendor_id == vid && d->identity.product_id == pid) {
                out.push_back(d->identity);
            }
        }
        return out;
    }

    Result<std::unique_ptr<UsbLink>> open(const DeviceIdentity& identity) override {
        for (auto& d : devices_) {
            if (d->identity.bus != identity.bus || d->identity.address != identity.address) continue;
            d->open_calls++;
            if (d->fail_open) return Error(ErrorKind::Io, "injected open failure", -1);
            if (d->busy_claims > 0) {
                d->busy_claims--;
                return Error(ErrorKind::DeviceBusy, "interface 0 busy", -6);
            }
            if (d->claimed) return Error(ErrorKind::DeviceBusy, "interface 0 busy", -6);
            d->claimed = true;
            return std::unique_ptr<UsbLink>(new FakeLink(d));
        }
        return Error(ErrorKind::NotFound, "no device at " + identity.bus_address());
    }

private:
    std::vector<std::shared_ptr<FakeDevice>> devices_;
};

// RetryPolicy that records the waits instead of sleeping
inline RetryPolicy no_sleep_policy(std::vector<long long>* waits = nullptr, int attempts = 5) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.sleep = [waits](std::chrono::milliseconds d) {
        if (waits) waits->push_back(d.count());
    };
    return policy;
}

} // namespace smartscreen::fakes
