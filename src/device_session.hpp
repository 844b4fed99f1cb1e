#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "display_mode.hpp"
#include "frame_codec.hpp"
#include "result.hpp"
#include "retry.hpp"
#include "usb_backend.hpp"

namespace smartscreen {

struct SessionOptions {
    RetryPolicy open_retry;             // applied to DeviceBusy on claim
    unsigned read_timeout_ms = 2000;
    unsigned write_timeout_ms = 2000;
    unsigned flush_timeout_ms = 100;
    int flush_reads = 5;
};

/**
 * One opened panel.
 *
 * Request/response is strictly synchronous on the calling thread. Sessions on
 * different devices are independent and may be used from different threads;
 * a single session must not be shared between threads.
 *
 * The claimed interface is released by close() or the destructor, whichever
 * comes first, on every exit path.
 */
class DeviceSession {
public:
    static Result<std::unique_ptr<DeviceSession>> open(UsbBackend& backend,
                                                       const DeviceIdentity& identity,
                                                       const SessionOptions& options = {});
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    const DeviceIdentity& identity() const { return identity_; }
    const SessionOptions& options() const { return options_; }
    bool is_open() const { return link_ != nullptr; }

    // Exactly one encoded frame
    Result<void> write(const codec::Frame& frame);

    // One frame from the IN endpoint, decoded
    Result<codec::DecodedFrame> read(unsigned timeout_ms);
    Result<codec::DecodedFrame> read() { return read(options_.read_timeout_ms); }

    // Encode + write, no acknowledgement expected
    Result<void> send(protocol::CommandId cmd, const uint8_t* payload, size_t len);
    Result<void> send(protocol::CommandId cmd, const std::vector<uint8_t>& payload = {}) {
        return send(cmd, payload.data(), payload.size());
    }

    // Encode + write + read acknowledgement, then drain stale input
    Result<codec::DecodedFrame> request(protocol::CommandId cmd,
                                        const std::vector<uint8_t>& payload = {});

    // Discard pending IN data (bounded number of short reads)
    void flush_input();

    void close();

    // Last mode persisted through this session, if any
    const std::optional<DisplayMode>& last_mode() const { return last_mode_; }
    void set_last_mode(const DisplayMode& mode) { last_mode_ = mode; }

    // Transfer bookkeeping used by TransferSession
    std::optional<TransferKind> active_transfer() const { return active_transfer_; }
    Result<void> begin_transfer(TransferKind kind);
    void end_transfer() { active_transfer_.reset(); }

    uint64_t frames_written() const { return frames_written_; }
    uint64_t frames_read() const { return frames_read_; }

private:
    DeviceSession(DeviceIdentity identity, std::unique_ptr<UsbLink> link, SessionOptions options);

    DeviceIdentity identity_;
    std::unique_ptr<UsbLink> link_;
    SessionOptions options_;

    std::optional<DisplayMode> last_mode_;
    std::optional<TransferKind> active_transfer_;

    uint64_t frames_written_ = 0;
    uint64_t frames_read_ = 0;
};

} // namespace smartscreen
