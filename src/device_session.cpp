#include "device_session.hpp"
#include "screen_log.hpp"
#include "screen_protocol.hpp"

using namespace smartscreen::protocol;

namespace smartscreen {

Result<std::unique_ptr<DeviceSession>> DeviceSession::open(UsbBackend& backend,
                                                           const DeviceIdentity& identity,
                                                           const SessionOptions& options) {
    auto link = retry_with_backoff(options.open_retry, ErrorKind::DeviceBusy, "open",
                                   [&]() { return backend.open(identity); });
    if (!link) {
        Error err = link.error();
        if (err.kind == ErrorKind::DeviceBusy) {
            err.message = "interface still claimed on " + identity.describe() + " after " +
                          std::to_string(options.open_retry.max_attempts) + " attempt(s)";
        }
        SLOG_ERROR("session", "Open failed: %s", err.describe().c_str());
        return err;
    }

    SLOG_INFO("session", "Using %s", identity.describe().c_str());
    return std::unique_ptr<DeviceSession>(
        new DeviceSession(identity, std::move(link).value(), options));
}

DeviceSession::DeviceSession(DeviceIdentity identity, std::unique_ptr<UsbLink> link,
                             SessionOptions options)
    : identity_(std::move(identity)), link_(std::move(link)), options_(std::move(options)) {}

DeviceSession::~DeviceSession() {
    close();
}

void DeviceSession::close() {
    if (!link_) return;
    if (active_transfer_) {
        SLOG_WARN("session", "[%s] Closing with %s transfer in progress",
                  identity_.serial.c_str(), transfer_kind_name(*active_transfer_));
    }
    link_->release();
    link_.reset();
    SLOG_DEBUG("session", "[%s] Closed (%llu frames out, %llu in)", identity_.serial.c_str(),
               (unsigned long long)frames_written_, (unsigned long long)frames_read_);
}

Result<void> DeviceSession::write(const codec::Frame& frame) {
    if (!link_) return Error(ErrorKind::Io, "session closed");

    auto ret = link_->bulk_write(frame.data(), frame.size(), options_.write_timeout_ms);
    if (!ret) return ret.error();
    frames_written_++;
    return Ok();
}

Result<codec::DecodedFrame> DeviceSession::read(unsigned timeout_ms) {
    if (!link_) return Error(ErrorKind::Io, "session closed");

    codec::Frame buf{};
    auto got = link_->bulk_read(buf.data(), buf.size(), timeout_ms);
    if (!got) {
        if (got.error().kind == ErrorKind::Timeout) {
            SLOG_WARN("session", "[%s] No response within %u ms", identity_.serial.c_str(), timeout_ms);
        }
        return got.error();
    }
    frames_read_++;

    auto decoded = codec::decode_frame(buf.data(), got.value());
    if (!decoded) {
        SLOG_ERROR("session", "[%s] %s", identity_.serial.c_str(), decoded.error().describe().c_str());
    }
    return decoded;
}

Result<void> DeviceSession::send(CommandId cmd, const uint8_t* payload, size_t len) {
    auto frame = codec::encode_frame(cmd, payload, len, codec::timestamp_now());
    if (!frame) return frame.error();
    SLOG_TRACE("session", "[%s] -> %s (%zu bytes)", identity_.serial.c_str(), cmd_name(cmd), len);
    return write(frame.value());
}

Result<codec::DecodedFrame> DeviceSession::request(CommandId cmd,
                                                   const std::vector<uint8_t>& payload) {
    auto sent = send(cmd, payload);
    if (!sent) return sent.error();

    auto response = read();
    if (response) {
        SLOG_DEBUG("session", "[%s] %s acknowledged (id=%u)", identity_.serial.c_str(),
                   cmd_name(cmd), response.value().command_id);
        flush_input();
    }
    return response;
}

void DeviceSession::flush_input() {
    if (!link_) return;
    codec::Frame scratch{};
    for (int i = 0; i < options_.flush_reads; i++) {
        auto got = link_->bulk_read(scratch.data(), scratch.size(), options_.flush_timeout_ms);
        if (!got) break;
    }
}

Result<void> DeviceSession::begin_transfer(TransferKind kind) {
    if (active_transfer_) {
        return Error(ErrorKind::ModeConflict,
                     std::string("a ") + transfer_kind_name(*active_transfer_) +
                     " transfer is already in progress on " + identity_.serial);
    }
    if (last_mode_ && !mode_accepts(*last_mode_, kind)) {
        return Error(ErrorKind::ModeConflict,
                     std::string("device ") + identity_.serial + " is in " + mode_name(*last_mode_) +
                     " mode, refusing " + transfer_kind_name(kind) + " upload");
    }
    active_transfer_ = kind;
    return Ok();
}

} // namespace smartscreen
