#include "transfer_engine.hpp"
#include <algorithm>
#include <cstring>
#include "screen_log.hpp"

using namespace smartscreen::protocol;

namespace smartscreen {

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Ready:      return "ready";
        case TransferState::InProgress: return "in-progress";
        case TransferState::Completed:  return "completed";
        case TransferState::Aborted:    return "aborted";
        case TransferState::Cancelled:  return "cancelled";
    }
    return "?";
}

namespace {

// Leftover replies skipped before the final acknowledgement
constexpr int MAX_STALE_REPLIES = 3;

Result<void> check_destination(const std::string& path, size_t header_fixed) {
    if (path.size() > MAX_STORAGE_PATH || header_fixed + path.size() > FRAME_DATA_CAPACITY) {
        return Error(ErrorKind::InvalidArgument,
                     "destination path too long (" + std::to_string(path.size()) + " bytes)");
    }
    return Ok();
}

std::vector<uint8_t> band_header(const EncodedBand& band, const std::string& path) {
    std::vector<uint8_t> h(BAND_OFF_PATH + path.size(), 0);
    put_be32(&h[BAND_OFF_SIZE], static_cast<uint32_t>(band.data.size()));
    put_be16(&h[BAND_OFF_INDEX], band.index);
    put_be16(&h[BAND_OFF_COUNT], band.count);
    put_be16(&h[BAND_OFF_Y], band.y);
    put_be16(&h[BAND_OFF_HEIGHT], band.height);
    h[BAND_OFF_PATH_LEN] = static_cast<uint8_t>(path.size());
    memcpy(h.data() + BAND_OFF_PATH, path.data(), path.size());
    return h;
}

std::vector<uint8_t> chunk_header(size_t length, size_t index, bool end_of_stream,
                                  const std::string& path) {
    std::vector<uint8_t> h(CHUNK_OFF_PATH + path.size(), 0);
    put_be32(&h[CHUNK_OFF_SIZE], static_cast<uint32_t>(length));
    put_be32(&h[CHUNK_OFF_INDEX], static_cast<uint32_t>(index));
    h[CHUNK_OFF_EOS] = end_of_stream ? 1 : 0;
    h[CHUNK_OFF_PATH_LEN] = static_cast<uint8_t>(path.size());
    memcpy(h.data() + CHUNK_OFF_PATH, path.data(), path.size());
    return h;
}

} // anonymous namespace

// =============================================================================
// TransferSession
// =============================================================================

TransferSession::TransferSession(DeviceSession& device, TransferKind kind, CommandId cmd,
                                 std::vector<uint8_t> source, std::vector<ChunkPlan> chunks,
                                 size_t chunk_limit, TransferOptions options)
    : device_(device), kind_(kind), cmd_(cmd), source_(std::move(source)),
      chunks_(std::move(chunks)), chunk_limit_(chunk_limit), options_(std::move(options)) {}

TransferSession::~TransferSession() {
    if (state_ == TransferState::InProgress) {
        SLOG_WARN("transfer", "[%s] %s transfer dropped after %zu/%zu chunks",
                  device_.identity().serial.c_str(), transfer_kind_name(kind_),
                  chunks_sent_, chunks_.size());
    }
    release_slot();
}

void TransferSession::release_slot() {
    if (!holds_slot_) return;
    device_.end_transfer();
    holds_slot_ = false;
}

Error TransferSession::abort(const Error& cause) {
    state_ = TransferState::Aborted;
    abort_reason_ = cause.describe();
    release_slot();
    SLOG_ERROR("transfer", "[%s] %s transfer aborted at chunk %zu/%zu: %s",
               device_.identity().serial.c_str(), transfer_kind_name(kind_),
               chunks_sent_ + 1, chunks_.size(), abort_reason_.c_str());
    return Error(ErrorKind::TransferAborted,
                 std::string(transfer_kind_name(kind_)) + " transfer aborted at chunk " +
                 std::to_string(chunks_sent_ + 1) + "/" + std::to_string(chunks_.size()) + ": " +
                 abort_reason_,
                 cause.code);
}

void TransferSession::cancel() {
    if (finished()) return;
    state_ = TransferState::Cancelled;
    abort_reason_ = "cancelled by caller";
    release_slot();
    SLOG_INFO("transfer", "[%s] %s transfer cancelled after %zu/%zu chunks",
              device_.identity().serial.c_str(), transfer_kind_name(kind_),
              chunks_sent_, chunks_.size());
}

Result<void> TransferSession::send_chunk(const ChunkPlan& chunk) {
    auto header = device_.send(cmd_, chunk.header);
    if (!header) return header.error();

    const uint8_t* base = source_.data() + chunk.offset;
    for (size_t done = 0; done < chunk.length; done += FRAME_DATA_CAPACITY) {
        size_t n = std::min(FRAME_DATA_CAPACITY, chunk.length - done);
        auto sent = device_.send(cmd_, base + done, n);
        if (!sent) return sent.error();
    }
    return Ok();
}

Result<void> TransferSession::await_ack() {
    const uint8_t expected = static_cast<uint8_t>(cmd_);
    for (int attempt = 0; attempt <= MAX_STALE_REPLIES; attempt++) {
        auto ack = device_.read();
        if (!ack) {
            Error err = ack.error();
            if (err.kind == ErrorKind::Timeout) {
                err.message = "no acknowledgement after final chunk (" + err.message + ")";
            }
            return err;
        }
        if (ack.value().command_id == expected) {
            SLOG_DEBUG("transfer", "[%s] Final chunk acknowledged",
                       device_.identity().serial.c_str());
            device_.flush_input();
            return Ok();
        }
        SLOG_WARN("transfer", "[%s] Skipping stale reply id=%u while waiting for %s acknowledgement",
                  device_.identity().serial.c_str(), ack.value().command_id, cmd_name(cmd_));
    }
    return Error(ErrorKind::ProtocolFraming,
                 std::string("no matching acknowledgement after final chunk (expected ") +
                 cmd_name(cmd_) + ")");
}

Result<void> TransferSession::send_next() {
    if (state_ == TransferState::Aborted || state_ == TransferState::Cancelled) {
        return Error(ErrorKind::TransferAborted, "transfer no longer active: " + abort_reason_);
    }
    if (state_ == TransferState::Completed) {
        return Error(ErrorKind::InvalidArgument, "transfer already completed");
    }
    state_ = TransferState::InProgress;

    const ChunkPlan& chunk = chunks_[chunks_sent_];
    auto sent = send_chunk(chunk);
    if (!sent) return abort(sent.error());

    chunks_sent_++;
    bytes_sent_ += chunk.length;
    SLOG_DEBUG("transfer", "[%s] Chunk %zu/%zu sent (%zu bytes)",
               device_.identity().serial.c_str(), chunks_sent_, chunks_.size(), chunk.length);
    if (options_.progress) options_.progress(chunks_sent_, chunks_.size());

    if (chunks_sent_ == chunks_.size()) {
        auto ack = await_ack();
        if (!ack) return abort(ack.error());
        state_ = TransferState::Completed;
        release_slot();
        SLOG_INFO("transfer", "[%s] %s transfer complete: %zu bytes in %zu chunk(s)",
                  device_.identity().serial.c_str(), transfer_kind_name(kind_),
                  bytes_sent_, chunks_.size());
    }
    return Ok();
}

Result<void> TransferSession::run() {
    if (state_ == TransferState::Completed) return Ok();
    do {
        auto step = send_next();
        if (!step) return step;
    } while (!finished());
    return Ok();
}

// =============================================================================
// TransferEngine
// =============================================================================

Result<std::unique_ptr<TransferSession>> TransferEngine::begin_image(DeviceSession& device,
                                                                     const ImageBuffer& image,
                                                                     TransferOptions options) {
    if (!device.is_open()) return Error(ErrorKind::Io, "session closed");

    auto path_ok = check_destination(options.destination, BAND_OFF_PATH);
    if (!path_ok) return path_ok.error();

    auto slot = device.begin_transfer(TransferKind::Image);
    if (!slot) {
        SLOG_ERROR("transfer", "%s", slot.error().message.c_str());
        return slot.error();
    }

    auto bands = split_into_bands(image, encoder_, options.band_limit);
    if (!bands) {
        device.end_transfer();
        return bands.error();
    }

    // Bottom band first: the device stacks layers, the last one sent on top
    std::vector<uint8_t> source;
    std::vector<TransferSession::ChunkPlan> chunks;
    const auto& list = bands.value();
    for (auto it = list.rbegin(); it != list.rend(); ++it) {
        TransferSession::ChunkPlan plan;
        plan.header = band_header(*it, options.destination);
        plan.offset = source.size();
        plan.length = it->data.size();
        source.insert(source.end(), it->data.begin(), it->data.end());
        chunks.push_back(std::move(plan));
    }

    SLOG_INFO("transfer", "[%s] Image %dx%d: %zu band(s), %zu encoded bytes",
              device.identity().serial.c_str(), image.width, image.height,
              chunks.size(), source.size());

    size_t limit = options.band_limit;
    return std::unique_ptr<TransferSession>(
        new TransferSession(device, TransferKind::Image, CommandId::SendImage, std::move(source),
                            std::move(chunks), limit, std::move(options)));
}

Result<std::unique_ptr<TransferSession>> TransferEngine::begin_video(DeviceSession& device,
                                                                     std::vector<uint8_t> stream,
                                                                     TransferOptions options) {
    if (!device.is_open()) return Error(ErrorKind::Io, "session closed");
    if (stream.empty()) return Error(ErrorKind::InvalidArgument, "empty video stream");
    if (options.chunk_size == 0) return Error(ErrorKind::InvalidArgument, "chunk size must be positive");

    if (options.destination.empty()) {
        options.destination = std::string(VIDEO_DIR) + "stream.h264";
    }
    auto path_ok = check_destination(options.destination, CHUNK_OFF_PATH);
    if (!path_ok) return path_ok.error();

    auto slot = device.begin_transfer(TransferKind::Video);
    if (!slot) {
        SLOG_ERROR("transfer", "%s", slot.error().message.c_str());
        return slot.error();
    }

    std::vector<TransferSession::ChunkPlan> chunks;
    size_t count = (stream.size() + options.chunk_size - 1) / options.chunk_size;
    for (size_t i = 0; i < count; i++) {
        TransferSession::ChunkPlan plan;
        plan.offset = i * options.chunk_size;
        plan.length = std::min(options.chunk_size, stream.size() - plan.offset);
        plan.header = chunk_header(plan.length, i, i + 1 == count, options.destination);
        chunks.push_back(std::move(plan));
    }

    SLOG_INFO("transfer", "[%s] Video %zu bytes -> %s in %zu chunk(s)",
              device.identity().serial.c_str(), stream.size(), options.destination.c_str(),
              chunks.size());

    size_t limit = options.chunk_size;
    return std::unique_ptr<TransferSession>(
        new TransferSession(device, TransferKind::Video, CommandId::SendVideo, std::move(stream),
                            std::move(chunks), limit, std::move(options)));
}

Result<void> TransferEngine::upload_image(DeviceSession& device, const ImageBuffer& image,
                                          TransferOptions options) {
    auto session = begin_image(device, image, std::move(options));
    if (!session) return session.error();
    return session.value()->run();
}

Result<void> TransferEngine::upload_video(DeviceSession& device, std::vector<uint8_t> stream,
                                          TransferOptions options) {
    auto session = begin_video(device, std::move(stream), std::move(options));
    if (!session) return session.error();
    return session.value()->run();
}

} // namespace smartscreen
