#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "device_session.hpp"
#include "display_mode.hpp"
#include "image_bands.hpp"
#include "result.hpp"
#include "screen_protocol.hpp"

namespace smartscreen {

struct TransferOptions {
    // On-device target path. Images: empty = display only. Video: empty =
    // VIDEO_DIR + "stream.h264".
    std::string destination;
    size_t band_limit = protocol::IMAGE_BAND_LIMIT;
    size_t chunk_size = protocol::VIDEO_CHUNK_SIZE;
    // Called after every chunk with (chunks_sent, total_chunks)
    std::function<void(size_t, size_t)> progress;
};

enum class TransferState { Ready, InProgress, Completed, Aborted, Cancelled };

const char* transfer_state_name(TransferState state);

/**
 * One multi-chunk upload to one device.
 *
 * Each chunk is a header frame followed by data frames of up to
 * FRAME_DATA_CAPACITY bytes, all inside the enciphered span. Image chunks
 * are bands sent bottom-to-top; video chunks are stream slices sent in
 * order, the last one flagged end-of-stream. One device
 * acknowledgement is read after the final chunk.
 *
 * Any I/O, timeout or framing failure aborts the session: nothing is retried
 * and every later send_next()/run() fails with TransferAborted. A new
 * transfer has to start from offset zero.
 *
 * The session holds the device's transfer slot until it completes, aborts,
 * is cancelled or is destroyed. It must not outlive the DeviceSession.
 */
class TransferSession {
public:
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Send the next chunk (and the final acknowledgement read after the last)
    Result<void> send_next();

    // Send all remaining chunks
    Result<void> run();

    // Stop sending; the device keeps whatever partial data it received
    void cancel();

    TransferKind kind() const { return kind_; }
    TransferState state() const { return state_; }
    bool finished() const { return state_ != TransferState::Ready && state_ != TransferState::InProgress; }
    size_t total_chunks() const { return chunks_.size(); }
    size_t chunks_sent() const { return chunks_sent_; }
    size_t bytes_sent() const { return bytes_sent_; }
    size_t total_bytes() const { return source_.size(); }
    size_t chunk_limit() const { return chunk_limit_; }
    const std::string& destination() const { return options_.destination; }

private:
    friend class TransferEngine;

    struct ChunkPlan {
        std::vector<uint8_t> header;   // header frame payload
        size_t offset = 0;             // into source_
        size_t length = 0;
    };

    TransferSession(DeviceSession& device, TransferKind kind, protocol::CommandId cmd,
                    std::vector<uint8_t> source, std::vector<ChunkPlan> chunks,
                    size_t chunk_limit, TransferOptions options);

    Result<void> send_chunk(const ChunkPlan& chunk);
    Result<void> await_ack();
    Error abort(const Error& cause);
    void release_slot();

    DeviceSession& device_;
    TransferKind kind_;
    protocol::CommandId cmd_;
    std::vector<uint8_t> source_;
    std::vector<ChunkPlan> chunks_;
    size_t chunk_limit_;
    TransferOptions options_;

    TransferState state_ = TransferState::Ready;
    size_t chunks_sent_ = 0;
    size_t bytes_sent_ = 0;
    bool holds_slot_ = true;
    std::string abort_reason_;
};

class TransferEngine {
public:
    explicit TransferEngine(BandEncoder& encoder) : encoder_(encoder) {}

    // Band the image and plan the upload. Nothing is sent yet.
    Result<std::unique_ptr<TransferSession>> begin_image(DeviceSession& device,
                                                         const ImageBuffer& image,
                                                         TransferOptions options = {});

    // Plan a raw Annex-B stream upload. Nothing is sent yet.
    Result<std::unique_ptr<TransferSession>> begin_video(DeviceSession& device,
                                                         std::vector<uint8_t> stream,
                                                         TransferOptions options = {});

    // begin + run
    Result<void> upload_image(DeviceSession& device, const ImageBuffer& image,
                              TransferOptions options = {});
    Result<void> upload_video(DeviceSession& device, std::vector<uint8_t> stream,
                              TransferOptions options = {});

private:
    BandEncoder& encoder_;
};

} // namespace smartscreen
