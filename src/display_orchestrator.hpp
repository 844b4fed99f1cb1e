// =============================================================================
// SmartScreen - Display Orchestrator
// =============================================================================
// Fleet setup across several panels:
//   - static plans (stats, image) first, in input order
//   - video plans last
//   - opens serialized with a fixed delay between them
//   - one failing panel never stops the batch
// =============================================================================
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "device_enumerator.hpp"
#include "device_session.hpp"
#include "display_mode.hpp"
#include "image_bands.hpp"
#include "result.hpp"
#include "transfer_engine.hpp"

namespace smartscreen {

struct DisplayPlan {
    std::string selector;
    DisplayMode mode = StatsMode{};
    DisplaySettings settings;
    std::optional<ImageBuffer> image;
    std::optional<std::vector<uint8_t>> video;
    std::string destination;    // on-device path for the asset, "" = default
};

struct DisplayResult {
    std::string selector;
    std::string serial;                        // "" if resolution failed
    std::optional<Error> error;                // empty on success
    std::unique_ptr<DeviceSession> session;    // kept open on success

    bool ok() const { return !error.has_value(); }
};

struct OrchestratorOptions {
    std::chrono::milliseconds open_delay{500};
    std::chrono::milliseconds sync_delay{200};
    SessionOptions session;
    std::function<void(std::chrono::milliseconds)> sleep;   // default: sleep_for
};

class DisplayOrchestrator {
public:
    DisplayOrchestrator(DeviceEnumerator& enumerator, TransferEngine& engine,
                        OrchestratorOptions options = {});

    // One result per plan, in input order
    std::vector<DisplayResult> setup(std::vector<DisplayPlan> plans);

    static bool is_static(const DisplayMode& mode) { return !std::holds_alternative<VideoMode>(mode); }

private:
    Result<void> configure(DisplayPlan& plan, const DeviceIdentity& identity, DisplayResult& result);
    void pause(std::chrono::milliseconds d) const;

    DeviceEnumerator& enumerator_;
    TransferEngine& engine_;
    OrchestratorOptions options_;
};

} // namespace smartscreen
