#include "display_orchestrator.hpp"
#include <set>
#include <thread>
#include "device_commands.hpp"
#include "screen_log.hpp"

namespace smartscreen {

DisplayOrchestrator::DisplayOrchestrator(DeviceEnumerator& enumerator, TransferEngine& engine,
                                         OrchestratorOptions options)
    : enumerator_(enumerator), engine_(engine), options_(std::move(options)) {}

void DisplayOrchestrator::pause(std::chrono::milliseconds d) const {
    if (d.count() <= 0) return;
    if (options_.sleep) options_.sleep(d);
    else std::this_thread::sleep_for(d);
}

Result<void> DisplayOrchestrator::configure(DisplayPlan& plan, const DeviceIdentity& identity,
                                            DisplayResult& result) {
    auto session = DeviceSession::open(enumerator_.backend(), identity, options_.session);
    if (!session) return session.error();
    DeviceSession& dev = *session.value();

    SS_TRY(delay_sync(dev, options_.sync_delay, options_.sleep));
    SS_TRY(save_settings(dev, plan.mode, plan.settings));
    SS_TRY(set_brightness(dev, plan.settings.brightness));

    TransferOptions transfer;
    transfer.destination = plan.destination;
    if (plan.image) {
        SS_TRY(engine_.upload_image(dev, *plan.image, transfer));
    }
    if (plan.video) {
        SS_TRY(engine_.upload_video(dev, std::move(*plan.video), transfer));
        plan.video.reset();
    }

    result.session = std::move(session).value();
    return Ok();
}

std::vector<DisplayResult> DisplayOrchestrator::setup(std::vector<DisplayPlan> plans) {
    std::vector<DisplayResult> results(plans.size());

    // Static panels first, video panels once every static one has been handled
    std::vector<size_t> order;
    for (size_t i = 0; i < plans.size(); i++) {
        if (is_static(plans[i].mode)) order.push_back(i);
    }
    for (size_t i = 0; i < plans.size(); i++) {
        if (!is_static(plans[i].mode)) order.push_back(i);
    }

    SLOG_INFO("orch", "Setting up %zu display(s)", plans.size());

    std::set<std::string> claimed;
    bool first = true;
    for (size_t i : order) {
        DisplayPlan& plan = plans[i];
        DisplayResult& result = results[i];
        result.selector = plan.selector;

        if (!first) pause(options_.open_delay);
        first = false;

        SLOG_INFO("orch", "[%zu] '%s' -> %s", i, plan.selector.c_str(), mode_name(plan.mode));

        auto identity = enumerator_.resolve(plan.selector);
        if (!identity) {
            result.error = identity.error();
            SLOG_ERROR("orch", "[%zu] '%s' failed: %s", i, plan.selector.c_str(),
                       result.error->describe().c_str());
            continue;
        }
        result.serial = identity.value().serial;

        // Two plans on one panel would fight over the interface claim
        if (claimed.count(result.serial)) {
            result.error = Error(ErrorKind::InvalidArgument,
                                 "device " + result.serial + " already configured by another plan");
            SLOG_ERROR("orch", "[%zu] %s", i, result.error->describe().c_str());
            continue;
        }

        auto status = configure(plan, identity.value(), result);
        if (!status) {
            result.error = status.error();
            result.session.reset();
            SLOG_ERROR("orch", "[%zu] '%s' failed: %s", i, plan.selector.c_str(),
                       result.error->describe().c_str());
            continue;
        }
        claimed.insert(result.serial);
        SLOG_INFO("orch", "[%zu] %s ready", i, result.serial.c_str());
    }

    size_t ok = 0;
    for (const auto& r : results) {
        if (r.ok()) ok++;
    }
    SLOG_INFO("orch", "Setup finished: %zu/%zu display(s) ready", ok, results.size());
    return results;
}

} // namespace smartscreen
