// smartscreen - command-line control for 1CBE:0088 USB display panels
//
// Usage: smartscreen [-v|-vv] [-d SELECTOR] [--config FILE] <command> [options]

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "asset_loader.hpp"
#include "config_loader.hpp"
#include "device_commands.hpp"
#include "device_enumerator.hpp"
#include "display_orchestrator.hpp"
#include "libusb_backend.hpp"
#include "png_band_encoder.hpp"
#include "screen_log.hpp"
#include "screen_protocol.hpp"
#include "transfer_engine.hpp"

using namespace smartscreen;
using namespace smartscreen::protocol;

namespace {

constexpr int PNG_COMPRESSION_LEVEL = 8;

struct CliArgs {
    int verbosity = -1;             // -1 = take the config's log level
    std::string selector;
    std::string config_path = "smartscreen.json";
    bool config_given = false;
    std::string command;

    std::string path;
    std::string dest;
    bool store = false;
    int value = -1;
    int brightness = -1;
    int startup = -1;
    int rotation = -1;
    int sleep = -1;
    int offline = -1;
};

void usage() {
    fprintf(stderr,
            "Usage: smartscreen [-v|-vv] [-d SELECTOR] [--config FILE] <command> [options]\n"
            "\n"
            "Commands:\n"
            "  list-devices                 list attached panels\n"
            "  sync                         handshake\n"
            "  restart                      reboot the panel\n"
            "  brightness --value N         0-%u\n"
            "  save [--brightness N] [--startup 0|1|2] [--rotation 0|2]\n"
            "       [--sleep N] [--offline 0|1]\n"
            "                               persist settings (startup: 0 stats, 1 image, 2 video)\n"
            "  clear-image                  show a transparent image\n"
            "  send-image --path PNG [--store | --dest PATH]\n"
            "  send-video --path H264 [--dest PATH]\n"
            "  setup                        configure every display in the config file\n"
            "\n"
            "SELECTOR is an index from list-devices, a serial or a unique serial prefix.\n",
            MAX_BRIGHTNESS);
}

bool parse_int(const char* text, int& out) {
    char* end = nullptr;
    long v = strtol(text, &end, 10);
    if (end == text || *end != '\0' || v < -1000000 || v > 1000000) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* a = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "%s needs a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };
        auto next_int = [&](const char* name, int& out) -> bool {
            const char* v = next(name);
            if (!v) return false;
            if (!parse_int(v, out)) {
                fprintf(stderr, "%s: '%s' is not a number\n", name, v);
                return false;
            }
            return true;
        };

        if (strcmp(a, "-v") == 0) {
            args.verbosity = 1;
        } else if (strcmp(a, "-vv") == 0) {
            args.verbosity = 2;
        } else if (strcmp(a, "-d") == 0 || strcmp(a, "--device") == 0) {
            const char* v = next(a);
            if (!v) return false;
            args.selector = v;
        } else if (strcmp(a, "--config") == 0) {
            const char* v = next(a);
            if (!v) return false;
            args.config_path = v;
            args.config_given = true;
        } else if (strcmp(a, "--path") == 0) {
            const char* v = next(a);
            if (!v) return false;
            args.path = v;
        } else if (strcmp(a, "--dest") == 0) {
            const char* v = next(a);
            if (!v) return false;
            args.dest = v;
        } else if (strcmp(a, "--store") == 0) {
            args.store = true;
        } else if (strcmp(a, "--value") == 0) {
            if (!next_int(a, args.value)) return false;
        } else if (strcmp(a, "--brightness") == 0) {
            if (!next_int(a, args.brightness)) return false;
        } else if (strcmp(a, "--startup") == 0) {
            if (!next_int(a, args.startup)) return false;
        } else if (strcmp(a, "--rotation") == 0) {
            if (!next_int(a, args.rotation)) return false;
        } else if (strcmp(a, "--sleep") == 0) {
            if (!next_int(a, args.sleep)) return false;
        } else if (strcmp(a, "--offline") == 0) {
            if (!next_int(a, args.offline)) return false;
        } else if (strcmp(a, "-h") == 0 || strcmp(a, "--help") == 0) {
            return false;
        } else if (a[0] == '-') {
            fprintf(stderr, "Unknown option %s\n", a);
            return false;
        } else if (args.command.empty()) {
            args.command = a;
        } else {
            fprintf(stderr, "Unexpected argument %s\n", a);
            return false;
        }
    }
    return !args.command.empty();
}

int fail(const Error& err) {
    fprintf(stderr, "Error: %s\n", err.describe().c_str());
    return 1;
}

void print_progress(size_t sent, size_t total) {
    fprintf(stderr, "\r  %zu/%zu chunk(s)", sent, total);
    if (sent == total) fprintf(stderr, "\n");
}

int cmd_list_devices(DeviceEnumerator& enumerator) {
    auto devices = enumerator.list();
    if (!devices) return fail(devices.error());
    if (devices.value().empty()) {
        printf("No panels found (%04X:%04X)\n", PANEL_VID, PANEL_PID);
        return 0;
    }
    printf("%-6s %-24s %-9s %-24s %s\n", "Index", "Serial", "Bus:Addr", "Product", "Firmware");
    size_t index = 0;
    for (const auto& d : devices.value()) {
        printf("%-6zu %-24s %-9s %-24s %s\n", index++, d.serial.c_str(), d.bus_address().c_str(),
               d.product.empty() ? "-" : d.product.c_str(), d.firmware_version().c_str());
    }
    return 0;
}

Result<DisplaySettings> settings_from_args(const CliArgs& args) {
    DisplaySettings s;
    auto take = [](int v, uint8_t& field, const char* name) -> Result<void> {
        if (v < 0) return Ok();
        if (v > 255) return Error(ErrorKind::InvalidArgument, std::string(name) + " out of range 0-255");
        field = static_cast<uint8_t>(v);
        return Ok();
    };
    SS_TRY(take(args.brightness, s.brightness, "brightness"));
    SS_TRY(take(args.rotation, s.rotation, "rotation"));
    SS_TRY(take(args.sleep, s.sleep, "sleep"));
    SS_TRY(take(args.offline, s.offline, "offline"));
    SS_TRY(validate_settings(s));
    return s;
}

int cmd_setup(DeviceEnumerator& enumerator, TransferEngine& engine,
              const config::AppConfig& cfg) {
    if (cfg.displays.empty()) {
        return fail(Error(ErrorKind::Config, "no displays configured"));
    }

    // Assets are loaded up front; a display whose asset is unreadable is skipped
    std::vector<DisplayPlan> plans;
    std::vector<size_t> plan_to_display;
    std::vector<std::string> load_errors(cfg.displays.size());
    for (size_t i = 0; i < cfg.displays.size(); i++) {
        const auto& d = cfg.displays[i];
        DisplayPlan plan;
        plan.selector = d.device;
        plan.mode = d.mode;
        plan.settings = d.settings;
        plan.destination = d.destination;
        if (!d.image.empty()) {
            auto image = load_image_file(d.image);
            if (!image) { load_errors[i] = image.error().describe(); continue; }
            plan.image = std::move(image).value();
            if (plan.destination.empty()) plan.destination = std::string(IMAGE_DIR) + file_basename(d.image);
        }
        if (!d.video.empty()) {
            auto stream = read_file_bytes(d.video);
            if (!stream) { load_errors[i] = stream.error().describe(); continue; }
            plan.video = std::move(stream).value();
            if (plan.destination.empty()) plan.destination = std::string(VIDEO_DIR) + file_basename(d.video);
        }
        plans.push_back(std::move(plan));
        plan_to_display.push_back(i);
    }

    OrchestratorOptions opts;
    opts.open_delay = std::chrono::milliseconds(cfg.orchestrator.open_delay_ms);
    opts.sync_delay = std::chrono::milliseconds(cfg.orchestrator.sync_delay_ms);
    opts.session = cfg.session_options();
    DisplayOrchestrator orchestrator(enumerator, engine, opts);
    auto results = orchestrator.setup(std::move(plans));

    std::vector<const DisplayResult*> by_display(cfg.displays.size(), nullptr);
    for (size_t k = 0; k < results.size(); k++) by_display[plan_to_display[k]] = &results[k];

    int failures = 0;
    for (size_t i = 0; i < cfg.displays.size(); i++) {
        const auto& d = cfg.displays[i];
        const DisplayResult* r = by_display[i];
        if (!r) {
            printf("[%zu] %-16s FAILED  %s\n", i, d.device.c_str(), load_errors[i].c_str());
            failures++;
        } else if (!r->ok()) {
            printf("[%zu] %-16s FAILED  %s\n", i, d.device.c_str(), r->error->describe().c_str());
            failures++;
        } else {
            printf("[%zu] %-16s OK      %s (%s)\n", i, d.device.c_str(), r->serial.c_str(),
                   mode_name(d.mode));
        }
    }
    return failures == 0 ? 0 : 1;
}

int run_device_command(const CliArgs& args, DeviceEnumerator& enumerator, TransferEngine& engine,
                       const config::AppConfig& cfg) {
    // Validate inputs before touching the device
    std::optional<DisplaySettings> settings;
    std::optional<DisplayMode> startup;
    if (args.command == "brightness") {
        if (args.value < 0) return fail(Error(ErrorKind::InvalidArgument, "brightness needs --value N"));
    } else if (args.command == "save") {
        auto s = settings_from_args(args);
        if (!s) return fail(s.error());
        settings = s.value();
        auto m = mode_from_startup_code(args.startup < 0 ? 0 : args.startup);
        if (!m) return fail(m.error());
        startup = m.value();
    } else if (args.command == "send-image" || args.command == "send-video") {
        if (args.path.empty()) return fail(Error(ErrorKind::InvalidArgument, args.command + " needs --path FILE"));
    } else if (args.command != "sync" && args.command != "restart" && args.command != "clear-image") {
        fprintf(stderr, "Unknown command '%s'\n", args.command.c_str());
        usage();
        return 1;
    }

    auto session = enumerator.open(args.selector, cfg.session_options());
    if (!session) return fail(session.error());
    DeviceSession& dev = *session.value();

    auto synced = delay_sync(dev, std::chrono::milliseconds(cfg.orchestrator.sync_delay_ms));
    if (!synced) return fail(synced.error());

    Result<void> status = Ok();
    if (args.command == "sync") {
        printf("Synced %s\n", dev.identity().serial.c_str());
    } else if (args.command == "restart") {
        status = restart(dev);
    } else if (args.command == "brightness") {
        status = set_brightness(dev, args.value);
    } else if (args.command == "save") {
        status = save_settings(dev, *startup, *settings);
    } else if (args.command == "clear-image") {
        status = clear_image(dev, engine);
    } else if (args.command == "send-image") {
        auto image = load_image_file(args.path);
        if (!image) return fail(image.error());
        TransferOptions opts;
        opts.destination = args.dest;
        if (opts.destination.empty() && args.store) {
            opts.destination = std::string(IMAGE_DIR) + file_basename(args.path);
        }
        opts.progress = print_progress;
        status = engine.upload_image(dev, image.value(), opts);
    } else if (args.command == "send-video") {
        auto stream = read_file_bytes(args.path);
        if (!stream) return fail(stream.error());
        TransferOptions opts;
        opts.destination = args.dest.empty() ? std::string(VIDEO_DIR) + file_basename(args.path)
                                             : args.dest;
        opts.progress = print_progress;
        status = engine.upload_video(dev, std::move(stream).value(), opts);
    }

    if (!status) return fail(status.error());
    if (args.command != "sync") printf("%s: OK (%s)\n", args.command.c_str(), dev.identity().serial.c_str());
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        usage();
        return 1;
    }

    auto cfg = config::loadConfig(args.config_path, args.config_given);
    if (!cfg) return fail(cfg.error());

    if (args.verbosity >= 2) smartscreen::log::setLogLevel(smartscreen::log::Level::Debug);
    else if (args.verbosity == 1) smartscreen::log::setLogLevel(smartscreen::log::Level::Info);
    else smartscreen::log::setLogLevel(smartscreen::log::levelFromName(cfg.value().log.level));
    if (!cfg.value().log.log_path.empty() && !smartscreen::log::openLogFile(cfg.value().log.log_path.c_str())) {
        fprintf(stderr, "Warning: cannot open log file %s\n", cfg.value().log.log_path.c_str());
    }

    auto backend = LibusbBackend::create();
    if (!backend) return fail(backend.error());

    auto level = set_png_compression_level(PNG_COMPRESSION_LEVEL);
    if (!level) return fail(level.error());

    DeviceEnumerator enumerator(*backend.value());
    PngBandEncoder encoder;
    TransferEngine engine(encoder);

    int rc;
    if (args.command == "list-devices") {
        rc = cmd_list_devices(enumerator);
    } else if (args.command == "setup") {
        rc = cmd_setup(enumerator, engine, cfg.value());
    } else {
        rc = run_device_command(args, enumerator, engine, cfg.value());
    }
    smartscreen::log::closeLogFile();
    return rc;
}
