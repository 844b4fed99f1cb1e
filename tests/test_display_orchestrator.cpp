// =============================================================================
// Unit tests for DisplayOrchestrator
// =============================================================================
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "device_enumerator.hpp"
#include "display_orchestrator.hpp"
#include "fake_usb_backend.hpp"
#include "transfer_engine.hpp"

using namespace smartscreen;
using namespace smartscreen::fakes;
using namespace smartscreen::protocol;

namespace {

class RawBandEncoder : public BandEncoder {
public:
    Result<std::vector<uint8_t>> encode(const ImageBuffer& image, int y, int rows) override {
        return std::vector<uint8_t>(image.row(y), image.row(y) + image.stride() * rows);
    }
};

class DisplayOrchestratorTest : public ::testing::Test {
protected:
    OrchestratorOptions options() {
        OrchestratorOptions opts;
        opts.session.open_retry = no_sleep_policy(nullptr, 2);
        opts.sleep = [this](std::chrono::milliseconds d) { sleeps_.push_back(d.count()); };
        return opts;
    }

    DisplayPlan plan(const std::string& selector, DisplayMode mode) {
        DisplayPlan p;
        p.selector = selector;
        p.mode = mode;
        return p;
    }

    FakeUsbBackend backend_;
    RawBandEncoder encoder_;
    TransferEngine engine_{encoder_};
    std::vector<long long> sleeps_;
};

} // anonymous namespace

TEST_F(DisplayOrchestratorTest, OneFailingDeviceDoesNotStopTheBatch) {
    backend_.add("A1");
    FakeDevice& b2 = backend_.add("B2");
    backend_.add("C3");
    b2.respond = false;     // sync times out

    DeviceEnumerator enumerator(backend_);
    DisplayOrchestrator orch(enumerator, engine_, options());

    std::vector<DisplayPlan> plans;
    plans.push_back(plan("A1", StatsMode{}));
    plans.push_back(plan("B2", StatsMode{}));
    plans.push_back(plan("C3", ImageMode{}));

    auto results = orch.setup(std::move(plans));
    ASSERT_EQ(results.size(), 3u);

    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].serial, "A1");
    ASSERT_TRUE(results[0].session != nullptr);
    EXPECT_TRUE(results[0].session->is_open());

    EXPECT_FALSE(results[1].ok());
    EXPECT_EQ(results[1].serial, "B2");
    EXPECT_EQ(results[1].error->kind, ErrorKind::Timeout);
    EXPECT_TRUE(results[1].session == nullptr);
    EXPECT_FALSE(b2.claimed);

    EXPECT_TRUE(results[2].ok());
    EXPECT_EQ(results[2].serial, "C3");
}

TEST_F(DisplayOrchestratorTest, UnresolvableSelectorReportedPerPlan) {
    backend_.add("A1");
    DeviceEnumerator enumerator(backend_);
    DisplayOrchestrator orch(enumerator, engine_, options());

    std::vector<DisplayPlan> plans;
    plans.push_back(plan("ZZ", StatsMode{}));
    plans.push_back(plan("A1", StatsMode{}));

    auto results = orch.setup(std::move(plans));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].error->kind, ErrorKind::NotFound);
    EXPECT_TRUE(results[0].serial.empty());
    EXPECT_TRUE(results[1].ok());
}

TEST_F(DisplayOrchestratorTest, VideoPlansRunAfterStaticOnes) {
    FakeDevice& v = backend_.add("V1");
    FakeDevice& s1 = backend_.add("S1");
    FakeDevice& s2 = backend_.add("S2");

    DeviceEnumerator enumerator(backend_);

    // Record which device is opened when
    std::vector<std::string> order;
    OrchestratorOptions opts = options();
    opts.sleep = [&](std::chrono::milliseconds d) {
        sleeps_.push_back(d.count());
        order.push_back(std::to_string(v.open_calls) + std::to_string(s1.open_calls) +
                        std::to_string(s2.open_calls));
    };
    DisplayOrchestrator orch(enumerator, engine_, opts);

    std::vector<DisplayPlan> plans;
    DisplayPlan video = plan("V1", VideoMode{});
    video.video = std::vector<uint8_t>(3000, 0x42);
    plans.push_back(std::move(video));
    plans.push_back(plan("S1", StatsMode{}));
    plans.push_back(plan("S2", ImageMode{}));

    auto results = orch.setup(std::move(plans));
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) EXPECT_TRUE(r.ok()) << r.selector;

    // Results stay in input order
    EXPECT_EQ(results[0].serial, "V1");
    EXPECT_EQ(results[1].serial, "S1");
    EXPECT_EQ(results[2].serial, "S2");

    // Sleeps alternate: sync delay (200) per device, open delay (500) between opens.
    // At the second open delay S1 and S2 are open and V1 is not.
    std::vector<std::string> at_open_delay;
    for (size_t i = 0; i < sleeps_.size(); i++) {
        if (sleeps_[i] == 500) at_open_delay.push_back(order[i]);
    }
    ASSERT_EQ(at_open_delay.size(), 2u);
    EXPECT_EQ(at_open_delay[0], "010");
    EXPECT_EQ(at_open_delay[1], "011");

    // The video device got its stream
    bool saw_video = false;
    for (const auto& f : v.decoded_writes()) {
        if (f.command_id == static_cast<uint8_t>(CommandId::SendVideo)) saw_video = true;
    }
    EXPECT_TRUE(saw_video);
}

TEST_F(DisplayOrchestratorTest, PlanSequenceIsSyncSaveBrightnessUpload) {
    FakeDevice& dev = backend_.add("A1");
    DeviceEnumerator enumerator(backend_);
    DisplayOrchestrator orch(enumerator, engine_, options());

    DisplayPlan p = plan("A1", ImageMode{});
    p.settings.brightness = 40;
    p.image = blank_image(16, 16);
    std::vector<DisplayPlan> plans;
    plans.push_back(std::move(p));

    auto results = orch.setup(std::move(plans));
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].ok());

    auto frames = dev.decoded_writes();
    ASSERT_GE(frames.size(), 4u);
    EXPECT_EQ(frames[0].command_id, 10);
    EXPECT_EQ(frames[1].command_id, 125);
    EXPECT_EQ(frames[1].payload[1], 1);     // startup = image
    EXPECT_EQ(frames[2].command_id, 14);
    EXPECT_EQ(frames[2].payload[0], 40);
    EXPECT_EQ(frames[3].command_id, 102);

    ASSERT_TRUE(results[0].session->last_mode().has_value());
    EXPECT_TRUE(std::holds_alternative<ImageMode>(*results[0].session->last_mode()));
}

TEST_F(DisplayOrchestratorTest, SamePanelInTwoPlansIsRejectedOnce) {
    backend_.add("A1");
    DeviceEnumerator enumerator(backend_);
    DisplayOrchestrator orch(enumerator, engine_, options());

    std::vector<DisplayPlan> plans;
    plans.push_back(plan("A1", StatsMode{}));
    plans.push_back(plan("0", StatsMode{}));

    auto results = orch.setup(std::move(plans));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok());
    ASSERT_FALSE(results[1].ok());
    EXPECT_EQ(results[1].error->kind, ErrorKind::InvalidArgument);
}

TEST_F(DisplayOrchestratorTest, BusyDeviceReportsDeviceBusy) {
    FakeDevice& dev = backend_.add("A1");
    dev.busy_claims = 10;
    DeviceEnumerator enumerator(backend_);
    DisplayOrchestrator orch(enumerator, engine_, options());

    std::vector<DisplayPlan> plans;
    plans.push_back(plan("A1", StatsMode{}));
    auto results = orch.setup(std::move(plans));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error->kind, ErrorKind::DeviceBusy);
    EXPECT_EQ(dev.open_calls, 2);
}
