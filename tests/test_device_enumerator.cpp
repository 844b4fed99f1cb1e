// =============================================================================
// Unit tests for DeviceEnumerator and selector resolution
// =============================================================================
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "device_enumerator.hpp"
#include "fake_usb_backend.hpp"

using namespace smartscreen;
using namespace smartscreen::fakes;

namespace {

std::vector<std::string> serials(const std::vector<DeviceIdentity>& devices) {
    std::vector<std::string> out;
    for (const auto& d : devices) out.push_back(d.serial);
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Listing
// ---------------------------------------------------------------------------
TEST(DeviceEnumeratorTest, ListIsSortedBySerial) {
    FakeUsbBackend backend;
    backend.add("b2");
    backend.add("a1");
    backend.add("c3");
    DeviceEnumerator enumerator(backend);

    auto list = enumerator.list();
    ASSERT_TRUE(list.is_ok());
    EXPECT_EQ(serials(list.value()), (std::vector<std::string>{"a1", "b2", "c3"}));
}

TEST(DeviceEnumeratorTest, IndicesFollowSortedOrder) {
    FakeUsbBackend backend;
    backend.add("b2");
    backend.add("a1");
    backend.add("c3");
    DeviceEnumerator enumerator(backend);

    auto zero = enumerator.resolve("0");
    ASSERT_TRUE(zero.is_ok());
    EXPECT_EQ(zero.value().serial, "a1");

    auto two = enumerator.resolve("2");
    ASSERT_TRUE(two.is_ok());
    EXPECT_EQ(two.value().serial, "c3");

    auto out = enumerator.resolve("3");
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.error().kind, ErrorKind::NotFound);
}

TEST(DeviceEnumeratorTest, EmptySelectorPicksFirst) {
    FakeUsbBackend backend;
    backend.add("zz");
    backend.add("mm");
    DeviceEnumerator enumerator(backend);

    auto first = enumerator.resolve("");
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().serial, "mm");
}

TEST(DeviceEnumeratorTest, FiltersOtherDevices) {
    FakeUsbBackend backend;
    backend.add("a1");
    FakeDevice& other = backend.add("x9");
    other.identity.product_id = 0x1234;
    DeviceEnumerator enumerator(backend);

    auto list = enumerator.list();
    ASSERT_TRUE(list.is_ok());
    EXPECT_EQ(serials(list.value()), (std::vector<std::string>{"a1"}));
}

TEST(DeviceEnumeratorTest, NoDevicesIsNotFound) {
    FakeUsbBackend backend;
    DeviceEnumerator enumerator(backend);

    auto r = enumerator.resolve("");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::NotFound);
}

TEST(DeviceEnumeratorTest, ScanFailurePropagates) {
    FakeUsbBackend backend;
    backend.add("a1");
    backend.fail_scan = true;
    DeviceEnumerator enumerator(backend);

    auto r = enumerator.resolve("a1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Io);
}

// ---------------------------------------------------------------------------
// Serial selectors
// ---------------------------------------------------------------------------
TEST(DeviceEnumeratorTest, ExactSerialBeatsPrefix) {
    FakeUsbBackend backend;
    backend.add("a");
    backend.add("a1");
    backend.add("a10");
    DeviceEnumerator enumerator(backend);

    auto exact = enumerator.resolve("a1");
    ASSERT_TRUE(exact.is_ok());
    EXPECT_EQ(exact.value().serial, "a1");
}

TEST(DeviceEnumeratorTest, AmbiguousPrefixListsCandidates) {
    FakeUsbBackend backend;
    backend.add("A1B2");
    backend.add("A1C3");
    backend.add("B777");
    DeviceEnumerator enumerator(backend);

    auto r = enumerator.resolve("A1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Ambiguous);
    EXPECT_NE(r.error().message.find("A1B2"), std::string::npos);
    EXPECT_NE(r.error().message.find("A1C3"), std::string::npos);
}

TEST(DeviceEnumeratorTest, UniquePrefixResolves) {
    FakeUsbBackend backend;
    backend.add("A1B2");
    backend.add("B777");
    DeviceEnumerator enumerator(backend);

    auto r = enumerator.resolve("B7");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().serial, "B777");
}

TEST(DeviceEnumeratorTest, UnknownSerialIsNotFound) {
    FakeUsbBackend backend;
    backend.add("a");
    backend.add("a1");
    backend.add("a10");
    DeviceEnumerator enumerator(backend);

    auto r = enumerator.resolve("z9");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::NotFound);
}

TEST(DeviceEnumeratorTest, ResolveSelectorIsPure) {
    std::vector<DeviceIdentity> sorted(2);
    sorted[0].serial = "AAA";
    sorted[1].serial = "AAB";

    auto r = resolve_selector(sorted, "AA");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Ambiguous);

    auto huge = resolve_selector(sorted, "99999999999999999999");
    ASSERT_TRUE(huge.is_err());
    EXPECT_EQ(huge.error().kind, ErrorKind::NotFound);
}

// ---------------------------------------------------------------------------
// Open through the enumerator
// ---------------------------------------------------------------------------
TEST(DeviceEnumeratorTest, OpenBySelectorClaimsResolvedDevice) {
    FakeUsbBackend backend;
    backend.add("b2");
    FakeDevice& a1 = backend.add("a1");
    DeviceEnumerator enumerator(backend);

    auto session = enumerator.open("0");
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value()->identity().serial, "a1");
    EXPECT_TRUE(a1.claimed);
}

TEST(DeviceEnumeratorTest, IdentityFormatting) {
    DeviceIdentity id;
    id.bus = 3;
    id.address = 17;
    id.bcd_device = 0x0102;
    EXPECT_EQ(id.bus_address(), "003:017");
    EXPECT_EQ(id.firmware_version(), "1.02");
}
