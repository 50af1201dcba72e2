#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "aranet.hpp"
#include "fake_transport.hpp"

using aranet_core::ConnectionError;
using aranet_test::FakePeripheral;
using aranet_test::FakePlatform;
namespace reg = aranet_registry;

namespace {

// Short timings keep the suite fast; semantics match the 10 s / 1 s defaults
using FastAranet = aranet<DiscoveryConfig<300, 10>>;

inline constexpr char kOtherPrefix[] = "Sensor";
using OtherPrefixAranet = aranet<DiscoveryConfig<300, 10, kOtherPrefix>>;

using Clock = std::chrono::steady_clock;

} // namespace

TEST(Discovery, DefaultsMatchTheDevice) {
    EXPECT_EQ(aranetDefault::config::timeout, std::chrono::seconds(10));
    EXPECT_EQ(aranetDefault::config::poll_interval, std::chrono::seconds(1));
    EXPECT_STREQ(aranetDefault::config::name_prefix, "Aranet4");
}

TEST(Discovery, ConnectsToNamedAranet) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    auto aranet4 = aranet_test::makeAranet();
    adapter->add(aranet4);

    auto result = FastAranet::connect(platform);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(aranet4->connect_calls, 1);
    EXPECT_EQ(adapter->scanFilter(), reg::kAdvertisedService);

    auto reading = result.value().readMeasurement();
    ASSERT_TRUE(reading.ok());
    EXPECT_EQ(reading.value().co2, 1000);
}

TEST(Discovery, NoAdapterIsAdapterUnavailable) {
    FakePlatform platform;

    const auto result = FastAranet::connect(platform);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kAdapterUnavailable);
}

TEST(Discovery, AdapterEnumerationFailureIsAdapterUnavailable) {
    FakePlatform platform;
    platform.addAdapter();
    platform.error = aranet_core::TransportError{1, "no controller"};

    const auto result = FastAranet::connect(platform);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kAdapterUnavailable);
}

TEST(Discovery, UsesFirstAdapter) {
    FakePlatform platform;
    auto first = platform.addAdapter();
    auto second = platform.addAdapter();
    first->add(aranet_test::makeAranet());

    ASSERT_TRUE(FastAranet::connect(platform).ok());
    EXPECT_FALSE(second->scanFilter().has_value());
}

TEST(Discovery, ScanStartFailureIsTransportError) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->scan_error = aranet_core::TransportError{3, "scan refused"};

    const auto result = FastAranet::connect(platform);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kTransport);
    EXPECT_EQ(result.error().cause->message, "scan refused");
}

TEST(Discovery, UnnamedPeripheralNeverMatches) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    auto unnamed = std::make_shared<FakePeripheral>(std::nullopt);
    unnamed->addCharacteristic(reg::kCurrentReadings, aranet_test::samplePayload());
    adapter->add(unnamed);

    EXPECT_FALSE(FastAranet::matchesName(*unnamed));

    const auto result = FastAranet::connect(platform);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kSearchTimeout);
    EXPECT_EQ(unnamed->connect_calls, 0);
}

TEST(Discovery, SkipsNonMatchingNamesAndPicksFirstMatch) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    auto speaker = std::make_shared<FakePeripheral>("JBL Flip 5");
    auto first = aranet_test::makeAranet("Aranet4 11111");
    auto second = aranet_test::makeAranet("Aranet4 22222");
    adapter->add(speaker);
    adapter->add(std::make_shared<FakePeripheral>(std::nullopt));
    adapter->add(first);
    adapter->add(second);

    auto result = FastAranet::connect(platform);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().name(), "Aranet4 11111");
    EXPECT_EQ(speaker->connect_calls, 0);
    EXPECT_EQ(second->connect_calls, 0);
}

TEST(Discovery, NamePrefixIsConfigurable) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->add(aranet_test::makeAranet("Aranet4 11111"));
    adapter->add(aranet_test::makeAranet("Sensor 42"));

    auto result = OtherPrefixAranet::connect(platform);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().name(), "Sensor 42");
}

TEST(Discovery, FindsPeripheralThatAppearsOnLaterPoll) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->add(aranet_test::makeAranet(), 3);

    auto result = FastAranet::connect(platform);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_GE(adapter->polls(), 4);
}

TEST(Discovery, FailingPeripheralQueryDoesNotEndSearch) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->failing_polls = 2;
    adapter->add(aranet_test::makeAranet());

    auto result = FastAranet::connect(platform);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_GE(adapter->polls(), 3);
}

TEST(Discovery, TimesOutWhenNothingMatches) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->add(std::make_shared<FakePeripheral>("Mi Band"));

    const auto start = Clock::now();
    const auto result = FastAranet::connect(platform);
    const auto elapsed = Clock::now() - start;

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kSearchTimeout);
    EXPECT_GE(elapsed, std::chrono::milliseconds(250));
    EXPECT_GE(adapter->polls(), 2);
}

TEST(Discovery, BlockedQueryDoesNotDelayTimeout) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->block_for = std::chrono::milliseconds(1500);
    adapter->add(aranet_test::makeAranet());

    const auto start = Clock::now();
    const auto result = FastAranet::connect(platform);
    const auto elapsed = Clock::now() - start;

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kSearchTimeout);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1200));
}

TEST(Discovery, ConnectFailureIsTransportError) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    auto aranet4 = aranet_test::makeAranet();
    aranet4->connect_error = aranet_core::TransportError{0x3E, "connection failed to be established"};
    adapter->add(aranet4);

    const auto result = FastAranet::connect(platform);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kTransport);
    ASSERT_TRUE(result.error().cause.has_value());
    EXPECT_EQ(result.error().cause->code, 0x3E);
}

TEST(Discovery, MissingCurrentReadingsIsCharacteristicNotFound) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    auto aranet4 = std::make_shared<FakePeripheral>("Aranet4 00000");
    aranet4->addCharacteristic(reg::kSerialNumber, aranet_test::bytesOf("1"));
    adapter->add(aranet4);

    const auto result = FastAranet::connect(platform);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kCharacteristicNotFound);
    EXPECT_EQ(result.error().uuid, "f0cd3001-95da-4f4b-9ac8-aa55d312af0c");
}

TEST(Discovery, ScanIsStoppedAfterTimeout) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->add(std::make_shared<FakePeripheral>("Mi Band"));

    const auto result = FastAranet::connect(platform);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ConnectionError::Kind::kSearchTimeout);
    EXPECT_EQ(adapter->stopCalls(), 1);
    EXPECT_FALSE(adapter->scanning());
}

TEST(Discovery, ScanIsStoppedBeforeConnecting) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->add(aranet_test::makeAranet());

    ASSERT_TRUE(FastAranet::connect(platform).ok());
    EXPECT_EQ(adapter->stopCalls(), 1);
    EXPECT_FALSE(adapter->scanning());
}

TEST(Discovery, ScanStopFailureDoesNotFailConnect) {
    FakePlatform platform;
    auto adapter = platform.addAdapter();
    adapter->stop_error = aranet_core::TransportError{4, "controller busy"};
    auto aranet4 = aranet_test::makeAranet();
    adapter->add(aranet4);

    const auto result = FastAranet::connect(platform);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(aranet4->connect_calls, 1);
}
