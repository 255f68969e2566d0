/**
 * @file test_port_registry.cpp
 * @brief Unit tests for PortRegistry
 *
 * Tests port decisions including:
 * - Allowed range derived from the connection limit
 * - Ports in use from live processes only
 * - Free port search and host-busy skipping
 * - Limit fast-fail without probing
 * - Last-port preference
 * - In-flight attempts and port reservations
 * - TCP probe against a real listener
 */

#include <gtest/gtest.h>
#include "wpman/port_registry.hpp"
#include "test_helpers.hpp"

#include <asio.hpp>
#include <cstdint>
#include <limits>
#include <set>
#include <vector>

using namespace wpman;
using wpman::test::FakePortProbe;
using wpman::test::FakeProcessBackend;

// Test fixture for port registry tests
class PortRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<PortRegistry>(backend_, probe_);
    }

    void TearDown() override {
        registry_.reset();
    }

    // Profile bound to port with a live (or dead) process
    Profile running_profile(const std::string& name, uint16_t port, bool alive = true) {
        Profile profile(name, "/tmp/" + name + ".conf");
        ProcessId pid = next_pid_++;
        if (alive) {
            backend_.adopt(pid);
        }
        profile.pid = pid;
        profile.proxy_port = port;
        profile.running = alive;
        return profile;
    }

    FakeProcessBackend backend_;
    FakePortProbe probe_;
    std::unique_ptr<PortRegistry> registry_;
    ProcessId next_pid_ = 500;
};

// ============================================================================
// Range Tests
// ============================================================================

TEST_F(PortRegistryTest, BaseRange) {
    PortRange range = registry_->base_range();
    EXPECT_EQ(range.low, 60000);
    EXPECT_EQ(range.high, 65535);
    EXPECT_EQ(range.size(), 5536u);
}

TEST_F(PortRegistryTest, AllowedRangeFollowsLimit) {
    for (uint32_t limit : {1u, 2u, 10u, 100u, 5536u}) {
        PortRange range = registry_->allowed_range(limit);
        EXPECT_EQ(range.low, 60000);
        EXPECT_EQ(range.size(), limit) << "limit=" << limit;
    }
}

TEST_F(PortRegistryTest, AllowedRangeCappedAtBase) {
    PortRange range = registry_->allowed_range(100000);
    EXPECT_EQ(range.high, 65535);
    EXPECT_EQ(range.size(), 5536u);
}

TEST_F(PortRegistryTest, AllowedRangeHugeLimitIsWholeBase) {
    const uint32_t huge = std::numeric_limits<uint32_t>::max();

    for (uint32_t limit : {huge, huge - 1, 5537u}) {
        PortRange range = registry_->allowed_range(limit);
        EXPECT_EQ(range.low, 60000) << "limit=" << limit;
        EXPECT_EQ(range.high, 65535) << "limit=" << limit;
        EXPECT_EQ(range.size(), 5536u) << "limit=" << limit;
    }

    EXPECT_TRUE(registry_->validate_requested_port(65535, huge));
    auto port = registry_->find_free_port({}, huge);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60000);
}

TEST_F(PortRegistryTest, UnlimitedUsesWholeBase) {
    PortRange range = registry_->allowed_range(0);
    EXPECT_EQ(range.low, 60000);
    EXPECT_EQ(range.high, 65535);
}

TEST_F(PortRegistryTest, InvalidBaseRangeThrows) {
    EXPECT_THROW(PortRegistry(backend_, probe_, 0, 10), std::invalid_argument);
    EXPECT_THROW(PortRegistry(backend_, probe_, 200, 100), std::invalid_argument);
}

TEST_F(PortRegistryTest, ValidateRequestedPort) {
    EXPECT_TRUE(registry_->validate_requested_port(60000, 10));
    EXPECT_TRUE(registry_->validate_requested_port(60009, 10));
    EXPECT_FALSE(registry_->validate_requested_port(60010, 10));
    EXPECT_FALSE(registry_->validate_requested_port(59999, 10));
    EXPECT_FALSE(registry_->validate_requested_port(70000, 0));
    EXPECT_TRUE(registry_->validate_requested_port(65535, 0));
}

// ============================================================================
// Ports In Use Tests
// ============================================================================

TEST_F(PortRegistryTest, PortsInUseOnlyCountsLiveProcesses) {
    std::vector<Profile> profiles = {
        running_profile("alive", 60000),
        running_profile("dead", 60001, false),
        Profile("stopped", "/tmp/stopped.conf")
    };

    auto used = registry_->ports_in_use(profiles);
    EXPECT_EQ(used, std::set<uint16_t>({60000}));
}

TEST_F(PortRegistryTest, PortsInUseIgnoresPidWithoutPort) {
    Profile profile = running_profile("odd", 60000);
    profile.proxy_port.reset();
    EXPECT_TRUE(registry_->ports_in_use({profile}).empty());
}

// ============================================================================
// Free Port Tests
// ============================================================================

TEST_F(PortRegistryTest, FindFreePortLowestFirst) {
    auto port = registry_->find_free_port({}, 10);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60000);
}

TEST_F(PortRegistryTest, FindFreePortSkipsUsedAndBusy) {
    std::vector<Profile> profiles = {running_profile("a", 60000)};
    probe_.set_busy(60001);

    auto port = registry_->find_free_port(profiles, 10);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60002);
    EXPECT_FALSE(probe_.was_probed(60000));
}

TEST_F(PortRegistryTest, FindFreePortSkipsExcluded) {
    auto port = registry_->find_free_port({}, 10, {60000, 60001});
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60002);
    EXPECT_FALSE(probe_.was_probed(60000));
}

TEST_F(PortRegistryTest, FindFreePortLimitReachedFailsFastWithoutProbing) {
    std::vector<Profile> profiles = {running_profile("a", 60000), running_profile("b", 60001)};

    auto port = registry_->find_free_port(profiles, 2);
    EXPECT_FALSE(port.has_value());
    EXPECT_EQ(probe_.probe_count(), 0u);
}

TEST_F(PortRegistryTest, FindFreePortAllBusyOnHost) {
    probe_.set_busy(60000);
    probe_.set_busy(60001);
    EXPECT_FALSE(registry_->find_free_port({}, 2).has_value());
}

TEST_F(PortRegistryTest, FindFreePortNeverLeavesAllowedRange) {
    std::vector<Profile> profiles;
    for (uint16_t port = 60000; port < 60005; ++port) {
        profiles.push_back(running_profile("p" + std::to_string(port), port));
    }
    probe_.set_busy(60005);

    // Limit 10: 5 in use, 60005 busy, answer must stay in 60006..60009
    for (int i = 0; i < 4; ++i) {
        auto port = registry_->find_free_port(profiles, 10);
        ASSERT_TRUE(port.has_value());
        EXPECT_GE(*port, 60006);
        EXPECT_LE(*port, 60009);
        profiles.push_back(running_profile("q" + std::to_string(i), *port));
    }
    EXPECT_FALSE(registry_->find_free_port(profiles, 10).has_value());
}

TEST_F(PortRegistryTest, DeadProcessPortIsReusable) {
    std::vector<Profile> profiles = {running_profile("dead", 60000, false)};
    auto port = registry_->find_free_port(profiles, 1);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60000);
}

// ============================================================================
// Preference Tests
// ============================================================================

TEST_F(PortRegistryTest, PickPrefersLastPort) {
    Profile profile("office", "/tmp/office.conf");
    profile.last_port = 60004;

    auto port = registry_->pick_port_for_profile(profile, {profile}, 10);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60004);
}

TEST_F(PortRegistryTest, PickFallsBackWhenLastPortTaken) {
    Profile profile("office", "/tmp/office.conf");
    profile.last_port = 60000;
    std::vector<Profile> profiles = {profile, running_profile("holder", 60000)};

    auto port = registry_->pick_port_for_profile(profile, profiles, 10);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60001);
}

TEST_F(PortRegistryTest, PickFallsBackWhenLastPortBusyOnHost) {
    Profile profile("office", "/tmp/office.conf");
    profile.last_port = 60003;
    probe_.set_busy(60003);

    auto port = registry_->pick_port_for_profile(profile, {profile}, 10);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60000);
}

TEST_F(PortRegistryTest, PickIgnoresLastPortOutsideShrunkRange) {
    Profile profile("office", "/tmp/office.conf");
    profile.last_port = 60008;

    auto port = registry_->pick_port_for_profile(profile, {profile}, 2);
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 60000);
}

TEST_F(PortRegistryTest, PickSkipsExcludedLastPort) {
    Profile profile("office", "/tmp/office.conf");
    profile.last_port = 60002;

    auto port = registry_->pick_port_for_profile(profile, {profile}, 10, {60002});
    ASSERT_TRUE(port.has_value());
    EXPECT_NE(*port, 60002);
}

TEST_F(PortRegistryTest, PickRespectsLimit) {
    Profile profile("office", "/tmp/office.conf");
    profile.last_port = 60001;
    std::vector<Profile> profiles = {profile, running_profile("holder", 60000)};

    EXPECT_FALSE(registry_->pick_port_for_profile(profile, profiles, 1).has_value());
}

// ============================================================================
// In-flight Launch Tests
// ============================================================================

TEST_F(PortRegistryTest, AttemptsCountAgainstLimit) {
    size_t used = 1;
    auto count_used = [&used]() { return used; };

    EXPECT_EQ(registry_->begin_attempt(3, count_used), SlotStatus::ACQUIRED);
    EXPECT_EQ(registry_->begin_attempt(3, count_used), SlotStatus::ACQUIRED);
    EXPECT_EQ(registry_->begin_attempt(3, count_used), SlotStatus::PENDING);
    EXPECT_EQ(registry_->attempts_in_flight(), 2u);

    // One attempt launched, the other failed
    used = 2;
    registry_->end_attempt();
    registry_->end_attempt();
    EXPECT_EQ(registry_->begin_attempt(3, count_used), SlotStatus::ACQUIRED);
    registry_->end_attempt();

    used = 3;
    EXPECT_EQ(registry_->begin_attempt(3, count_used), SlotStatus::LIMIT_REACHED);
    EXPECT_EQ(registry_->attempts_in_flight(), 0u);
}

TEST_F(PortRegistryTest, UnlimitedAttemptsAlwaysAcquired) {
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(registry_->begin_attempt(0, []() { return size_t(50000); }), SlotStatus::ACQUIRED);
    }
    EXPECT_EQ(registry_->attempts_in_flight(), 100u);
}

TEST_F(PortRegistryTest, ReservePortIsExclusive) {
    EXPECT_TRUE(registry_->reserve_port(60000, nullptr));
    EXPECT_FALSE(registry_->reserve_port(60000, nullptr));
    EXPECT_TRUE(registry_->is_reserved(60000));
    EXPECT_EQ(registry_->reserved_ports(), std::set<uint16_t>({60000}));

    registry_->release_port(60000);
    EXPECT_FALSE(registry_->is_reserved(60000));
    EXPECT_TRUE(registry_->reserve_port(60000, nullptr));
}

TEST_F(PortRegistryTest, ReservePortRejectsHeldPort) {
    auto held = [](uint16_t port) { return port == 60001; };

    EXPECT_FALSE(registry_->reserve_port(60001, held));
    EXPECT_TRUE(registry_->reserve_port(60002, held));
    EXPECT_EQ(registry_->reserved_ports(), std::set<uint16_t>({60002}));
}

TEST_F(PortRegistryTest, ReservationReleasedOnScopeExit) {
    {
        PortReservation reservation(*registry_);
        ASSERT_TRUE(reservation.acquire_slot(1, []() { return size_t(0); }));
        ASSERT_TRUE(reservation.claim(60000, nullptr));

        EXPECT_EQ(reservation.port(), 60000);
        EXPECT_EQ(registry_->attempts_in_flight(), 1u);
        EXPECT_TRUE(registry_->is_reserved(60000));

        PortReservation other(*registry_);
        EXPECT_FALSE(other.acquire_slot(1, []() { return size_t(0); }));
        EXPECT_FALSE(other.claim(60000, nullptr));
    }

    EXPECT_EQ(registry_->attempts_in_flight(), 0u);
    EXPECT_TRUE(registry_->reserved_ports().empty());
}

TEST_F(PortRegistryTest, ReservationClaimMovesPort) {
    PortReservation reservation(*registry_);
    ASSERT_TRUE(reservation.claim(60000, nullptr));
    ASSERT_TRUE(reservation.claim(60003, nullptr));

    EXPECT_EQ(registry_->reserved_ports(), std::set<uint16_t>({60003}));
}

// ============================================================================
// TCP Probe Tests
// ============================================================================

TEST(TcpPortProbeTest, ListenerIsBusyClosedPortIsFree) {
    asio::io_context io_context;
    asio::ip::tcp::acceptor acceptor(io_context);
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);

    acceptor.open(endpoint.protocol());
    acceptor.bind(endpoint);
    acceptor.listen();
    uint16_t port = acceptor.local_endpoint().port();

    TcpPortProbe probe(std::chrono::milliseconds(500));
    EXPECT_FALSE(probe.is_port_free(port));

    acceptor.close();
    EXPECT_TRUE(probe.is_port_free(port));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
