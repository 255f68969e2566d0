/**
 * @file test_proxy_manager.cpp
 * @brief Integration tests for ProxyManager
 *
 * Tests the manager facade including:
 * - Import, scan, rename, edit and delete of profiles
 * - Connect on explicit and automatic ports
 * - Contended ports, override, external port holders
 * - Connection limit and executable resolution
 * - Death detection and session history
 * - Persistence across restarts
 * - Auto-connect, stop-all and shutdown
 */

#include <gtest/gtest.h>
#include "wpman/proxy_manager.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace wpman;
using namespace wpman::utilities;
using wpman::test::FakePortProbe;
using wpman::test::FakeProcessBackend;
using wpman::test::make_executable;
using wpman::test::sample_config;
namespace fs = std::filesystem;

namespace {

/// Records manager events
class EventLog : public ManagerObserver {
public:
    void on_profile_added(const Profile& profile) override { push("added:" + profile.name); }
    void on_profile_removed(const std::string& name) override { push("removed:" + name); }
    void on_profile_renamed(const std::string& old_name, const std::string& new_name) override {
        push("renamed:" + old_name + "->" + new_name);
    }
    void on_profile_started(const Profile& profile) override { push("started:" + profile.name); }
    void on_profile_stopped(const std::string& name, StopReason reason) override {
        push(std::string(reason == StopReason::DIED ? "died:" : "stopped:") + name);
    }
    void on_auto_connect_finished(const AutoConnectSummary& /*summary*/) override { push("finished"); }

    std::vector<std::string> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    bool contains(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(events_.begin(), events_.end(), event) != events_.end();
    }

private:
    void push(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::mutex mutex_;
    std::vector<std::string> events_;
};

} // namespace

// Test fixture for proxy manager tests
class ProxyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_ = std::make_unique<wpman::test::TempDir>("wpman_manager_test");
        data_dir_ = temp_->path() / "data";
        executable_ = make_executable(temp_->path() / "bin" / "wireproxy");

        open_manager();
        ASSERT_TRUE(manager_->set_executable_path(executable_));
    }

    void TearDown() override {
        manager_.reset();
        temp_.reset();
    }

    /// (Re)create the manager on the same data directory with fresh fakes
    void open_manager() {
        manager_.reset();

        ManagerOptions options;
        options.data_dir = data_dir_;
        auto backend = std::make_unique<FakeProcessBackend>();
        auto probe = std::make_unique<FakePortProbe>();
        backend_ = backend.get();
        probe_ = probe.get();
        options.backend = std::move(backend);
        options.probe = std::move(probe);
        options.launch_grace = std::chrono::milliseconds(0);
        options.stop_grace = std::chrono::milliseconds(0);
        options.worker_pause = std::chrono::milliseconds(0);

        manager_ = std::make_unique<ProxyManager>(std::move(options));
        events_ = std::make_shared<EventLog>();
        manager_->add_observer(events_);
    }

    void import(const std::string& name, const std::string& endpoint = "vpn.example.com:51820") {
        ImportResult result = manager_->import_text(name, sample_config(endpoint));
        ASSERT_TRUE(result.ok()) << result.message;
        ASSERT_EQ(result.profile->name, name);
    }

    fs::path launch_config(const std::string& name) const {
        return manager_->profile_directory() / (name + config::LAUNCH_CONFIG_SUFFIX);
    }

    std::unique_ptr<wpman::test::TempDir> temp_;
    fs::path data_dir_;
    fs::path executable_;
    std::unique_ptr<ProxyManager> manager_;
    FakeProcessBackend* backend_ = nullptr;     // Owned by manager_
    FakePortProbe* probe_ = nullptr;            // Owned by manager_
    std::shared_ptr<EventLog> events_;
};

// ============================================================================
// Profile Management Tests
// ============================================================================

TEST_F(ProxyManagerTest, ImportAddsProfile) {
    import("office");

    auto profiles = manager_->profiles();
    ASSERT_EQ(profiles.size(), 1u);
    EXPECT_EQ(profiles[0].name, "office");
    EXPECT_FALSE(profiles[0].running);
    EXPECT_TRUE(events_->contains("added:office"));
    EXPECT_EQ(manager_->get_config("office"), sample_config());
}

TEST_F(ProxyManagerTest, ImportFileUsesStem) {
    fs::path source = temp_->path() / "incoming" / "home.conf";
    write_file(source, sample_config());

    ImportResult result = manager_->import_file(source);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_TRUE(manager_->find_profile("home").has_value());
    EXPECT_FALSE(manager_->import_file(source).ok());
}

TEST_F(ProxyManagerTest, ScanAdoptsDroppedFiles) {
    write_file(manager_->profile_directory() / "dropped.conf", sample_config());

    EXPECT_EQ(manager_->scan_profiles(), 1u);
    EXPECT_TRUE(manager_->find_profile("dropped").has_value());
    EXPECT_EQ(manager_->scan_profiles(), 0u);
}

TEST_F(ProxyManagerTest, DeleteRunningProfileStopsIt) {
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());

    EXPECT_EQ(manager_->delete_profile("office"), StoreError::NONE);
    EXPECT_EQ(backend_->alive_count(), 0u);
    EXPECT_FALSE(manager_->find_profile("office").has_value());
    EXPECT_FALSE(fs::exists(manager_->profile_directory() / "office.conf"));
    EXPECT_FALSE(fs::exists(launch_config("office")));
    EXPECT_TRUE(events_->contains("removed:office"));
    EXPECT_EQ(manager_->delete_profile("office"), StoreError::NOT_FOUND);
}

TEST_F(ProxyManagerTest, RenameRequiresStoppedProfile) {
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());
    EXPECT_EQ(manager_->rename_profile("office", "hq"), StoreError::PROFILE_RUNNING);

    ASSERT_TRUE(manager_->disconnect("office"));
    EXPECT_EQ(manager_->rename_profile("office", "hq"), StoreError::NONE);
    EXPECT_TRUE(manager_->find_profile("hq").has_value());
    EXPECT_TRUE(fs::exists(manager_->profile_directory() / "hq.conf"));
    EXPECT_FALSE(fs::exists(manager_->profile_directory() / "office.conf"));
    EXPECT_TRUE(events_->contains("renamed:office->hq"));

    // Session history follows the profile
    EXPECT_FALSE(manager_->history("hq").empty());
    EXPECT_TRUE(manager_->history("office").empty());
}

TEST_F(ProxyManagerTest, RenameRejectsTakenAndInvalidNames) {
    import("office");
    import("home");

    EXPECT_EQ(manager_->rename_profile("office", "home"), StoreError::DUPLICATE_NAME);
    EXPECT_EQ(manager_->rename_profile("office", "bad name"), StoreError::INVALID_NAME);
    EXPECT_EQ(manager_->rename_profile("ghost", "other"), StoreError::NOT_FOUND);
}

TEST_F(ProxyManagerTest, UpdateProfileRewritesConfigAndHost) {
    import("office", "old.example.com:51820");
    EXPECT_EQ(manager_->endpoint_host("office"), std::string("old.example.com"));

    EXPECT_EQ(manager_->update_profile("office", "hq", sample_config("new.example.com:51820")), StoreError::NONE);
    EXPECT_FALSE(manager_->find_profile("office").has_value());
    EXPECT_EQ(manager_->endpoint_host("hq"), std::string("new.example.com"));
}

TEST_F(ProxyManagerTest, UpdateRunningProfileRejected) {
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());
    EXPECT_EQ(manager_->update_profile("office", "", sample_config()), StoreError::PROFILE_RUNNING);
}

// ============================================================================
// Connect Tests
// ============================================================================

TEST_F(ProxyManagerTest, ConnectPicksLowestFreePort) {
    import("office");

    ConnectOutcome outcome = manager_->connect("office");
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.port, 60000);
    ASSERT_TRUE(outcome.pid.has_value());

    auto profile = manager_->find_profile("office");
    EXPECT_TRUE(profile->running);
    EXPECT_EQ(profile->proxy_port, 60000);
    EXPECT_TRUE(fs::exists(launch_config("office")));
    EXPECT_TRUE(events_->contains("started:office"));
}

TEST_F(ProxyManagerTest, ConnectExplicitPort) {
    import("office");

    ConnectOutcome outcome = manager_->connect("office", 60005);
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.port, 60005);
}

TEST_F(ProxyManagerTest, ConnectPortOutsideRange) {
    import("office");

    EXPECT_EQ(manager_->connect("office", 60010).status, ConnectStatus::PORT_OUT_OF_RANGE);
    EXPECT_EQ(manager_->connect("office", 59999).status, ConnectStatus::PORT_OUT_OF_RANGE);
    EXPECT_EQ(backend_->spawn_count(), 0u);
}

TEST_F(ProxyManagerTest, ConnectUnknownProfile) {
    EXPECT_EQ(manager_->connect("ghost").status, ConnectStatus::PROFILE_NOT_FOUND);
}

TEST_F(ProxyManagerTest, ConnectTwiceReportsRunning) {
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());

    ConnectOutcome again = manager_->connect("office");
    EXPECT_EQ(again.status, ConnectStatus::ALREADY_RUNNING);
    EXPECT_EQ(again.port, 60000);
    EXPECT_EQ(backend_->spawn_count(), 1u);
}

TEST_F(ProxyManagerTest, ConnectWithMissingConfig) {
    import("office");
    fs::remove(manager_->profile_directory() / "office.conf");

    EXPECT_EQ(manager_->connect("office").status, ConnectStatus::CONFIG_MISSING);
    EXPECT_EQ(backend_->spawn_count(), 0u);
}

TEST_F(ProxyManagerTest, ImmediateExitIsLaunchFailure) {
    import("office");
    backend_->set_exit_immediately(true, 2);

    ConnectOutcome outcome = manager_->connect("office");
    EXPECT_EQ(outcome.status, ConnectStatus::LAUNCH_FAILED);
    EXPECT_EQ(outcome.exit_code, 2);
    EXPECT_FALSE(manager_->find_profile("office")->running);

    auto history = manager_->history("office");
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history[0].event, SessionEvent::LAUNCH_FAILED);
    EXPECT_EQ(history[0].exit_code, 2);
}

// ============================================================================
// Contention Tests
// ============================================================================

TEST_F(ProxyManagerTest, ContendedPortNeedsOverride) {
    import("office");
    import("home");
    ASSERT_TRUE(manager_->connect("office", 60000).ok());

    ConnectOutcome outcome = manager_->connect("home", 60000);
    EXPECT_EQ(outcome.status, ConnectStatus::PORT_CONTENDED);
    EXPECT_EQ(outcome.holder, "office");
    EXPECT_TRUE(manager_->find_profile("office")->running);
    EXPECT_FALSE(manager_->find_profile("home")->running);
}

TEST_F(ProxyManagerTest, OverrideStopsHolder) {
    import("office");
    import("home");
    ASSERT_TRUE(manager_->connect("office", 60000).ok());

    ConnectOutcome outcome = manager_->connect("home", 60000, true);
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.port, 60000);
    EXPECT_FALSE(manager_->find_profile("office")->running);
    EXPECT_TRUE(manager_->find_profile("home")->running);
    EXPECT_EQ(backend_->alive_count(), 1u);
    EXPECT_TRUE(events_->contains("stopped:office"));
}

TEST_F(ProxyManagerTest, ExternallyBusyExplicitPort) {
    import("office");
    probe_->set_busy(60003);

    ConnectOutcome outcome = manager_->connect("office", 60003, true);
    EXPECT_EQ(outcome.status, ConnectStatus::PORT_BUSY_EXTERNAL);
    EXPECT_EQ(backend_->spawn_count(), 0u);
}

TEST_F(ProxyManagerTest, ExternallyBusyOnlyPortUnderLimit) {
    import("office");
    ASSERT_TRUE(manager_->set_port_limit(1));
    probe_->set_busy(60000);

    EXPECT_EQ(manager_->connect("office").status, ConnectStatus::PORT_BUSY_EXTERNAL);
}

TEST_F(ProxyManagerTest, LimitReachedForAutomaticPort) {
    import("office");
    import("home");
    ASSERT_TRUE(manager_->set_port_limit(1));
    ASSERT_TRUE(manager_->connect("office").ok());

    EXPECT_EQ(manager_->connect("home").status, ConnectStatus::NO_PORT_AVAILABLE);
}

TEST_F(ProxyManagerTest, ShrunkLimitCountsConnectionsOutsideRange) {
    import("office");
    import("home");
    ASSERT_TRUE(manager_->connect("office", 60005).ok());
    ASSERT_TRUE(manager_->set_port_limit(1));

    EXPECT_EQ(manager_->connect("home", 60000).status, ConnectStatus::NO_PORT_AVAILABLE);
    EXPECT_TRUE(manager_->find_profile("office")->running);
}

TEST_F(ProxyManagerTest, UnlimitedAcceptsTopOfBaseRange) {
    import("office");
    ASSERT_TRUE(manager_->set_port_limit(0));

    EXPECT_TRUE(manager_->connect("office", 65535).ok());
}

// ============================================================================
// Port Reuse Tests
// ============================================================================

TEST_F(ProxyManagerTest, StoppedPortIsImmediatelyReusable) {
    import("office");
    import("home");
    ASSERT_TRUE(manager_->connect("office", 60002).ok());
    ASSERT_TRUE(manager_->disconnect("office"));

    ConnectOutcome outcome = manager_->connect("home", 60002);
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_FALSE(fs::exists(launch_config("office")));
}

TEST_F(ProxyManagerTest, ReconnectPrefersLastPort) {
    import("office");
    import("home");
    ASSERT_TRUE(manager_->connect("office").ok());
    ASSERT_TRUE(manager_->connect("home").ok());
    ASSERT_TRUE(manager_->disconnect("office"));
    ASSERT_TRUE(manager_->disconnect("home"));

    ConnectOutcome outcome = manager_->connect("home");
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.port, 60001);
    EXPECT_EQ(manager_->find_profile("office")->last_port, 60000);
}

TEST_F(ProxyManagerTest, ToggleConnectsThenDisconnects) {
    import("office");

    ConnectOutcome first = manager_->toggle("office");
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(first.disconnected);
    EXPECT_TRUE(manager_->find_profile("office")->running);

    ConnectOutcome second = manager_->toggle("office");
    EXPECT_TRUE(second.ok());
    EXPECT_TRUE(second.disconnected);
    EXPECT_FALSE(manager_->find_profile("office")->running);
}

TEST_F(ProxyManagerTest, DisconnectStoppedProfileIsNoop) {
    import("office");
    EXPECT_TRUE(manager_->disconnect("office"));
    EXPECT_FALSE(manager_->disconnect("ghost"));
    EXPECT_EQ(backend_->terminate_calls(), 0u);
}

// ============================================================================
// Liveness Tests
// ============================================================================

TEST_F(ProxyManagerTest, DeadProcessDetected) {
    import("office");
    ConnectOutcome outcome = manager_->connect("office");
    ASSERT_TRUE(outcome.ok());

    backend_->kill(*outcome.pid);

    EXPECT_EQ(manager_->refresh(), std::vector<std::string>({"office"}));
    auto profile = manager_->find_profile("office");
    EXPECT_FALSE(profile->running);
    EXPECT_FALSE(profile->pid.has_value());
    EXPECT_EQ(profile->last_port, 60000);
    EXPECT_FALSE(fs::exists(launch_config("office")));
    EXPECT_TRUE(events_->contains("died:office"));

    auto history = manager_->history("office");
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history[0].event, SessionEvent::DIED);

    // Port is free again for anyone
    import("home");
    EXPECT_EQ(manager_->connect("home", 60000).status, ConnectStatus::OK);
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST_F(ProxyManagerTest, SettingsAndProfilesSurviveRestart) {
    import("office");
    ASSERT_TRUE(manager_->set_port_limit(3));
    ASSERT_TRUE(manager_->set_proxy_type(ProxyType::HTTP));
    ASSERT_TRUE(manager_->set_process_logging(false));
    ASSERT_TRUE(manager_->connect("office", 60002).ok());
    ASSERT_TRUE(manager_->disconnect("office"));

    open_manager();

    GlobalConfig settings = manager_->settings();
    EXPECT_EQ(settings.port_limit, 3u);
    EXPECT_EQ(settings.proxy_type, ProxyType::HTTP);
    EXPECT_FALSE(settings.process_logging);
    ASSERT_TRUE(settings.executable_path.has_value());
    EXPECT_EQ(settings.executable_path->string(), executable_.string());

    auto profile = manager_->find_profile("office");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->last_port, 60002);
    EXPECT_EQ(manager_->allowed_range().high, 60002);
}

TEST_F(ProxyManagerTest, VanishedProcessClearedOnRestart) {
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());
    ASSERT_TRUE(fs::exists(launch_config("office")));

    // The new backend knows no processes, as after a reboot
    open_manager();

    auto profile = manager_->find_profile("office");
    ASSERT_TRUE(profile.has_value());
    EXPECT_FALSE(profile->running);
    EXPECT_FALSE(profile->pid.has_value());
    EXPECT_EQ(profile->last_port, 60000);
    EXPECT_FALSE(fs::exists(launch_config("office")));
    EXPECT_EQ(manager_->history("office")[0].event, SessionEvent::DIED);
}

TEST_F(ProxyManagerTest, RestartKeepsLaunchConfigOfLiveProcess) {
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());

    ManagerOptions options;
    options.data_dir = data_dir_;
    auto backend = std::make_unique<FakeProcessBackend>();
    backend->adopt(*manager_->find_profile("office")->pid);
    options.backend = std::move(backend);
    options.probe = std::make_unique<FakePortProbe>();

    manager_.reset();
    manager_ = std::make_unique<ProxyManager>(std::move(options));

    EXPECT_TRUE(manager_->find_profile("office")->running);
    EXPECT_TRUE(fs::exists(launch_config("office")));
}

// ============================================================================
// Executable Resolution Tests
// ============================================================================

TEST_F(ProxyManagerTest, RejectsNonExecutablePath) {
    fs::path plain = temp_->path() / "plain";
    write_file(plain, "data");
    EXPECT_FALSE(manager_->set_executable_path(plain));
    EXPECT_EQ(manager_->settings().executable_path->string(), executable_.string());
}

#ifndef _WIN32

TEST_F(ProxyManagerTest, MissingExecutableBlocksConnect) {
    std::string saved_path = get_env("PATH");
    fs::path empty_bin = temp_->path() / "empty_bin";
    fs::create_directories(empty_bin);
    ::setenv("PATH", empty_bin.c_str(), 1);

    data_dir_ = temp_->path() / "fresh";
    open_manager();
    import("office");

    EXPECT_FALSE(manager_->resolve_executable().has_value());
    EXPECT_EQ(manager_->connect("office").status, ConnectStatus::EXECUTABLE_NOT_FOUND);
    EXPECT_FALSE(manager_->auto_connect());
    EXPECT_EQ(backend_->spawn_count(), 0u);

    ::setenv("PATH", saved_path.c_str(), 1);
}

TEST_F(ProxyManagerTest, ExecutableFoundOnPathIsRemembered) {
    std::string saved_path = get_env("PATH");
    ::setenv("PATH", executable_.parent_path().c_str(), 1);

    data_dir_ = temp_->path() / "fresh";
    open_manager();
    EXPECT_FALSE(manager_->settings().executable_path.has_value());

    auto resolved = manager_->resolve_executable();
    ::setenv("PATH", saved_path.c_str(), 1);

    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->string(), executable_.string());
    EXPECT_EQ(manager_->settings().executable_path->string(), executable_.string());
}

#endif

// ============================================================================
// Bulk Operation Tests
// ============================================================================

TEST_F(ProxyManagerTest, AutoConnectStartsAndRecordsProfiles) {
    import("a");
    import("b");
    import("c");

    ASSERT_TRUE(manager_->auto_connect());
    manager_->wait_auto_connect();

    for (const auto& profile : manager_->profiles()) {
        EXPECT_TRUE(profile.running) << profile.name;
        EXPECT_EQ(manager_->history(profile.name)[0].event, SessionEvent::STARTED);
    }
    EXPECT_TRUE(events_->contains("finished"));

    // State was persisted by the workers
    open_manager();
    for (const auto& profile : manager_->profiles()) {
        EXPECT_TRUE(profile.last_port.has_value()) << profile.name;
    }
}

TEST_F(ProxyManagerTest, AutoConnectRespectsLimitWithManualConnections) {
    for (const char* name : {"a", "b", "c", "d"}) {
        import(name);
    }
    ASSERT_TRUE(manager_->set_port_limit(3));
    ASSERT_TRUE(manager_->connect("d").ok());

    ASSERT_TRUE(manager_->auto_connect());
    manager_->wait_auto_connect();

    EXPECT_EQ(backend_->alive_count(), 3u);
}

TEST_F(ProxyManagerTest, AutoConnectSkipsPortOfConnectInProgress) {
    import("office");
    import("home");
    backend_->set_spawn_delay(std::chrono::milliseconds(300));

    ConnectOutcome office;
    std::thread connecting([this, &office]() { office = manager_->connect("office"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(manager_->auto_connect(AutoConnectRequest::rows({1})));
    manager_->wait_auto_connect();
    connecting.join();

    ASSERT_TRUE(office.ok()) << office.message;
    auto home = manager_->find_profile("home");
    ASSERT_TRUE(home->running);
    EXPECT_EQ(office.port, 60000);
    EXPECT_EQ(home->proxy_port, 60001);
}

TEST_F(ProxyManagerTest, AutoConnectCountsConnectInProgressAgainstLimit) {
    import("office");
    import("home");
    ASSERT_TRUE(manager_->set_port_limit(1));
    backend_->set_spawn_delay(std::chrono::milliseconds(300));

    ConnectOutcome office;
    std::thread connecting([this, &office]() { office = manager_->connect("office"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(manager_->auto_connect(AutoConnectRequest::rows({1})));
    manager_->wait_auto_connect();
    connecting.join();

    EXPECT_TRUE(office.ok()) << office.message;
    EXPECT_FALSE(manager_->find_profile("home")->running);
    EXPECT_EQ(backend_->alive_count(), 1u);
}

TEST_F(ProxyManagerTest, AutoConnectReportsEarlierDeath) {
    import("office");
    import("home");
    ConnectOutcome outcome = manager_->connect("office");
    ASSERT_TRUE(outcome.ok());
    backend_->kill(*outcome.pid);

    ASSERT_TRUE(manager_->auto_connect(AutoConnectRequest::rows({1})));
    manager_->wait_auto_connect();

    EXPECT_TRUE(events_->contains("died:office"));
    EXPECT_FALSE(fs::exists(launch_config("office")));
    EXPECT_EQ(manager_->history("office")[0].event, SessionEvent::DIED);
    EXPECT_TRUE(manager_->find_profile("home")->running);
}

TEST_F(ProxyManagerTest, DeathSeenByAutoConnectIsStillReported) {
    import("office");
    import("home");
    ConnectOutcome outcome = manager_->connect("office");
    ASSERT_TRUE(outcome.ok());

    // Dies while a connect holds the manager, so the run starts unrefreshed
    backend_->set_spawn_delay(std::chrono::milliseconds(300));
    import("spare");
    std::thread connecting([this]() { manager_->connect("spare"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    backend_->kill(*outcome.pid);

    EXPECT_TRUE(manager_->auto_connect(AutoConnectRequest::rows({1})));
    manager_->wait_auto_connect();
    connecting.join();

    EXPECT_EQ(manager_->refresh(), std::vector<std::string>({"office"}));
    EXPECT_TRUE(events_->contains("died:office"));
    EXPECT_FALSE(fs::exists(launch_config("office")));
}

TEST_F(ProxyManagerTest, StopAllStopsEveryProfile) {
    import("a");
    import("b");
    ASSERT_TRUE(manager_->connect("a").ok());
    ASSERT_TRUE(manager_->connect("b").ok());

    EXPECT_EQ(manager_->stop_all(), 2u);
    EXPECT_EQ(backend_->alive_count(), 0u);
    EXPECT_EQ(manager_->stop_all(), 0u);
}

TEST_F(ProxyManagerTest, ShutdownStopsEverythingAndCleansUp) {
    import("a");
    import("b");
    ASSERT_TRUE(manager_->connect("a").ok());
    ASSERT_TRUE(manager_->connect("b").ok());

    manager_->shutdown();

    EXPECT_EQ(backend_->alive_count(), 0u);
    EXPECT_FALSE(fs::exists(launch_config("a")));
    EXPECT_FALSE(fs::exists(launch_config("b")));
    for (const auto& profile : manager_->profiles()) {
        EXPECT_FALSE(profile.running);
    }
}

TEST_F(ProxyManagerTest, DestructorLeavesProcessesRunning) {
    import("a");
    ASSERT_TRUE(manager_->connect("a").ok());

    manager_.reset();

    // Nothing was stopped, so the saved state still says running
    auto state = StateStore(config::get_state_file(data_dir_)).load();
    ASSERT_EQ(state.profiles.size(), 1u);
    EXPECT_TRUE(state.profiles[0].running);
}

// ============================================================================
// History Tests
// ============================================================================

TEST_F(ProxyManagerTest, HistoryRecordsSessions) {
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());
    ASSERT_TRUE(manager_->disconnect("office"));

    auto history = manager_->history("office");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].event, SessionEvent::STOPPED);
    EXPECT_EQ(history[1].event, SessionEvent::STARTED);
    EXPECT_EQ(history[1].port, 60000);
    EXPECT_FALSE(history[1].config_sha256.empty());
    EXPECT_EQ(manager_->history().size(), 2u);
}

TEST_F(ProxyManagerTest, LedgerCanBeDisabled) {
    manager_.reset();

    ManagerOptions options;
    options.data_dir = temp_->path() / "no_ledger";
    options.backend = std::make_unique<FakeProcessBackend>();
    options.probe = std::make_unique<FakePortProbe>();
    options.launch_grace = std::chrono::milliseconds(0);
    options.enable_ledger = false;
    manager_ = std::make_unique<ProxyManager>(std::move(options));

    ASSERT_TRUE(manager_->set_executable_path(executable_));
    import("office");
    ASSERT_TRUE(manager_->connect("office").ok());
    EXPECT_TRUE(manager_->history().empty());
    EXPECT_FALSE(fs::exists(config::get_ledger_file(temp_->path() / "no_ledger")));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
