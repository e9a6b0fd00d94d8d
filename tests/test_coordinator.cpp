#include <gtest/gtest.h>
#include <supervisor/coordinator.hpp>
#include <platform/lock_file.hpp>
#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

// Answers probes from a script; once the script runs out, returns fallback.
class ScriptedProbe : public LivenessProbe {
public:
    std::deque<bool> answers;
    bool fallback = false;
    int calls = 0;
    std::function<void()> before_answer;

    bool probe(const Endpoint&, int) override {
        ++calls;
        if (before_answer) before_answer();
        if (answers.empty()) return fallback;
        bool a = answers.front();
        answers.pop_front();
        return a;
    }
};

// Launches a short-lived shell instead of the real backend, or fails on demand.
class FakeLauncher : public BackendLauncher {
public:
    FakeLauncher() : BackendLauncher(BackendConfig{}) {}

    bool fail = false;
    std::string script = "sleep 0.2";
    int calls = 0;

    Result<platform::ProcessHandle> launch() override {
        ++calls;
        if (fail) return Result<platform::ProcessHandle>::Err("/bin/sh: permission denied");
        return platform::spawn("/bin/sh", {"-c", script});
    }
};

class CoordinatorTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::optional<Config> config;
    ScriptedProbe prober;
    FakeLauncher launcher;
    Reaper reaper;
    std::vector<std::pair<std::string, std::string>> events;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("hubwarden_coordinator_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        config = load_config(test_dir.string());
    }

    void TearDown() override {
        reaper.join_all();
        fs::remove_all(test_dir);
    }

    Config load_config(const std::string& lock_dir) {
        auto path = test_dir / "config.yaml";
        std::ofstream(path) << "locks:\n"
                            << "  dir: \"" << lock_dir << "\"\n"
                            << "timing:\n"
                            << "  probe_timeout_ms: 50\n"
                            << "  backoff_ms: 10\n"
                            << "  max_attempts: 3\n";
        auto r = Config::load(path);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }

    std::unique_ptr<Coordinator> make_coordinator() {
        auto c = std::make_unique<Coordinator>(*config, prober, launcher, reaper);
        c->on_event([this](const std::string& event, const std::string& payload) {
            events.emplace_back(event, payload);
        });
        return c;
    }

    std::string spawn_lock() const { return config->spawn_lock_path().string(); }

    void plant_spawn_lock(const std::string& pid) {
        std::ofstream(spawn_lock()) << pid << "\n";
    }

    void expect_single_outcome(const std::string& name) {
        ASSERT_EQ(events.size(), 1u);
        EXPECT_EQ(events[0].first, "backend-started");
        EXPECT_EQ(events[0].second, name);
    }
};

// ── Spawn protocol ─────────────────────────────────────────

TEST_F(CoordinatorTest, ReachableBackendMeansNoSpawnAttempt) {
    prober.answers = {true};
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::AlreadyRunning);
    EXPECT_EQ(c->launches(), 0);
    EXPECT_EQ(launcher.calls, 0);
    EXPECT_EQ(prober.calls, 1);
    EXPECT_FALSE(fs::exists(spawn_lock()));
    expect_single_outcome("already-running");
}

TEST_F(CoordinatorTest, SpawnsWhenNothingIsListening) {
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::Spawned);
    EXPECT_EQ(launcher.calls, 1);
    expect_single_outcome("spawned");

    // The lock records the child's pid, not ours.
    auto owner = platform::LockFile::read_owner(spawn_lock());
    ASSERT_TRUE(owner.has_value());
    EXPECT_NE(*owner, getpid());

    // And goes away once the child exits.
    reaper.join_all();
    EXPECT_FALSE(fs::exists(spawn_lock()));
}

TEST_F(CoordinatorTest, LaunchFailureReleasesLockAndStops) {
    launcher.fail = true;
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::SpawnFailed);
    EXPECT_EQ(launcher.calls, 1);
    EXPECT_FALSE(fs::exists(spawn_lock()));
    expect_single_outcome("spawn-failed");
}

TEST_F(CoordinatorTest, StaleLockFromCrashIsRecovered) {
    // Previous launcher died before the backend ever bound its port.
    plant_spawn_lock("99999");
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::Spawned);
    EXPECT_EQ(launcher.calls, 1);
    // initial, attempt 1, re-probe after contention, attempt 2
    EXPECT_EQ(prober.calls, 4);
    auto owner = platform::LockFile::read_owner(spawn_lock());
    ASSERT_TRUE(owner.has_value());
    EXPECT_NE(*owner, 99999);
    expect_single_outcome("spawned");
}

TEST_F(CoordinatorTest, ContendedLockWithReachableBackendIsStartedByOther) {
    plant_spawn_lock("12345");
    prober.answers = {false, false, true};
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::StartedByOther);
    EXPECT_EQ(launcher.calls, 0);
    // The other launcher's lock is left alone.
    EXPECT_EQ(platform::LockFile::read_owner(spawn_lock()).value_or(-1), 12345);
    expect_single_outcome("started-by-other");
}

TEST_F(CoordinatorTest, BackendAppearingBeforeLockIsStartedByOther) {
    prober.answers = {false, true};
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::StartedByOther);
    EXPECT_EQ(launcher.calls, 0);
    EXPECT_FALSE(fs::exists(spawn_lock()));
    expect_single_outcome("started-by-other");
}

TEST_F(CoordinatorTest, RacerRemovesLiveLockThenSeesBackend) {
    // Launcher A holds the lock and is still starting the backend. B's
    // re-probe is a moment too early, so B deletes A's live lock, backs off,
    // and finds the backend up on the next attempt.
    plant_spawn_lock(std::to_string(getpid()));
    prober.answers = {false, false, false, true};
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::StartedByOther);
    EXPECT_EQ(launcher.calls, 0);
    EXPECT_FALSE(fs::exists(spawn_lock()));
    expect_single_outcome("started-by-other");
}

TEST_F(CoordinatorTest, GivesUpAfterAttemptBudget) {
    // A competing launcher grabs the lock again before every acquire.
    prober.before_answer = [this] {
        if (!fs::exists(spawn_lock())) plant_spawn_lock("777");
    };
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::SpawnFailed);
    EXPECT_EQ(launcher.calls, 0);
    // initial probe + (probe, re-probe) per attempt
    EXPECT_EQ(prober.calls, 1 + 3 * 2);
    expect_single_outcome("spawn-failed");
}

TEST_F(CoordinatorTest, AttemptBudgetFollowsConfig) {
    auto path = test_dir / "one_attempt.yaml";
    std::ofstream(path) << "locks:\n  dir: \"" << test_dir.string() << "\"\n"
                        << "timing:\n  max_attempts: 1\n  backoff_ms: 0\n";
    auto loaded = Config::load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    config = loaded.value;

    plant_spawn_lock("777");
    prober.before_answer = [this] {
        if (!fs::exists(spawn_lock())) plant_spawn_lock("777");
    };
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::SpawnFailed);
    EXPECT_EQ(prober.calls, 3);
    expect_single_outcome("spawn-failed");
}

TEST_F(CoordinatorTest, UnusableSpawnLockCountsAsFailedAttempt) {
    std::ofstream(test_dir / "plain").close();
    config = load_config((test_dir / "plain").string());
    auto c = make_coordinator();

    EXPECT_EQ(c->ensure_backend(), SupervisorOutcome::SpawnFailed);
    EXPECT_EQ(launcher.calls, 0);
    expect_single_outcome("spawn-failed");
}

// ── Supervisor singleton ───────────────────────────────────

TEST_F(CoordinatorTest, SecondSupervisorSeesAlreadyRunning) {
    auto first = make_coordinator();
    auto second = make_coordinator();

    EXPECT_EQ(first->claim_instance(), InstanceClaim::Acquired);
    EXPECT_TRUE(first->holds_instance());
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(platform::LockFile::read_owner(first->instance_lock_path()).value_or(-1), getpid());

    EXPECT_EQ(second->claim_instance(), InstanceClaim::AlreadyRunning);
    EXPECT_FALSE(second->holds_instance());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, "already-running");
    EXPECT_EQ(events[0].second, "another-instance");

    // Claiming again from the holder is a no-op.
    EXPECT_EQ(first->claim_instance(), InstanceClaim::Acquired);
}

TEST_F(CoordinatorTest, ReleasedInstanceCanBeClaimedAgain) {
    auto first = make_coordinator();
    ASSERT_EQ(first->claim_instance(), InstanceClaim::Acquired);
    ASSERT_TRUE(first->release_instance().is_ok());
    EXPECT_FALSE(fs::exists(first->instance_lock_path()));

    auto second = make_coordinator();
    EXPECT_EQ(second->claim_instance(), InstanceClaim::Acquired);
}

TEST_F(CoordinatorTest, ReleaseWithoutClaimLeavesOtherHolderAlone) {
    auto holder = make_coordinator();
    auto other = make_coordinator();
    ASSERT_EQ(holder->claim_instance(), InstanceClaim::Acquired);
    ASSERT_EQ(other->claim_instance(), InstanceClaim::AlreadyRunning);

    EXPECT_TRUE(other->release_instance().is_ok());
    EXPECT_TRUE(fs::exists(holder->instance_lock_path()));
}

TEST_F(CoordinatorTest, ConcurrentSupervisorsHaveOneWinner) {
    constexpr int kSupervisors = 8;
    std::vector<std::unique_ptr<Coordinator>> coords;
    for (int i = 0; i < kSupervisors; ++i) {
        coords.push_back(std::make_unique<Coordinator>(*config, prober, launcher, reaper));
    }

    std::atomic<bool> go{false};
    std::atomic<int> acquired{0};
    std::atomic<int> already{0};
    std::vector<std::thread> threads;
    for (auto& c : coords) {
        threads.emplace_back([&, ptr = c.get()] {
            while (!go.load()) std::this_thread::yield();
            auto claim = ptr->claim_instance();
            if (claim == InstanceClaim::Acquired) acquired++;
            if (claim == InstanceClaim::AlreadyRunning) already++;
        });
    }
    go.store(true);
    for (auto& t : threads) t.join();

    EXPECT_EQ(acquired.load(), 1);
    EXPECT_EQ(already.load(), kSupervisors - 1);
}

TEST_F(CoordinatorTest, UnusableInstanceLockIsAnError) {
    std::ofstream(test_dir / "plain").close();
    config = load_config((test_dir / "plain").string());
    auto c = make_coordinator();

    EXPECT_EQ(c->claim_instance(), InstanceClaim::Error);
    EXPECT_FALSE(c->holds_instance());
    // No other supervisor exists, so this must not read as contention.
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, "instance-lock-error");
    EXPECT_FALSE(events[0].second.empty());
}

TEST(SupervisorOutcome, WireNames) {
    EXPECT_STREQ(outcome_name(SupervisorOutcome::AlreadyRunning), "already-running");
    EXPECT_STREQ(outcome_name(SupervisorOutcome::StartedByOther), "started-by-other");
    EXPECT_STREQ(outcome_name(SupervisorOutcome::Spawned), "spawned");
    EXPECT_STREQ(outcome_name(SupervisorOutcome::SpawnFailed), "spawn-failed");
    EXPECT_STREQ(claim_name(InstanceClaim::AlreadyRunning), "already-running");
}
