#include <gtest/gtest.h>
#include <monitor/monitor.hpp>
#include <platform/platform.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fstream>
#include <map>
#include <mutex>

// Serves queued fetch results in order; the last one repeats.
class ScriptedSource : public MachineSource {
public:
    std::vector<Result<std::vector<MachineState>>> script;
    size_t calls = 0;

    Result<std::vector<MachineState>> fetch() override {
        size_t i = std::min(calls, script.size() - 1);
        calls++;
        return script[i];
    }

    void push(std::vector<MachineState> machines) {
        script.push_back(Result<std::vector<MachineState>>::Ok(std::move(machines)));
    }
};

class RecordingTransport : public Transport {
public:
    bool deliver(const NotificationTarget&, const Message& message) override {
        std::lock_guard<std::mutex> lock(mtx_);
        titles_.push_back(message.title);
        return true;
    }

    int count(const std::string& title) {
        std::lock_guard<std::mutex> lock(mtx_);
        return static_cast<int>(std::count(titles_.begin(), titles_.end(), title));
    }

private:
    std::mutex mtx_;
    std::vector<std::string> titles_;
};

static MachineState machine(int64_t id, const std::string& occupancy, double disk = 0.0, int running = 0) {
    MachineState m;
    m.machine_id = id;
    m.gpu_occupancy = occupancy;
    m.num_gpus = static_cast<int>(split_ws(occupancy).size());
    m.listed_gpu_cost = 0.5;
    m.listed_storage_cost = 0.1;
    m.alloc_disk_space = disk;
    m.counters.running = running;
    m.counters.resident = running;
    return m;
}

class MonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = platform::temp_file("rentwatch-monitor-");
        fs::create_directories(dir_);
        auto cfg = Config::parse(
            "api_key: k\n"
            "machine_ids: [1, 2]\n"
            "log_file: test.log\n"
            "check_frequency: 60\n"
            "notify:\n"
            "  on_startup_existing: true\n"
            "  error_ping_interval_minutes: 60\n",
            dir_);
        ASSERT_TRUE(cfg.is_ok()) << cfg.error;
        config_ = cfg.value;
        store_ = std::make_unique<RegistryStore>(dir_);
        ASSERT_TRUE(store_->ensure_dirs().is_ok());

        NotificationTarget t;
        t.name = "default-1";
        t.url = "json://localhost";
        t.service = "default";
        RetryPolicy retry;
        retry.min_delay_ms = 0;
        retry.max_delay_ms = 0;
        transport_ = std::make_shared<RecordingTransport>();
        notifier_ = std::make_unique<NotificationDispatcher>(
            std::vector<NotificationTarget>{t}, transport_, std::nullopt, retry);
    }

    void TearDown() override {
        notifier_->close();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::unique_ptr<Monitor> make_monitor() {
        auto m = std::make_unique<Monitor>(config_, source_, *store_, notifier_.get());
        m->clock = [this] { return now_; };
        return m;
    }

    fs::path dir_;
    Config config_;
    ScriptedSource source_;
    std::unique_ptr<RegistryStore> store_;
    std::shared_ptr<RecordingTransport> transport_;
    std::unique_ptr<NotificationDispatcher> notifier_;
    std::string now_ = "2025-03-01T00:00:00Z";
};

TEST_F(MonitorTest, FirstSightingSavesSnapshotOnly) {
    source_.push({machine(1, "x x")});
    auto monitor = make_monitor();

    EXPECT_EQ(monitor->run_cycle(), 1);
    EXPECT_TRUE(fs::exists(store_->snapshot_path(1)));
    EXPECT_TRUE(store_->has_registry(1));
    EXPECT_TRUE(store_->load(1).value.sessions.empty());
}

TEST_F(MonitorTest, RentalLifecycleIsPersistedArchivedAndAnnounced) {
    source_.push({machine(1, "x x")});
    source_.push({machine(1, "D x", 20.0, 1)});
    source_.push({machine(1, "x x", 0.0, 0)});
    auto monitor = make_monitor();

    monitor->run_cycle();
    now_ = "2025-03-01T01:00:00Z";
    EXPECT_EQ(monitor->run_cycle(), 1);

    auto reg = store_->load(1).value;
    ASSERT_EQ(reg.sessions.size(), 1u);
    EXPECT_DOUBLE_EQ(reg.sessions.begin()->second.storage_gb, 20.0);

    now_ = "2025-03-01T03:00:00Z";
    EXPECT_EQ(monitor->run_cycle(), 1);
    EXPECT_TRUE(store_->load(1).value.sessions.empty());

    std::vector<fs::path> archived;
    for (const auto& e : fs::directory_iterator(store_->archive_dir())) archived.push_back(e.path());
    ASSERT_EQ(archived.size(), 1u);
    EXPECT_EQ(archived[0].filename().string(), "20250301T030000_session_m1-0001.yaml");

    notifier_->close();
    EXPECT_EQ(transport_->count("New Rental"), 1);
    EXPECT_EQ(transport_->count("Rental Ended"), 1);
}

TEST_F(MonitorTest, StorageDropAloneIsBilledAtLowerRate) {
    auto rented = machine(1, "D x", 20.0, 1);
    auto cheaper = rented;
    cheaper.listed_storage_cost = 0.01;
    source_.push({machine(1, "x x")});
    source_.push({rented});
    source_.push({cheaper});
    auto monitor = make_monitor();

    monitor->run_cycle();
    now_ = "2025-03-01T01:00:00Z";
    monitor->run_cycle();
    now_ = "2025-03-01T02:00:00Z";
    EXPECT_EQ(monitor->run_cycle(), 1);

    auto reg = store_->load(1).value;
    ASSERT_EQ(reg.sessions.size(), 1u);
    const auto& s = reg.sessions.begin()->second;
    ASSERT_EQ(s.storage_segments.size(), 2u);
    ASSERT_NE(s.open_storage(), nullptr);
    EXPECT_DOUBLE_EQ(s.open_storage()->rate_per_gb_month, 0.01);
    EXPECT_EQ(s.open_storage()->start, "2025-03-01T02:00:00Z");
}

TEST_F(MonitorTest, FailedSnapshotWriteDoesNotReplayDiskDrop) {
    auto before = machine(1, "D x", 100.0, 1);
    before.counters.running_on_demand = 1;
    before.counters.resident = 2;
    before.counters.resident_on_demand = 2;
    ASSERT_TRUE(store_->save_snapshot(before).is_ok());

    MachineRegistry reg;
    reg.machine_id = 1;
    reg.observe(before);
    Session live;
    live.id = reg.allocate_session_id();
    live.gpus = {0};
    live.rental_type = "D";
    live.gpu_contracted_rate = 0.5;
    live.storage_contracted_rate = 0.1;
    live.storage_gb = 50.0;
    live.start_time = now_;
    live.open_gpu_segment(0.5, 1, now_);
    live.open_storage_segment(0.1, now_);
    reg.assign_slots(live.gpus, live.id);
    reg.sessions[live.id] = live;
    Session parked;
    parked.id = reg.allocate_session_id();
    parked.status = SessionStatus::Stored;
    parked.gpus = {1};
    parked.rental_type = "D";
    parked.storage_gb = 50.0;
    parked.start_time = now_;
    parked.open_storage_segment(0.1, now_);
    reg.sessions[parked.id] = parked;
    ASSERT_TRUE(store_->save(reg).is_ok());

    auto after = machine(1, "x x", 50.0, 0);
    after.counters.resident = 1;
    after.counters.resident_on_demand = 1;
    source_.push({after});
    auto monitor = make_monitor();

    // The snapshot cannot be replaced while a directory sits on its temp path
    fs::path blocker = store_->snapshot_path(1);
    blocker += ".tmp";
    fs::create_directories(blocker);

    now_ = "2025-03-01T01:00:00Z";
    EXPECT_EQ(monitor->run_cycle(), 0);
    ASSERT_EQ(store_->load(1).value.sessions.size(), 1u);

    now_ = "2025-03-01T02:00:00Z";
    monitor->run_cycle();
    auto kept = store_->load(1).value;
    ASSERT_EQ(kept.sessions.size(), 1u);
    EXPECT_EQ(kept.sessions.begin()->first, "m1-0002");
    EXPECT_EQ(kept.sessions.begin()->second.status, SessionStatus::Stored);

    int archived = 0;
    for (const auto& e : fs::directory_iterator(store_->archive_dir())) {
        (void)e;
        archived++;
    }
    EXPECT_EQ(archived, 1);
}

TEST_F(MonitorTest, FetchFailureSkipsCycle) {
    source_.script.push_back(Result<std::vector<MachineState>>::Err("api down"));
    auto monitor = make_monitor();
    EXPECT_EQ(monitor->run_cycle(), -1);
    EXPECT_FALSE(store_->has_registry(1));
}

TEST_F(MonitorTest, CorruptRegistrySkipsOnlyThatMachine) {
    {
        std::ofstream out(store_->registry_path(2));
        out << "sessions: [ {id: \n";
    }
    source_.push({machine(1, "x x"), machine(2, "x x")});
    auto monitor = make_monitor();

    EXPECT_EQ(monitor->run_cycle(), 1);
    EXPECT_TRUE(fs::exists(store_->snapshot_path(1)));
    EXPECT_FALSE(fs::exists(store_->snapshot_path(2)));
}

TEST_F(MonitorTest, ErrorPingsAreThrottledAndRecoveryAnnounced) {
    auto broken = machine(1, "x x");
    broken.error_description = "disk failing";
    source_.push({machine(1, "x x")});
    source_.push({broken});
    source_.push({broken});
    source_.push({broken});
    source_.push({machine(1, "x x")});
    auto monitor = make_monitor();

    monitor->run_cycle();
    now_ = "2025-03-01T00:05:00Z";
    monitor->run_cycle();               // first ping
    EXPECT_TRUE(store_->load(1).value.last_error_notified_at.has_value());
    now_ = "2025-03-01T00:15:00Z";
    monitor->run_cycle();               // throttled
    now_ = "2025-03-01T01:06:00Z";
    monitor->run_cycle();               // due again
    now_ = "2025-03-01T01:07:00Z";
    monitor->run_cycle();               // cleared

    EXPECT_FALSE(store_->load(1).value.last_error_notified_at.has_value());
    notifier_->close();
    EXPECT_EQ(transport_->count("Machine Error"), 2);
    EXPECT_EQ(transport_->count("Machine Recovered"), 1);
}

TEST_F(MonitorTest, TimeoutIsReportedAsError) {
    auto stuck = machine(1, "x x");
    stuck.timeout = 120;
    source_.push({machine(1, "x x")});
    source_.push({stuck});
    source_.push({machine(1, "x x")});
    auto monitor = make_monitor();

    monitor->run_cycle();
    monitor->run_cycle();
    monitor->run_cycle();
    notifier_->close();
    EXPECT_EQ(transport_->count("Machine Error"), 1);
    EXPECT_EQ(transport_->count("Machine Recovered"), 1);
}

TEST_F(MonitorTest, StartupSeedsAndSummarizes) {
    auto busy = machine(1, "D D x x", 0.0, 1);
    busy.counters.running_on_demand = 1;
    source_.push({busy, machine(2, "x x")});
    auto monitor = make_monitor();

    monitor->startup();

    auto reg = store_->load(1).value;
    ASSERT_EQ(reg.sessions.size(), 1u);
    EXPECT_EQ(reg.sessions.begin()->second.gpus, (std::vector<int>{0, 1}));
    EXPECT_TRUE(store_->has_registry(2));

    notifier_->close();
    EXPECT_EQ(transport_->count("Startup Summary"), 1);
}

TEST_F(MonitorTest, RunStopsWhenFlagIsSet) {
    source_.push({machine(1, "x x")});
    auto monitor = make_monitor();

    std::atomic<bool> stop{true};
    monitor->run(stop);
    notifier_->close();
    EXPECT_EQ(transport_->count("Monitor Started"), 1);
    EXPECT_EQ(transport_->count("Monitor Stopped"), 1);
}
