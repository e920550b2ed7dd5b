#include <gtest/gtest.h>
#include <monitor/registry_store.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

class RegistryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = platform::temp_file("rentwatch-store-");
        store_ = std::make_unique<RegistryStore>(dir_);
        ASSERT_TRUE(store_->ensure_dirs().is_ok());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static MachineRegistry sample() {
        MachineRegistry reg;
        reg.machine_id = 12;
        reg.gpu_name = "A100";
        reg.num_gpus = 2;
        reg.gpu_occupancy = "D x";
        reg.alloc_disk_space = 43.3;
        reg.counters.running = 1;
        reg.counters.running_on_demand = 1;
        reg.counters.resident = 2;
        reg.counters.resident_on_demand = 1;
        reg.last_error_notified_at = "2025-03-01T00:30:00Z";

        Session running;
        running.id = reg.allocate_session_id();
        running.gpus = {0};
        running.rental_type = "D";
        running.gpu_contracted_rate = 1.1;
        running.storage_contracted_rate = 0.12;
        running.storage_gb = 33.3;
        running.start_time = "2025-03-01T00:00:00Z";
        running.client_end_date = "2025-04-01T00:00:00Z";
        running.open_gpu_segment(1.1, 1, "2025-03-01T00:00:00Z");
        running.open_gpu_segment(0.9, 1, "2025-03-01T02:00:00Z");
        running.open_storage_segment(0.12, "2025-03-01T00:00:00Z");
        reg.assign_slots(running.gpus, running.id);
        reg.sessions[running.id] = running;

        Session stored;
        stored.id = reg.allocate_session_id();
        stored.status = SessionStatus::Stored;
        stored.gpus = {1};
        stored.rental_type = "I";
        stored.storage_gb = 10.0;
        stored.start_time = "2025-03-01T00:00:00Z";
        stored.open_gpu_segment(0.2, 1, "2025-03-01T00:00:00Z");
        stored.close_gpu_segment("2025-03-01T01:00:00Z");
        stored.open_storage_segment(0.12, "2025-03-01T00:00:00Z");
        reg.sessions[stored.id] = stored;
        return reg;
    }

    fs::path dir_;
    std::unique_ptr<RegistryStore> store_;
};

TEST_F(RegistryStoreTest, MissingRegistryIsFresh) {
    EXPECT_FALSE(store_->has_registry(99));
    auto r = store_->load(99);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.machine_id, 99);
    EXPECT_TRUE(r.value.sessions.empty());
    EXPECT_EQ(r.value.next_session_seq, 1);
}

TEST_F(RegistryStoreTest, SaveAndReload) {
    auto reg = sample();
    ASSERT_TRUE(store_->save(reg).is_ok());
    ASSERT_TRUE(store_->has_registry(12));
    EXPECT_FALSE(fs::exists(store_->registry_path(12).string() + ".tmp"));

    auto r = store_->load(12);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& back = r.value;

    EXPECT_EQ(back.next_session_seq, reg.next_session_seq);
    EXPECT_EQ(back.slots, reg.slots);
    EXPECT_EQ(back.gpu_occupancy, "D x");
    EXPECT_EQ(back.alloc_disk_space, std::optional<double>(43.3));
    EXPECT_TRUE(back.has_baseline());
    EXPECT_EQ(back.counters.resident, 2);
    EXPECT_EQ(back.last_error_notified_at, reg.last_error_notified_at);
    EXPECT_FALSE(back.last_timeout_notified_at.has_value());
    ASSERT_EQ(back.sessions.size(), 2u);

    for (const auto& [sid, s] : reg.sessions) {
        const auto& b = back.sessions.at(sid);
        EXPECT_EQ(b.status, s.status);
        EXPECT_EQ(b.gpus, s.gpus);
        EXPECT_EQ(b.rental_type, s.rental_type);
        EXPECT_DOUBLE_EQ(b.storage_gb, s.storage_gb);
        EXPECT_EQ(b.client_end_date, s.client_end_date);
        ASSERT_EQ(b.gpu_segments.size(), s.gpu_segments.size());
        for (size_t i = 0; i < s.gpu_segments.size(); ++i) {
            EXPECT_EQ(b.gpu_segments[i].start, s.gpu_segments[i].start);
            EXPECT_EQ(b.gpu_segments[i].end, s.gpu_segments[i].end);
            EXPECT_DOUBLE_EQ(b.gpu_segments[i].rate, s.gpu_segments[i].rate);
            EXPECT_EQ(b.gpu_segments[i].gpu_count, s.gpu_segments[i].gpu_count);
        }
        ASSERT_EQ(b.storage_segments.size(), s.storage_segments.size());
        EXPECT_DOUBLE_EQ(b.totals("2025-03-02T00:00:00Z").total(),
                         s.totals("2025-03-02T00:00:00Z").total());
    }
    EXPECT_TRUE(registry_violations(back).empty());
}

TEST_F(RegistryStoreTest, CorruptRegistryIsAnErrorAndLeftInPlace) {
    {
        std::ofstream out(store_->registry_path(5));
        out << "sessions: [ {id: m5-0001, status: \n";
    }
    auto r = store_->load(5);
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(fs::exists(store_->registry_path(5)));
}

TEST_F(RegistryStoreTest, UnknownSessionStatusIsRejected) {
    auto r = registry_from_yaml("machine_id: 1\nsessions:\n  - id: m1-0001\n    status: paused\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("unknown status"), std::string::npos);
}

TEST_F(RegistryStoreTest, SnapshotRoundTrip) {
    auto none = store_->load_snapshot(3);
    ASSERT_TRUE(none.is_ok());
    EXPECT_FALSE(none.value.has_value());

    MachineState m;
    m.machine_id = 3;
    m.num_gpus = 2;
    m.gpu_occupancy = "I x";
    m.min_bid_price = 0.123456789;
    m.alloc_disk_space = 12.5;
    ASSERT_TRUE(store_->save_snapshot(m).is_ok());

    auto back = store_->load_snapshot(3);
    ASSERT_TRUE(back.is_ok()) << back.error;
    ASSERT_TRUE(back.value.has_value());
    EXPECT_EQ(back.value->gpu_occupancy, "I x");
    EXPECT_DOUBLE_EQ(back.value->min_bid_price, 0.123456789);
    EXPECT_TRUE(changed_fields(m, *back.value).empty());
}

TEST_F(RegistryStoreTest, ArchiveWritesFinalizedSession) {
    auto reg = sample();
    Session s = reg.sessions.at("m12-0001");
    s.finalize("2025-03-01T05:06:07Z");

    auto path = store_->archive(12, s);
    ASSERT_TRUE(path.is_ok()) << path.error;
    EXPECT_EQ(path.value.filename().string(), "20250301T050607_session_m12-0001.yaml");
    EXPECT_EQ(path.value.parent_path(), store_->archive_dir());

    YAML::Node root = YAML::LoadFile(path.value.string());
    EXPECT_EQ(root["machine_id"].as<int64_t>(), 12);
    auto parsed = parse_session(root["session"]);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    EXPECT_EQ(parsed.value.status, SessionStatus::Ended);
    ASSERT_TRUE(parsed.value.estimated_earnings.has_value());
    EXPECT_DOUBLE_EQ(*parsed.value.estimated_earnings, *s.estimated_earnings);
}

TEST_F(RegistryStoreTest, RegistryWithoutDiskHasNoBaseline) {
    {
        std::ofstream out(store_->registry_path(5));
        out << "machine_id: 5\ngpu_occupancy: D x\nnext_session_seq: 1\n";
    }
    auto r = store_->load(5);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.has_baseline());
}

TEST_F(RegistryStoreTest, ArchivingTwiceKeepsOneFile) {
    auto reg = sample();
    Session s = reg.sessions.at("m12-0001");
    s.finalize("2025-03-01T05:06:07Z");
    ASSERT_TRUE(store_->archive(12, s).is_ok());

    Session again = reg.sessions.at("m12-0001");
    again.finalize("2025-03-01T06:00:00Z");
    auto path = store_->archive(12, again);
    ASSERT_TRUE(path.is_ok()) << path.error;
    EXPECT_EQ(path.value.filename().string(), "20250301T050607_session_m12-0001.yaml");

    // A different session with a similar id is not mistaken for it
    Session other = reg.sessions.at("m12-0001");
    other.id = "m112-0001";
    other.finalize("2025-03-01T06:00:00Z");
    ASSERT_TRUE(store_->archive(112, other).is_ok());

    int files = 0;
    for (const auto& e : fs::directory_iterator(store_->archive_dir())) {
        (void)e;
        files++;
    }
    EXPECT_EQ(files, 2);

    auto parsed = parse_session(YAML::LoadFile(path.value.string())["session"]);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    EXPECT_EQ(parsed.value.end_time, std::optional<std::string>("2025-03-01T06:00:00Z"));
}
