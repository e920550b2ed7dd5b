#include <gtest/gtest.h>
#include <core/config.hpp>

static const char* MINIMAL = R"(
api_key: secret
machine_ids: [101, 202]
log_file: monitor.log
check_frequency: 300
)";

static Result<Config> parse(const std::string& text) {
    return Config::parse(text, "/srv/rentwatch");
}

TEST(Config, MinimalDefaults) {
    auto r = parse(MINIMAL);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.machine_ids(), (std::vector<int64_t>{101, 202}));
    EXPECT_EQ(c.check_frequency(), 300);
    EXPECT_FALSE(c.debug());
    EXPECT_EQ(c.state_dir(), fs::path("/srv/rentwatch"));
    EXPECT_EQ(c.log_file(), fs::path("/srv/rentwatch/monitor.log"));
    EXPECT_DOUBLE_EQ(c.reconcile().disk_tolerance_gb, 1.0);
    EXPECT_FALSE(c.notify().on_startup_existing);
    EXPECT_TRUE(c.notify().on_start);
    EXPECT_EQ(c.notify().error_ping_interval_minutes, 60);
    EXPECT_TRUE(c.targets().empty());
}

TEST(Config, PollCommandSubstitutesApiKey) {
    auto c = parse(MINIMAL).value;
    auto cmd = c.poll_command();
    ASSERT_FALSE(cmd.empty());
    EXPECT_EQ(cmd.front(), "vastai");
    EXPECT_EQ(cmd.back(), "secret");
}

TEST(Config, JsonIsAccepted) {
    auto r = parse(R"({"api_key": "k", "machine_ids": [1], "log_file": "/var/log/rw.log",
                       "check_frequency": 60, "debug": true})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.debug());
    EXPECT_EQ(r.value.log_file(), fs::path("/var/log/rw.log"));
}

TEST(Config, StateDirRelativeToBase) {
    auto r = parse(std::string(MINIMAL) + "state_dir: state\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.state_dir(), fs::path("/srv/rentwatch/state"));
    EXPECT_EQ(r.value.log_file(), fs::path("/srv/rentwatch/state/monitor.log"));
}

TEST(Config, MissingApiKey) {
    auto r = parse("machine_ids: [1]\nlog_file: a.log\ncheck_frequency: 60\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("api_key"), std::string::npos);
}

TEST(Config, EmptyMachineIds) {
    auto r = parse("api_key: k\nmachine_ids: []\nlog_file: a.log\ncheck_frequency: 60\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("machine_ids"), std::string::npos);
}

TEST(Config, LogFileMustEndInLog) {
    auto r = parse("api_key: k\nmachine_ids: [1]\nlog_file: a.txt\ncheck_frequency: 60\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("log_file"), std::string::npos);
}

TEST(Config, CheckFrequencyFloor) {
    auto r = parse("api_key: k\nmachine_ids: [1]\nlog_file: a.log\ncheck_frequency: 30\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("check_frequency"), std::string::npos);
}

TEST(Config, ToleranceMustBePositive) {
    auto r = parse(std::string(MINIMAL) + "reconcile:\n  disk_tolerance_gb: 0\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("disk_tolerance_gb"), std::string::npos);
}

TEST(Config, MalformedYamlIsAnError) {
    auto r = parse("api_key: [unclosed\n");
    EXPECT_TRUE(r.is_err());
}

TEST(Config, NotifyAndTargets) {
    auto r = parse(std::string(MINIMAL) + R"(
notify:
  on_startup_existing: true
  error_ping_interval_minutes: 15
apprise:
  error_mention: "1234"
  targets:
    - discord://hook/a
    - url: tgram://bot/chat
      events: [rental_start, rental_end]
    - url: mailto://x
      enabled: false
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_TRUE(c.notify().on_startup_existing);
    EXPECT_EQ(c.notify().error_ping_interval_minutes, 15);
    EXPECT_EQ(c.error_mention(), std::optional<std::string>("1234"));

    ASSERT_EQ(c.targets().size(), 2u);
    EXPECT_EQ(c.targets()[0].name, "discord-1");
    EXPECT_EQ(c.targets()[0].service, "discord");
    EXPECT_FALSE(c.targets()[0].events.has_value());
    EXPECT_EQ(c.targets()[1].name, "tgram-1");
    ASSERT_TRUE(c.targets()[1].events.has_value());
    EXPECT_EQ(c.targets()[1].events->size(), 2u);
}

// ── Target normalization ────────────────────────────────────

TEST(NormalizeTargets, NamesAndServices) {
    RawTarget a;
    a.url = "discord://a";
    RawTarget b;
    b.url = "discord://b";
    RawTarget c;
    c.url = "no-scheme-url";
    RawTarget d;
    d.url = "json://x";
    d.service = "Discord";

    auto out = normalize_targets({a, b, c, d});
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].name, "discord-1");
    EXPECT_EQ(out[1].name, "discord-2");
    EXPECT_EQ(out[2].name, "default-1");
    EXPECT_EQ(out[2].service, "default");
    EXPECT_EQ(out[3].service, "discord");
    EXPECT_EQ(out[3].name, "discord-3");
}

TEST(NormalizeTargets, DuplicateNamesGetSuffix) {
    RawTarget a;
    a.url = "discord://a";
    a.name = "ops";
    RawTarget b = a;
    b.url = "discord://b";

    auto out = normalize_targets({a, b});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].name, "ops");
    EXPECT_EQ(out[1].name, "ops-2");
    EXPECT_EQ(out[1].tags.front(), "ops-2");
}

TEST(NormalizeTargets, SkipsDisabledAndUrlless) {
    RawTarget off;
    off.url = "discord://a";
    off.enabled = false;
    RawTarget empty;

    EXPECT_TRUE(normalize_targets({off, empty}).empty());
}

TEST(NormalizeTargets, EventFilters) {
    RawTarget all;
    all.url = "discord://a";
    all.events = {"rental_start", "*"};
    RawTarget some;
    some.url = "discord://b";
    some.events = {" Rental_End ", "bogus"};
    RawTarget none;
    none.url = "discord://c";
    none.events = {"bogus"};

    auto out = normalize_targets({all, some, none});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FALSE(out[0].events.has_value());
    ASSERT_TRUE(out[1].events.has_value());
    EXPECT_EQ(*out[1].events, (std::set<std::string>{"rental_end"}));
    EXPECT_FALSE(out[2].events.has_value());
}
