#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_set>

#include "agw/foundation/clock.hpp"
#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/error_code.hpp"
#include "agw/foundation/gateway_error.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/foundation/types.hpp"

using namespace agw::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::QuotaExceeded), "Quota");
    EXPECT_EQ(errorSubsystem(ErrorCode::ProbeFailed), "Health");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidOverride), "Priority");
    EXPECT_EQ(errorSubsystem(ErrorCode::UpstreamSaturated), "Routing");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownPrincipal), "Admission");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigurationMissing), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobTimeout), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::StoreTimeout), "Store");
}

TEST(ErrorCodeTest, OnlyStoreErrorsAreTransient) {
    EXPECT_TRUE(isTransient(ErrorCode::StoreUnavailable));
    EXPECT_TRUE(isTransient(ErrorCode::StoreTimeout));
    EXPECT_FALSE(isTransient(ErrorCode::QuotaExceeded));
    EXPECT_FALSE(isTransient(ErrorCode::UpstreamUnavailable));
}

// --- GatewayError tests ---

TEST(GatewayErrorTest, DefaultConstruction) {
    GatewayError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GatewayErrorTest, CodeAndMessage) {
    GatewayError err(ErrorCode::UpstreamUnavailable, "no_healthy_upstream");
    EXPECT_EQ(err.code(), ErrorCode::UpstreamUnavailable);
    EXPECT_EQ(err.message(), "no_healthy_upstream");
    EXPECT_EQ(err.subsystem(), "Routing");
    EXPECT_FALSE(err.isTransient());
}

TEST(GatewayErrorTest, RetryHintContext) {
    GatewayError err(ErrorCode::UpstreamUnavailable, "no_healthy_upstream",
                     std::chrono::seconds(12));
    ASSERT_TRUE(err.hasContext());
    const auto* hint = err.context<std::chrono::seconds>();
    ASSERT_NE(hint, nullptr);
    EXPECT_EQ(hint->count(), 12);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

// --- GatewayResult tests ---

TEST(GatewayResultTest, OkValue) {
    auto result = GatewayResult<uint64_t>::ok(100);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 100u);
}

TEST(GatewayResultTest, ErrorValue) {
    auto result = GatewayResult<uint64_t>::err(
        GatewayError(ErrorCode::StoreTimeout, "shard busy"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StoreTimeout);
    EXPECT_TRUE(result.error().isTransient());
}

TEST(GatewayResultTest, VoidPropagate) {
    auto failed = GatewayResult<void>::err(GatewayError(ErrorCode::ConfigInvalid, "bad"));
    auto lifted = failed.propagate<int>();
    ASSERT_TRUE(lifted.hasError());
    EXPECT_EQ(lifted.error().code(), ErrorCode::ConfigInvalid);
}

// --- StrongId tests ---

TEST(StrongIdTest, DefaultInvalid) {
    OverrideId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    OverrideId a(1);
    OverrideId b(2);
    EXPECT_TRUE(a.isValid());
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
    EXPECT_EQ(a, OverrideId(1));
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_set<LeaseId> leases;
    leases.insert(LeaseId(7));
    leases.insert(LeaseId(7));
    leases.insert(LeaseId(8));
    EXPECT_EQ(leases.size(), 2u);
}

// --- Clock tests ---

TEST(ManualClockTest, AdvanceAndSet) {
    ManualClock clock;
    auto start = clock.now();

    clock.advance(std::chrono::seconds(90));
    EXPECT_EQ(clock.now() - start, std::chrono::seconds(90));

    clock.set(Clock::time_point{std::chrono::milliseconds(61'500)});
    EXPECT_EQ(clock.nowMillis(), 61'500);
}

TEST(SystemClockTest, TracksWallClock) {
    SystemClock clock;
    auto before = std::chrono::system_clock::now();
    auto now = clock.now();
    EXPECT_GE(now, before);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("agw_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("gateway.yaml", R"(
gateway:
  http_port: 8080
  service_name: "agw-edge"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto port = config.get<int>("gateway.http_port");
    ASSERT_TRUE(port.hasValue());
    EXPECT_EQ(port.value(), 8080);

    auto name = config.get<std::string>("gateway.service_name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "agw-edge");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("{}").hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("value: hello").hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlFailsToLoad) {
    ConfigManager config;
    auto result = config.loadString("tiers: [unclosed");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, NonMappingRootRejected) {
    ConfigManager config;
    auto result = config.loadString("- just\n- a list\n");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("ledger:\n  store_deadline_ms: fast\n").hasValue());

    auto missing = config.getOr<int>("ledger.retry_backoff_ms", 10);
    ASSERT_TRUE(missing.hasValue());
    EXPECT_EQ(missing.value(), 10);

    // Present with the wrong type is still an error.
    auto wrong = config.getOr<int>("ledger.store_deadline_ms", 50);
    EXPECT_TRUE(wrong.hasError());
}

TEST_F(ConfigManagerTest, SequencesAreLeaves) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
tiers:
  free:
    - resource: /api/*
      base_quota: 30
  standard:
    - resource: /api/*
      base_quota: 100
)").hasValue());

    auto children = config.childKeys("tiers");
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0], "free");
    EXPECT_EQ(children[1], "standard");

    auto node = config.node("tiers.standard");
    ASSERT_TRUE(node.hasValue());
    ASSERT_TRUE(node.value().IsSequence());
    EXPECT_EQ(node.value()[0]["base_quota"].as<int>(), 100);

    EXPECT_FALSE(config.hasKey("tiers.standard.base_quota"));
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("gateway.http_port", 9090);

    auto result = config.get<int>("gateway.http_port");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 9090);
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("routing.reserved_fraction", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<double>("routing.reserved_fraction", 0.2);
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "routing.reserved_fraction");
}
