#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "ftr/foundation/error_code.hpp"
#include "ftr/foundation/travel_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace ftr::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return minLevel_.load(std::memory_order_acquire); }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const { return flushed_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class TravelLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override { GlobalLoggerRegistry::instance().clear(); }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::World), "World");
    EXPECT_EQ(logCategoryName(LogCategory::Physics), "Physics");
    EXPECT_EQ(logCategoryName(LogCategory::Currency), "Currency");
    EXPECT_EQ(logCategoryName(LogCategory::Scene), "Scene");
    EXPECT_EQ(logCategoryName(LogCategory::Travel), "Travel");
    EXPECT_EQ(logCategoryName(LogCategory::Registry), "Registry");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, ParseAcceptsAnyCase) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

// ---------------------------------------------------------------------------
// Category levels
// ---------------------------------------------------------------------------

TEST(TravelLoggerBasicTest, DefaultCategoryLevels) {
    TravelLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Currency), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Travel), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Registry), LogLevel::Info);
}

TEST(TravelLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    TravelLogger logger;
    logger.setCategoryLevel(LogCategory::Scene, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Scene));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Scene));

    logger.setCategoryLevel(LogCategory::Scene, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Scene));
}

TEST(TravelLoggerBasicTest, InvalidCategoryReturnsOff) {
    TravelLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

TEST_F(TravelLoggerTest, LogFormatsMessageWithCategory) {
    TravelLogger logger;
    logger.log(LogLevel::Info, LogCategory::Travel, "travel requested");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Travel] travel requested");
}

TEST_F(TravelLoggerTest, LogFiltersMessagesBelowLevel) {
    TravelLogger logger;
    logger.setCategoryLevel(LogCategory::Currency, LogLevel::Warning);
    logger.log(LogLevel::Info, LogCategory::Currency, "filtered");

    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(TravelLoggerTest, LogWithContextIncludesFields) {
    TravelLogger logger;

    LogContext ctx;
    ctx.destination = "Cierzo";
    ctx.nodeId = NodeId(7);
    ctx.candidate = "named-property";
    ctx.extra["amount"] = "200";
    logger.logWithContext(LogLevel::Info, LogCategory::Currency, "charge confirmed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Currency] charge confirmed {"), std::string::npos);
    EXPECT_NE(msg.find("destination=Cierzo"), std::string::npos);
    EXPECT_NE(msg.find("node=7"), std::string::npos);
    EXPECT_NE(msg.find("candidate=named-property"), std::string::npos);
    EXPECT_NE(msg.find("amount=200"), std::string::npos);
}

TEST_F(TravelLoggerTest, LogWithEmptyContextOmitsBraces) {
    TravelLogger logger;
    logger.logWithContext(LogLevel::Warning, LogCategory::Registry, "no context", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[Registry] no context");
}

TEST_F(TravelLoggerTest, NamedCategoryLoggerTakesPrecedence) {
    auto sceneLogger = std::make_shared<MockLogger>();
    auto registered = GlobalLoggerRegistry::instance().register_logger("ftr.Scene", sceneLogger);
    ASSERT_TRUE(registered.is_ok());

    TravelLogger logger;
    logger.log(LogLevel::Info, LogCategory::Scene, "scene activated");
    logger.log(LogLevel::Info, LogCategory::Core, "frame loop started");

    ASSERT_EQ(sceneLogger->records().size(), 1u);
    EXPECT_EQ(sceneLogger->records()[0].message, "[Scene] scene activated");
    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] frame loop started");
}

TEST_F(TravelLoggerTest, FlushDelegatesToLogger) {
    TravelLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(TravelLoggerTest, MacroLogsWhenEnabled) {
    TravelLogger::instance().setCategoryLevel(LogCategory::World, LogLevel::Debug);

    FTR_LOG_DEBUG(LogCategory::World, "macro test");

    bool found = false;
    for (const auto& r : mockLogger_->records()) {
        if (r.message == "[World] macro test") {
            found = true;
        }
    }
    EXPECT_TRUE(found);
    TravelLogger::instance().setCategoryLevel(LogCategory::World, LogLevel::Info);
}

TEST(TravelLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&TravelLogger::instance(), &TravelLogger::instance());
}
