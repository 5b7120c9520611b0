#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tsim/foundation/error_code.hpp"
#include "tsim/foundation/game_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace tsim::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        logCount_.fetch_add(1, std::memory_order_relaxed);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    // Test helpers
    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::size_t logCount() const {
        return logCount_.load(std::memory_order_relaxed);
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        logCount_.store(0, std::memory_order_relaxed);
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<std::size_t> logCount_{0};
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class GameLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// ErrorCode: Logger subsystem lookup
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerNotInitialized), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::ECS), "ECS");
    EXPECT_EQ(logCategoryName(LogCategory::World), "World");
    EXPECT_EQ(logCategoryName(LogCategory::Content), "Content");
    EXPECT_EQ(logCategoryName(LogCategory::Needs), "Needs");
    EXPECT_EQ(logCategoryName(LogCategory::Actions), "Actions");
    EXPECT_EQ(logCategoryName(LogCategory::AI), "AI");
    EXPECT_EQ(logCategoryName(LogCategory::Economy), "Economy");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
}

TEST(LogCategoryTest, CategoryCountIsNine) {
    EXPECT_EQ(kLogCategoryCount, 9u);
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(logLevelName(LogLevel::Info), "INFO");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Error), "ERROR");
    EXPECT_EQ(logLevelName(LogLevel::Critical), "CRITICAL");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(GameLoggerBasicTest, MoveConstruction) {
    GameLogger a;
    a.setCategoryLevel(LogCategory::AI, LogLevel::Trace);
    GameLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::AI), LogLevel::Trace);
}

TEST(GameLoggerBasicTest, DefaultCategoryLevelsAreInfo) {
    GameLogger logger;
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        EXPECT_EQ(logger.getCategoryLevel(static_cast<LogCategory>(i)), LogLevel::Info)
            << logCategoryName(static_cast<LogCategory>(i));
    }
}

// ---------------------------------------------------------------------------
// isEnabled / setCategoryLevel
// ---------------------------------------------------------------------------

TEST(GameLoggerBasicTest, PerTickDiagnosticsSilentByDefault) {
    GameLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Actions));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::AI));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Config));
}

TEST(GameLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Actions, LogLevel::Debug);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Actions));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Needs));

    logger.setCategoryLevel(LogCategory::Actions, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Actions));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Actions));
}

TEST(GameLoggerBasicTest, SetAllCategoryLevels) {
    GameLogger logger;
    logger.setAllCategoryLevels(LogLevel::Trace);
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, static_cast<LogCategory>(i)));
    }
}

TEST(GameLoggerBasicTest, SetCategoryLevelToOffDisablesAll) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Economy, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Economy));
}

TEST(GameLoggerBasicTest, InvalidCategoryReturnsOff) {
    GameLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Basic logging
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogFormatsMessageWithCategory) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Core, "simulation created");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Core] simulation created");
}

TEST_F(GameLoggerTest, LogFiltersMessagesBelowLevel) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Warning);
    logger.log(LogLevel::Info, LogCategory::Core, "Should be filtered");

    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(GameLoggerTest, LogMultipleCategories) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::World, "world msg");
    logger.log(LogLevel::Warning, LogCategory::Economy, "economy msg");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "[World] world msg");
    EXPECT_EQ(records[1].message, "[Economy] economy msg");
    EXPECT_EQ(records[1].level, log_level::warning);
}

TEST_F(GameLoggerTest, LogAllLevels) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);

    logger.log(LogLevel::Trace, LogCategory::Core, "trace");
    logger.log(LogLevel::Debug, LogCategory::Core, "debug");
    logger.log(LogLevel::Info, LogCategory::Core, "info");
    logger.log(LogLevel::Warning, LogCategory::Core, "warn");
    logger.log(LogLevel::Error, LogCategory::Core, "error");
    logger.log(LogLevel::Critical, LogCategory::Core, "critical");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 6u);
    EXPECT_EQ(records[0].level, log_level::trace);
    EXPECT_EQ(records[1].level, log_level::debug);
    EXPECT_EQ(records[2].level, log_level::info);
    EXPECT_EQ(records[3].level, log_level::warning);
    EXPECT_EQ(records[4].level, log_level::error);
    EXPECT_EQ(records[5].level, log_level::critical);
}

// ---------------------------------------------------------------------------
// Structured logging with context
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogWithContextIncludesFields) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Actions, LogLevel::Debug);

    LogContext ctx;
    ctx.entityId = 7;
    ctx.tick = 4810;
    ctx.system = "ActionSystem";
    ctx.extra["action"] = "Going to Farm";

    logger.logWithContext(LogLevel::Debug, LogCategory::Actions, "action aborted", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);

    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Actions]"), std::string::npos);
    EXPECT_NE(msg.find("action aborted"), std::string::npos);
    EXPECT_NE(msg.find("tick=4810"), std::string::npos);
    EXPECT_NE(msg.find("entity=7"), std::string::npos);
    EXPECT_NE(msg.find("system=ActionSystem"), std::string::npos);
    EXPECT_NE(msg.find("action=Going to Farm"), std::string::npos);
}

TEST_F(GameLoggerTest, LogWithEmptyContextOmitsBraces) {
    GameLogger logger;

    LogContext ctx; // All fields empty
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(GameLoggerTest, LogWithContextFilteredBelowLevel) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::AI, LogLevel::Warning);

    LogContext ctx;
    ctx.entityId = 1;
    logger.logWithContext(LogLevel::Debug, LogCategory::AI, "filtered", ctx);

    EXPECT_TRUE(mockLogger_->records().empty());
}

// ---------------------------------------------------------------------------
// Flush
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, FlushDelegatesToLogger) {
    GameLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// Singleton instance
// ---------------------------------------------------------------------------

TEST(GameLoggerSingletonTest, InstanceReturnsSameObject) {
    auto& a = GameLogger::instance();
    auto& b = GameLogger::instance();
    EXPECT_EQ(&a, &b);
}

// ---------------------------------------------------------------------------
// TSIM_LOG macros
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, MacroLogsWhenEnabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Debug);

    TSIM_LOG_DEBUG(LogCategory::Core, "macro test");

    bool found = false;
    for (const auto& r : mockLogger_->records()) {
        if (r.message.find("macro test") != std::string::npos) {
            found = true;
            break;
        }
    }
    EXPECT_TRUE(found);
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);
}

TEST_F(GameLoggerTest, MacroSkipsWhenDisabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Error);
    mockLogger_->reset();

    TSIM_LOG_DEBUG(LogCategory::Core, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);
}

TEST_F(GameLoggerTest, MacroDoesNotEvaluateDisabledMessage) {
    GameLogger::instance().setCategoryLevel(LogCategory::AI, LogLevel::Info);
    int evaluations = 0;
    auto build = [&evaluations] {
        ++evaluations;
        return std::string("expensive");
    };

    TSIM_LOG_TRACE(LogCategory::AI, build());

    EXPECT_EQ(evaluations, 0);
}

TEST_F(GameLoggerTest, ContextMacroAttachesContext) {
    GameLogger::instance().setCategoryLevel(LogCategory::Needs, LogLevel::Debug);

    LogContext logCtx;
    logCtx.entityId = 3;
    TSIM_LOG_CTX(LogLevel::Debug, LogCategory::Needs, "Hunger became critical", logCtx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_NE(records[0].message.find("entity=3"), std::string::npos);
    GameLogger::instance().setCategoryLevel(LogCategory::Needs, LogLevel::Info);
}

// ---------------------------------------------------------------------------
// Thread safety: concurrent logging from multiple threads
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, ConcurrentLoggingIsSafe) {
    GameLogger logger;

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Core,
                           "thread " + std::to_string(t) + " msg " + std::to_string(i));
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->logCount(), static_cast<std::size_t>(kThreads * kMessagesPerThread));
}
