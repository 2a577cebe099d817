#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <micrograd/core/error/error_code.hpp>
#include <micrograd/utils/logger/logger.hpp>
#include <source_location>
#include <string>
#include <thread>

using namespace micrograd::log;
namespace error = micrograd::core::error;

class LoggerTest : public ::testing::Test {
protected:
    static Logger::Config sync_config(Severity min_severity) {
        Logger::Config config;
        config.min_severity = min_severity;
        config.async = false;
        return config;
    }
};

TEST_F(LoggerTest, ParseSeverityIsCaseInsensitive) {
    auto debug = parse_severity("debug");
    ASSERT_TRUE(debug.has_value());
    EXPECT_EQ(*debug, Severity::Debug);

    auto warning = parse_severity("WARNING");
    ASSERT_TRUE(warning.has_value());
    EXPECT_EQ(*warning, Severity::Warning);

    auto warn = parse_severity("Warn");
    ASSERT_TRUE(warn.has_value());
    EXPECT_EQ(*warn, Severity::Warning);
}

TEST_F(LoggerTest, ParseSeverityRejectsUnknownNames) {
    auto result = parse_severity("verbose");
    ASSERT_FALSE(result.has_value());
    ASSERT_NE(result.error(), nullptr);
    EXPECT_NE(std::string(result.error()->what()).find("verbose"),
              std::string::npos);
    EXPECT_NE(dynamic_cast<error::InvalidArgument*>(result.error().get()),
              nullptr);
}

TEST_F(LoggerTest, SeverityNames) {
    EXPECT_EQ(to_string(Severity::Trace), "TRACE");
    EXPECT_EQ(to_string(Severity::Info), "INFO");
    EXPECT_EQ(to_string(Severity::Fatal), "FATAL");
}

TEST_F(LoggerTest, FiltersBelowMinimumSeverity) {
    Logger logger(sync_config(Severity::Warning));
    auto sink = std::make_shared<CircularBufferSink>(16);
    logger.add_sink(sink);

    logger.log(Severity::Info, std::source_location::current(), "dropped");
    logger.log(Severity::Error, std::source_location::current(), "kept {}", 1);

    auto entries = sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept 1");
    EXPECT_EQ(entries[0].severity, Severity::Error);
    EXPECT_EQ(entries[0].thread_id, std::this_thread::get_id());
}

TEST_F(LoggerTest, MinimumSeverityCanBeChanged) {
    Logger logger(sync_config(Severity::Info));
    auto sink = std::make_shared<CircularBufferSink>(16);
    logger.add_sink(sink);

    EXPECT_FALSE(logger.should_log(Severity::Trace));
    logger.set_min_severity(Severity::Trace);
    EXPECT_TRUE(logger.should_log(Severity::Trace));

    logger.log(Severity::Trace, std::source_location::current(), "topo {}",
               3);
    ASSERT_EQ(sink->entries().size(), 1u);
}

TEST_F(LoggerTest, CircularBufferKeepsNewestEntries) {
    Logger logger(sync_config(Severity::Trace));
    auto sink = std::make_shared<CircularBufferSink>(3);
    logger.add_sink(sink);

    for (int i = 0; i < 5; ++i)
        logger.log(Severity::Info, std::source_location::current(),
                   "epoch {}", i);

    auto entries = sink->entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().message, "epoch 2");
    EXPECT_EQ(entries.back().message, "epoch 4");
}

TEST_F(LoggerTest, EntriesCarryErrorCodes) {
    Logger logger(sync_config(Severity::Info));
    auto sink = std::make_shared<CircularBufferSink>(4);
    logger.add_sink(sink);

    logger.log_with_error(
        Severity::Error,
        error::make_error_code(error::LogicCategory::Code::AlreadyBorrowed),
        std::source_location::current(), "node {} busy", 12);

    auto entries = sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_TRUE(entries[0].error.has_value());
    EXPECT_EQ(entries[0].error->message(), "Already borrowed");

    const auto line = format_entry(entries[0]);
    EXPECT_NE(line.find("[ERROR]"), std::string::npos);
    EXPECT_NE(line.find("node 12 busy"), std::string::npos);
    EXPECT_NE(line.find("logger_test.cpp"), std::string::npos);
}

TEST_F(LoggerTest, AsyncFlushDeliversEveryEntryInOrder) {
    Logger::Config config;
    config.min_severity = Severity::Debug;
    config.async = true;

    for (int round = 0; round < 50; ++round) {
        Logger logger(config);
        auto sink = std::make_shared<CircularBufferSink>(1024);
        logger.add_sink(sink);

        for (int i = 0; i < 500; ++i)
            logger.log(Severity::Debug, std::source_location::current(),
                       "{}", i);
        logger.flush();

        const auto entries = sink->entries();
        ASSERT_EQ(entries.size(), 500u) << "round " << round;
        for (int i = 0; i < 500; ++i)
            ASSERT_EQ(entries[i].message, std::to_string(i))
                << "round " << round;
    }
}

TEST_F(LoggerTest, FileSinkWritesLines) {
    const auto path =
        std::filesystem::temp_directory_path() / "micrograd_logger_test.log";
    std::filesystem::remove(path);

    {
        Logger logger(sync_config(Severity::Info));
        logger.add_sink(std::make_shared<FileLogSink>(
            FileLogSink::Config{.path = path}));
        logger.log(Severity::Info, std::source_location::current(),
                   "loss {:.2f}", 0.5);
        logger.flush();
    }

    std::ifstream file(path);
    std::string line;
    ASSERT_TRUE(std::getline(file, line));
    EXPECT_NE(line.find("loss 0.50"), std::string::npos);

    file.close();
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, FileSinkReportsUnopenablePathAsIoError) {
    const auto path = std::filesystem::temp_directory_path() /
                      "micrograd_missing_dir" / "nested" / "train.log";
    std::filesystem::remove_all(path.parent_path().parent_path());

    try {
        FileLogSink sink(FileLogSink::Config{.path = path});
        FAIL() << "Expected RuntimeError";
    } catch (const error::RuntimeError& e) {
        ASSERT_NE(e.code(), nullptr);
        EXPECT_EQ(*e.code(),
                  error::make_error_code(error::RuntimeCategory::Code::IoError));
        EXPECT_NE(std::string(e.what()).find("train.log"), std::string::npos);
    }
}
