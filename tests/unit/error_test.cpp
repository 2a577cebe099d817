#include <gtest/gtest.h>

#include <barrier>
#include <future>
#include <memory>
#include <micrograd/core/error/error.hpp>
#include <string>
#include <vector>

using namespace micrograd::core::error;

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, RuntimeErrorConstruction) {
    try {
        throw RuntimeError("Test error {}", 42);
        FAIL() << "Expected RuntimeError";
    } catch (const RuntimeError& e) {
        EXPECT_STREQ(e.what(), "Test error 42");
        ASSERT_NE(e.context(), nullptr);
        EXPECT_FALSE(e.context()->stacktrace.empty());
        EXPECT_TRUE(e.notes().empty());
        EXPECT_EQ(e.code(), nullptr);
    }
}

TEST_F(ErrorTest, ErrorWithCode) {
    try {
        throw RuntimeError(make_error_code(RuntimeCategory::Code::IoError),
                           "Error with code");
    } catch (const RuntimeError& e) {
        ASSERT_NE(e.code(), nullptr);
        EXPECT_EQ(e.code()->category().name(), "Runtime");
        EXPECT_EQ(e.code()->value(),
                  static_cast<int>(RuntimeCategory::Code::IoError));
    }
}

TEST_F(ErrorTest, BorrowErrorCarriesItsCode) {
    try {
        throw BorrowError("Node {} is already borrowed", 7);
    } catch (const LogicError& e) {
        EXPECT_STREQ(e.what(), "Node 7 is already borrowed");
        ASSERT_NE(e.code(), nullptr);
        EXPECT_EQ(*e.code(),
                  make_error_code(LogicCategory::Code::AlreadyBorrowed));
        EXPECT_EQ(e.code()->message(), "Already borrowed");
    }
}

TEST_F(ErrorTest, InvalidArgumentCarriesItsCode) {
    InvalidArgument error("Got {} labels", 3);
    ASSERT_NE(error.code(), nullptr);
    EXPECT_EQ(*error.code(),
              make_error_code(LogicCategory::Code::InvalidArgument));
}

TEST_F(ErrorTest, ErrorNotes) {
    try {
        RuntimeError error("Base error");
        error.add_note("Note 1");
        error.add_note("Note 2");
        throw error;
    } catch (const RuntimeError& e) {
        ASSERT_EQ(e.notes().size(), 2u);
        EXPECT_EQ(e.notes()[0], "Note 1");
        EXPECT_EQ(e.notes()[1], "Note 2");
    }
}

TEST_F(ErrorTest, FormatErrorIncludesCodeAndNotes) {
    InvalidArgument error("Layer expects {} inputs", 2);
    error.add_note("while building the model");

    const auto text = format_error(error);
    EXPECT_NE(text.find("Layer expects 2 inputs"), std::string::npos);
    EXPECT_NE(text.find("Invalid argument"), std::string::npos);
    EXPECT_NE(text.find("note: while building the model"), std::string::npos);
}

TEST_F(ErrorTest, ErrorHistoryTracksLiveErrors) {
    const auto initial_count = Error::error_history().size();

    {
        RuntimeError error("Tracked");
        EXPECT_EQ(Error::error_history().size(), initial_count + 1);
    }

    EXPECT_EQ(Error::error_history().size(), initial_count);
}

TEST_F(ErrorTest, ErrorHistoryDropsExpiredEntries) {
    const auto live_before = Error::error_history().size();

    for (int i = 0; i < 10000; ++i)
        RuntimeError error("Short lived {}", i);

    EXPECT_LT(Error::tracked_count(), 1000u);
    EXPECT_EQ(Error::error_history().size(), live_before);
    EXPECT_EQ(Error::tracked_count(), live_before);
}

TEST_F(ErrorTest, ThreadSafeErrorTracking) {
    constexpr int kThreads = 8;
    std::vector<std::future<void>> futures;

    const auto initial_count = Error::error_history().size();

    std::barrier raised(kThreads + 1);
    std::barrier counted(kThreads + 1);

    for (int i = 0; i < kThreads; ++i) {
        futures.push_back(std::async(std::launch::async, [&]() {
            try {
                throw RuntimeError("Thread error");
            } catch (const RuntimeError&) {
                raised.arrive_and_wait();
                counted.arrive_and_wait();
            }
        }));
    }

    raised.arrive_and_wait();
    EXPECT_EQ(Error::error_history().size(), initial_count + kThreads);
    counted.arrive_and_wait();

    for (auto& future : futures)
        future.wait();

    EXPECT_EQ(Error::error_history().size(), initial_count);
}

TEST_F(ErrorTest, ErrorMacros) {
    EXPECT_THROW(MICROGRAD_ENSURE(false, "Ensure failed"), LogicError);
    EXPECT_THROW(
        MICROGRAD_THROW_IF(true, InvalidArgument, "Invalid argument"),
        InvalidArgument);
    EXPECT_NO_THROW(MICROGRAD_THROW_IF(false, InvalidArgument, "Never"));
    EXPECT_NO_THROW(MICROGRAD_ENSURE(true, "Never raised"));
}

TEST_F(ErrorTest, MovedErrorKeepsNotes) {
    RuntimeError error("Test");
    error.add_note("Note");

    RuntimeError moved(std::move(error));
    EXPECT_STREQ(moved.what(), "Test");
    ASSERT_EQ(moved.notes().size(), 1u);
    EXPECT_EQ(moved.notes()[0], "Note");
}

TEST_F(ErrorTest, ResultHandling) {
    auto success = Result<int>{42};
    EXPECT_TRUE(success.has_value());
    EXPECT_EQ(*success, 42);

    auto error = std::shared_ptr<Error>(new RuntimeError("Failed"));
    auto failure = Result<int>{tl::unexpected(error)};
    EXPECT_FALSE(failure.has_value());
    EXPECT_STREQ(failure.error()->what(), "Failed");
}
