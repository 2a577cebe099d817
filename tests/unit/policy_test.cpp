#include <gtest/gtest.h>

#include <cstddef>
#include <future>
#include <micrograd/autograd/autograd.hpp>
#include <mutex>
#include <string_view>
#include <type_traits>
#include <vector>

using namespace micrograd::autograd;
namespace error = micrograd::core::error;

static_assert(AccessPolicy<SingleThreaded>);
static_assert(AccessPolicy<MultiThreaded>);
static_assert(!SingleThreaded::thread_safe);
static_assert(MultiThreaded::thread_safe);
static_assert(std::is_same_v<Value, BasicValue<DefaultPolicy>>);

// Gradients and rules are written only by the builder and the backward pass
template <typename N>
concept WritableFromOutside = requires(N& node) {
    node.set_grad(1.0f);
} || requires(N& node) {
    node.accumulate_grad(1.0f);
} || requires(N& node) {
    node.set_op(OpType::Add);
} || requires(N& node) {
    node.take_backward();
};
static_assert(!WritableFromOutside<Node<SingleThreaded>>);
static_assert(!WritableFromOutside<Node<MultiThreaded>>);

class PolicyTest : public ::testing::Test {};

TEST_F(PolicyTest, DefaultPolicyMatchesBuildOption) {
#if defined(MICROGRAD_THREAD_SAFE)
    EXPECT_TRUE((std::is_same_v<DefaultPolicy, MultiThreaded>));
#else
    EXPECT_TRUE((std::is_same_v<DefaultPolicy, SingleThreaded>));
#endif
    EXPECT_EQ(DefaultPolicy::name, std::string_view(MICROGRAD_POLICY_NAME));
}

TEST_F(PolicyTest, BorrowFlagRejectsNestedAccess) {
    BorrowFlag flag;
    std::lock_guard outer(flag);
    EXPECT_TRUE(flag.is_borrowed());

    try {
        std::lock_guard inner(flag);
        FAIL() << "Expected BorrowError";
    } catch (const error::BorrowError& e) {
        ASSERT_NE(e.code(), nullptr);
        EXPECT_EQ(e.code()->value(),
                  static_cast<int>(
                      error::LogicCategory::Code::AlreadyBorrowed));
    }

    // The failed attempt leaves the outstanding borrow intact
    EXPECT_TRUE(flag.is_borrowed());
}

TEST_F(PolicyTest, BorrowFlagReleases) {
    BorrowFlag flag;
    EXPECT_FALSE(flag.is_borrowed());

    {
        std::lock_guard lock(flag);
        EXPECT_FALSE(flag.try_lock());
    }

    EXPECT_FALSE(flag.is_borrowed());
    EXPECT_TRUE(flag.try_lock());
    EXPECT_THROW(flag.lock(), error::BorrowError);
    flag.unlock();
    EXPECT_NO_THROW(flag.lock());
    flag.unlock();
}

TEST_F(PolicyTest, SingleThreadedNodesReleaseBetweenAccesses) {
    BasicValue<SingleThreaded> x(3.0f);

    // Reading a value while building from it never overlaps two accesses
    auto y = x * x + x.pow(2.0f) - x / x;
    y.backward();
    EXPECT_FLOAT_EQ(y.value(), 17.0f);
    EXPECT_FLOAT_EQ(x.grad(), 12.0f);
    EXPECT_EQ(x.op(), OpType::Leaf);
}

TEST_F(PolicyTest, MultiThreadedConcurrentForwardMatchesSerial) {
    using MtValue = BasicValue<MultiThreaded>;
    constexpr int kThreads = 8;
    constexpr int kTermsPerThread = 50;

    auto build = [](const MtValue& w, const MtValue& b, int offset) {
        MtValue sum(0.0f);
        for (int i = 0; i < kTermsPerThread; ++i) {
            const float x = static_cast<float>(offset + i) * 0.01f;
            sum = sum + (w * x + b).relu();
        }
        return sum;
    };

    MtValue w_serial(0.7f);
    MtValue b_serial(-0.2f);
    std::vector<MtValue> serial_parts;
    for (int t = 0; t < kThreads; ++t)
        serial_parts.push_back(build(w_serial, b_serial, t * kTermsPerThread));

    MtValue serial_total = serial_parts.front();
    for (std::size_t t = 1; t < serial_parts.size(); ++t)
        serial_total = serial_total + serial_parts[t];
    serial_total.backward();

    MtValue w(0.7f);
    MtValue b(-0.2f);
    std::vector<std::future<MtValue>> futures;
    for (int t = 0; t < kThreads; ++t) {
        futures.push_back(std::async(std::launch::async, [&, t]() {
            return build(w, b, t * kTermsPerThread);
        }));
    }

    std::vector<MtValue> parts;
    for (auto& future : futures)
        parts.push_back(future.get());

    MtValue total = parts.front();
    for (std::size_t t = 1; t < parts.size(); ++t)
        total = total + parts[t];
    total.backward();

    EXPECT_FLOAT_EQ(total.value(), serial_total.value());
    EXPECT_FLOAT_EQ(w.grad(), w_serial.grad());
    EXPECT_FLOAT_EQ(b.grad(), b_serial.grad());
}

TEST_F(PolicyTest, MultiThreadedBackwardPassesAreSerialized) {
    using MtValue = BasicValue<MultiThreaded>;
    constexpr int kThreads = 8;

    MtValue shared(2.0f);
    std::vector<std::future<void>> futures;
    for (int t = 0; t < kThreads; ++t) {
        futures.push_back(std::async(std::launch::async, [&shared, t]() {
            auto y = shared * static_cast<float>(t + 1);
            y.backward();
        }));
    }

    for (auto& future : futures)
        future.get();

    // 1 + 2 + ... + 8
    EXPECT_FLOAT_EQ(shared.grad(), 36.0f);
}

TEST_F(PolicyTest, OperatorsMoveNodesOutOfTemporaries) {
    using StValue = BasicValue<SingleThreaded>;

    StValue a(2.0f);
    auto node = a.node_ptr();
    ASSERT_EQ(node.use_count(), 2);

    auto released = std::move(a).release_node();
    EXPECT_EQ(a.node_ptr(), nullptr);
    EXPECT_EQ(released.use_count(), 2);

    // The product is the only owner of both operands
    auto y = StValue(2.0f) * StValue(3.0f);
    ASSERT_EQ(y.node().parents().size(), 2u);
    EXPECT_EQ(y.node().parents()[0].use_count(), 1);
    EXPECT_EQ(y.node().parents()[1].use_count(), 1);

    y.backward();
    EXPECT_FLOAT_EQ(y.parents()[0].grad(), 3.0f);
}

TEST_F(PolicyTest, CompoundAssignmentKeepsOperandAlive) {
    using StValue = BasicValue<SingleThreaded>;

    StValue x(4.0f);
    StValue acc = x;
    acc *= x;
    acc += StValue(1.0f);
    acc.backward();

    EXPECT_FLOAT_EQ(acc.value(), 17.0f);
    EXPECT_FLOAT_EQ(x.grad(), 8.0f);
}
