#include <cstdint>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "core/transaction.hpp"
#include "ingest/spsc_ring.hpp"

namespace {

using Ring = ingest::SpscRing<core::Transaction, 8>;

core::Transaction with_amount(core::AmountCents cents) {
    core::Transaction tx{};
    tx.amount_cents = cents;
    return tx;
}

class SpscRingTest : public ::testing::Test {
protected:
    Ring ring_{};
    core::Transaction tx_{};
};

TEST_F(SpscRingTest, PushPopOrder) {
    core::Transaction out{};

    ASSERT_TRUE(ring_.try_push(with_amount(1)));
    ASSERT_TRUE(ring_.try_push(with_amount(2)));

    ASSERT_TRUE(ring_.try_pop(out));
    EXPECT_EQ(out.amount_cents, 1);

    ASSERT_TRUE(ring_.try_pop(out));
    EXPECT_EQ(out.amount_cents, 2);
}

TEST_F(SpscRingTest, EverySlotIsUsable) {
    for (std::size_t i = 0; i < Ring::capacity(); ++i) {
        ASSERT_TRUE(ring_.try_push(tx_)) << "Failed to push at index " << i;
    }
    EXPECT_FALSE(ring_.try_push(tx_)) << "Push should fail when the ring is full";
    EXPECT_EQ(ring_.size_approx(), Ring::capacity());

    for (std::size_t i = 0; i < Ring::capacity(); ++i) {
        ASSERT_TRUE(ring_.try_pop(tx_)) << "Failed to pop at index " << i;
    }
    EXPECT_FALSE(ring_.try_pop(tx_)) << "Pop should fail when the ring is empty";
    EXPECT_TRUE(ring_.empty_approx());
}

TEST_F(SpscRingTest, WrapsAroundManyTimes) {
    core::Transaction out{};
    for (core::AmountCents i = 0; i < 100; ++i) {
        ASSERT_TRUE(ring_.try_push(with_amount(i)));
        ASSERT_TRUE(ring_.try_pop(out));
        EXPECT_EQ(out.amount_cents, i);
    }
    EXPECT_EQ(ring_.size_approx(), 0u);
}

TEST(SpscRingThreads, ProducerConsumerPreserveOrder) {
    auto ring = std::make_unique<ingest::SpscRing<core::Transaction, 64>>();
    constexpr core::AmountCents total = 20'000;

    std::thread producer([&] {
        for (core::AmountCents i = 1; i <= total; ++i) {
            while (!ring->try_push(with_amount(i))) {
                std::this_thread::yield();
            }
        }
    });

    core::AmountCents expected = 1;
    core::Transaction out{};
    while (expected <= total) {
        if (ring->try_pop(out)) {
            ASSERT_EQ(out.amount_cents, expected);
            ++expected;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    EXPECT_TRUE(ring->empty_approx());
}

} // namespace
