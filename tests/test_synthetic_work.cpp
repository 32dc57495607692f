// CPU Benchmark - SyntheticWork tests

#include <gtest/gtest.h>

#include "synthetic_work.hpp"

TEST(SyntheticWorkTest, SameSeedIsDeterministic) {
    SyntheticWork a(7);
    SyntheticWork b(7);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(a.step(), b.step());
    }
    EXPECT_EQ(a.checksum(), b.checksum());
}

TEST(SyntheticWorkTest, DifferentSeedsDiverge) {
    SyntheticWork a(1);
    SyntheticWork b(2);
    a.step();
    b.step();
    EXPECT_NE(a.checksum(), b.checksum());
}

TEST(SyntheticWorkTest, EveryStepChangesTheChecksum) {
    SyntheticWork work(3);
    uint64_t previous = work.checksum();
    for (int i = 0; i < 10; ++i) {
        uint64_t current = work.step();
        EXPECT_NE(current, previous);
        previous = current;
    }
}
