#include <unistd.h>
#include "adder.hpp"
#include "gtest/gtest.h"

TEST(AdderTest, addTest) {
    Adder adder;
    EXPECT_EQ(adder(1, 2), 3);
}

TEST(AdderTest, sleepTest) {
    while (true) sleep(1);
}

TEST(AdderTest, neverRunTest) {
    Adder adder;
    EXPECT_EQ(adder(2, 2), 4);
}
