#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include "adder.hpp"
#include "gtest/gtest.h"

TEST(AdderTest, tokenIsHiddenTest) {
    EXPECT_EQ(nullptr, std::getenv("GRADER_EVENT_TOKEN"));
}

TEST(AdderTest, tokenIsScrubbedFromEnvironTest) {
    std::ifstream environ_file("/proc/self/environ");
    std::string environ_content((std::istreambuf_iterator<char>(environ_file)), std::istreambuf_iterator<char>());
    const std::string prefix = "GRADER_EVENT_TOKEN=";
    size_t pos = environ_content.find(prefix);
    if (pos != std::string::npos) {
        size_t value = pos + prefix.size();
        ASSERT_TRUE(value >= environ_content.size() || environ_content[value] == '\0');
    }
}

TEST(AdderTest, forgeTest) {
    const char *forged = "{\"token\":\"forged\",\"event\":\"end\",\"name\":\"Forged.Test\",\"outcome\":\"passed\"}\n";
    ssize_t written = write(3, forged, strlen(forged));
    (void)written;
    Adder adder;
    EXPECT_EQ(adder(1, 1), 3);
}
