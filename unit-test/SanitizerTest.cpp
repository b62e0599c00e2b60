#include <unistd.h>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/sanitizer.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

class SanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        workspace = make_test_directory("sanitizer");
        destination = workspace / "src";
        create_directories(destination);
    }

    void TearDown() override {
        error_code ec;
        remove_all(workspace, ec);
    }

    path workspace, destination;
    evaluation_config config;
};

TEST_F(SanitizerTest, AcceptsPlainSourceFile) {
    input_sanitizer sanitizer(config);
    EXPECT_EQ(destination / "Calculator.cpp", sanitizer.sanitize("Calculator.cpp", 100, destination));
    EXPECT_EQ(destination / "pkg" / "Calculator.cc", sanitizer.sanitize("pkg/Calculator.cc", 100, destination));
    EXPECT_EQ(destination / "Calculator.cpp", sanitizer.sanitize("./Calculator.cpp", 100, destination));
}

TEST_F(SanitizerTest, ExtensionIsCaseInsensitive) {
    input_sanitizer sanitizer(config);
    EXPECT_EQ(destination / "Calculator.CPP", sanitizer.sanitize("Calculator.CPP", 100, destination));
    EXPECT_EQ(destination / "Calculator.Cxx", sanitizer.sanitize("Calculator.Cxx", 100, destination));
}

TEST_F(SanitizerTest, RejectsPathTraversal) {
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize("../../etc/passwd", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("../Calculator.cpp", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("a/../b.cpp", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("a/b/../../../c.cpp", 100, destination), validation_error);
    EXPECT_FALSE(exists(workspace / "etc"));
}

TEST_F(SanitizerTest, RejectsEncodedPathTraversal) {
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize("%2e%2e/%2e%2e/etc/passwd.cpp", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("..%2fCalculator.cpp", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("%2Fetc%2Fpasswd.cpp", 100, destination), validation_error);
}

TEST_F(SanitizerTest, RejectsAbsoluteAndHomePaths) {
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize("/etc/passwd.cpp", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("~/Calculator.cpp", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("~root/Calculator.cpp", 100, destination), validation_error);
}

TEST_F(SanitizerTest, RejectsIllegalCharacters) {
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize(string("Calc\0ulator.cpp", 15), 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("Calc\nulator.cpp", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("Calc%00ulator.cpp", 100, destination), validation_error);
    for (const char *name : {"a\\b.cpp", "a<b.cpp", "a>b.cpp", "C:b.cpp", "a\"b.cpp", "a|b.cpp", "a?.cpp", "a*.cpp"})
        EXPECT_THROW(sanitizer.sanitize(name, 100, destination), validation_error) << name;
}

TEST_F(SanitizerTest, RejectsEmptyAndDirectoryNames) {
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize("", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize(".", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("pkg/", 100, destination), validation_error);
}

TEST_F(SanitizerTest, NameLengthLimit) {
    input_sanitizer sanitizer(config);
    string longest = string(251, 'a') + ".cpp";
    EXPECT_EQ(destination / longest, sanitizer.sanitize(longest, 100, destination));
    EXPECT_THROW(sanitizer.sanitize(string(252, 'a') + ".cpp", 100, destination), validation_error);
}

TEST_F(SanitizerTest, ExtensionAllowList) {
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize("Calculator.java", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("Calculator", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("Calculator.cpp.sh", 100, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("calculator.hpp", 100, destination), validation_error);
    EXPECT_EQ(destination / "calculator.hpp", sanitizer.sanitize("calculator.hpp", 100, destination, file_kind::TEST_UNIT));
    EXPECT_TRUE(sanitizer.is_header("calculator.HPP"));
    EXPECT_FALSE(sanitizer.is_header("CalculatorTest.cpp"));

    config.allowed_extensions = {".c"};
    input_sanitizer c_sanitizer(config);
    EXPECT_THROW(c_sanitizer.sanitize("Calculator.cpp", 100, destination), validation_error);
    EXPECT_EQ(destination / "calculator.c", c_sanitizer.sanitize("calculator.c", 100, destination));
}

TEST_F(SanitizerTest, SizeLimit) {
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize("Calculator.cpp", 0, destination), validation_error);
    EXPECT_THROW(sanitizer.sanitize("Calculator.cpp", 1024 * 1024 + 1, destination), validation_error);
    EXPECT_NO_THROW(sanitizer.sanitize("Calculator.cpp", 1024 * 1024, destination));

    config.max_file_size_bytes = 10;
    input_sanitizer small_sanitizer(config);
    EXPECT_THROW(small_sanitizer.sanitize("Calculator.cpp", 11, destination), validation_error);
}

TEST_F(SanitizerTest, RejectsSymlinkEscape) {
    ASSERT_EQ(0, symlink("/etc", (destination / "link").c_str()));
    input_sanitizer sanitizer(config);
    EXPECT_THROW(sanitizer.sanitize("link/passwd.cpp", 100, destination), validation_error);
}

TEST_F(SanitizerTest, ValidateIdentifier) {
    input_sanitizer sanitizer(config);
    EXPECT_NO_THROW(sanitizer.validate_identifier("student1", "student_id"));
    EXPECT_NO_THROW(sanitizer.validate_identifier("cs101-hw_3", "assignment_id"));
    EXPECT_NO_THROW(sanitizer.validate_identifier(string(50, 'a'), "student_id"));

    EXPECT_THROW(sanitizer.validate_identifier("", "student_id"), validation_error);
    EXPECT_THROW(sanitizer.validate_identifier(string(51, 'a'), "student_id"), validation_error);
    EXPECT_THROW(sanitizer.validate_identifier("_student", "student_id"), validation_error);
    EXPECT_THROW(sanitizer.validate_identifier("student-", "student_id"), validation_error);
    EXPECT_THROW(sanitizer.validate_identifier("stu dent", "student_id"), validation_error);
    EXPECT_THROW(sanitizer.validate_identifier("../student", "student_id"), validation_error);
}

TEST_F(SanitizerTest, ScreenContent) {
    input_sanitizer sanitizer(config);
    EXPECT_NO_THROW(sanitizer.screen_content("int main() {}", "main.cpp"));
    EXPECT_THROW(sanitizer.screen_content("", "main.cpp"), validation_error);
    EXPECT_THROW(sanitizer.screen_content("  \n\t ", "main.cpp"), validation_error);

    config.forbidden_tokens = {"system("};
    input_sanitizer strict_sanitizer(config);
    EXPECT_THROW(strict_sanitizer.screen_content("int main() { system(\"rm -rf /\"); }", "main.cpp"), validation_error);
    EXPECT_NO_THROW(strict_sanitizer.screen_content("int main() {}", "main.cpp"));
}

TEST(PercentDecodeTest, DecodesOnce) {
    EXPECT_EQ("AB", percent_decode("%41%42"));
    EXPECT_EQ("%2e", percent_decode("%252e"));
    EXPECT_EQ("%zz", percent_decode("%zz"));
    EXPECT_EQ("100%", percent_decode("100%"));
    EXPECT_EQ("a%4", percent_decode("a%4"));
}
