#include <sys/stat.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        workspace = make_test_directory("sandbox");
    }

    void TearDown() override {
        error_code ec;
        remove_all(workspace, ec);
    }

    static mode_t mode_of(const path &p) {
        struct stat st;
        EXPECT_EQ(0, stat(p.c_str(), &st));
        return st.st_mode & 0777;
    }

    path workspace;
};

TEST_F(SandboxTest, PlanIsUniqueAndDoesNotTouchDisk) {
    path a = sandbox::plan(workspace, "student1", "calculator");
    path b = sandbox::plan(workspace, "student1", "calculator");
    EXPECT_NE(a, b);
    EXPECT_EQ(workspace / "sandboxes", a.parent_path());
    EXPECT_EQ(0u, a.filename().string().find("sandbox_student1_calculator_"));
    EXPECT_FALSE(exists(a));
    EXPECT_FALSE(exists(workspace / "sandboxes"));
}

TEST_F(SandboxTest, CreatesPrivateLayoutAndRemovesOnDestruction) {
    path dir = sandbox::plan(workspace, "student1", "calculator");
    {
        sandbox box(dir);
        EXPECT_EQ(dir, box.root());
        for (const path &sub : {box.source_dir(), box.build_dir(), box.tests_dir(), box.output_dir()}) {
            EXPECT_TRUE(is_directory(sub)) << sub;
            EXPECT_EQ(0700u, mode_of(sub)) << sub;
        }
        EXPECT_EQ(0700u, mode_of(dir));

        box.write_file(box.source_dir() / "Calculator.cpp", "int x;");
        EXPECT_EQ("int x;", read_file_content(box.source_dir() / "Calculator.cpp"));
        EXPECT_EQ(0600u, mode_of(box.source_dir() / "Calculator.cpp"));

        box.write_file(box.source_dir() / "pkg" / "Helper.cpp", "int y;");
        EXPECT_TRUE(is_regular_file(box.source_dir() / "pkg" / "Helper.cpp"));
    }
    EXPECT_FALSE(exists(dir));
}

TEST_F(SandboxTest, KeepLeavesDirectory) {
    path dir = sandbox::plan(workspace, "student1", "calculator");
    {
        sandbox box(dir, true);
    }
    EXPECT_TRUE(is_directory(dir));
}

TEST_F(SandboxTest, RefusesToWriteOutside) {
    path dir = sandbox::plan(workspace, "student1", "calculator");
    sandbox box(dir);
    EXPECT_THROW(box.write_file(workspace / "escaped.cpp", "int x;"), runner_error);
    EXPECT_THROW(box.write_file(box.source_dir() / ".." / ".." / "escaped.cpp", "int x;"), runner_error);
    EXPECT_FALSE(exists(workspace / "escaped.cpp"));
    EXPECT_FALSE(exists(workspace / "sandboxes" / "escaped.cpp"));
}

TEST_F(SandboxTest, ExistingDirectoryIsNotReused) {
    path dir = sandbox::plan(workspace, "student1", "calculator");
    create_directories(dir);
    EXPECT_THROW(sandbox box(dir), runner_error);
    EXPECT_TRUE(is_directory(dir));
}

TEST_F(SandboxTest, ConcurrentSandboxesAreIsolated) {
    sandbox a(sandbox::plan(workspace, "student1", "calculator"));
    sandbox b(sandbox::plan(workspace, "student1", "calculator"));
    a.write_file(a.source_dir() / "Calculator.cpp", "a");
    b.write_file(b.source_dir() / "Calculator.cpp", "b");
    EXPECT_EQ("a", read_file_content(a.source_dir() / "Calculator.cpp"));
    EXPECT_EQ("b", read_file_content(b.source_dir() / "Calculator.cpp"));
}
