#include <stdlib.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "remote/local_context.hpp"
#include "test/recording_channel.hpp"

using namespace std;
using namespace grader;
using namespace grader::test;
namespace fs = std::filesystem;

class LocalContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = make_temp_directory("local-context-test-");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path dir;
    local_context context;
    recording_channel chan;
    reporter rep{chan, "task-4"};
};

TEST_F(LocalContextTest, MkdirPushRmdir) {
    fs::path workspace = dir / "sessions" / "ws";
    context.mkdir(workspace);
    EXPECT_TRUE(fs::is_directory(workspace));

    context.push_files({source_file("main.adb", "procedure Main is"), source_file("cli.txt", "")}, workspace);
    EXPECT_EQ(read_file_content(workspace / "main.adb"), "procedure Main is");
    EXPECT_TRUE(fs::exists(workspace / "cli.txt"));

    context.rmdir(workspace);
    EXPECT_FALSE(fs::exists(workspace));
    EXPECT_NO_THROW(context.rmdir(workspace));
}

TEST_F(LocalContextTest, PushToMissingDirectory) {
    EXPECT_THROW(context.push_files({source_file("a.c", "")}, dir / "missing"), execution_error);
}

TEST_F(LocalContextTest, ExecuteStreamsLines) {
    execution_result result = context.execute({"/bin/sh", "-c", "echo first; echo oops >&2; printf second; exit 3"}, rep, true);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.out, "first\nsecond");
    EXPECT_EQ(result.err, "oops\n");

    auto out = chan.of_type("stdout");
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].get<string>(), "first");
    EXPECT_EQ(out[1].get<string>(), "second");
    ASSERT_EQ(chan.of_type("stderr").size(), 1u);
    EXPECT_EQ(chan.of_type("stderr")[0].get<string>(), "oops");
}

TEST_F(LocalContextTest, ExecuteWithoutInheritedEnvironment) {
    set_env("GRADER_LOCAL_CONTEXT_TEST", "visible");
    execution_result inherited = context.execute({"/bin/sh", "-c", "printf \"$GRADER_LOCAL_CONTEXT_TEST\""}, rep, true);
    EXPECT_EQ(inherited.out, "visible");

    execution_result isolated = context.execute({"/bin/sh", "-c", "printf \"$GRADER_LOCAL_CONTEXT_TEST\""}, rep, false);
    EXPECT_EQ(isolated.out, "");
    unsetenv("GRADER_LOCAL_CONTEXT_TEST");
}

TEST_F(LocalContextTest, ExecuteMissingProgram) {
    execution_result result = context.execute({"grader-no-such-program"}, rep, true);
    EXPECT_EQ(result.exit_code, 127);
}

TEST_F(LocalContextTest, TimeoutExitCode) {
    execution_result result = context.execute({"timeout", "1s", "sleep", "5"}, rep, false);
    EXPECT_EQ(result.exit_code, E_TIMEOUT);
}

TEST_F(LocalContextTest, SignalExitCode) {
    execution_result result = context.execute({"/bin/sh", "-c", "kill -9 $$"}, rep, true);
    EXPECT_EQ(result.exit_code, 128 + 9);
}
