#include "gtest/gtest.h"
#include "sandbox/docker.hpp"
#include "sandbox/sandbox.hpp"
#include "test/workspace.hpp"

using namespace std;
using namespace hjudge;
using namespace hjudge::test;

/**
 * 需要本地运行 docker 并且已经拉取了 alpine 镜像
 */
class DISABLED_DockerTest : public ::testing::Test {
protected:
    DISABLED_DockerTest() : runtime("/var/run/docker.sock") {
        options.image = "alpine";
        options.run_dir = workspace.root;
    }

    temp_workspace workspace;
    sandbox::docker_runtime runtime;
    sandbox::sandbox_options options;
};

TEST_F(DISABLED_DockerTest, RunCommand) {
    sandbox::sandbox_runner runner(runtime, options);
    sandbox::scoped_sandbox box(runner, runner.acquire("docker-test"));
    box->put_file("in", "hello\n");

    sandbox::execution_limits limits;
    limits.cpu_time = 1;
    limits.wall_time = 3;
    limits.memory = 64 << 20;
    auto result = runner.run(*box, "cat in > out", limits);
    EXPECT_EQ(result.cause, sandbox::termination_cause::NORMAL_EXIT);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(box->read_file("out"), "hello\n");
}

TEST_F(DISABLED_DockerTest, TimeLimitExceeded) {
    sandbox::sandbox_runner runner(runtime, options);
    sandbox::scoped_sandbox box(runner, runner.acquire("docker-test"));

    sandbox::execution_limits limits;
    limits.cpu_time = 0.5;
    limits.wall_time = 2;
    limits.memory = 64 << 20;
    auto result = runner.run(*box, "while true; do :; done", limits);
    EXPECT_EQ(result.cause, sandbox::termination_cause::TIME_LIMIT_EXCEEDED);

    // 容器被终止后应当可以继续运行命令
    result = runner.run(*box, "echo ok", limits);
    EXPECT_EQ(result.cause, sandbox::termination_cause::NORMAL_EXIT);
    EXPECT_EQ(result.stdout_text, "ok\n");
}

TEST_F(DISABLED_DockerTest, NetworkIsDisabled) {
    sandbox::sandbox_runner runner(runtime, options);
    sandbox::scoped_sandbox box(runner, runner.acquire("docker-test"));

    sandbox::execution_limits limits;
    limits.wall_time = 5;
    auto result = runner.run(*box, "wget -T 2 -q -O - http://example.com", limits);
    EXPECT_NE(result.exit_code, 0);
}
