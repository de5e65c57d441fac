#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "monitor/monitor.hpp"

/**
 * @brief 单元测试只输出警告以上的日志，所有测试结束后清除注册的监控
 */
class LoggingEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        FLAGS_logtostderr = true;
        FLAGS_minloglevel = google::GLOG_WARNING;
    }

    void TearDown() override {
        hjudge::clear_monitors();
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new LoggingEnvironment);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
