#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

/**
 * @brief 所有测试共享的环境
 * 日志直接输出到 stderr，避免测试在工作路径下留下日志文件
 */
class LoggingEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        FLAGS_logtostderr = true;
        FLAGS_colorlogtostderr = true;
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new LoggingEnvironment);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
