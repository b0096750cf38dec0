#include <glog/logging.h>
#include <filesystem>
#include <system_error>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        std::filesystem::create_directories(arbiter::test::scratch_root());
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(arbiter::test::scratch_root(), ec);
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
