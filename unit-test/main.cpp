#include <glog/logging.h>
#include <stdlib.h>
#include <filesystem>
#include <string>
#include <vector>
#include "arbiter/config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

/**
 * @brief 每个测试进程使用独立的 RUN_DIR，测试结束后删除
 */
class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    std::string pattern = (std::filesystem::temp_directory_path() / "arbiter-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    ASSERT_NE(mkdtemp(buffer.data()), nullptr);
    run_dir = buffer.data();
    arbiter::RUN_DIR = run_dir;
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(run_dir, ec);
  }

 private:
  std::filesystem::path run_dir;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
