/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <iterator>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace pyrsia::common {
  namespace fs = boost::filesystem;

  /**
   * @given logger writing on another thread
   * @when log file is set meanwhile and another logger is created after it
   * @then output of both loggers reaches the file
   */
  TEST(LoggerTest, LogFile) {
    auto path{fs::temp_directory_path()
              / fs::unique_path("pyrsia-log-%%%%-%%%%.log")};
    auto before{createLogger("log_file_before")};
    std::thread writer{[&] {
      for (auto i{0}; i < 1000; ++i) {
        before->info("line {}", i);
      }
    }};
    setLogFile(path.string());
    writer.join();

    before->info("before marker");
    auto after{createLogger("log_file_after")};
    after->info("after marker");
    before->flush();
    after->flush();

    fs::ifstream file{path};
    std::string content{std::istreambuf_iterator<char>{file},
                        std::istreambuf_iterator<char>{}};
    EXPECT_NE(content.find("log_file_before I before marker"),
              std::string::npos);
    EXPECT_NE(content.find("log_file_after I after marker"),
              std::string::npos);
    boost::system::error_code ec;
    fs::remove(path, ec);
  }
}  // namespace pyrsia::common
