/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "common/logger.hpp"

// intentionally here, so users can use fs shortcut
namespace fs = boost::filesystem;

namespace test {

  /**
   * @brief Base test, which involves filesystem. Can be created with given
   * path. Clears path before test and after test.
   */
  struct BaseFS_Test : public ::testing::Test {
    explicit BaseFS_Test(fs::path path);

    ~BaseFS_Test() override;

    /**
     * @brief Delete directory and all containing files
     */
    void clear();

    /**
     * @brief Create testing directory
     */
    void mkdir();

    std::string getPathString() const;

    /**
     * @brief Create subdirectory in test directory
     * @param dirname is a new subdirectory name
     * @return full pathname to the new subdirectory
     */
    fs::path createDir(const fs::path &dirname) const;

    /**
     * @brief create file with content in test directory
     * @return full pathname to the new file
     */
    fs::path createFile(const fs::path &filename,
                        const std::string &content = {}) const;

    bool exists(const fs::path &entity) const;

    /// Number of regular files under directory, recursively
    size_t countFiles(const fs::path &dirname) const;

    void SetUp() override;

    void TearDown() override;

   protected:
    fs::path base_path;
    pyrsia::common::Logger logger;
  };

}  // namespace test
