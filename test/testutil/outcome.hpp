/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE(var, val, expr)                         \
  auto &&var = expr;                                                 \
  ASSERT_TRUE(var) << "Line " << __LINE__ << ": "                    \
                   << (var ? "" : var.error().message());            \
  auto &&val = var.value();

/**
 * Expects result to be successful and declares val initialized with value
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  _EXPECT_OUTCOME_TRUE(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, expr)

/**
 * Expects result to be successful, value is ignored
 */
#define EXPECT_OUTCOME_TRUE_1(expr)                                      \
  {                                                                      \
    auto &&_result = expr;                                               \
    ASSERT_TRUE(_result) << "Line " << __LINE__ << ": "                  \
                         << (_result ? "" : _result.error().message()); \
  }

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_FALSE(var, val, expr)                   \
  auto &&var = expr;                                            \
  ASSERT_FALSE(var) << "Line " << __LINE__ << ": value expected \
to be error";                                                   \
  auto &&val = var.error();

/**
 * Expects result to be error and declares val initialized with error code
 */
#define EXPECT_OUTCOME_FALSE(val, expr) \
  _EXPECT_OUTCOME_FALSE(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, expr)

/**
 * Expects result to be error, error is ignored
 */
#define EXPECT_OUTCOME_FALSE_1(expr)                                     \
  {                                                                      \
    auto &&_result = expr;                                               \
    ASSERT_FALSE(_result) << "Line " << __LINE__ << ": value expected " \
                             "to be error";                              \
  }

/**
 * Expects result to be given error
 */
#define EXPECT_OUTCOME_ERROR(error, expr)                 \
  {                                                       \
    auto &&_result = expr;                                \
    ASSERT_FALSE(_result);                                \
    EXPECT_EQ(_result.error(), make_error_code(error));   \
  }

/**
 * Expects result to be successful and equal to expected value
 */
#define EXPECT_OUTCOME_EQ(expr, expected)                                \
  {                                                                      \
    auto &&_result = expr;                                               \
    ASSERT_TRUE(_result) << "Line " << __LINE__ << ": "                  \
                         << (_result ? "" : _result.error().message()); \
    EXPECT_EQ(_result.value(), expected);                                \
  }
