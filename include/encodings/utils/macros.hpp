// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

/**
 * @brief Verify an internal invariant and abort if it does not hold
 * @param expr Expression to verify
 */
#define ENCODINGS_VERIFY(expr)                                            \
  if (!static_cast<bool>(expr)) {                                         \
    spdlog::critical("{}:{}: Verifying '{}' failed.", __FILE__, __LINE__, \
                     #expr);                                              \
    std::abort();                                                         \
  }

/**
 * @brief Verify input and raise std::invalid_argument if false
 * @param expr Expression to verify
 * @param msg Error message
 */
#define ENCODINGS_VERIFY_INPUT(expr, msg) \
  if (!static_cast<bool>(expr))           \
    throw std::invalid_argument(std::string("InputError: " + std::string(msg)));
