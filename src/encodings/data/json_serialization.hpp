// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <encodings/utils/complex.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>

namespace encodings::data {

/**
 * @file json_serialization.hpp
 * @brief JSON helpers shared by the serializable data classes
 */

/**
 * @brief Validate serialization version compatibility
 *
 * Major and minor versions must match; patch differences are accepted.
 *
 * @param expected_version The version string this code writes
 * @param found_version The version string found in the serialized data
 * @throws std::runtime_error on a major or minor mismatch
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Parse "major.minor.patch"
 * @throws std::runtime_error if the format is invalid
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

/**
 * @brief Encode a complex number as the array [real, imag]
 */
nlohmann::json complex_to_json(const Complex& value);

/**
 * @brief Decode a complex number from [real, imag] or a plain real number
 * @throws std::invalid_argument for any other JSON shape
 */
Complex json_to_complex(const nlohmann::json& j);

}  // namespace encodings::data
