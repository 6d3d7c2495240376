// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "json_serialization.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

namespace encodings::data {

std::tuple<int, int, int> parse_version_string(
    const std::string& version_string) {
  const std::string format_error =
      "Invalid version string format. Expected 'major.minor.patch', got: " +
      version_string;
  std::size_t first_dot = version_string.find('.');
  if (first_dot == std::string::npos) throw std::runtime_error(format_error);
  std::size_t second_dot = version_string.find('.', first_dot + 1);
  if (second_dot == std::string::npos) throw std::runtime_error(format_error);

  try {
    int major = std::stoi(version_string.substr(0, first_dot));
    int minor = std::stoi(
        version_string.substr(first_dot + 1, second_dot - first_dot - 1));
    int patch = std::stoi(version_string.substr(second_dot + 1));
    return std::make_tuple(major, minor, patch);
  } catch (const std::logic_error&) {
    throw std::runtime_error(format_error);
  }
}

void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version) {
  if (expected_version == found_version) return;

  auto [expected_major, expected_minor, expected_patch] =
      parse_version_string(expected_version);
  auto [found_major, found_minor, found_patch] =
      parse_version_string(found_version);

  if (expected_major != found_major || expected_minor != found_minor) {
    throw std::runtime_error("Serialization version mismatch. Expected: " +
                             expected_version + ", Found: " + found_version +
                             ". Only patch versions may differ.");
  }
}

nlohmann::json complex_to_json(const Complex& value) {
  return nlohmann::json::array({value.real(), value.imag()});
}

Complex json_to_complex(const nlohmann::json& j) {
  if (j.is_number()) {
    return {j.get<double>(), 0.0};
  }
  if (j.is_array() && j.size() == 2 && j[0].is_number() && j[1].is_number()) {
    return {j[0].get<double>(), j[1].get<double>()};
  }
  throw std::invalid_argument(
      "Complex values must be a number or a [real, imag] array, got: " +
      j.dump());
}

}  // namespace encodings::data
