// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <concepts>
#include <nlohmann/json.hpp>
#include <string>

namespace encodings::data {

/**
 * @brief Base interface for the library's serializable value types
 *
 * Data classes are pure in-memory values; they convert to and from JSON but
 * never touch the file system.
 */
class DataClass {
 public:
  virtual ~DataClass() = default;

  /**
   * @brief Get the data type name for this class
   *
   * Written into the serialized form so that readers can reject mismatched
   * payloads.
   *
   * @return String containing the data type name (e.g., "settings")
   */
  virtual std::string get_data_type_name() const = 0;

  /**
   * @brief Get a summary string describing the object
   * @return String containing object summary information
   */
  virtual std::string get_summary() const = 0;

  /**
   * @brief Convert object to JSON representation
   * @return JSON object containing the serialized data
   */
  virtual nlohmann::json to_json() const = 0;

 protected:
  DataClass() = default;
  DataClass(const DataClass& other) = default;
  DataClass& operator=(const DataClass& other) = default;
  DataClass(DataClass&& other) = default;
  DataClass& operator=(DataClass&& other) = default;
};

/**
 * @brief Concept for data classes that can be rebuilt from their JSON form
 */
template <typename T>
concept DataClassCompliant = std::derived_from<T, DataClass> && requires {
  T::from_json(std::declval<nlohmann::json>());
};

}  // namespace encodings::data
