// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <concepts>
#include <cstdint>
#include <encodings/data/data_class.hpp>
#include <limits>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace encodings::data {

/**
 * @brief Value types a setting can hold
 *
 * Integers are always stored as int64_t; get<T>() converts on request.
 */
using SettingValue =
    std::variant<bool, int64_t, double, std::string, std::vector<int64_t>,
                 std::vector<double>, std::vector<std::string>>;

/**
 * @brief Inclusive [min, max] bounds on a numeric setting
 */
template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();
  T max = std::numeric_limits<T>::max();
};

/**
 * @brief Explicit list of accepted values
 */
template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;
};

/**
 * @brief Any constraint attachable to a setting
 */
using Constraint =
    std::variant<BoundConstraint<int64_t>, ListConstraint<int64_t>,
                 BoundConstraint<double>, ListConstraint<std::string>>;

/**
 * @brief Integral types other than bool
 */
template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<T, bool>;

/**
 * @brief Whether T is one of the alternatives of a variant
 */
template <typename T, typename Variant>
struct is_variant_member_impl;

template <typename T, typename... Ts>
struct is_variant_member_impl<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T, typename Variant>
concept VariantMember = is_variant_member_impl<T, Variant>::value;

/**
 * @brief Thrown when a locked settings object is modified
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Thrown when a key is not present
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Thrown when a value has a different type than the stored one
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @brief Typed key/value configuration of an algorithm
 *
 * The set of keys is fixed by the derived class constructor through
 * set_default(); afterwards only existing keys can be changed, each keeping
 * the type of its default and honoring its constraint. Algorithms lock their
 * settings when they run.
 *
 * ```cpp
 * class MapperSettings : public Settings {
 *  public:
 *   MapperSettings() {
 *     set_default("threshold", 0.0, "Pruning threshold",
 *                 BoundConstraint<double>{0.0, 1.0});
 *   }
 * };
 * ```
 */
class Settings : public DataClass {
 public:
  Settings() = default;
  virtual ~Settings() = default;
  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  /**
   * @brief Change an existing setting
   * @throws SettingsAreLocked if the settings are locked
   * @throws SettingNotFound if the key does not exist
   * @throws SettingTypeMismatch if the value type differs from the default
   * @throws std::invalid_argument if the value violates the constraint
   */
  void set(const std::string& key, const SettingValue& value);

  /// Store a C string as std::string
  void set(const std::string& key, const char* value);

  /// Store any integer as int64_t
  template <NonBoolIntegral Integer>
    requires(!std::same_as<Integer, int64_t>)
  void set(const std::string& key, Integer value) {
    if constexpr (std::is_unsigned_v<Integer>) {
      if (value > static_cast<std::make_unsigned_t<int64_t>>(
                      std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Value for setting '" + key +
                                "' cannot be represented as int64_t.");
      }
    }
    set(key, SettingValue(static_cast<int64_t>(value)));
  }

  /**
   * @brief Get a setting as variant
   * @throws SettingNotFound if the key does not exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Get a setting with type checking
   *
   * Integer settings may be requested as any integral type that can hold the
   * stored value.
   *
   * @throws SettingNotFound if the key does not exist
   * @throws SettingTypeMismatch if the stored type does not convert to T
   */
  template <typename T>
  T get(const std::string& key) const {
    const auto& value = find_(key);
    if constexpr (VariantMember<T, SettingValue>) {
      if (const auto* v = std::get_if<T>(&value)) return *v;
    } else if constexpr (NonBoolIntegral<T>) {
      if (const auto* v = std::get_if<int64_t>(&value)) {
        if (std::in_range<T>(*v)) return static_cast<T>(*v);
      }
    }
    throw SettingTypeMismatch(key, type_name_of_<T>());
  }

  /**
   * @brief Get a setting, or a fallback if the key is missing or has another
   * type
   */
  template <typename T>
  T get_or_default(const std::string& key, const T& default_value) const {
    if (!has(key)) return default_value;
    try {
      return get<T>(key);
    } catch (const SettingTypeMismatch&) {
      return default_value;
    }
  }

  bool has(const std::string& key) const;

  /// Keys in lexicographic order
  std::vector<std::string> keys() const;

  std::size_t size() const;

  bool empty() const;

  /**
   * @brief String form of a setting value
   * @throws SettingNotFound if the key does not exist
   */
  std::string get_as_string(const std::string& key) const;

  /// Name of the stored type ("bool", "int64_t", "double", "string", ...)
  std::string get_type_name(const std::string& key) const;

  bool has_description(const std::string& key) const;

  /**
   * @throws SettingNotFound if the key has no description
   */
  std::string get_description(const std::string& key) const;

  bool has_limits(const std::string& key) const;

  /**
   * @throws SettingNotFound if the key has no constraint
   */
  Constraint get_limits(const std::string& key) const;

  /**
   * @brief Apply several changes at once
   *
   * Every change is validated before any is applied.
   */
  void update(const std::map<std::string, SettingValue>& updates);

  /// Prevent further modification
  void lock() const;

  bool is_locked() const { return locked_; }

  std::string get_data_type_name() const override { return "settings"; }

  std::string get_summary() const override;

  /**
   * @brief JSON object of all values plus "version", "_descriptions" and
   * "_limits"
   */
  nlohmann::json to_json() const override;

  /**
   * @brief Rebuild settings from to_json() output
   *
   * Keys are taken from the JSON as-is.
   *
   * @throws std::runtime_error on malformed input or a version mismatch
   */
  static std::shared_ptr<Settings> from_json(const nlohmann::json& json_obj);

  /**
   * @brief Copy the values of matching keys from JSON into these settings
   *
   * Unlike from_json(), the set of keys stays fixed and every value goes
   * through set().
   *
   * @throws SettingNotFound for a key not present in these settings
   */
  void update_from_json(const nlohmann::json& json_obj);

 protected:
  /**
   * @brief Declare a setting with its default value
   *
   * Only meant for derived-class constructors. A key that already exists is
   * left unchanged.
   *
   * @param key Setting name
   * @param value Default value; fixes the type of the setting
   * @param description Human-readable description
   * @param limit Constraint checked by set()
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  /// Declare a string setting from a C string
  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  template <typename T>
  static std::string type_name_of_() {
    if constexpr (std::same_as<T, bool>) return "bool";
    if constexpr (std::same_as<T, double>) return "double";
    if constexpr (std::same_as<T, std::string>) return "string";
    if constexpr (std::same_as<T, std::vector<int64_t>>)
      return "vector<int64_t>";
    if constexpr (std::same_as<T, std::vector<double>>) return "vector<double>";
    if constexpr (std::same_as<T, std::vector<std::string>>)
      return "vector<string>";
    if constexpr (NonBoolIntegral<T>) return "integer";
    return "unsupported";
  }

  const SettingValue& find_(const std::string& key) const;

  /// Throws unless value may replace the current value of key
  void validate_(const std::string& key, const SettingValue& value) const;

  static std::string to_string_(const SettingValue& value);
  static nlohmann::json value_to_json_(const SettingValue& value);
  static SettingValue json_to_value_(const nlohmann::json& j);

  std::map<std::string, SettingValue> settings_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;

  mutable bool locked_ = false;
};

static_assert(DataClassCompliant<Settings>,
              "Settings must derive from DataClass and provide from_json");

}  // namespace encodings::data
