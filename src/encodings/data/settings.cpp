// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <encodings/data/settings.hpp>
#include <sstream>

#include "json_serialization.hpp"

namespace encodings::data {

namespace {

template <typename T>
std::string format_options(const std::vector<T>& options) {
  std::string result = "[";
  for (std::size_t i = 0; i < options.size(); ++i) {
    if (i > 0) result += ", ";
    if constexpr (std::same_as<T, std::string>) {
      result += "\"" + options[i] + "\"";
    } else {
      result += std::to_string(options[i]);
    }
  }
  return result + "]";
}

// Checks one scalar against a constraint whose element type matches
template <typename T>
void check_against(const std::string& key, const T& candidate,
                   const Constraint& limit) {
  if constexpr (VariantMember<ListConstraint<T>, Constraint>) {
    if (const auto* list = std::get_if<ListConstraint<T>>(&limit)) {
      const auto& allowed = list->allowed_values;
      if (std::find(allowed.begin(), allowed.end(), candidate) ==
          allowed.end()) {
        throw std::invalid_argument("Value for setting '" + key +
                                    "' is out of allowed options. Allowed "
                                    "options: " +
                                    format_options(allowed));
      }
    }
  }
  if constexpr (VariantMember<BoundConstraint<T>, Constraint>) {
    if (const auto* bound = std::get_if<BoundConstraint<T>>(&limit)) {
      if (candidate < bound->min || candidate > bound->max) {
        throw std::invalid_argument(
            "Value for setting '" + key +
            "' is out of allowed range. Allowed range: [" +
            std::to_string(bound->min) + ", " + std::to_string(bound->max) +
            "]");
      }
    }
  }
}

}  // namespace

const SettingValue& Settings::find_(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::validate_(const std::string& key,
                         const SettingValue& value) const {
  if (value.index() != find_(key).index()) {
    throw SettingTypeMismatch(key, get_type_name(key));
  }
  auto limit = limits_.find(key);
  if (limit == limits_.end()) return;

  std::visit(
      [&](const auto& v) {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::same_as<ValueType, bool>) {
          return;
        } else if constexpr (std::same_as<ValueType, int64_t> ||
                             std::same_as<ValueType, double> ||
                             std::same_as<ValueType, std::string>) {
          check_against(key, v, limit->second);
        } else {
          for (const auto& element : v) check_against(key, element, limit->second);
        }
      },
      value);
}

void Settings::set(const std::string& key, const SettingValue& value) {
  if (locked_) {
    throw SettingsAreLocked();
  }
  validate_(key, value);
  settings_[key] = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

SettingValue Settings::get(const std::string& key) const { return find_(key); }

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, value] : settings_) result.push_back(key);
  return result;
}

std::size_t Settings::size() const { return settings_.size(); }

bool Settings::empty() const { return settings_.empty(); }

std::string Settings::get_as_string(const std::string& key) const {
  return to_string_(find_(key));
}

std::string Settings::get_type_name(const std::string& key) const {
  return std::visit(
      [](const auto& v) -> std::string {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::same_as<ValueType, int64_t>) {
          return "int64_t";
        } else if constexpr (std::same_as<ValueType, std::vector<int64_t>>) {
          return "vector<int64_t>";
        } else {
          return type_name_of_<ValueType>();
        }
      },
      find_(key));
}

bool Settings::has_description(const std::string& key) const {
  return descriptions_.count(key) > 0;
}

std::string Settings::get_description(const std::string& key) const {
  auto it = descriptions_.find(key);
  if (it == descriptions_.end()) {
    throw SettingNotFound("No description found for setting: " + key);
  }
  return it->second;
}

bool Settings::has_limits(const std::string& key) const {
  return limits_.count(key) > 0;
}

Constraint Settings::get_limits(const std::string& key) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    throw SettingNotFound("No limits found for setting: " + key);
  }
  return it->second;
}

void Settings::update(const std::map<std::string, SettingValue>& updates) {
  if (locked_) {
    throw SettingsAreLocked();
  }
  for (const auto& [key, value] : updates) validate_(key, value);
  for (const auto& [key, value] : updates) settings_[key] = value;
}

void Settings::lock() const { locked_ = true; }

std::string Settings::get_summary() const {
  std::ostringstream oss;
  oss << "Settings Summary:\n";
  if (empty()) {
    oss << "  No settings configured.\n";
    return oss.str();
  }
  for (const auto& [key, value] : settings_) {
    auto value_str = to_string_(value);
    if (value_str.length() > 50) value_str = value_str.substr(0, 47) + "...";
    oss << "  " << key << " = " << value_str << "\n";
  }
  return oss.str();
}

nlohmann::json Settings::to_json() const {
  nlohmann::json json_obj;
  json_obj["version"] = SERIALIZATION_VERSION;
  for (const auto& [key, value] : settings_) {
    json_obj[key] = value_to_json_(value);
  }
  if (!descriptions_.empty()) {
    json_obj["_descriptions"] = descriptions_;
  }
  if (!limits_.empty()) {
    nlohmann::json limits_json;
    for (const auto& [key, limit] : limits_) {
      std::visit(
          [&limits_json, &key](const auto& c) {
            using LimitType = std::decay_t<decltype(c)>;
            if constexpr (std::same_as<LimitType, BoundConstraint<int64_t>> ||
                          std::same_as<LimitType, BoundConstraint<double>>) {
              limits_json[key] = {{"min", c.min}, {"max", c.max}};
            } else {
              limits_json[key] = {{"allowed_values", c.allowed_values}};
            }
          },
          limit);
    }
    json_obj["_limits"] = limits_json;
  }
  return json_obj;
}

std::shared_ptr<Settings> Settings::from_json(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw std::runtime_error("JSON must be an object");
  }
  if (json_obj.contains("version")) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   json_obj["version"].get<std::string>());
  }

  auto settings = std::make_shared<Settings>();
  for (const auto& [key, value] : json_obj.items()) {
    if (key == "version" || key == "_descriptions" || key == "_limits") {
      continue;
    }
    settings->settings_[key] = json_to_value_(value);
  }
  if (json_obj.contains("_descriptions")) {
    settings->descriptions_ =
        json_obj["_descriptions"].get<std::map<std::string, std::string>>();
  }
  if (json_obj.contains("_limits")) {
    for (const auto& [key, limit] : json_obj["_limits"].items()) {
      if (limit.contains("allowed_values")) {
        const auto& allowed = limit["allowed_values"];
        if (!allowed.empty() && allowed[0].is_string()) {
          settings->limits_[key] = ListConstraint<std::string>{
              allowed.get<std::vector<std::string>>()};
        } else {
          settings->limits_[key] =
              ListConstraint<int64_t>{allowed.get<std::vector<int64_t>>()};
        }
      } else if (limit.contains("min") && limit.contains("max")) {
        if (limit["min"].is_number_integer() &&
            limit["max"].is_number_integer()) {
          settings->limits_[key] = BoundConstraint<int64_t>{
              limit["min"].get<int64_t>(), limit["max"].get<int64_t>()};
        } else {
          settings->limits_[key] = BoundConstraint<double>{
              limit["min"].get<double>(), limit["max"].get<double>()};
        }
      } else {
        throw std::runtime_error("Malformed limits for setting: " + key);
      }
    }
  }
  return settings;
}

void Settings::update_from_json(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw std::runtime_error("JSON must be an object");
  }
  std::map<std::string, SettingValue> updates;
  for (const auto& [key, value] : json_obj.items()) {
    if (key == "version" || key == "_descriptions" || key == "_limits") {
      continue;
    }
    auto converted = json_to_value_(value);
    // JSON does not distinguish 1.0 from 1
    if (has(key) && std::holds_alternative<double>(find_(key)) &&
        std::holds_alternative<int64_t>(converted)) {
      converted = static_cast<double>(std::get<int64_t>(converted));
    }
    if (!has(key)) throw SettingNotFound(key);
    updates[key] = std::move(converted);
  }
  update(updates);
}

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) return;
  settings_[key] = value;
  if (description) descriptions_[key] = std::move(*description);
  if (limit) limits_[key] = std::move(*limit);
}

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  set_default(key, SettingValue(std::string(value)), std::move(description),
              std::move(limit));
}

std::string Settings::to_string_(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::same_as<ValueType, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::same_as<ValueType, std::string>) {
          return v;
        } else if constexpr (std::same_as<ValueType, double>) {
          std::ostringstream oss;
          oss << std::scientific << v;
          return oss.str();
        } else if constexpr (std::same_as<ValueType, int64_t>) {
          return std::to_string(v);
        } else {
          std::ostringstream oss;
          oss << "[";
          for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) oss << ", ";
            if constexpr (std::same_as<typename ValueType::value_type,
                                       std::string>) {
              oss << "\"" << v[i] << "\"";
            } else if constexpr (std::same_as<typename ValueType::value_type,
                                              double>) {
              oss << std::scientific << v[i];
            } else {
              oss << v[i];
            }
          }
          oss << "]";
          return oss.str();
        }
      },
      value);
}

nlohmann::json Settings::value_to_json_(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> nlohmann::json {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::same_as<ValueType, std::vector<int64_t>> ||
                      std::same_as<ValueType, std::vector<double>> ||
                      std::same_as<ValueType, std::vector<std::string>>) {
          if (v.empty()) {
            // Empty arrays carry their element type explicitly
            nlohmann::json typed = nlohmann::json::object();
            typed["__type__"] = "array";
            if constexpr (std::same_as<ValueType, std::vector<int64_t>>) {
              typed["__element_type__"] = "int64";
            } else if constexpr (std::same_as<ValueType,
                                              std::vector<double>>) {
              typed["__element_type__"] = "double";
            } else {
              typed["__element_type__"] = "string";
            }
            typed["__value__"] = nlohmann::json::array();
            return typed;
          }
        }
        return nlohmann::json(v);
      },
      value);
}

SettingValue Settings::json_to_value_(const nlohmann::json& j) {
  if (j.is_boolean()) return j.get<bool>();
  if (j.is_number_integer()) return j.get<int64_t>();
  if (j.is_number_float()) return j.get<double>();
  if (j.is_string()) return j.get<std::string>();
  if (j.is_object() && j.contains("__type__") && j["__type__"] == "array") {
    const auto elem_type = j.value("__element_type__", std::string());
    if (elem_type == "int64") return std::vector<int64_t>();
    if (elem_type == "double") return std::vector<double>();
    if (elem_type == "string") return std::vector<std::string>();
    throw std::runtime_error("Unsupported typed array element type: " +
                             elem_type);
  }
  if (j.is_array()) {
    if (j.empty()) return std::vector<int64_t>();
    if (j[0].is_number_integer()) return j.get<std::vector<int64_t>>();
    if (j[0].is_number_float()) return j.get<std::vector<double>>();
    if (j[0].is_string()) return j.get<std::vector<std::string>>();
    throw std::runtime_error("Unsupported array element type in JSON");
  }
  throw std::runtime_error("Unsupported JSON type");
}

}  // namespace encodings::data
