// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <encodings/data/settings.hpp>
#include <encodings/utils/logger.hpp>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace encodings::algorithms {

/**
 * @brief Base class for named, configurable operations
 *
 * run() locks the settings and then delegates to _run_impl(), so a
 * configuration cannot change once an algorithm has produced a result.
 *
 * @tparam Derived The abstract algorithm interface, e.g. QubitMapper
 * @tparam ReturnType Result type of run() and _run_impl()
 * @tparam Args Argument types of run() and _run_impl()
 *
 * @code
 * class QubitMapper
 *     : public Algorithm<QubitMapper, data::PauliRegisterSequence,
 *                        data::LadderOperatorUnit, std::uint64_t,
 *                        std::uint64_t> { ... };
 * @endcode
 */
template <typename Derived, typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  /**
   * @brief Lock the settings and run the algorithm
   */
  virtual ReturnType run(Args... args) const {
    this->lock_settings();
    return this->_run_impl(std::forward<Args>(args)...);
  }

  /// Mutable access to the settings; fails once run() has been called
  data::Settings& settings() { return *_settings; }

  const data::Settings& settings() const { return *_settings; }

  /// Registry name of this implementation
  virtual std::string name() const = 0;

  /**
   * @brief All names this implementation is registered under
   *
   * Includes name(); implementations add short forms.
   */
  virtual std::vector<std::string> aliases() const { return {this->name()}; }

  /// Name of the algorithm interface, shared by all implementations
  virtual std::string type_name() const = 0;

 protected:
  void lock_settings() const { this->_settings->lock(); }

  virtual ReturnType _run_impl(Args... args) const = 0;

  /// Replaced by implementations that declare settings
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

/**
 * @brief Name-keyed registry of algorithm implementations
 *
 * Each instantiation keeps its own registry. The first access registers the
 * defaults through Derived::register_default_instances().
 *
 * @tparam BaseAlgorithmType Interface all registered implementations share
 * @tparam Derived Concrete factory providing algorithm_type_name(),
 * default_algorithm_name() and register_default_instances()
 */
template <typename BaseAlgorithmType, typename Derived>
class AlgorithmFactory {
 public:
  using return_type = std::unique_ptr<BaseAlgorithmType>;
  using functor_type = std::function<return_type(void)>;

  /**
   * @brief Create an implementation by name or alias
   * @param name Registered name; empty selects the default
   * @throws std::runtime_error if nothing is registered under the name
   */
  static return_type create(const std::string& name = "") {
    const std::string key =
        name.empty() ? Derived::default_algorithm_name() : name;
    auto it = registry().find(key);
    if (it == registry().end()) {
      std::string options;
      for (const auto& [k, _] : registry()) {
        if (!options.empty()) options += ", ";
        options += k;
      }
      throw std::runtime_error("Algorithm factory for " +
                               Derived::algorithm_type_name() +
                               ": Algorithm with name '" + key +
                               "' not found in registry, available options "
                               "are: " +
                               options);
    }
    return it->second();
  }

  /**
   * @brief Register an implementation under its name and all aliases
   * @throws std::runtime_error on a type mismatch or a name already taken
   */
  static void register_instance(functor_type func) {
    auto& reg = registry();
    auto instance = func();

    if (instance->type_name() != Derived::algorithm_type_name()) {
      throw std::runtime_error(
          "Algorithm factory for " + Derived::algorithm_type_name() +
          ": algorithm with name '" + instance->name() +
          "' has incorrect algorithm type: " + instance->type_name() +
          " expected is: " + Derived::algorithm_type_name());
    }

    const auto aliases = instance->aliases();
    for (const auto& alias : aliases) {
      if (reg.count(alias)) {
        throw std::runtime_error("Algorithm factory for " +
                                 Derived::algorithm_type_name() +
                                 ": algorithm with name/alias '" + alias +
                                 "' already exists in registry");
      }
    }
    for (const auto& alias : aliases) reg[alias] = func;
    ENCODINGS_LOGGER().debug("Registered {} '{}' ({} names)",
                             Derived::algorithm_type_name(), instance->name(),
                             aliases.size());
  }

  /**
   * @brief Remove one registered name
   * @return Whether the name was registered
   */
  static bool unregister_instance(const std::string& key) {
    return registry().erase(key) > 0;
  }

  /// Registered names and aliases in lexicographic order
  static std::vector<std::string> available() {
    std::vector<std::string> keys;
    keys.reserve(registry().size());
    for (const auto& [key, _] : registry()) keys.push_back(key);
    return keys;
  }

  static bool has(const std::string& key) { return registry().count(key) > 0; }

  /// Remove every registered implementation, defaults included
  static void clear() { registry().clear(); }

 protected:
  static std::map<std::string, functor_type>& registry() {
    static std::map<std::string, functor_type> instance;
    static bool initialized = false;
    if (!initialized) {
      initialized = true;
      Derived::register_default_instances();
    }
    return instance;
  }
};

}  // namespace encodings::algorithms
