// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <algorithm>
#include <encodings/algorithms/majorana_encoding.hpp>
#include <encodings/algorithms/qubit_mapper.hpp>
#include <encodings/algorithms/tree_encoding.hpp>
#include <encodings/data/settings.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ut_common.hpp"

using namespace encodings;
using namespace encodings::algorithms;
using namespace encodings::data;

namespace {

const std::vector<std::string> builtin_names = {
    "jordan_wigner", "bravyi_kitaev", "parity", "balanced_binary_tree",
    "balanced_ternary_tree"};

// Path construction on a linear tree, registered only by the tests below
class LinearTreeMapper : public QubitMapper {
 public:
  std::string name() const final { return "test_linear_tree"; }
  bool is_logarithmic() const final { return false; }

 protected:
  PauliRegisterSequence _run_impl(LadderOperatorUnit op, std::uint64_t j,
                                  std::uint64_t n) const override {
    if (op == LadderOperatorUnit::Identity || j >= n) return {};
    return encode_with_ternary_tree(linear_tree(n), op, j, n);
  }
};

std::unique_ptr<QubitMapper> make_linear_tree_mapper() {
  return std::make_unique<LinearTreeMapper>();
}

// Claims the built-in "jw" alias
class ShadowingMapper : public LinearTreeMapper {
 public:
  std::vector<std::string> aliases() const override {
    return {"test_shadow", "jw"};
  }
};

std::unique_ptr<QubitMapper> make_shadowing_mapper() {
  return std::make_unique<ShadowingMapper>();
}

}  // namespace

TEST(QubitMapperTest, CreateByNameAndAlias) {
  auto jw = QubitMapperFactory::create("jordan_wigner");
  EXPECT_EQ(jw->name(), "jordan_wigner");
  EXPECT_EQ(jw->type_name(), "qubit_mapper");
  EXPECT_EQ(QubitMapperFactory::create("jw")->name(), "jordan_wigner");
  EXPECT_EQ(QubitMapperFactory::create("bk")->name(), "bravyi_kitaev");
  EXPECT_EQ(QubitMapperFactory::create("binary_tree")->name(),
            "balanced_binary_tree");
  EXPECT_EQ(QubitMapperFactory::create("ternary_tree")->name(),
            "balanced_ternary_tree");
}

TEST(QubitMapperTest, DefaultIsJordanWigner) {
  EXPECT_EQ(QubitMapperFactory::default_algorithm_name(), "jordan_wigner");
  EXPECT_EQ(QubitMapperFactory::create()->name(), "jordan_wigner");
  EXPECT_EQ(QubitMapperFactory::create("")->name(), "jordan_wigner");
}

TEST(QubitMapperTest, UnknownNameThrows) {
  try {
    QubitMapperFactory::create("no_such_mapper");
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    const std::string message = e.what();
    EXPECT_NE(message.find("no_such_mapper"), std::string::npos);
    EXPECT_NE(message.find("jordan_wigner"), std::string::npos);
  }
}

TEST(QubitMapperTest, AvailableNamesAreSorted) {
  const auto names = QubitMapperFactory::available();
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  for (const auto& name : builtin_names) {
    EXPECT_TRUE(QubitMapperFactory::has(name)) << name;
  }
  for (const auto& alias : {"jw", "bk", "binary_tree", "ternary_tree"}) {
    EXPECT_TRUE(QubitMapperFactory::has(alias)) << alias;
  }
  EXPECT_FALSE(QubitMapperFactory::has("no_such_mapper"));
}

TEST(QubitMapperTest, LogarithmicMappings) {
  EXPECT_FALSE(QubitMapperFactory::create("jordan_wigner")->is_logarithmic());
  EXPECT_FALSE(QubitMapperFactory::create("parity")->is_logarithmic());
  EXPECT_TRUE(QubitMapperFactory::create("bravyi_kitaev")->is_logarithmic());
  EXPECT_TRUE(
      QubitMapperFactory::create("balanced_binary_tree")->is_logarithmic());
  EXPECT_TRUE(
      QubitMapperFactory::create("balanced_ternary_tree")->is_logarithmic());
}

TEST(QubitMapperTest, RunMatchesEncoderFunctions) {
  const auto op = LadderOperatorUnit::Raise;
  EXPECT_EQ(QubitMapperFactory::create("jw")->run(op, 2, 6),
            jordan_wigner_terms(op, 2, 6));
  EXPECT_EQ(QubitMapperFactory::create("bk")->run(op, 1, 8),
            bravyi_kitaev_terms(op, 1, 8));
  EXPECT_EQ(QubitMapperFactory::create("parity")->run(op, 3, 5),
            parity_terms(op, 3, 5));
  EXPECT_EQ(QubitMapperFactory::create("binary_tree")->run(op, 4, 7),
            balanced_binary_tree_terms(op, 4, 7));
  EXPECT_EQ(QubitMapperFactory::create("ternary_tree")->run(op, 0, 9),
            ternary_tree_terms(op, 0, 9));
  EXPECT_TRUE(QubitMapperFactory::create("bk")
                  ->run(LadderOperatorUnit::Identity, 0, 4)
                  .empty());
}

TEST(QubitMapperTest, EncodersSatisfyAnticommutation) {
  for (const auto& name : builtin_names) {
    const auto encode =
        QubitMapper::as_encoder(QubitMapperFactory::create(name));
    EXPECT_EQ(testing::check_anticommutation(encode, 5), "")
        << name;
  }
}

TEST(QubitMapperTest, RunLocksSettings) {
  auto mapper = QubitMapperFactory::create("bk");
  EXPECT_FALSE(mapper->settings().is_locked());
  mapper->run(LadderOperatorUnit::Lower, 0, 4);
  EXPECT_TRUE(mapper->settings().is_locked());
  EXPECT_THROW(mapper->settings().set("threshold", 0.1), SettingsAreLocked);

  std::shared_ptr<QubitMapper> other = QubitMapperFactory::create("jw");
  auto encode = QubitMapper::as_encoder(other);
  EXPECT_TRUE(other->settings().is_locked());
  EXPECT_EQ(encode(LadderOperatorUnit::Raise, 0, 2),
            jordan_wigner_terms(LadderOperatorUnit::Raise, 0, 2));
}

TEST(QubitMapperTest, EncoderOutlivesMapperHandle) {
  EncoderFn encode = QubitMapper::as_encoder(QubitMapperFactory::create("bk"));
  EXPECT_EQ(encode(LadderOperatorUnit::Raise, 1, 4),
            bravyi_kitaev_terms(LadderOperatorUnit::Raise, 1, 4));

  std::shared_ptr<const QubitMapper> mapper =
      QubitMapperFactory::create("ternary_tree");
  const auto ternary = QubitMapper::as_encoder(mapper);
  mapper.reset();
  EXPECT_EQ(ternary(LadderOperatorUnit::Lower, 3, 9),
            ternary_tree_terms(LadderOperatorUnit::Lower, 3, 9));

  EXPECT_THROW(QubitMapper::as_encoder(nullptr), std::invalid_argument);
}

TEST(QubitMapperTest, RegisterCustomMapper) {
  QubitMapperFactory::register_instance(&make_linear_tree_mapper);
  ASSERT_TRUE(QubitMapperFactory::has("test_linear_tree"));

  auto mapper = QubitMapperFactory::create("test_linear_tree");
  EXPECT_EQ(mapper->aliases(), std::vector<std::string>{"test_linear_tree"});
  EXPECT_EQ(testing::check_anticommutation(
                QubitMapper::as_encoder(std::move(mapper)), 4),
            "");

  // Names are unique across the registry
  EXPECT_THROW(QubitMapperFactory::register_instance(&make_linear_tree_mapper),
               std::runtime_error);

  EXPECT_TRUE(QubitMapperFactory::unregister_instance("test_linear_tree"));
  EXPECT_FALSE(QubitMapperFactory::unregister_instance("test_linear_tree"));
  EXPECT_FALSE(QubitMapperFactory::has("test_linear_tree"));
}

TEST(QubitMapperTest, DuplicateAliasRegistersNothing) {
  const auto before = QubitMapperFactory::available();
  EXPECT_THROW(QubitMapperFactory::register_instance(&make_shadowing_mapper),
               std::runtime_error);
  EXPECT_FALSE(QubitMapperFactory::has("test_shadow"));
  EXPECT_EQ(QubitMapperFactory::available(), before);
}
