// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cmath>
#include <encodings/algorithms/majorana_encoding.hpp>
#include <encodings/data/pauli_register.hpp>
#include <encodings/utils/dense_representation.hpp>
#include <stdexcept>
#include <vector>

#include "ut_common.hpp"

using namespace encodings;
using namespace encodings::data;
using namespace encodings::utils;

namespace {

const Complex one(1.0, 0.0);
const Complex i_unit(0.0, 1.0);

}  // namespace

TEST(DenseRepresentationTest, SingleQubitPaulis) {
  Eigen::Matrix2cd x;
  x << 0.0, one, one, 0.0;
  Eigen::Matrix2cd y;
  y << 0.0, -i_unit, i_unit, 0.0;
  Eigen::Matrix2cd z;
  z << one, 0.0, 0.0, -one;

  EXPECT_TRUE(to_dense_matrix(PauliRegister("X"), 1).isApprox(x));
  EXPECT_TRUE(to_dense_matrix(PauliRegister("Y"), 1).isApprox(y));
  EXPECT_TRUE(to_dense_matrix(PauliRegister("Z"), 1).isApprox(z));
  EXPECT_TRUE(to_dense_matrix(PauliRegister("I", 2.0), 1)
                  .isApprox(2.0 * Eigen::Matrix2cd::Identity()));
}

TEST(DenseRepresentationTest, QubitZeroIsMostSignificant) {
  const auto m = to_dense_matrix(PauliRegister("ZI"), 2);
  Eigen::Vector4cd expected(1.0, 1.0, -1.0, -1.0);
  EXPECT_TRUE(m.diagonal().isApprox(expected));

  // Shorter registers are padded with identities
  EXPECT_TRUE(to_dense_matrix(PauliRegister("Z"), 2).isApprox(m));
}

TEST(DenseRepresentationTest, RegisterProductMatchesMatrixProduct) {
  const PauliRegister a("XYZ", Complex(0.5, 0.0));
  const PauliRegister b("ZXY", Complex(0.0, 2.0));
  const auto product = to_dense_matrix(a * b, 3);
  const auto expected = to_dense_matrix(a, 3) * to_dense_matrix(b, 3);
  EXPECT_TRUE(product.isApprox(expected));
}

TEST(DenseRepresentationTest, SequenceIsSumOfTerms) {
  const PauliRegisterSequence s(
      std::vector<PauliRegister>{PauliRegister("XI"), PauliRegister("ZZ", 0.5)});
  const auto expected = to_dense_matrix(PauliRegister("XI"), 2) +
                        to_dense_matrix(PauliRegister("ZZ", 0.5), 2);
  EXPECT_TRUE(to_dense_matrix(s, 2).isApprox(expected));
  EXPECT_TRUE(to_dense_matrix(PauliRegisterSequence(), 2).isZero());
}

TEST(DenseRepresentationTest, HermitianSpectrum) {
  // X + Z on qubit 0 has eigenvalues ±√2, each twice on two qubits
  const PauliRegisterSequence s(
      std::vector<PauliRegister>{PauliRegister("XI"), PauliRegister("ZI")});
  const auto eigenvalues = hermitian_spectrum(s, 2);
  ASSERT_EQ(eigenvalues.size(), 4);
  EXPECT_NEAR(eigenvalues(0), -std::sqrt(2.0), testing::eigenvalue_tolerance);
  EXPECT_NEAR(eigenvalues(1), -std::sqrt(2.0), testing::eigenvalue_tolerance);
  EXPECT_NEAR(eigenvalues(3), std::sqrt(2.0), testing::eigenvalue_tolerance);

  // The encoded number operator has eigenvalues 0 and 1
  const auto number =
      algorithms::jordan_wigner_terms(LadderOperatorUnit::Raise, 1, 3) *
      algorithms::jordan_wigner_terms(LadderOperatorUnit::Lower, 1, 3);
  const auto occupations = hermitian_spectrum(number, 3);
  EXPECT_NEAR(occupations(0), 0.0, testing::eigenvalue_tolerance);
  EXPECT_NEAR(occupations(3), 0.0, testing::eigenvalue_tolerance);
  EXPECT_NEAR(occupations(4), 1.0, testing::eigenvalue_tolerance);
  EXPECT_NEAR(occupations(7), 1.0, testing::eigenvalue_tolerance);
}

TEST(DenseRepresentationTest, SizeLimits) {
  EXPECT_THROW(to_dense_matrix(PauliRegister("XX"), 1), std::invalid_argument);
  EXPECT_THROW(to_dense_matrix(PauliRegisterSequence(), max_dense_qubits + 1),
               std::invalid_argument);
  EXPECT_THROW(hermitian_spectrum(PauliRegisterSequence(), 20),
               std::invalid_argument);
}
