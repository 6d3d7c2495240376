// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "builtin/hamiltonian_encoder.hpp"

#include <encodings/algorithms/hamiltonian.hpp>
#include <encodings/config.hpp>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/utils/logger.hpp>
#include <encodings/utils/omp_utils.hpp>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

namespace encodings::algorithms {

namespace {

// One coefficient together with the ladder operators it multiplies
struct HamiltonianTerm {
  std::vector<std::pair<data::LadderOperatorUnit, std::uint64_t>> operators;
  Complex coefficient;
};

std::vector<HamiltonianTerm> collect_terms(
    const CoefficientFactory& coefficients, std::uint64_t n,
    double two_body_scale) {
  using data::LadderOperatorUnit;
  std::vector<HamiltonianTerm> terms;
  for (std::uint64_t i = 0; i < n; ++i) {
    for (std::uint64_t j = 0; j < n; ++j) {
      if (auto h = coefficients(one_body_key(i, j))) {
        terms.push_back(
            {{{LadderOperatorUnit::Raise, i}, {LadderOperatorUnit::Lower, j}},
             *h});
      }
    }
  }
  for (std::uint64_t i = 0; i < n; ++i) {
    for (std::uint64_t j = 0; j < n; ++j) {
      for (std::uint64_t k = 0; k < n; ++k) {
        for (std::uint64_t l = 0; l < n; ++l) {
          if (auto h = coefficients(two_body_key(i, j, k, l))) {
            terms.push_back({{{LadderOperatorUnit::Raise, i},
                              {LadderOperatorUnit::Raise, j},
                              {LadderOperatorUnit::Lower, k},
                              {LadderOperatorUnit::Lower, l}},
                             *h * two_body_scale});
          }
        }
      }
    }
  }
  return terms;
}

}  // namespace

std::string one_body_key(std::uint64_t i, std::uint64_t j) {
  return std::to_string(i) + std::to_string(j);
}

std::string two_body_key(std::uint64_t i, std::uint64_t j, std::uint64_t k,
                         std::uint64_t l) {
  return std::to_string(i) + std::to_string(j) + std::to_string(k) +
         std::to_string(l);
}

CoefficientFactory make_coefficient_factory(
    std::map<std::string, Complex> coefficients) {
  return [table = std::move(coefficients)](
             const std::string& key) -> std::optional<Complex> {
    auto it = table.find(key);
    if (it == table.end()) return std::nullopt;
    return it->second;
  };
}

data::PauliRegisterSequence compute_hamiltonian(
    const EncoderFn& encode, const CoefficientFactory& coefficients,
    std::uint64_t n, double two_body_scale) {
  ENCODINGS_LOG_TRACE_ENTERING();
  const auto terms = collect_terms(coefficients, n, two_body_scale);

  std::vector<data::PauliRegisterSequence> encoded(terms.size());
  const auto count = static_cast<std::int64_t>(terms.size());
  // Exceptions may not leave a parallel region; the first one is rethrown
  std::exception_ptr failure;
#ifdef ENCODINGS_ENABLE_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
  for (std::int64_t t = 0; t < count; ++t) {
    try {
      const auto& term = terms[t];
      auto product =
          data::PauliRegisterSequence(std::vector<data::PauliRegister>{
              data::PauliRegister(n, term.coefficient)});
      for (const auto& [op, index] : term.operators) {
        product = product * encode(op, index, n);
      }
      encoded[t] = std::move(product);
    } catch (...) {
#ifdef ENCODINGS_ENABLE_OPENMP
#pragma omp critical(encodings_hamiltonian_failure)
#endif
      {
        if (!failure) failure = std::current_exception();
      }
    }
  }
  if (failure) std::rethrow_exception(failure);

  auto result = data::PauliRegisterSequence(encoded);
  ENCODINGS_LOGGER().debug(
      "Encoded {} integral terms on {} modes into {} Pauli terms ({}, {} "
      "threads)",
      terms.size(), n, result.size(),
      utils::openmp_enabled() ? "OpenMP" : "serial", utils::max_threads());
  return result;
}

namespace builtin {

data::PauliRegisterSequence LadderHamiltonianEncoder::_run_impl(
    const CoefficientFactory& coefficients, std::uint64_t n) const {
  const auto encoding = _settings->get<std::string>("encoding");
  const auto threshold = _settings->get<double>("threshold");
  const auto scale = _settings->get<double>("two_body_scale");

  std::shared_ptr<const QubitMapper> mapper =
      QubitMapperFactory::create(encoding);
  auto result = compute_hamiltonian(QubitMapper::as_encoder(mapper),
                                    coefficients, n, scale);
  if (threshold > 0.0) {
    const auto before = result.size();
    result = result.prune_threshold(threshold);
    ENCODINGS_LOGGER().debug("Pruned {} terms below {}",
                             before - result.size(), threshold);
  }
  ENCODINGS_LOGGER().info("Encoded {}-mode Hamiltonian with {}: {} Pauli terms",
                          n, mapper->name(), result.size());
  return result;
}

}  // namespace builtin

std::unique_ptr<HamiltonianEncoder> make_ladder_hamiltonian_encoder() {
  return std::make_unique<builtin::LadderHamiltonianEncoder>();
}

void HamiltonianEncoderFactory::register_default_instances() {
  HamiltonianEncoderFactory::register_instance(
      &make_ladder_hamiltonian_encoder);
}

}  // namespace encodings::algorithms
