// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <encodings/config.hpp>

#ifdef ENCODINGS_ENABLE_OPENMP
#include <omp.h>
#endif

namespace encodings::utils {

/**
 * @brief Number of threads an OpenMP parallel region would use.
 *
 * @returns omp_get_max_threads() when built with OpenMP, 1 otherwise
 */
inline int max_threads() {
#ifdef ENCODINGS_ENABLE_OPENMP
  return omp_get_max_threads();
#else
  return 1;
#endif
}

/**
 * @brief Whether the library was built with OpenMP support.
 */
inline constexpr bool openmp_enabled() {
#ifdef ENCODINGS_ENABLE_OPENMP
  return true;
#else
  return false;
#endif
}

}  // namespace encodings::utils
