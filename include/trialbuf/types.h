/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_TYPES_H
#define INCLUDED_TRIALBUF_TYPES_H

#include <Eigen/Core>

#include <cstdint>
#include <vector>

namespace gr {
namespace trialbuf {

using scalar = double;

template <typename Type, int count = Eigen::Dynamic>
using heap_vectors = Eigen::Matrix<Type, Eigen::Dynamic, count>;
template <typename Type>
using heap_vector = heap_vectors<Type, 1>;

// rows are samples in chronological order, columns are channels
using sample_matrix = heap_vectors<scalar>;

// seconds relative to the trigger event
using time_vector = heap_vector<scalar>;

// parent-clock samples relative to the trigger event
using clock_vector = heap_vector<int64_t>;

// generic values as they travel over the parameter protocol
using raw_values = std::vector<double>;

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_TYPES_H */
