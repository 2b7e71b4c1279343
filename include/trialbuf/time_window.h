/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_TIME_WINDOW_H
#define INCLUDED_TRIALBUF_TIME_WINDOW_H

#include <trialbuf/api.h>
#include <trialbuf/types.h>

#include <limits>

namespace gr {
namespace trialbuf {

/*!
 * \brief Closed interval [lo, hi] of seconds relative to the trigger.
 *
 * Either bound may be infinite.
 */
struct time_range
{
  double lo = -std::numeric_limits<double>::infinity();
  double hi = std::numeric_limits<double>::infinity();

  bool contains(double t) const { return t >= lo && t <= hi; }
  bool unbounded() const;
};

//! throws validation_error unless lo < hi and neither bound is NaN
TRIALBUF_API void validate_time_range(const time_range& range);

/*!
 * \brief Drop every row whose time stamp lies strictly outside \p range.
 *
 * \p time and \p data must have the same number of rows, otherwise
 * alignment_error is thrown and neither is modified.
 */
TRIALBUF_API void crop_to_range(time_vector& time, sample_matrix& data, const time_range& range);

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_TIME_WINDOW_H */
