/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <trialbuf/errors.h>
#include <trialbuf/time_window.h>

#include <cmath>

namespace gr {
namespace trialbuf {

bool time_range::unbounded() const
{
  return std::isinf(lo) && lo < 0 && std::isinf(hi) && hi > 0;
}

void validate_time_range(const time_range& range)
{
  if (std::isnan(range.lo) || std::isnan(range.hi) || !(range.lo < range.hi)) {
    throw validation_error("time window [" + std::to_string(range.lo) + ", " +
                           std::to_string(range.hi) +
                           "] must be non-NaN and increasing");
  }
}

void crop_to_range(time_vector& time, sample_matrix& data, const time_range& range)
{
  if (time.size() != data.rows()) {
    throw alignment_error("time-stamp to sample mismatch, " +
                          std::to_string(time.size()) + " stamps for " +
                          std::to_string(data.rows()) + " samples");
  }
  if (range.unbounded()) {
    return;
  }

  Eigen::Index kept = 0;
  for (Eigen::Index r = 0; r < time.size(); ++ r) {
    if (range.contains(time(r))) {
      if (kept != r) {
        time(kept) = time(r);
        data.row(kept) = data.row(r);
      }
      ++ kept;
    }
  }
  time.conservativeResize(kept);
  data.conservativeResize(kept, Eigen::NoChange);
}

} // namespace trialbuf
} // namespace gr
