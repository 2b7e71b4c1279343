/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_TIMESTAMPS_H
#define INCLUDED_TRIALBUF_TIMESTAMPS_H

#include <trialbuf/api.h>
#include <trialbuf/schema.h>
#include <trialbuf/types.h>

namespace gr {
namespace trialbuf {

struct clock_plan
{
  int64_t seconds_per_minute = 1;
  double parent_rate = 1;
  int64_t down_samp = 1;
  // time samples packed per stored word, 1 unless compressing over time
  unsigned time_factor = 1;

  static clock_plan from_config(const session_config& cfg);
};

/*!
 * \brief Parent-clock sample of every decoded row, relative to the trigger.
 *
 * One entry per stored sample, or time_factor entries per stored sample in
 * chronological order when several time samples share a stored word.
 * Throws alignment_error if \p minutes and \p seconds differ in length.
 */
TRIALBUF_API clock_vector sample_clock(const raw_values& minutes,
                                       const raw_values& seconds,
                                       int64_t event_minute,
                                       int64_t event_second,
                                       const clock_plan& plan);

//! sample_clock() converted to seconds
TRIALBUF_API time_vector reconstruct_times(const raw_values& minutes,
                                           const raw_values& seconds,
                                           int64_t event_minute,
                                           int64_t event_second,
                                           const clock_plan& plan);

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_TIMESTAMPS_H */
