/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <trialbuf/errors.h>
#include <trialbuf/timestamps.h>

#include <cmath>

namespace gr {
namespace trialbuf {

namespace {

int64_t stamp(double value)
{
  if (!std::isfinite(value)) {
    throw remote_error("time stamp is not finite");
  }
  return std::llround(value);
}

} // namespace

clock_plan clock_plan::from_config(const session_config& cfg)
{
  clock_plan plan;
  plan.seconds_per_minute = cfg.seconds_per_minute;
  plan.parent_rate = cfg.parent_rate;
  plan.down_samp = cfg.down_samp;
  plan.time_factor = cfg.domain == COMPRESSION_TIME ? cfg.comp_factor : 1;
  return plan;
}

clock_vector sample_clock(const raw_values& minutes,
                          const raw_values& seconds,
                          int64_t event_minute,
                          int64_t event_second,
                          const clock_plan& plan)
{
  if (minutes.size() != seconds.size()) {
    throw alignment_error("read " + std::to_string(minutes.size()) +
                          " minute stamps but " + std::to_string(seconds.size()) +
                          " second stamps");
  }

  int64_t spm = plan.seconds_per_minute;
  int64_t t0 = event_minute * spm + event_second;
  int64_t f = plan.time_factor;

  clock_vector clock(minutes.size() * f);
  for (size_t i = 0; i < minutes.size(); ++ i) {
    int64_t t = stamp(minutes[i]) * spm + stamp(seconds[i]) - t0;
    // the stamp belongs to the last of the f samples packed together
    for (int64_t k = 0; k < f; ++ k) {
      clock(i * f + k) = t - (f - 1 - k) * plan.down_samp;
    }
  }
  return clock;
}

time_vector reconstruct_times(const raw_values& minutes,
                              const raw_values& seconds,
                              int64_t event_minute,
                              int64_t event_second,
                              const clock_plan& plan)
{
  return sample_clock(minutes, seconds, event_minute, event_second, plan).cast<double>() /
         plan.parent_rate;
}

} // namespace trialbuf
} // namespace gr
