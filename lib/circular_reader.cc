/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <trialbuf/circular_reader.h>
#include <trialbuf/errors.h>

#include <cmath>
#include <limits>

namespace gr {
namespace trialbuf {

std::vector<read_segment> plan_reads(uint64_t capacity,
                                     uint64_t counter,
                                     uint64_t index,
                                     uint64_t elements_per_sample)
{
  std::vector<read_segment> plan;
  if (counter == 0) {
    return plan;
  }

  uint64_t elements = capacity * elements_per_sample;
  if (index >= elements) {
    throw remote_error("write index " + std::to_string(index) +
                       " outside circular store of " + std::to_string(elements) +
                       " elements");
  }

  // once wrapped, the oldest data sits after the write index
  if (counter > capacity) {
    plan.push_back({index, elements - index});
  }
  plan.push_back({0, index});
  return plan;
}

circular_reader::circular_reader(device::sptr dev,
                                 const std::string& entity,
                                 gr::logger_ptr logger)
  : d_device(dev),
    d_entity(entity),
    d_logger(logger)
{
}

int64_t circular_reader::read_count(control ctl)
{
  double value = d_device->get_value(d_entity, control_name(ctl));
  if (!std::isfinite(value) || value < 0 || std::floor(value) != value ||
      value >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
    throw remote_error(d_entity + " " + control_name(ctl) +
                       " returned " + std::to_string(value));
  }
  return static_cast<int64_t>(value);
}

buffer_snapshot circular_reader::snapshot()
{
  buffer_snapshot snap;
  snap.index[SUB_MINUTES] = read_count(CTL_MINDEX);
  snap.index[SUB_SECONDS] = read_count(CTL_SINDEX);
  snap.index[SUB_SAMPLES] = read_count(CTL_MCINDEX);
  snap.counter = read_count(CTL_COUNTER);
  snap.event_minute = read_count(CTL_EVENT_MIN);
  snap.event_second = read_count(CTL_EVENT_SEC);
  return snap;
}

raw_values circular_reader::read(sub_buffer which,
                                 const buffer_snapshot& snap,
                                 uint64_t capacity,
                                 uint64_t elements_per_sample)
{
  static const control stores[SUB_COUNT] = { CTL_MINUTES, CTL_SECONDS, CTL_MCSAMPLES };
  const char* name = control_name(stores[which]);

  std::vector<read_segment> plan;
  try {
    plan = plan_reads(capacity, snap.counter, snap.index[which], elements_per_sample);
  } catch (const remote_error& e) {
    throw remote_error(d_entity + " " + name + ": " + e.what());
  }

  raw_values values;
  for (const read_segment& segment : plan) {
    if (segment.count == 0) {
      continue;
    }
    GR_LOG_DEBUG(d_logger,
                 "reading " + d_entity + " " + name + " [" +
                     std::to_string(segment.offset) + ", " +
                     std::to_string(segment.offset + segment.count) + ")");
    raw_values part = d_device->get_values(d_entity, name, segment.count, segment.offset);
    if (part.size() != segment.count) {
      throw remote_error(d_entity + " " + name + " returned " +
                         std::to_string(part.size()) + " of " +
                         std::to_string(segment.count) + " values");
    }
    values.insert(values.end(), part.begin(), part.end());
  }
  return values;
}

} // namespace trialbuf
} // namespace gr
