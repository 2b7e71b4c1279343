/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_CIRCULAR_READER_H
#define INCLUDED_TRIALBUF_CIRCULAR_READER_H

#include <trialbuf/api.h>
#include <trialbuf/constants.h>
#include <trialbuf/device.h>
#include <trialbuf/types.h>

#include <gnuradio/logger.h>

#include <cstdint>
#include <string>
#include <vector>

namespace gr {
namespace trialbuf {

// the three parallel circular stores of a windowed buffer
enum sub_buffer
{
  SUB_MINUTES,
  SUB_SECONDS,
  SUB_SAMPLES,
  SUB_COUNT
};

// contiguous run [offset, offset + count) of an array parameter
struct read_segment
{
  uint64_t offset;
  uint64_t count;
};

/*!
 * \brief Write positions of all sub-buffers, captured before any array read.
 */
struct buffer_snapshot
{
  uint64_t index[SUB_COUNT] = {0, 0, 0}; // elements, < capacity
  uint64_t counter = 0;                  // lifetime stored samples
  int64_t event_minute = 0;
  int64_t event_second = 0;

  bool wrapped(uint64_t capacity) const { return counter > capacity; }
};

/*!
 * \brief Plan the reads that return a circular store oldest element first.
 *
 * \p capacity is in stored samples and is compared against \p counter.
 * \p index is in elements; one sample occupies \p elements_per_sample
 * elements.  Zero-length segments are part of the plan.
 */
TRIALBUF_API std::vector<read_segment> plan_reads(uint64_t capacity,
                                                  uint64_t counter,
                                                  uint64_t index,
                                                  uint64_t elements_per_sample = 1);

/*!
 * \brief Reads the sub-buffers of one windowed buffer entity.
 */
class TRIALBUF_API circular_reader
{
public:
  circular_reader(device::sptr dev, const std::string& entity, gr::logger_ptr logger);

  //! read the index, counter and event stamp controls
  buffer_snapshot snapshot();

  /*!
   * \brief Fetch the live contents of \p which, oldest first.
   *
   * Throws remote_error if the snapshot's write index lies outside the
   * store.
   */
  raw_values read(sub_buffer which,
                  const buffer_snapshot& snap,
                  uint64_t capacity,
                  uint64_t elements_per_sample);

private:
  device::sptr d_device;
  std::string d_entity;
  gr::logger_ptr d_logger;

  int64_t read_count(control ctl);
};

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_CIRCULAR_READER_H */
