/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_CONSTANTS_H
#define INCLUDED_TRIALBUF_CONSTANTS_H

#include <trialbuf/api.h>

namespace gr {
namespace trialbuf {

// bits per number (word, value, element) buffered on the device
constexpr unsigned WORD_BITS = 32;

// device modes, as returned by device::mode()
enum device_mode
{
  MODE_IDLE = 0,
  MODE_STANDBY = 1,
  MODE_PREVIEW = 2,
  MODE_RECORD = 3
};

// buffers only run, and can only be bound, from this mode upwards
constexpr int MODE_ACTIVE_MIN = MODE_PREVIEW;

// axis along which several values are packed into one buffered word.
// the numeric values are the codes reported by the CompDomain control.
enum compression_domain
{
  COMPRESSION_NONE = 0,
  COMPRESSION_CHANNELS = 1,
  COMPRESSION_TIME = 2
};

constexpr int COMPRESSION_CODE_COUNT = 3;

TRIALBUF_API const char* compression_name(compression_domain domain);

// controls a windowed buffer entity exposes
enum control
{
  CTL_BUFF_SIZE,       // capacity in buffered samples
  CTL_BUFF_SIZE_MC,    // capacity of the sample array, in elements
  CTL_CHAN_PER_SAMP,   // elements per buffered sample
  CTL_DOWN_SAMP,       // parent-clock samples per buffered sample
  CTL_RESP_WIN,        // response window, parent-clock samples
  CTL_START_BUFF,      // rising edge starts or resumes buffering
  CTL_MINDEX,
  CTL_SINDEX,
  CTL_MCINDEX,
  CTL_COUNTER,         // lifetime count of buffered samples
  CTL_EVENT_MIN,
  CTL_EVENT_SEC,
  CTL_MINUTES,
  CTL_SECONDS,
  CTL_MCSAMPLES,

  // compression extension, present as a set or not at all
  CTL_BITS_PER_VAL,
  CTL_SCALE_FACTOR,
  CTL_COMP_DOMAIN,

  CTL_COUNT
};

constexpr int CTL_REQUIRED_COUNT = CTL_BITS_PER_VAL;

TRIALBUF_API const char* control_name(control ctl);

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_CONSTANTS_H */
