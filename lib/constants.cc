/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <trialbuf/constants.h>

#include <stdexcept>

namespace gr {
namespace trialbuf {

const char* compression_name(compression_domain domain)
{
  switch (domain) {
  case COMPRESSION_NONE: return "none";
  case COMPRESSION_CHANNELS: return "channels";
  case COMPRESSION_TIME: return "time";
  default: throw std::logic_error("invalid compression domain");
  }
}

const char* control_name(control ctl)
{
  static const char* names[CTL_COUNT] = {
    "BuffSize", "BuffSizeMC", "ChanPerSamp", "DownSamp", "RespWin",
    "StartBuff", "Mindex", "Sindex", "MCindex", "Counter", "EventMin",
    "EventSec", "Minutes", "Seconds", "MCsamples",
    "BitsPerVal", "ScaleFactor", "CompDomain"
  };
  if (ctl < 0 || ctl >= CTL_COUNT) {
    throw std::logic_error("invalid control");
  }
  return names[ctl];
}

} // namespace trialbuf
} // namespace gr
