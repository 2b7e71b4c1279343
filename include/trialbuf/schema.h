/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_SCHEMA_H
#define INCLUDED_TRIALBUF_SCHEMA_H

#include <trialbuf/api.h>
#include <trialbuf/constants.h>
#include <trialbuf/device.h>
#include <trialbuf/time_window.h>

#include <gnuradio/logger.h>

#include <array>
#include <bitset>
#include <cstdint>
#include <string>

namespace gr {
namespace trialbuf {

// how values of the sample array are stored on the device
struct sample_format
{
  bool integer = false;   // 32-bit words, else floating values
  bool is_signed = true;
};

/*!
 * \brief Controls of a windowed buffer entity, checked against the device.
 *
 * Resolution fails with binding_error when the entity is absent or the
 * device is not acquiring, and with schema_error when a required control is
 * missing or the compression controls are only partly present.
 */
class TRIALBUF_API schema
{
public:
  static schema
  resolve(device& dev, const std::string& entity, const gr::logger_ptr& logger);

  const std::string& entity() const { return d_entity; }
  const std::string& parent() const { return d_parent; }
  double parent_rate() const { return d_parent_rate; }

  bool has(control ctl) const { return d_present.test(ctl); }
  //! throws schema_error when \p ctl is absent
  const param_info& info(control ctl) const;

  bool supports_compression() const { return has(CTL_COMP_DOMAIN); }

private:
  schema() = default;

  std::string d_entity;
  std::string d_parent;
  double d_parent_rate = 0;
  std::array<param_info, CTL_COUNT> d_info;
  std::bitset<CTL_COUNT> d_present;
};

/*!
 * \brief Everything a session needs to read and decode one buffer entity.
 *
 * Built once by derive_config() and afterwards changed only through the
 * session's setters.
 */
struct session_config
{
  std::string entity;
  std::string parent;
  double parent_rate = 0;          // Hz
  double buffer_rate = 0;          // Hz, parent_rate / down_samp
  int64_t seconds_per_minute = 0;  // parent-clock samples per minute stamp

  size_t chan_per_samp = 1;
  int64_t down_samp = 1;

  bool supports_compression = false;
  compression_domain domain = COMPRESSION_NONE;
  unsigned bits_per_val = WORD_BITS;
  unsigned comp_factor = 1;
  double scale_factor = 1;
  sample_format format;

  size_t buff_size = 0;
  size_t buff_size_max = 0;
  size_t buff_size_mc = 0;
  size_t compressed_capacity = 0;  // stored samples the circular store holds
  double buffer_seconds = 0;

  int64_t resp_win = 0;            // parent-clock samples
  double resp_win_seconds = 0;

  size_t chsubsel = 0;
  time_range window;

  size_t max_channels() const;
  //! elements one stored sample occupies in the sample array
  size_t elements_per_sample() const { return chan_per_samp; }
};

/*!
 * \brief Read the entity's current control values and derive the session.
 *
 * The channel sub-selection starts at max_channels() and the time window
 * unbounded.
 */
TRIALBUF_API session_config derive_config(device& dev, const schema& s);

/*!
 * \brief Re-derive compressed_capacity and buffer_seconds from raw
 * BuffSize / BuffSizeMC values.
 */
TRIALBUF_API void
apply_buffer_size(session_config& cfg, size_t buff_size, size_t buff_size_mc);

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_SCHEMA_H */
