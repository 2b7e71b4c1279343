/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_WINDOW_BUFFER_H
#define INCLUDED_TRIALBUF_WINDOW_BUFFER_H

#include <trialbuf/api.h>
#include <trialbuf/device.h>
#include <trialbuf/schema.h>
#include <trialbuf/time_window.h>
#include <trialbuf/types.h>

#include <cstdint>
#include <memory>
#include <string>

namespace gr {
namespace trialbuf {

/*!
 * \brief Decoded contents of a windowed buffer.
 *
 * Row r of data was sampled at time(r) seconds after the trigger.
 */
struct acquisition
{
  time_vector time;
  sample_matrix data;

  size_t samples() const { return static_cast<size_t>(time.size()); }
};

/*!
 * \brief Outcome of a setter that round trips to the device.
 */
struct clamp_report
{
  double requested = 0;        // seconds asked for
  double applied = 0;          // seconds now in effect
  int64_t requested_count = 0; // samples written
  int64_t applied_count = 0;   // samples read back
  bool clamped = false;        // the device kept a different value
  bool consistent = true;      // the buffer still spans the response window
};

/*!
 * \brief Client of one windowed circular buffer on a remote device.
 *
 * The device buffers samples with minute/second stamps in three parallel
 * circular stores and stamps the trigger event.  getdata() retrieves the
 * stores, unpacks compressed samples, and returns them with times relative
 * to the trigger, cropped to the time window.
 *
 * Binding needs the device in preview or record mode.
 */
class TRIALBUF_API window_buffer
{
public:
  typedef std::shared_ptr<window_buffer> sptr;

  /*!
   * \param dev     handle to the remote device
   * \param entity  name of the buffer entity on \p dev
   */
  static sptr make(device::sptr dev, const std::string& entity);

  virtual ~window_buffer() = default;

  virtual const session_config& config() const = 0;
  virtual size_t max_channels() const = 0;

  /*!
   * \brief Keep channels 1 to \p count after decoding.
   */
  virtual void set_channel_subselection(size_t count) = 0;
  virtual size_t channel_subselection() const = 0;

  /*!
   * \brief Set the buffer duration in seconds at the buffering rate, or at
   * \p rate when given.  The device may clamp the value.
   */
  virtual clamp_report set_buffer_size(double seconds) = 0;
  virtual clamp_report set_buffer_size(double seconds, double rate) = 0;
  virtual double buffer_size() const = 0;

  /*!
   * \brief Set how long after the trigger the device keeps buffering.
   */
  virtual clamp_report set_response_window(double seconds) = 0;
  virtual clamp_report set_response_window(double seconds, double rate) = 0;
  virtual double response_window() const = 0;

  virtual void set_time_window(const time_range& range) = 0;
  virtual const time_range& time_window() const = 0;

  //! start or resume circular buffering
  virtual void start_buffering() = 0;

  /*!
   * \brief Read, decode and crop the buffers.
   *
   * Call once the trigger has been sent and the response window has
   * elapsed, otherwise the result may be incomplete.
   */
  virtual const acquisition& getdata() = 0;

  //! result of the latest getdata()
  virtual const acquisition& last() const = 0;
};

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_WINDOW_BUFFER_H */
