/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_WINDOW_BUFFER_IMPL_H
#define INCLUDED_TRIALBUF_WINDOW_BUFFER_IMPL_H

#include <trialbuf/circular_reader.h>
#include <trialbuf/window_buffer.h>

#include <gnuradio/logger.h>

namespace gr {
namespace trialbuf {

class window_buffer_impl : public window_buffer
{
private:
  device::sptr d_device;
  gr::logger_ptr d_logger;
  session_config d_config;
  circular_reader d_reader;
  acquisition d_last;

  void check_seconds(double seconds) const;
  void check_rate(double rate) const;
  int64_t read_control(control ctl);
  void write_control(control ctl, double value);
  bool check_consistency();

public:
  window_buffer_impl(device::sptr dev, const std::string& entity);
  ~window_buffer_impl() override;

  const session_config& config() const override { return d_config; }
  size_t max_channels() const override { return d_config.max_channels(); }

  void set_channel_subselection(size_t count) override;
  size_t channel_subselection() const override { return d_config.chsubsel; }

  clamp_report set_buffer_size(double seconds) override;
  clamp_report set_buffer_size(double seconds, double rate) override;
  double buffer_size() const override { return d_config.buffer_seconds; }

  clamp_report set_response_window(double seconds) override;
  clamp_report set_response_window(double seconds, double rate) override;
  double response_window() const override { return d_config.resp_win_seconds; }

  void set_time_window(const time_range& range) override;
  const time_range& time_window() const override { return d_config.window; }

  void start_buffering() override;

  const acquisition& getdata() override;
  const acquisition& last() const override { return d_last; }
};

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_WINDOW_BUFFER_IMPL_H */
