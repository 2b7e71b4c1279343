/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "window_buffer_impl.h"

#include <trialbuf/codec.h>
#include <trialbuf/errors.h>
#include <trialbuf/timestamps.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace gr {
namespace trialbuf {

window_buffer::sptr window_buffer::make(device::sptr dev, const std::string& entity)
{
  if (!dev) {
    throw binding_error("cannot bind " + entity + " without a device");
  }
  return std::make_shared<window_buffer_impl>(dev, entity);
}

window_buffer_impl::window_buffer_impl(device::sptr dev, const std::string& entity)
  : d_device(dev),
    d_logger(std::make_shared<gr::logger>("window_buffer " + entity)),
    d_config(derive_config(*dev, schema::resolve(*dev, entity, d_logger))),
    d_reader(dev, entity, d_logger)
{
  GR_LOG_INFO(d_logger,
              "bound to " + entity + " on " + d_config.parent + " at " +
                  std::to_string(d_config.parent_rate) + " Hz, " +
                  std::to_string(d_config.max_channels()) + " channels, compression " +
                  compression_name(d_config.domain) + ", " +
                  std::to_string(d_config.compressed_capacity) + " samples buffered");
}

window_buffer_impl::~window_buffer_impl()
{
}

void window_buffer_impl::check_seconds(double seconds) const
{
  if (!std::isfinite(seconds) || seconds < 0) {
    throw validation_error("seconds must be finite and >= 0, got " +
                           std::to_string(seconds));
  }
}

void window_buffer_impl::check_rate(double rate) const
{
  if (!std::isfinite(rate) || rate <= 0 || rate > d_config.parent_rate) {
    throw validation_error("rate must be in range (0," +
                           std::to_string(d_config.parent_rate) + "] Hz, got " +
                           std::to_string(rate));
  }
}

int64_t window_buffer_impl::read_control(control ctl)
{
  double value = d_device->get_value(d_config.entity, control_name(ctl));
  if (!std::isfinite(value) || value < 0 || std::floor(value) != value ||
      value >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
    throw remote_error(d_config.entity + " " + control_name(ctl) + " returned " +
                       std::to_string(value));
  }
  return static_cast<int64_t>(value);
}

void window_buffer_impl::write_control(control ctl, double value)
{
  d_device->set_value(d_config.entity, control_name(ctl), value);
}

bool window_buffer_impl::check_consistency()
{
  // one parent-clock sample of slack for rounding in either duration
  double slack = 1 / d_config.parent_rate;
  if (d_config.resp_win_seconds > d_config.buffer_seconds + slack) {
    GR_LOG_WARN(d_logger,
                d_config.entity + " response window of " +
                    std::to_string(d_config.resp_win_seconds) +
                    " s exceeds the buffer of " +
                    std::to_string(d_config.buffer_seconds) + " s");
    return false;
  }
  return true;
}

void window_buffer_impl::set_channel_subselection(size_t count)
{
  size_t max = max_channels();
  if (count < 1 || count > max) {
    throw range_error("channel sub-selection must be from range [1," +
                      std::to_string(max) + "], got " + std::to_string(count));
  }
  d_config.chsubsel = count;
}

clamp_report window_buffer_impl::set_buffer_size(double seconds)
{
  return set_buffer_size(seconds, d_config.buffer_rate);
}

clamp_report window_buffer_impl::set_buffer_size(double seconds, double rate)
{
  check_seconds(seconds);
  check_rate(rate);

  clamp_report report;
  report.requested = seconds;

  double n = std::ceil(seconds * rate);
  double max = static_cast<double>(d_config.buff_size_max);
  bool capped = n > max;
  if (capped) {
    n = max;
  }
  report.requested_count = static_cast<int64_t>(n);

  write_control(CTL_BUFF_SIZE, n);
  int64_t applied = read_control(CTL_BUFF_SIZE);
  int64_t applied_mc = read_control(CTL_BUFF_SIZE_MC);
  report.applied_count = applied;
  report.clamped = capped || applied != report.requested_count;

  if (capped) {
    GR_LOG_WARN(d_logger,
                d_config.entity + " BuffSize capped at its maximum of " +
                    std::to_string(d_config.buff_size_max));
  }
  if (applied != report.requested_count) {
    GR_LOG_WARN(d_logger,
                "failed to change " + d_config.entity + " BuffSize to " +
                    std::to_string(report.requested_count) + ", device kept " +
                    std::to_string(applied));
  }

  try {
    apply_buffer_size(d_config, applied, applied_mc);
  } catch (const schema_error& e) {
    // put the device back on the size the session still reads with
    GR_LOG_ERROR(d_logger,
                 std::string(e.what()) + ", restoring BuffSize " +
                     std::to_string(d_config.buff_size));
    double buffer_seconds = d_config.buffer_seconds;
    write_control(CTL_BUFF_SIZE, static_cast<double>(d_config.buff_size));
    apply_buffer_size(d_config, read_control(CTL_BUFF_SIZE), read_control(CTL_BUFF_SIZE_MC));
    d_config.buffer_seconds = buffer_seconds;
    throw;
  }
  d_config.buffer_seconds = applied / rate;
  report.applied = d_config.buffer_seconds;
  report.consistent = check_consistency();
  return report;
}

clamp_report window_buffer_impl::set_response_window(double seconds)
{
  return set_response_window(seconds, d_config.buffer_rate);
}

clamp_report window_buffer_impl::set_response_window(double seconds, double rate)
{
  check_seconds(seconds);
  check_rate(rate);

  clamp_report report;
  report.requested = seconds;

  // the longest window the buffer can hold at this rate
  double longest = d_config.buff_size_max / rate;
  bool capped = seconds > longest;
  double n = std::ceil(std::min(seconds, longest) * d_config.parent_rate);
  report.requested_count = static_cast<int64_t>(n);

  write_control(CTL_RESP_WIN, n);
  int64_t applied = read_control(CTL_RESP_WIN);
  report.applied_count = applied;
  report.clamped = capped || applied != report.requested_count;

  if (capped) {
    GR_LOG_WARN(d_logger,
                d_config.entity + " response window capped at " +
                    std::to_string(longest) + " s");
  }
  if (applied != report.requested_count) {
    GR_LOG_WARN(d_logger,
                "failed to change " + d_config.entity + " RespWin to " +
                    std::to_string(report.requested_count) + ", device kept " +
                    std::to_string(applied));
  }

  d_config.resp_win = applied;
  d_config.resp_win_seconds = applied / d_config.parent_rate;
  report.applied = d_config.resp_win_seconds;
  report.consistent = check_consistency();
  return report;
}

void window_buffer_impl::set_time_window(const time_range& range)
{
  validate_time_range(range);
  d_config.window = range;
}

void window_buffer_impl::start_buffering()
{
  write_control(CTL_START_BUFF, 1);
  write_control(CTL_START_BUFF, 0);
  GR_LOG_DEBUG(d_logger, "buffering started on " + d_config.entity);
}

const acquisition& window_buffer_impl::getdata()
{
  buffer_snapshot snap = d_reader.snapshot();
  uint64_t capacity = d_config.compressed_capacity;

  raw_values minutes = d_reader.read(SUB_MINUTES, snap, capacity, 1);
  raw_values seconds = d_reader.read(SUB_SECONDS, snap, capacity, 1);
  raw_values samples =
      d_reader.read(SUB_SAMPLES, snap, capacity, d_config.elements_per_sample());

  acquisition result;
  result.time = reconstruct_times(minutes,
                                  seconds,
                                  snap.event_minute,
                                  snap.event_second,
                                  clock_plan::from_config(d_config));
  result.data = decode_samples(samples, codec_plan::from_config(d_config));

  if (result.time.size() != result.data.rows()) {
    throw alignment_error(d_config.entity + " time-stamp to sample mismatch, " +
                          std::to_string(result.time.size()) + " stamps for " +
                          std::to_string(result.data.rows()) + " samples");
  }

  crop_to_range(result.time, result.data, d_config.window);

  GR_LOG_DEBUG(d_logger,
               "read " + std::to_string(snap.counter) + " buffered samples from " +
                   d_config.entity + (snap.wrapped(capacity) ? ", wrapped" : "") +
                   ", kept " + std::to_string(result.samples()));

  d_last = std::move(result);
  return d_last;
}

} // namespace trialbuf
} // namespace gr
