/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <trialbuf/errors.h>
#include <trialbuf/schema.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace gr {
namespace trialbuf {

namespace {

int64_t as_count(double value, const std::string& entity, control ctl)
{
  if (!std::isfinite(value) || value < 0 || std::floor(value) != value ||
      value >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
    throw schema_error(entity + " " + control_name(ctl) +
                       " is not a whole number: " + std::to_string(value));
  }
  return static_cast<int64_t>(value);
}

} // namespace

schema
schema::resolve(device& dev, const std::string& entity, const gr::logger_ptr& logger)
{
  int mode = dev.mode();
  if (mode < MODE_ACTIVE_MIN) {
    throw binding_error("cannot bind " + entity +
                        ", device is not in preview or record mode (mode " +
                        std::to_string(mode) + ")");
  }

  std::vector<std::string> entities = dev.entity_names();
  if (std::find(entities.begin(), entities.end(), entity) == entities.end()) {
    throw binding_error("no entity named " + entity + " on the device");
  }

  schema s;
  s.d_entity = entity;
  s.d_parent = dev.entity_parent(entity);

  std::map<std::string, double> rates = dev.sampling_rates();
  auto rate = rates.find(s.d_parent);
  if (rate == rates.end() || !std::isfinite(rate->second) || rate->second <= 0) {
    throw schema_error("no sampling rate for " + s.d_parent + ", parent of " + entity);
  }
  s.d_parent_rate = rate->second;

  std::vector<std::string> names = dev.parameter_names(entity);
  std::set<std::string> offered(names.begin(), names.end());
  for (int i = 0; i < CTL_COUNT; ++ i) {
    control ctl = static_cast<control>(i);
    if (offered.erase(control_name(ctl))) {
      s.d_info[ctl] = dev.parameter_info(entity, control_name(ctl));
      s.d_present.set(ctl);
    }
  }
  for (const std::string& name : offered) {
    GR_LOG_DEBUG(logger, "ignoring " + entity + " parameter " + name);
  }

  std::string missing;
  for (int i = 0; i < CTL_REQUIRED_COUNT; ++ i) {
    if (!s.d_present.test(i)) {
      missing += std::string(" ") + control_name(static_cast<control>(i));
    }
  }
  if (!missing.empty()) {
    throw schema_error(entity + " is missing parameters:" + missing);
  }

  int compression = 0;
  for (int i = CTL_REQUIRED_COUNT; i < CTL_COUNT; ++ i) {
    compression += s.d_present.test(i);
  }
  if (compression != 0 && compression != CTL_COUNT - CTL_REQUIRED_COUNT) {
    throw schema_error(entity + " has an incomplete set of compression parameters");
  }

  return s;
}

const param_info& schema::info(control ctl) const
{
  if (!has(ctl)) {
    throw schema_error(d_entity + " has no parameter " + control_name(ctl));
  }
  return d_info[ctl];
}

size_t session_config::max_channels() const
{
  if (domain == COMPRESSION_CHANNELS) {
    return chan_per_samp * comp_factor;
  }
  return chan_per_samp;
}

session_config derive_config(device& dev, const schema& s)
{
  const std::string& entity = s.entity();
  auto count = [&](control ctl) {
    return as_count(dev.get_value(entity, control_name(ctl)), entity, ctl);
  };

  session_config cfg;
  cfg.entity = entity;
  cfg.parent = s.parent();
  cfg.parent_rate = s.parent_rate();

  cfg.chan_per_samp = count(CTL_CHAN_PER_SAMP);
  cfg.down_samp = count(CTL_DOWN_SAMP);
  if (cfg.chan_per_samp == 0 || cfg.down_samp == 0) {
    throw schema_error(entity + " ChanPerSamp and DownSamp must be positive");
  }
  cfg.buffer_rate = cfg.parent_rate / cfg.down_samp;

  // the second stamp wraps into the minute stamp at its declared maximum
  cfg.seconds_per_minute = as_count(s.info(CTL_SECONDS).max, entity, CTL_SECONDS);
  if (cfg.seconds_per_minute == 0) {
    throw schema_error(entity + " Seconds has no range");
  }

  const param_info& samples = s.info(CTL_MCSAMPLES);
  cfg.format.integer = samples.type == PARAM_INT;
  cfg.format.is_signed = samples.min < 0;

  cfg.supports_compression = s.supports_compression();
  if (cfg.supports_compression) {
    int64_t code = count(CTL_COMP_DOMAIN);
    if (code >= COMPRESSION_CODE_COUNT) {
      throw schema_error("unknown compression type in " + entity + ", code " +
                         std::to_string(code));
    }
    cfg.domain = static_cast<compression_domain>(code);

    int64_t bits = count(CTL_BITS_PER_VAL);
    if (bits < 1 || bits > WORD_BITS || WORD_BITS % bits != 0) {
      throw schema_error(entity + " BitsPerVal " + std::to_string(bits) +
                         " does not divide a " + std::to_string(WORD_BITS) +
                         "-bit word");
    }
    cfg.bits_per_val = static_cast<unsigned>(bits);

    cfg.scale_factor = dev.get_value(entity, control_name(CTL_SCALE_FACTOR));
    if (!std::isfinite(cfg.scale_factor) || cfg.scale_factor == 0) {
      throw schema_error(entity + " ScaleFactor is not usable: " +
                         std::to_string(cfg.scale_factor));
    }
  }

  if (cfg.domain != COMPRESSION_NONE) {
    if (!cfg.format.integer) {
      throw schema_error(entity + " compresses samples that are not stored as integers");
    }
    cfg.comp_factor = WORD_BITS / cfg.bits_per_val;
  }

  cfg.buff_size_max = as_count(s.info(CTL_BUFF_SIZE).max, entity, CTL_BUFF_SIZE);
  apply_buffer_size(cfg, count(CTL_BUFF_SIZE), count(CTL_BUFF_SIZE_MC));

  cfg.resp_win = count(CTL_RESP_WIN);
  cfg.resp_win_seconds = cfg.resp_win / cfg.parent_rate;

  cfg.chsubsel = cfg.max_channels();
  return cfg;
}

void apply_buffer_size(session_config& cfg, size_t buff_size, size_t buff_size_mc)
{
  size_t capacity = buff_size;
  if (cfg.domain == COMPRESSION_TIME) {
    // several time samples share each element; only the element count is exact
    if (buff_size_mc % cfg.chan_per_samp != 0) {
      throw schema_error(cfg.entity + " BuffSizeMC " + std::to_string(buff_size_mc) +
                         " is not a multiple of ChanPerSamp " +
                         std::to_string(cfg.chan_per_samp));
    }
    capacity = buff_size_mc / cfg.chan_per_samp;
  }

  cfg.buff_size = buff_size;
  cfg.buff_size_mc = buff_size_mc;
  cfg.compressed_capacity = capacity;
  cfg.buffer_seconds = buff_size / cfg.buffer_rate;
}

} // namespace trialbuf
} // namespace gr
