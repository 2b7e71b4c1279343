/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <trialbuf/codec.h>
#include <trialbuf/errors.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace gr {
namespace trialbuf {

namespace {

// rounded and saturated into a 32-bit word, as a numeric cast does
uint32_t to_word(double value, bool is_signed)
{
  double lo = is_signed ? std::numeric_limits<int32_t>::min() : 0;
  double hi = is_signed ? std::numeric_limits<int32_t>::max()
                        : std::numeric_limits<uint32_t>::max();
  double r = std::round(value);
  if (std::isnan(r)) {
    r = 0;
  }
  r = std::min(std::max(r, lo), hi);
  if (is_signed) {
    return static_cast<uint32_t>(static_cast<int32_t>(r));
  }
  return static_cast<uint32_t>(r);
}

double from_word(uint32_t word, bool is_signed)
{
  if (is_signed) {
    return static_cast<int32_t>(word);
  }
  return word;
}

// k-th field of width bits, least significant first
double sub_word(uint32_t word, unsigned k, unsigned bits, bool is_signed)
{
  uint64_t mask = (uint64_t(1) << bits) - 1;
  int64_t v = (uint64_t(word) >> (k * bits)) & mask;
  if (is_signed && ((v >> (bits - 1)) & 1)) {
    v -= int64_t(1) << bits;
  }
  return static_cast<double>(v);
}

int64_t quantize(double value, unsigned bits, bool is_signed)
{
  double r = std::round(value);
  double lo = is_signed ? -std::ldexp(1.0, bits - 1) : 0;
  double hi = is_signed ? std::ldexp(1.0, bits - 1) - 1 : std::ldexp(1.0, bits) - 1;
  if (!std::isfinite(r) || r < lo || r > hi) {
    throw validation_error("value " + std::to_string(value) + " does not fit " +
                           std::to_string(bits) + (is_signed ? " signed" : " unsigned") +
                           " bits");
  }
  return static_cast<int64_t>(r);
}

// position of field k of element w of stored sample s in the decoded matrix
void locate(const codec_plan& plan, size_t s, size_t w, unsigned k, size_t& row, size_t& col)
{
  if (plan.domain == COMPRESSION_TIME) {
    row = s * plan.comp_factor + k;
    col = w;
  } else {
    row = s;
    col = w * (plan.domain == COMPRESSION_CHANNELS ? plan.comp_factor : 1) + k;
  }
}

void check_plan(const codec_plan& plan)
{
  if (plan.chan_per_samp == 0) {
    throw validation_error("no elements per stored sample");
  }
  if (plan.domain != COMPRESSION_NONE && !plan.format.integer) {
    throw validation_error("compressed samples must be stored as integers");
  }
  if (plan.chsubsel < 1 || plan.chsubsel > plan.total_channels()) {
    throw range_error("channel sub-selection " + std::to_string(plan.chsubsel) +
                      " outside [1," + std::to_string(plan.total_channels()) + "]");
  }
}

} // namespace

codec_plan codec_plan::from_config(const session_config& cfg)
{
  codec_plan plan;
  plan.domain = cfg.domain;
  plan.chan_per_samp = cfg.chan_per_samp;
  plan.bits_per_val = cfg.bits_per_val;
  plan.comp_factor = cfg.domain == COMPRESSION_NONE ? 1 : cfg.comp_factor;
  plan.format = cfg.format;
  plan.chsubsel = cfg.chsubsel;
  plan.scale_factor = cfg.scale_factor;
  return plan;
}

size_t codec_plan::total_channels() const
{
  if (domain == COMPRESSION_CHANNELS) {
    return chan_per_samp * comp_factor;
  }
  return chan_per_samp;
}

size_t codec_plan::rows_per_sample() const
{
  return domain == COMPRESSION_TIME ? comp_factor : 1;
}

sample_matrix decode_samples(const raw_values& raw, const codec_plan& plan)
{
  check_plan(plan);
  size_t cps = plan.chan_per_samp;
  if (raw.size() % cps != 0) {
    throw alignment_error("sample array holds " + std::to_string(raw.size()) +
                          " values, not whole samples of " + std::to_string(cps));
  }

  size_t stored = raw.size() / cps;
  unsigned fields = plan.domain == COMPRESSION_NONE ? 1 : plan.comp_factor;
  sample_matrix out(stored * plan.rows_per_sample(), plan.chsubsel);

  for (size_t s = 0; s < stored; ++ s) {
    for (size_t w = 0; w < cps; ++ w) {
      double value = raw[s * cps + w];
      if (plan.domain == COMPRESSION_NONE) {
        if (w < plan.chsubsel) {
          out(s, w) = plan.format.integer
                          ? from_word(to_word(value, plan.format.is_signed),
                                      plan.format.is_signed)
                          : value;
        }
        continue;
      }

      uint32_t word = to_word(value, plan.format.is_signed);
      for (unsigned k = 0; k < fields; ++ k) {
        size_t row, col;
        locate(plan, s, w, k, row, col);
        if (col < plan.chsubsel) {
          out(row, col) = sub_word(word, k, plan.bits_per_val, plan.format.is_signed);
        }
      }
    }
  }

  if (plan.scale_factor != 1) {
    out /= plan.scale_factor;
  }
  return out;
}

raw_values encode_samples(const sample_matrix& samples, const codec_plan& plan)
{
  check_plan(plan);
  size_t channels = plan.total_channels();
  size_t columns = samples.cols();
  if (columns != channels && columns != plan.chsubsel) {
    throw validation_error("cannot encode " + std::to_string(columns) +
                           " channels, expected " + std::to_string(channels));
  }
  size_t rows_per_sample = plan.rows_per_sample();
  if (samples.rows() % rows_per_sample != 0) {
    throw validation_error("cannot encode " + std::to_string(samples.rows()) +
                           " rows in samples of " + std::to_string(rows_per_sample));
  }

  size_t cps = plan.chan_per_samp;
  size_t stored = samples.rows() / rows_per_sample;
  unsigned fields = plan.domain == COMPRESSION_NONE ? 1 : plan.comp_factor;
  unsigned bits = plan.domain == COMPRESSION_NONE ? WORD_BITS : plan.bits_per_val;
  uint64_t mask = (uint64_t(1) << bits) - 1;
  raw_values raw(stored * cps);

  for (size_t s = 0; s < stored; ++ s) {
    for (size_t w = 0; w < cps; ++ w) {
      if (!plan.format.integer) {
        raw[s * cps + w] = w < columns ? samples(s, w) * plan.scale_factor : 0;
        continue;
      }

      uint32_t word = 0;
      for (unsigned k = 0; k < fields; ++ k) {
        size_t row, col;
        locate(plan, s, w, k, row, col);
        double value = col < columns ? samples(row, col) * plan.scale_factor : 0;
        uint64_t field = quantize(value, bits, plan.format.is_signed);
        word |= static_cast<uint32_t>((field & mask) << (k * bits));
      }
      raw[s * cps + w] = from_word(word, plan.format.is_signed);
    }
  }
  return raw;
}

} // namespace trialbuf
} // namespace gr
