/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_CODEC_H
#define INCLUDED_TRIALBUF_CODEC_H

#include <trialbuf/api.h>
#include <trialbuf/schema.h>
#include <trialbuf/types.h>

namespace gr {
namespace trialbuf {

/*!
 * \brief Layout of the sample array of one buffer entity.
 */
struct codec_plan
{
  compression_domain domain = COMPRESSION_NONE;
  size_t chan_per_samp = 1;
  unsigned bits_per_val = WORD_BITS;
  unsigned comp_factor = 1;
  sample_format format;
  size_t chsubsel = 1;
  double scale_factor = 1;

  static codec_plan from_config(const session_config& cfg);

  //! channels one stored sample expands to
  size_t total_channels() const;
  //! time samples one stored sample expands to
  size_t rows_per_sample() const;
};

/*!
 * \brief Decode raw values of the sample array into a samples x channels
 * matrix, cropped to the channel sub-selection and divided by the scale
 * factor.
 *
 * Throws alignment_error when \p raw does not hold whole stored samples.
 */
TRIALBUF_API sample_matrix decode_samples(const raw_values& raw, const codec_plan& plan);

/*!
 * \brief Pack a samples x channels matrix the way the device stores it.
 *
 * \p samples holds total_channels() columns, or chsubsel columns in which
 * case the remaining channels are stored as zero.  Values are multiplied by
 * the scale factor and rounded.  Throws validation_error if a value does not
 * fit the storage width, or if the row count is not a whole number of stored
 * samples.
 */
TRIALBUF_API raw_values encode_samples(const sample_matrix& samples, const codec_plan& plan);

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_CODEC_H */
