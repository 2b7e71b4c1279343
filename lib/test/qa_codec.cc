/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <trialbuf/codec.h>
#include <trialbuf/errors.h>

using namespace gr::trialbuf;

static codec_plan packed(compression_domain domain,
                         size_t chan_per_samp,
                         unsigned bits,
                         bool is_signed = true)
{
  codec_plan plan;
  plan.domain = domain;
  plan.chan_per_samp = chan_per_samp;
  plan.bits_per_val = bits;
  plan.comp_factor = domain == COMPRESSION_NONE ? 1 : WORD_BITS / bits;
  plan.format.integer = true;
  plan.format.is_signed = is_signed;
  plan.chsubsel = plan.total_channels();
  return plan;
}

// deterministic values spanning the range of a field
static sample_matrix pattern(Eigen::Index rows, Eigen::Index cols, unsigned bits, bool is_signed)
{
  int64_t span = int64_t(1) << bits;
  int64_t lo = is_signed ? -span / 2 : 0;
  sample_matrix m(rows, cols);
  for (Eigen::Index r = 0; r < rows; ++ r) {
    for (Eigen::Index c = 0; c < cols; ++ c) {
      m(r, c) = lo + (r * 7919 + c * 104729) % span;
    }
  }
  return m;
}

TEST_CASE( "sub-words are unpacked least significant first", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_CHANNELS, 1, 8, false);
  sample_matrix m = decode_samples({ double(0x04030201) }, plan);
  REQUIRE( m.rows() == 1 );
  REQUIRE( m.cols() == 4 );
  REQUIRE( m(0, 0) == 1 );
  REQUIRE( m(0, 1) == 2 );
  REQUIRE( m(0, 2) == 3 );
  REQUIRE( m(0, 3) == 4 );
}

TEST_CASE( "signed sub-words are sign extended", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_CHANNELS, 1, 16, true);
  // 0xfffe8001 as a signed word
  sample_matrix m = decode_samples({ -98303.0 }, plan);
  REQUIRE( m(0, 0) == -32767 );
  REQUIRE( m(0, 1) == -2 );
}

TEST_CASE( "time compression packs consecutive samples of one channel", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_TIME, 2, 16, false);
  double a = 1, b = 2, c = 3, d = 4;
  raw_values raw = { b * 65536 + a, d * 65536 + c };
  sample_matrix m = decode_samples(raw, plan);
  REQUIRE( m.rows() == 2 );
  REQUIRE( m.cols() == 2 );
  REQUIRE( m(0, 0) == a );
  REQUIRE( m(0, 1) == c );
  REQUIRE( m(1, 0) == b );
  REQUIRE( m(1, 1) == d );
}

TEST_CASE( "encoded samples decode back to the same matrix", "[codec]" )
{
  SECTION( "channel domain" )
  {
    codec_plan plan = packed(COMPRESSION_CHANNELS, 2, 8, true);
    sample_matrix m = pattern(5, 8, 8, true);
    raw_values raw = encode_samples(m, plan);
    REQUIRE( raw.size() == 10 );
    REQUIRE( decode_samples(raw, plan) == m );
  }

  SECTION( "time domain" )
  {
    codec_plan plan = packed(COMPRESSION_TIME, 3, 8, false);
    sample_matrix m = pattern(12, 3, 8, false);
    raw_values raw = encode_samples(m, plan);
    REQUIRE( raw.size() == 9 );
    REQUIRE( decode_samples(raw, plan) == m );
  }

  SECTION( "no compression" )
  {
    codec_plan plan = packed(COMPRESSION_NONE, 4, 32, true);
    sample_matrix m = pattern(6, 4, 31, true);
    REQUIRE( decode_samples(encode_samples(m, plan), plan) == m );
  }

  SECTION( "floating point storage" )
  {
    codec_plan plan = packed(COMPRESSION_NONE, 3, 32, true);
    plan.format.integer = false;
    sample_matrix m = sample_matrix::Random(4, 3);
    REQUIRE( decode_samples(encode_samples(m, plan), plan) == m );
  }

  SECTION( "scaled values" )
  {
    codec_plan plan = packed(COMPRESSION_CHANNELS, 2, 16, true);
    plan.scale_factor = 100;
    sample_matrix m = sample_matrix::Random(7, 4) * 300;
    sample_matrix decoded = decode_samples(encode_samples(m, plan), plan);
    REQUIRE( (decoded - m).cwiseAbs().maxCoeff() <= 0.5 / plan.scale_factor + 1e-9 );
  }
}

TEST_CASE( "channel sub-selection keeps the leading channels", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_CHANNELS, 2, 8, true);
  sample_matrix m = pattern(4, 8, 8, true);
  raw_values raw = encode_samples(m, plan);

  plan.chsubsel = 3;
  sample_matrix cropped = decode_samples(raw, plan);
  REQUIRE( cropped.cols() == 3 );
  REQUIRE( cropped == m.leftCols(3) );

  plan.chsubsel = 9;
  REQUIRE_THROWS_AS( decode_samples(raw, plan), range_error );
}

TEST_CASE( "partial stored samples are misaligned", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_NONE, 4, 32, true);
  REQUIRE_THROWS_AS( decode_samples(raw_values(6, 0.0), plan), alignment_error );
  REQUIRE( decode_samples(raw_values(), plan).rows() == 0 );
}

TEST_CASE( "values outside the field width are rejected", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_CHANNELS, 1, 8, true);
  sample_matrix m = sample_matrix::Zero(1, 4);
  m(0, 2) = 128;
  REQUIRE_THROWS_AS( encode_samples(m, plan), validation_error );

  plan = packed(COMPRESSION_TIME, 1, 8, true);
  REQUIRE_THROWS_AS( encode_samples(sample_matrix::Zero(3, 1), plan), validation_error );
}

TEST_CASE( "integer words are rounded and saturated", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_NONE, 2, 32, true);
  sample_matrix m = decode_samples({ 5e9, -2.6 }, plan);
  REQUIRE( m(0, 0) == 2147483647.0 );
  REQUIRE( m(0, 1) == -3 );
}

TEST_CASE( "compression needs integer storage", "[codec]" )
{
  codec_plan plan = packed(COMPRESSION_CHANNELS, 1, 16, true);
  plan.format.integer = false;
  REQUIRE_THROWS_AS( decode_samples({ 1.0 }, plan), validation_error );
}
