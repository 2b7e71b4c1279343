/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <trialbuf/circular_reader.h>
#include <trialbuf/errors.h>

#include "simulated_device.h"

using namespace gr::trialbuf;

static void require_segment(const read_segment& s, uint64_t offset, uint64_t count)
{
  REQUIRE( s.offset == offset );
  REQUIRE( s.count == count );
}

TEST_CASE( "nothing buffered plans no reads", "[reader]" )
{
  REQUIRE( plan_reads(100, 0, 0).empty() );
}

TEST_CASE( "unwrapped store is read from the start", "[reader]" )
{
  std::vector<read_segment> plan = plan_reads(100, 37, 37);
  REQUIRE( plan.size() == 1 );
  require_segment(plan[0], 0, 37);
}

TEST_CASE( "a store filled exactly once has not wrapped", "[reader]" )
{
  std::vector<read_segment> plan = plan_reads(100, 100, 0);
  REQUIRE( plan.size() == 1 );
  require_segment(plan[0], 0, 0);

  plan = plan_reads(100, 101, 1);
  REQUIRE( plan.size() == 2 );
  require_segment(plan[0], 1, 99);
  require_segment(plan[1], 0, 1);
}

TEST_CASE( "wrapped store is read oldest first", "[reader]" )
{
  std::vector<read_segment> plan = plan_reads(100, 137, 37);
  REQUIRE( plan.size() == 2 );
  require_segment(plan[0], 37, 63);
  require_segment(plan[1], 0, 37);
  REQUIRE( plan[0].count + plan[1].count == 100 );

  SECTION( "several elements per sample" )
  {
    plan = plan_reads(100, 150, 40, 4);
    REQUIRE( plan.size() == 2 );
    require_segment(plan[0], 40, 360);
    require_segment(plan[1], 0, 40);
  }

  SECTION( "index at the start of the store" )
  {
    plan = plan_reads(100, 200, 0);
    REQUIRE( plan.size() == 2 );
    require_segment(plan[0], 0, 100);
    require_segment(plan[1], 0, 0);
  }
}

TEST_CASE( "write index outside the store is a protocol violation", "[reader]" )
{
  REQUIRE_THROWS_AS( plan_reads(100, 37, 100), remote_error );
  REQUIRE_THROWS_AS( plan_reads(100, 137, 400, 4), remote_error );
  REQUIRE_NOTHROW( plan_reads(100, 137, 399, 4) );
}

TEST_CASE( "reader returns device stores oldest first", "[reader]" )
{
  auto dev = std::make_shared<test::simulated_device>();
  test::entity_setup setup;
  setup.chan_per_samp = 2;
  setup.buff_size = 5;
  dev->add_entity("wb1", setup);
  dev->set_value("wb1", "StartBuff", 1);

  sample_matrix rows(7, 2);
  for (int r = 0; r < 7; ++ r) {
    rows(r, 0) = r;
    rows(r, 1) = 100 + r;
  }
  dev->buffer("wb1", rows);

  gr::logger_ptr logger = std::make_shared<gr::logger>("qa_circular_reader");
  circular_reader reader(dev, "wb1", logger);
  buffer_snapshot snap = reader.snapshot();
  REQUIRE( snap.counter == 7 );
  REQUIRE( snap.index[SUB_SECONDS] == 2 );
  REQUIRE( snap.index[SUB_SAMPLES] == 4 );
  REQUIRE( snap.wrapped(5) );

  dev->clear_reads();
  raw_values samples = reader.read(SUB_SAMPLES, snap, 5, 2);
  REQUIRE( samples == raw_values({ 2, 102, 3, 103, 4, 104, 5, 105, 6, 106 }) );
  REQUIRE( dev->reads().size() == 2 );
  REQUIRE( dev->reads()[0].offset == 4 );
  REQUIRE( dev->reads()[0].count == 6 );

  raw_values seconds = reader.read(SUB_SECONDS, snap, 5, 1);
  REQUIRE( seconds == raw_values({ 2, 3, 4, 5, 6 }) );

  SECTION( "zero-length segments are not requested" )
  {
    dev->buffer("wb1", rows.topRows(3));
    snap = reader.snapshot();
    REQUIRE( snap.index[SUB_MINUTES] == 0 );
    dev->clear_reads();
    raw_values minutes = reader.read(SUB_MINUTES, snap, 5, 1);
    REQUIRE( minutes.size() == 5 );
    REQUIRE( dev->reads().size() == 1 );
  }

  SECTION( "counts beyond 64-bit range are rejected" )
  {
    dev->set_parameter("wb1", "Counter", 1e20);
    REQUIRE_THROWS_AS( reader.snapshot(), remote_error );
    dev->set_parameter("wb1", "Counter", 9223372036854775808.0);
    REQUIRE_THROWS_AS( reader.snapshot(), remote_error );
  }

  SECTION( "device failures propagate" )
  {
    dev->set_failing(true);
    REQUIRE_THROWS_AS( reader.snapshot(), remote_error );
  }
}
