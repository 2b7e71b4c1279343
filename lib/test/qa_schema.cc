/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <trialbuf/errors.h>
#include <trialbuf/schema.h>

#include "simulated_device.h"

#include <string>

using namespace gr::trialbuf;

static gr::logger_ptr logger = std::make_shared<gr::logger>("qa_schema");

static session_config bind_entity(test::simulated_device& dev, const std::string& entity = "wb1")
{
  return derive_config(dev, schema::resolve(dev, entity, logger));
}

TEST_CASE( "uncompressed entity", "[schema]" )
{
  test::simulated_device dev;
  test::entity_setup setup;
  setup.down_samp = 4;
  dev.add_entity("wb1", setup);

  session_config cfg = bind_entity(dev);
  REQUIRE( cfg.entity == "wb1" );
  REQUIRE( cfg.parent == "RZ2" );
  REQUIRE( cfg.parent_rate == 1000 );
  REQUIRE( cfg.buffer_rate == 250 );
  REQUIRE( cfg.seconds_per_minute == 60000 );
  REQUIRE( cfg.supports_compression );
  REQUIRE( cfg.domain == COMPRESSION_NONE );
  REQUIRE( cfg.comp_factor == 1 );
  REQUIRE( cfg.format.integer );
  REQUIRE( cfg.format.is_signed );
  REQUIRE( cfg.max_channels() == 4 );
  REQUIRE( cfg.chsubsel == 4 );
  REQUIRE( cfg.compressed_capacity == 100 );
  REQUIRE( cfg.buff_size_max == 1000 );
  REQUIRE( cfg.buffer_seconds == Approx(0.4) );
  REQUIRE( cfg.window.unbounded() );
}

TEST_CASE( "channel compression multiplies the channel count", "[schema]" )
{
  test::simulated_device dev;
  test::entity_setup setup;
  setup.chan_per_samp = 2;
  setup.domain = COMPRESSION_CHANNELS;
  setup.bits_per_val = 8;
  setup.is_signed = false;
  dev.add_entity("wb1", setup);

  session_config cfg = bind_entity(dev);
  REQUIRE( cfg.domain == COMPRESSION_CHANNELS );
  REQUIRE( cfg.bits_per_val == 8 );
  REQUIRE( cfg.comp_factor == 4 );
  REQUIRE( cfg.max_channels() == 8 );
  REQUIRE( cfg.compressed_capacity == 100 );
  REQUIRE_FALSE( cfg.format.is_signed );
}

TEST_CASE( "time compression derives capacity from the element count", "[schema]" )
{
  test::simulated_device dev;
  test::entity_setup setup;
  setup.chan_per_samp = 3;
  setup.domain = COMPRESSION_TIME;
  setup.bits_per_val = 16;
  dev.add_entity("wb1", setup);

  session_config cfg = bind_entity(dev);
  REQUIRE( cfg.comp_factor == 2 );
  REQUIRE( cfg.max_channels() == 3 );
  REQUIRE( cfg.buff_size == 100 );
  REQUIRE( cfg.buff_size_mc == 150 );
  REQUIRE( cfg.compressed_capacity == 50 );

  REQUIRE_THROWS_AS( apply_buffer_size(cfg, 100, 151), schema_error );
  REQUIRE( cfg.compressed_capacity == 50 );
}

TEST_CASE( "entity without compression controls", "[schema]" )
{
  test::simulated_device dev;
  test::entity_setup setup;
  setup.compression = false;
  setup.integer = false;
  dev.add_entity("wb1", setup);

  schema s = schema::resolve(dev, "wb1", logger);
  REQUIRE_FALSE( s.supports_compression() );
  REQUIRE_THROWS_AS( s.info(CTL_BITS_PER_VAL), schema_error );

  session_config cfg = derive_config(dev, s);
  REQUIRE_FALSE( cfg.supports_compression );
  REQUIRE( cfg.domain == COMPRESSION_NONE );
  REQUIRE( cfg.bits_per_val == 32 );
  REQUIRE( cfg.scale_factor == 1 );
  REQUIRE_FALSE( cfg.format.integer );
}

TEST_CASE( "binding needs an active device and a known entity", "[schema]" )
{
  test::simulated_device dev;
  dev.add_entity("wb1", test::entity_setup());

  dev.set_mode(MODE_STANDBY);
  REQUIRE_THROWS_AS( bind_entity(dev), binding_error );
  dev.set_mode(MODE_RECORD);
  REQUIRE_NOTHROW( bind_entity(dev) );
  REQUIRE_THROWS_AS( bind_entity(dev, "wb2"), binding_error );
}

TEST_CASE( "malformed schemas are rejected", "[schema]" )
{
  test::simulated_device dev;
  test::entity_setup setup;
  setup.domain = COMPRESSION_CHANNELS;
  setup.bits_per_val = 16;
  dev.add_entity("wb1", setup);

  SECTION( "missing required control" )
  {
    dev.remove_parameter("wb1", "Counter");
    REQUIRE_THROWS_WITH( bind_entity(dev), Catch::Contains("Counter") );
    REQUIRE_THROWS_AS( bind_entity(dev), schema_error );
  }

  SECTION( "partial compression controls" )
  {
    dev.remove_parameter("wb1", "ScaleFactor");
    REQUIRE_THROWS_AS( bind_entity(dev), schema_error );
  }

  SECTION( "unknown compression domain" )
  {
    dev.set_parameter("wb1", "CompDomain", 3);
    REQUIRE_THROWS_AS( bind_entity(dev), schema_error );
  }

  SECTION( "bits per value not dividing the word" )
  {
    dev.set_parameter("wb1", "BitsPerVal", 12);
    REQUIRE_THROWS_AS( bind_entity(dev), schema_error );
  }

  SECTION( "counts beyond 64-bit range" )
  {
    dev.set_parameter("wb1", "DownSamp", 1e20);
    REQUIRE_THROWS_AS( bind_entity(dev), schema_error );
  }

  SECTION( "compression over floating point storage" )
  {
    test::simulated_device floats;
    setup.integer = false;
    floats.add_entity("wb1", setup);
    REQUIRE_THROWS_AS( bind_entity(floats), schema_error );
  }
}

TEST_CASE( "controls have fixed names", "[schema]" )
{
  REQUIRE( std::string(control_name(CTL_MCSAMPLES)) == "MCsamples" );
  REQUIRE( std::string(control_name(CTL_BUFF_SIZE_MC)) == "BuffSizeMC" );
  REQUIRE( std::string(control_name(CTL_COMP_DOMAIN)) == "CompDomain" );
  REQUIRE( std::string(compression_name(COMPRESSION_TIME)) == "time" );
}
