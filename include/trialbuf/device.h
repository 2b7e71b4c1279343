/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_DEVICE_H
#define INCLUDED_TRIALBUF_DEVICE_H

#include <trialbuf/api.h>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gr {
namespace trialbuf {

// declared value type of a device parameter
enum param_type
{
  PARAM_INT,
  PARAM_FLOAT,
  PARAM_LOGIC,
  PARAM_OTHER
};

struct param_info
{
  param_type type = PARAM_OTHER;
  double min = 0;
  double max = 0;
  size_t array_length = 0; // 0 for scalars

  bool is_array() const { return array_length != 0; }
};

/*!
 * \brief Parameter protocol of a remote acquisition device.
 *
 * Implemented by the caller on top of whatever RPC mechanism reaches the
 * hardware.  Transport failures should be thrown as gr::trialbuf::remote_error.
 * Every call is a synchronous request/response.
 */
class TRIALBUF_API device
{
public:
  typedef std::shared_ptr<device> sptr;

  virtual ~device() = default;

  virtual int mode() = 0;

  virtual std::vector<std::string> entity_names() = 0;
  virtual std::string entity_parent(const std::string& entity) = 0;

  //! sampling rate in Hz of each parent device, keyed by device name
  virtual std::map<std::string, double> sampling_rates() = 0;

  virtual std::vector<std::string> parameter_names(const std::string& entity) = 0;
  virtual param_info parameter_info(const std::string& entity,
                                    const std::string& name) = 0;

  virtual double get_value(const std::string& entity, const std::string& name) = 0;
  virtual void
  set_value(const std::string& entity, const std::string& name, double value) = 0;

  /*!
   * \brief Fetch \p count elements of an array parameter starting at \p offset.
   */
  virtual std::vector<double> get_values(const std::string& entity,
                                         const std::string& name,
                                         size_t count,
                                         size_t offset) = 0;
  virtual void set_values(const std::string& entity,
                          const std::string& name,
                          const std::vector<double>& values,
                          size_t offset) = 0;
};

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_DEVICE_H */
