/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_ERRORS_H
#define INCLUDED_TRIALBUF_ERRORS_H

#include <trialbuf/api.h>

#include <stdexcept>
#include <string>

namespace gr {
namespace trialbuf {

/*!
 * \brief The buffer entity is absent, or the device is not in an active mode.
 */
class TRIALBUF_API binding_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/*!
 * \brief The entity does not expose the controls a windowed buffer needs,
 * or reports values no decoder exists for.
 */
class TRIALBUF_API schema_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/*!
 * \brief A malformed argument.  Nothing was changed.
 */
class TRIALBUF_API validation_error : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/*!
 * \brief An argument outside its permitted interval.  Nothing was changed.
 */
class TRIALBUF_API range_error : public validation_error
{
public:
  using validation_error::validation_error;
};

/*!
 * \brief Decoded samples and decoded time stamps disagree.
 */
class TRIALBUF_API alignment_error : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/*!
 * \brief A parameter round trip with the device failed, or the device
 * answered with something the protocol does not allow.
 */
class TRIALBUF_API remote_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

} // namespace trialbuf
} // namespace gr

#endif /* INCLUDED_TRIALBUF_ERRORS_H */
