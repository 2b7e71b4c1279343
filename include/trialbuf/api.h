/* -*- c++ -*- */
/*
 * Copyright 2021 Free Software Foundation, Inc..
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef INCLUDED_TRIALBUF_API_H
#define INCLUDED_TRIALBUF_API_H

#include <gnuradio/attributes.h>

#ifdef trialbuf_EXPORTS
#define TRIALBUF_API __GR_ATTR_EXPORT
#else
#define TRIALBUF_API __GR_ATTR_IMPORT
#endif

#endif /* INCLUDED_TRIALBUF_API_H */
