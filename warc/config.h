/**
 * Copyright (c) 2012-2014, Stephen Blackheath and Anthony Jones
 * Released under a BSD3 licence.
 *
 * C++ implementation courtesy of International Telematics Ltd.
 */
#ifndef _WARC_CONFIG_H_
#define _WARC_CONFIG_H_

#include <cstddef>
#if defined(WARC_EXTRA_INCLUDE)
#include WARC_EXTRA_INCLUDE
#endif

// Weight handed to the first handle of a new cell, and withdrawn again (less
// one) whenever a handle runs down to a local weight of 1.
#ifndef WARC_INITIAL_WEIGHT
#define WARC_INITIAL_WEIGHT (std::size_t(1) << 16)
#endif

#if defined(WARC_NO_EXCEPTIONS)
#include <stdlib.h>
#else
#include <stdexcept>
#endif

#ifndef WARC_THROW
#define WARC_THROW(text)  throw std::overflow_error(text)
#endif

#endif
