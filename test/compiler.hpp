// Copyright (C) 2020 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef	COMPILER_HPP_
#define	COMPILER_HPP_

namespace omap {}
using namespace omap;

#ifdef __clang__
#pragma clang diagnostic ignored "-Wpadded"
#pragma clang diagnostic ignored "-Wunused-member-function"
#endif

#ifdef __GNUC__
#pragma GCC diagnostic ignored "-Wunused-result"
#endif

#if !defined(_MSC_VER) && __cplusplus < 201703L
#error C++17 compliant compiler required
#endif

#ifdef  OMAP_TESTING
#undef  NDEBUG
#ifndef DEBUG
#define DEBUG
#endif
#endif

#include <cassert>
#include <cstdint>
#endif
