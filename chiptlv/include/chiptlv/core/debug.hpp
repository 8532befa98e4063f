/*
 * File: debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */


#pragma once

#ifndef CHIPTLV_ASSERT
#include <cassert>
#define CHIPTLV_ASSERT(cond, msg) do { static_cast<void>(msg); assert(cond); } while(0)
#endif

#ifdef ENABLE_PRIVATE_TESTS
#define PRIVATE_TESTABLE public
#else
#define PRIVATE_TESTABLE private
#endif
