#ifndef __SSP_TEST_HEADERS__
#define __SSP_TEST_HEADERS__

#include <catch2/catch_all.hpp>

#include "Headers.hpp"

#endif  // __SSP_TEST_HEADERS__
