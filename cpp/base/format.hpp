#pragma once

/**
 * @file format.hpp
 * @brief Single include point for the `fmt` formatting library.
 */

#include <fmt/format.h>
#include <fmt/ranges.h>
