#pragma once

// Minimal shared header for the test runner.
//
// Individual tests use their own local SAI_ASSERT macro and return a failure
// count; test_main.cpp sums them.

#include <cmath>
#include <string>

inline bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }
