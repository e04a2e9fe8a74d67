// SPDX-License-Identifier: MIT
#pragma once

/// Umbrella header for the scalar root finders
///
/// Bracketing: bisection_find_root, regula_falsi_find_root, illinois_find_root
/// Open:       secant_find_root
/// Fixed point: fixed_point_solve, steffensen_solve

#include "src/math/bisection.hpp"
#include "src/math/fixed_point.hpp"
#include "src/math/illinois.hpp"
#include "src/math/iteration_record.hpp"
#include "src/math/regula_falsi.hpp"
#include "src/math/root_finding.hpp"
#include "src/math/secant.hpp"
#include "src/math/steffensen.hpp"
