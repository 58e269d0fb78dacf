/*
 * Copyright (c) 2011-2019, The DART development contributors
 * All rights reserved.
 *
 * The list of contributors can be found at:
 *   https://github.com/dartsim/dart/blob/master/LICENSE
 *
 * This file is provided under the following "BSD-style" License:
 *   Redistribution and use in source and binary forms, with or
 *   without modification, are permitted provided that the following
 *   conditions are met:
 *   * Redistributions of source code must retain the above copyright
 *     notice, this list of conditions and the following disclaimer.
 *   * Redistributions in binary form must reproduce the above
 *     copyright notice, this list of conditions and the following
 *     disclaimer in the documentation and/or other materials provided
 *     with the distribution.
 *   THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND
 *   CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES,
 *   INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
 *   MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 *   DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 *   CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 *   SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 *   LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF
 *   USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED
 *   AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 *   LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN
 *   ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *   POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef GAITKIT_MATH_MATHTYPES_HPP_
#define GAITKIT_MATH_MATHTYPES_HPP_

#include <cmath>
#include <vector>

#include <Eigen/Dense>

typedef double s_t;
using std::abs;
using std::ceil;
using std::floor;
using std::isfinite;
using std::isnan;
using std::sqrt;

//------------------------------------------------------------------------------
// Types
//------------------------------------------------------------------------------
namespace Eigen {

typedef Matrix<s_t, Dynamic, Dynamic> MatrixXs;
typedef Matrix<s_t, Dynamic, 1> VectorXs;
typedef Matrix<s_t, 2, 1> Vector2s;
typedef Matrix<s_t, 3, 1> Vector3s;
typedef Matrix<s_t, 3, 3> Matrix3s;
typedef Matrix<s_t, 1, 3> RowVector3s;
typedef Matrix<s_t, 1, Dynamic> RowVectorXs;

} // namespace Eigen

namespace gaitkit {
namespace math {

/// Standard gravitational acceleration, m/s^2
constexpr s_t GRAVITY = 9.81;

} // namespace math
} // namespace gaitkit

#endif // GAITKIT_MATH_MATHTYPES_HPP_
