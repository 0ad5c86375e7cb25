// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <cmath>

#include "Eigen/Core"
#include "Eigen/Geometry"
#include "Eigen/SVD"
#include "logger.h"

namespace mvis { namespace math {

// Nearest rotation (in the Frobenius sense) to m. Camera rotations coming out of an
// optimizer drift slightly away from orthonormal.
inline Eigen::Matrix3d projectToRotation(const Eigen::Matrix3d& m)
{
  Eigen::JacobiSVD<Eigen::Matrix3d> svd(m, Eigen::ComputeFullU | Eigen::ComputeFullV);
  Eigen::Matrix3d d = Eigen::Matrix3d::Identity();
  d(2, 2) = (svd.matrixU() * svd.matrixV().transpose()).determinant() < 0 ? -1.0 : 1.0;
  return svd.matrixU() * d * svd.matrixV().transpose();
}

// Unit quaternion for a right-handed 3x3 rotation matrix, with w >= 0 so that equal
// rotations always produce equal coefficients.
inline Eigen::Quaterniond quaternionFromRotationMatrix(const Eigen::Matrix3d& rotation)
{
  XCHECK(rotation.allFinite()) << "rotation has non-finite entries:\n" << rotation;
  Eigen::Quaterniond q(projectToRotation(rotation));
  q.normalize();
  if (q.w() < 0) q.coeffs() *= -1.0;
  return q;
}

}}  // namespace mvis::math
