// __BEGIN_LICENSE__
//  Copyright (c) 2006-2013, United States Government as represented by the
//  Administrator of the National Aeronautics and Space Administration. All
//  rights reserved.
//
//  The NASA Vision Workbench is licensed under the Apache License,
//  Version 2.0 (the "License"); you may not use this file except in
//  compliance with the License. You may obtain a copy of the License at
//  http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.
// __END_LICENSE__


/// \file LinearAlgebra.h
///
/// Dense linear solvers built on LAPACK.
///
#ifndef __TW_MATH_LINEARALGEBRA_H__
#define __TW_MATH_LINEARALGEBRA_H__

#include <tw/Math/Matrix.h>

namespace tw {
namespace math {

  /// Solve the square system A * X = B for X, where B may carry
  /// several right-hand sides as columns.  Throws ArgumentErr when the
  /// dimensions disagree and MathErr when A is singular.
  Matrix<double> solve( Matrix<double> const& A, Matrix<double> const& B );

}} // namespace tw::math

#endif // __TW_MATH_LINEARALGEBRA_H__
