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


#ifndef __TW_MATH_LAPACK_EXPORTS_H__
#define __TW_MATH_LAPACK_EXPORTS_H__

#include <tw/Core/FundamentalTypes.h>

// There are two bloodlines of lapack.  One descends directly from the
// fortran libs and uses the fortran definition of integer, an int32.
// The other is f2c output and uses long.  The reference LAPACK,
// OpenBLAS and ATLAS builds found by FindLAPACK are all fortran-based;
// define TW_HAVE_PKG_CLAPACK when linking an f2c build instead.
namespace tw {
namespace math {

#if defined(TW_HAVE_PKG_CLAPACK) && TW_HAVE_PKG_CLAPACK==1
  typedef long  f77_int;
#else
  typedef int32 f77_int;
#endif

  /// Solve the general system A * X = B by LU decomposition with
  /// partial pivoting.  a is n x n and b is n x nrhs, both in
  /// column-major (fortran) order.  On return a holds the factors, b
  /// holds X and info is > 0 if A is exactly singular.
  void gesv(f77_int n, f77_int nrhs, double *a, f77_int lda, f77_int *ipiv,
            double *b, f77_int ldb, f77_int *info);

}} // namespace tw::math

#endif // __TW_MATH_LAPACK_EXPORTS_H__
