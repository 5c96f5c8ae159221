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


#include <tw/Math/LinearAlgebra.h>
#include <tw/Math/LapackExports.h>

#include <vector>

namespace tw {
namespace math {

  Matrix<double> solve( Matrix<double> const& A, Matrix<double> const& B ) {
    TW_ASSERT( A.rows() == A.cols(),
               ArgumentErr() << "solve: matrix must be square, got " << A.rows() << "x" << A.cols() );
    TW_ASSERT( B.rows() == A.rows(),
               ArgumentErr() << "solve: right-hand side has " << B.rows() << " rows, expected " << A.rows() );
    TW_ASSERT( A.rows() > 0, ArgumentErr() << "solve: empty system" );

    const f77_int n = f77_int(A.rows());
    const f77_int nrhs = f77_int(B.cols());

    // LAPACK wants column-major storage.
    std::vector<double> a( A.rows()*A.cols() );
    for (size_t i = 0; i < A.rows(); ++i)
      for (size_t j = 0; j < A.cols(); ++j)
        a[j*A.rows() + i] = A(i,j);

    std::vector<double> b( B.rows()*B.cols() );
    for (size_t i = 0; i < B.rows(); ++i)
      for (size_t j = 0; j < B.cols(); ++j)
        b[j*B.rows() + i] = B(i,j);

    std::vector<f77_int> ipiv( A.rows() );
    f77_int info = 0;
    gesv( n, nrhs, &a[0], n, &ipiv[0], &b[0], n, &info );

    if (info > 0)
      tw_throw( MathErr() << "solve: matrix is singular (zero pivot at " << info << ")" );

    Matrix<double> X( B.rows(), B.cols() );
    for (size_t i = 0; i < B.rows(); ++i)
      for (size_t j = 0; j < B.cols(); ++j)
        X(i,j) = b[j*B.rows() + i];
    return X;
  }

}} // namespace tw::math
