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


#include <tw/Math/LapackExports.h>
#include <tw/Core/Exception.h>

  /// \cond INTERNAL
  extern "C" {
    void dgesv_(tw::math::f77_int *n,    tw::math::f77_int *nrhs, double *a,
                tw::math::f77_int *lda,  tw::math::f77_int *ipiv, double *b,
                tw::math::f77_int *ldb,  tw::math::f77_int *info);
  }
  /// \endcond

namespace tw {
namespace math {

  namespace detail {
    void _check_info(const f77_int *info, const char* func, const char* file, const int line) {
      if (*info < 0)
        tw::tw_throw( tw::ArgumentErr() << file << ":" << line << " LAPACK reported an error with argument " << -(*info) << " in " << func);
    }
  }

#define CHECK() tw::math::detail::_check_info(info, __func__, __FILE__, __LINE__)

  void gesv(f77_int n, f77_int nrhs, double *a, f77_int lda, f77_int *ipiv,
            double *b, f77_int ldb, f77_int *info) {
    dgesv_(&n, &nrhs, a, &lda, ipiv, b, &ldb, info);
    CHECK();
  }

#undef CHECK

}} // namespace tw::math
