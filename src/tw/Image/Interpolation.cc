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


#include <tw/Image/Interpolation.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace tw {

  InterpolationKernel interpolation_kernel_from_string( std::string const& name ) {
    std::string key = boost::to_lower_copy( boost::trim_copy(name) );
    if (key == "nearest")
      return NearestPixelKernel;
    if (key == "bilinear")
      return BilinearKernel;
    tw_throw( ArgumentErr() << "Unknown resampling kernel \"" << name
              << "\". Expected \"nearest\" or \"bilinear\"." );
  }

  std::string interpolation_kernel_name( InterpolationKernel kernel ) {
    switch (kernel) {
    case NearestPixelKernel: return "nearest";
    case BilinearKernel:     return "bilinear";
    }
    tw_throw( LogicErr() << "Unknown interpolation kernel " << int(kernel) );
  }

} // namespace tw
