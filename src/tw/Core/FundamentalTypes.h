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


/// \file Core/FundamentalTypes.h
///
/// Fixed-width integer and floating point typedefs used throughout
/// TileWarp.
///
#ifndef __TW_CORE_FUNDAMENTALTYPES_H__
#define __TW_CORE_FUNDAMENTALTYPES_H__

#include <boost/cstdint.hpp>

namespace tw {

  // Integer typedefs
  typedef boost::int8_t  int8;
  typedef boost::int16_t int16;
  typedef boost::int32_t int32;
  typedef boost::int64_t int64;

  // Unsigned integer typedefs
  typedef boost::uint8_t  uint8;
  typedef boost::uint16_t uint16;
  typedef boost::uint32_t uint32;
  typedef boost::uint64_t uint64;

  // Floating point typedefs
  typedef float float32;
  typedef double float64;

} // namespace tw

#endif // __TW_CORE_FUNDAMENTALTYPES_H__
