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


/// \file TileAddress.h
///
/// Conversions between the two tile row conventions.  Clients address
/// tiles north-up (XYZ, row 0 is the northernmost row) and the stored
/// pyramid is south-up (TMS, row 0 is the southernmost row).  At zoom
/// z the two are related by row' = (2^z - 1) - row in either
/// direction.
///
#ifndef __TW_MOSAIC_TILEADDRESS_H__
#define __TW_MOSAIC_TILEADDRESS_H__

#include <tw/Mosaic/Tile.h>

#include <string>

namespace tw {
namespace mosaic {

  /// True if zoom is in [0,30] and col and row are in [0, 2^zoom).
  bool tile_address_in_range( int32 zoom, int32 col, int32 row );

  /// Converts a row between the north-up and south-up conventions.
  /// Throws ArgumentErr if the zoom or row is out of range.
  int32 flip_row( int32 zoom, int32 row );

  /// The stored index of a tile addressed north-up.
  TileIndex index_from_xyz( int32 zoom, int32 col, int32 north_row );

  /// Relative path of a stored tile, "zoom/col/row.png".
  std::string tile_path( TileIndex const& index, std::string const& extension = ".png" );

}} // namespace tw::mosaic

#endif // __TW_MOSAIC_TILEADDRESS_H__
