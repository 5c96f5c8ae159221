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


#include <tw/Mosaic/TileAddress.h>
#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Exception.h>

#include <sstream>

namespace tw {
namespace mosaic {

  bool tile_address_in_range( int32 zoom, int32 col, int32 row ) {
    if (zoom < 0 || zoom > cartography::web_mercator::MAX_ZOOM)
      return false;
    const int64 n = int64(1) << zoom;
    return col >= 0 && row >= 0 && col < n && row < n;
  }

  int32 flip_row( int32 zoom, int32 row ) {
    if (!tile_address_in_range( zoom, 0, row ))
      tw_throw( ArgumentErr() << "Tile row " << row << " is out of range at zoom " << zoom << "." );
    return int32( ((int64(1) << zoom) - 1) - row );
  }

  TileIndex index_from_xyz( int32 zoom, int32 col, int32 north_row ) {
    if (!tile_address_in_range( zoom, col, north_row ))
      tw_throw( ArgumentErr() << "Tile " << zoom << "/" << col << "/" << north_row
                << " is out of range." );
    return TileIndex( zoom, col, flip_row( zoom, north_row ) );
  }

  // TMS layout: level/x/y, with y counted from the south.
  std::string tile_path( TileIndex const& index, std::string const& extension ) {
    std::ostringstream path;
    path << index.zoom << "/" << index.col << "/" << index.row << extension;
    return path.str();
  }

}} // namespace tw::mosaic
