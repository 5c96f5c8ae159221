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


#include <tw/Mosaic/TilePyramid.h>
#include <tw/Mosaic/TileAddress.h>
#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Exception.h>

namespace tw {
namespace mosaic {

  TilePyramid::TilePyramid( int32 min_zoom, int32 max_zoom, int32 tile_size )
    : m_min_zoom(min_zoom), m_max_zoom(max_zoom), m_tile_size(tile_size) {
    TW_ASSERT( min_zoom >= 0 && min_zoom <= max_zoom && max_zoom <= cartography::web_mercator::MAX_ZOOM,
               ArgumentErr() << "Invalid zoom range [" << min_zoom << "," << max_zoom << "]." );
    TW_ASSERT( tile_size > 0, ArgumentErr() << "Invalid tile size " << tile_size << "." );
  }

  void TilePyramid::insert( Tile const& tile ) {
    TileIndex const& index = tile.index();
    TW_ASSERT( index.zoom >= m_min_zoom && index.zoom <= m_max_zoom,
               ArgumentErr() << index << " is outside the zoom range of the pyramid." );
    TW_ASSERT( tile_address_in_range( index.zoom, index.col, index.row ),
               ArgumentErr() << index << " is outside the world." );
    TW_ASSERT( tile.pixels().cols() == m_tile_size && tile.pixels().rows() == m_tile_size,
               ArgumentErr() << tile << " does not have the pyramid tile size " << m_tile_size << "." );
    bool inserted = m_tiles.insert( std::make_pair( index, tile ) ).second;
    TW_ASSERT( inserted, LogicErr() << index << " is already in the pyramid." );
  }

  Tile const* TilePyramid::find( TileIndex const& index ) const {
    const_iterator it = m_tiles.find( index );
    if (it == m_tiles.end())
      return 0;
    return &it->second;
  }

  std::vector<Tile> TilePyramid::tiles_at( int32 zoom ) const {
    std::vector<Tile> tiles;
    const_iterator it = m_tiles.lower_bound( TileIndex( zoom, 0, 0 ) );
    for ( ; it != m_tiles.end() && it->first.zoom == zoom; ++it)
      tiles.push_back( it->second );
    return tiles;
  }

  std::ostream& operator<<( std::ostream& os, TilePyramid const& pyramid ) {
    return os << "TilePyramid(" << pyramid.size() << " tiles, zoom " << pyramid.min_zoom()
              << "-" << pyramid.max_zoom() << ", " << pyramid.tile_size() << "px)";
  }

}} // namespace tw::mosaic
