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


/// \file TilePyramid.h
///
/// A sparse set of tiles over a range of zoom levels.  Only tiles that
/// hold data are present.
///
#ifndef __TW_MOSAIC_TILEPYRAMID_H__
#define __TW_MOSAIC_TILEPYRAMID_H__

#include <tw/Mosaic/Tile.h>

#include <map>
#include <ostream>
#include <vector>

namespace tw {
namespace mosaic {

  class TilePyramid {
  public:
    typedef std::map<TileIndex, Tile> map_type;
    typedef map_type::const_iterator const_iterator;

    /// Constructs an empty pyramid over [min_zoom, max_zoom].  Throws
    /// ArgumentErr for an invalid range or tile size.
    TilePyramid( int32 min_zoom, int32 max_zoom, int32 tile_size );

    int32 min_zoom() const { return m_min_zoom; }
    int32 max_zoom() const { return m_max_zoom; }
    int32 tile_size() const { return m_tile_size; }

    /// Adds a tile.  The tile must be square with the pyramid's tile
    /// size, lie in its zoom range, and not already be present.
    void insert( Tile const& tile );

    /// Returns the tile at the given index, or 0 if there is none.
    Tile const* find( TileIndex const& index ) const;

    bool contains( TileIndex const& index ) const { return m_tiles.count( index ) != 0; }

    /// The tiles at one zoom level, in index order.
    std::vector<Tile> tiles_at( int32 zoom ) const;

    size_t size() const { return m_tiles.size(); }
    bool empty() const { return m_tiles.empty(); }

    const_iterator begin() const { return m_tiles.begin(); }
    const_iterator end() const { return m_tiles.end(); }

  private:
    int32 m_min_zoom, m_max_zoom, m_tile_size;
    map_type m_tiles;
  };

  std::ostream& operator<<( std::ostream& os, TilePyramid const& pyramid );

}} // namespace tw::mosaic

#endif // __TW_MOSAIC_TILEPYRAMID_H__
