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


/// \file Tile.h
///
/// A single square RGBA tile of a pyramid and its address.
///
/// Tiles are addressed by (zoom, col, row) with rows counted up from
/// the south edge of the world, the TMS convention.  Pixel row 0 of a
/// tile image is its northern edge.
///
#ifndef __TW_MOSAIC_TILE_H__
#define __TW_MOSAIC_TILE_H__

#include <tw/Core/FundamentalTypes.h>
#include <tw/Image/ImageView.h>
#include <tw/Image/PixelTypes.h>

#include <ostream>

namespace tw {
namespace mosaic {

  struct TileIndex {
    int32 zoom, col, row;

    TileIndex() : zoom(0), col(0), row(0) {}
    TileIndex( int32 zoom, int32 col, int32 row ) : zoom(zoom), col(col), row(row) {}

    /// The tile one level up that contains this one.
    TileIndex parent() const {
      return TileIndex( zoom-1, col/2, row/2 );
    }

    /// One of the four tiles one level down.  dx picks the eastern
    /// half and dy the northern half.
    TileIndex child( int32 dx, int32 dy ) const {
      return TileIndex( zoom+1, 2*col + dx, 2*row + dy );
    }
  };

  // Ordered by zoom, then column, then row.
  inline bool operator<( TileIndex const& a, TileIndex const& b ) {
    if (a.zoom != b.zoom) return a.zoom < b.zoom;
    if (a.col != b.col) return a.col < b.col;
    return a.row < b.row;
  }

  inline bool operator==( TileIndex const& a, TileIndex const& b ) {
    return a.zoom == b.zoom && a.col == b.col && a.row == b.row;
  }

  inline bool operator!=( TileIndex const& a, TileIndex const& b ) {
    return !( a == b );
  }

  std::ostream& operator<<( std::ostream& os, TileIndex const& index );

  /// An immutable tile.  The pixels are held by reference count, so
  /// copying a Tile is cheap.
  class Tile {
    TileIndex m_index;
    ImageView<PixelRGBA8> m_pixels;

  public:
    Tile() {}
    Tile( TileIndex const& index, ImageView<PixelRGBA8> const& pixels )
      : m_index(index), m_pixels(pixels) {}

    TileIndex const& index() const { return m_index; }
    ImageView<PixelRGBA8> const& pixels() const { return m_pixels; }

    int32 size() const { return m_pixels.cols(); }
  };

  std::ostream& operator<<( std::ostream& os, Tile const& tile );

}} // namespace tw::mosaic

#endif // __TW_MOSAIC_TILE_H__
