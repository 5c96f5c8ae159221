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


/// \file RasterImage.h
///
/// An 8-bit multi-band raster as decoded from disk, with the optional
/// palette of a single-band indexed image.
///
#ifndef __TW_IMAGE_RASTERIMAGE_H__
#define __TW_IMAGE_RASTERIMAGE_H__

#include <tw/Image/ImageView.h>
#include <tw/Image/PixelTypes.h>

#include <boost/optional.hpp>

#include <vector>
#include <ostream>

namespace tw {

  /// Maps palette indices to colors.  Indices past the end of the
  /// table have no color.
  class ColorTable {
    std::vector<PixelRGB8> m_entries;
  public:
    ColorTable() {}
    explicit ColorTable( std::vector<PixelRGB8> const& entries ) : m_entries(entries) {}

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    void push_back( PixelRGB8 const& entry ) { m_entries.push_back(entry); }

    /// True if the index has a table entry.
    bool contains( uint8 index ) const { return index < m_entries.size(); }

    /// The color of the given index; black when the index is not in the table.
    PixelRGB8 lookup( uint8 index ) const {
      return contains(index) ? m_entries[index] : PixelRGB8();
    }
  };

  /// A width x height raster with one ImageView plane per band.
  ///
  /// A RasterImage is immutable once constructed: it takes a private
  /// copy of the band data and only hands out read access.  Each stage
  /// that transforms a raster builds a new one.
  class RasterImage {
    ImageView<uint8> m_bands;
    boost::optional<ColorTable> m_color_table;

  public:
    /// Constructs an empty raster.
    RasterImage() {}

    /// Constructs a raster from planar band data.  A color table is
    /// only meaningful for single-band rasters; ArgumentErr otherwise.
    explicit RasterImage( ImageView<uint8> const& bands,
                          boost::optional<ColorTable> const& color_table = boost::none );

    int32 width() const { return m_bands.cols(); }
    int32 height() const { return m_bands.rows(); }
    int32 band_count() const { return m_bands.planes(); }

    /// Returns the sample of the given band at (col, row).
    uint8 operator()( int32 col, int32 row, int32 band=0 ) const { return m_bands(col, row, band); }

    ImageView<uint8> const& bands() const { return m_bands; }

    bool has_color_table() const { return m_color_table.is_initialized(); }
    ColorTable const& color_table() const;
  };

  std::ostream& operator<<( std::ostream& os, RasterImage const& raster );

} // namespace tw

#endif // __TW_IMAGE_RASTERIMAGE_H__
