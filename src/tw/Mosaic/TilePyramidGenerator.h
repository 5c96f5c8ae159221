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


/// \file TilePyramidGenerator.h
///
/// Cuts a georeferenced RGBA raster into a Web Mercator tile pyramid.
///
/// The deepest zoom level is rendered directly from the raster: every
/// tile pixel center is mapped into the raster and sampled with the
/// chosen kernel, the alpha band acting as the data mask.  Each
/// shallower level is then built from the level below it by pasting
/// the four children of a tile (a missing child is transparent) and
/// averaging every 2x2 block.  A tile whose pixels all have zero alpha
/// is left out, so the pyramid only covers the data.
///
/// Tiles of one level are rendered in parallel on a FifoWorkQueue, and
/// a level is finished before the next shallower one starts.  The
/// output does not depend on the number of threads.
///
#ifndef __TW_MOSAIC_TILEPYRAMIDGENERATOR_H__
#define __TW_MOSAIC_TILEPYRAMIDGENERATOR_H__

#include <tw/Core/ProgressCallback.h>
#include <tw/Image/Interpolation.h>
#include <tw/Image/RasterImage.h>
#include <tw/Math/BBox.h>
#include <tw/Mosaic/TilePyramid.h>

namespace tw {
namespace mosaic {

  class TilePyramidGenerator {
  public:
    /// rgba is a four-band raster and bbox its extent in Web Mercator
    /// meters.  The zoom range, tile size and kernel start out at the
    /// values in tw_settings().
    TilePyramidGenerator( RasterImage const& rgba, BBox2 const& bbox );

    /// Renders the pyramid.
    TilePyramid generate( ProgressCallback const& progress = ProgressCallback::dummy_instance() ) const;

    int32 get_min_zoom() const { return m_min_zoom; }
    int32 get_max_zoom() const { return m_max_zoom; }

    /// Throws ArgumentErr unless 0 <= min_zoom <= max_zoom <= 30.
    void set_zoom_range( int32 min_zoom, int32 max_zoom );

    int32 get_tile_size() const { return m_tile_size; }

    /// Throws ArgumentErr unless size is a positive power of two.
    void set_tile_size( int32 size );

    InterpolationKernel get_kernel() const { return m_kernel; }
    void set_kernel( InterpolationKernel kernel ) { m_kernel = kernel; }

    /// The tiles at the given zoom that the raster extent touches, as
    /// a box of [col, south_row] indices.
    BBox2i tile_range( int32 zoom ) const;

  private:
    RasterImage m_raster;
    BBox2 m_bbox;
    int32 m_min_zoom, m_max_zoom, m_tile_size;
    InterpolationKernel m_kernel;
  };

}} // namespace tw::mosaic

#endif // __TW_MOSAIC_TILEPYRAMIDGENERATOR_H__
