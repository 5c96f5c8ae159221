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


#include <tw/Mosaic/TilePyramidGenerator.h>
#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/Core/Settings.h>
#include <tw/Core/System.h>
#include <tw/Core/ThreadPool.h>
#include <tw/Image/Manipulation.h>

#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>

#include <set>
#include <vector>

namespace tw {
namespace mosaic {

  namespace wm = cartography::web_mercator;

  namespace {

    // The share of the progress bar spent on the deepest level.  The
    // shallower levels together take the rest.
    const double RENDER_SHARE = 0.75;

    class TileTask : public Task {
    protected:
      TileIndex m_index;
      boost::optional<Tile> m_result;
      ProgressCallback const& m_progress;
      double m_progress_share;

      void finish( ImageView<PixelRGBA8> const& pixels ) {
        if (!is_transparent( pixels ))
          m_result = Tile( m_index, pixels );
        m_progress.report_incremental_progress( m_progress_share );
      }

    public:
      TileTask( TileIndex const& index, ProgressCallback const& progress, double share )
        : m_index(index), m_progress(progress), m_progress_share(share) {}

      /// The tile, unless it came out transparent.
      boost::optional<Tile> const& result() const { return m_result; }
    };

    // Samples the raster at the center of every pixel of one tile.
    class RenderTileTask : public TileTask {
      ImageView<uint8> m_bands;
      BBox2 m_bbox;
      Vector2 m_pixel_size;
      int32 m_tile_size;
      InterpolationKernel m_kernel;

    public:
      RenderTileTask( TileIndex const& index, RasterImage const& raster, BBox2 const& bbox,
                      int32 tile_size, InterpolationKernel kernel,
                      ProgressCallback const& progress, double share )
        : TileTask(index, progress, share), m_bands(raster.bands()), m_bbox(bbox),
          m_pixel_size( bbox.width() / raster.width(), bbox.height() / raster.height() ),
          m_tile_size(tile_size), m_kernel(kernel) {}

      virtual void operator()() {
        BBox2 footprint = wm::tile_bbox( m_index.zoom, m_index.col, m_index.row );
        const double res = footprint.width() / m_tile_size;
        PlaneValid valid( m_bands, 3 );

        ImageView<PixelRGBA8> pixels( m_tile_size, m_tile_size );
        uint8 px[4];
        for (int32 j = 0; j < m_tile_size; ++j) {
          double y = footprint.max()[1] - (j + 0.5) * res;
          double v = (m_bbox.max()[1] - y) / m_pixel_size[1];
          for (int32 i = 0; i < m_tile_size; ++i) {
            double x = footprint.min()[0] + (i + 0.5) * res;
            double u = (x - m_bbox.min()[0]) / m_pixel_size[0];
            if (sample_pixel( m_bands, u, v, m_kernel, valid, px ))
              pixels(i, j) = PixelRGBA8( px[0], px[1], px[2], px[3] );
          }
        }
        finish( pixels );
      }
    };

    // Builds a tile from its four children one level down.
    class DownsampleTileTask : public TileTask {
      TilePyramid const& m_pyramid;

    public:
      DownsampleTileTask( TileIndex const& index, TilePyramid const& pyramid,
                          ProgressCallback const& progress, double share )
        : TileTask(index, progress, share), m_pyramid(pyramid) {}

      virtual void operator()() {
        const int32 size = m_pyramid.tile_size();
        ImageView<PixelRGBA8> canvas( 2*size, 2*size );
        for (int32 dy = 0; dy < 2; ++dy)
          for (int32 dx = 0; dx < 2; ++dx) {
            Tile const* child = m_pyramid.find( m_index.child( dx, dy ) );
            // The northern children go on top.
            if (child)
              paste( canvas, child->pixels(), dx*size, (1-dy)*size );
          }
        finish( box_subsample_2x2( canvas ) );
      }
    };

    // Runs one level's tasks to completion and adds the resulting
    // tiles in index order.
    size_t run_level( std::vector<boost::shared_ptr<TileTask> > const& tasks, TilePyramid& pyramid ) {
      {
        FifoWorkQueue queue;
        for (size_t i = 0; i < tasks.size(); ++i)
          queue.add_task( tasks[i] );
        queue.join_all();
      }
      size_t count = 0;
      for (size_t i = 0; i < tasks.size(); ++i) {
        tasks[i]->rethrow_if_failed();
        if (tasks[i]->result()) {
          pyramid.insert( *tasks[i]->result() );
          ++count;
        }
      }
      return count;
    }

  } // anonymous namespace

  TilePyramidGenerator::TilePyramidGenerator( RasterImage const& rgba, BBox2 const& bbox )
    : m_raster(rgba), m_bbox(bbox), m_min_zoom(0), m_max_zoom(0), m_tile_size(0),
      m_kernel( interpolation_kernel_from_string( tw_settings().resample_kernel() ) ) {
    TW_ASSERT( rgba.band_count() == 4,
               ArgumentErr() << "Tiles are cut from four-band rasters, not " << rgba << "." );
    TW_ASSERT( rgba.width() > 0 && rgba.height() > 0 && !bbox.empty(),
               ArgumentErr() << "Cannot tile an empty raster over " << bbox << "." );
    set_zoom_range( tw_settings().min_zoom(), tw_settings().max_zoom() );
    set_tile_size( tw_settings().tile_size() );
  }

  void TilePyramidGenerator::set_zoom_range( int32 min_zoom, int32 max_zoom ) {
    TW_ASSERT( min_zoom >= 0 && min_zoom <= max_zoom && max_zoom <= wm::MAX_ZOOM,
               ArgumentErr() << "Invalid zoom range [" << min_zoom << "," << max_zoom << "]." );
    m_min_zoom = min_zoom;
    m_max_zoom = max_zoom;
  }

  void TilePyramidGenerator::set_tile_size( int32 size ) {
    TW_ASSERT( size > 0 && (size & (size-1)) == 0,
               ArgumentErr() << "Tile size must be a power of two, not " << size << "." );
    m_tile_size = size;
  }

  BBox2i TilePyramidGenerator::tile_range( int32 zoom ) const {
    return wm::tiles_touching( m_bbox, zoom );
  }

  TilePyramid TilePyramidGenerator::generate( ProgressCallback const& progress ) const {
    TilePyramid pyramid( m_min_zoom, m_max_zoom, m_tile_size );
    progress.report_progress( 0 );

    BBox2i range = tile_range( m_max_zoom );
    TW_OUT(DebugMessage, "mosaic") << "Rendering zoom " << m_max_zoom << " tiles " << range
                                   << " from " << m_raster << "\n";
    {
      SubProgressCallback sub( progress, 0, m_min_zoom == m_max_zoom ? 1.0 : RENDER_SHARE );
      std::vector<boost::shared_ptr<TileTask> > tasks;
      const double tile_count = double(range.width()) * range.height();
      for (int32 col = range.min()[0]; col < range.max()[0]; ++col)
        for (int32 row = range.min()[1]; row < range.max()[1]; ++row)
          tasks.push_back( boost::shared_ptr<TileTask>(
            new RenderTileTask( TileIndex(m_max_zoom, col, row), m_raster, m_bbox,
                                m_tile_size, m_kernel, sub, 1.0 / tile_count ) ) );
      size_t count = run_level( tasks, pyramid );
      TW_OUT(InfoMessage, "mosaic") << "Zoom " << m_max_zoom << ": " << count << " of "
                                    << tasks.size() << " tiles hold data.\n";
    }

    const int32 levels = m_max_zoom - m_min_zoom;
    for (int32 zoom = m_max_zoom - 1; zoom >= m_min_zoom; --zoom) {
      const int32 step = m_max_zoom - 1 - zoom;
      SubProgressCallback sub( progress, RENDER_SHARE + (1 - RENDER_SHARE) * step / levels,
                               RENDER_SHARE + (1 - RENDER_SHARE) * (step + 1) / levels );

      std::set<TileIndex> parents;
      std::vector<Tile> children = pyramid.tiles_at( zoom + 1 );
      for (size_t i = 0; i < children.size(); ++i)
        parents.insert( children[i].index().parent() );

      std::vector<boost::shared_ptr<TileTask> > tasks;
      for (std::set<TileIndex>::const_iterator it = parents.begin(); it != parents.end(); ++it)
        tasks.push_back( boost::shared_ptr<TileTask>(
          new DownsampleTileTask( *it, pyramid, sub, 1.0 / parents.size() ) ) );
      size_t count = run_level( tasks, pyramid );
      TW_OUT(InfoMessage, "mosaic") << "Zoom " << zoom << ": " << count << " tiles.\n";
    }

    progress.report_finished();
    return pyramid;
  }

}} // namespace tw::mosaic
