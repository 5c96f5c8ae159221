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


#include <tw/Cartography/Reproject.h>
#include <tw/Cartography/WebMercator.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/Core/ThreadPool.h>

#include <boost/shared_ptr.hpp>
#include <boost/scoped_array.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <vector>

namespace tw {
namespace cartography {

  namespace {

    const int32 EDGE_SAMPLES = 20;
    const int32 ROWS_PER_TASK = 64;
    const int64 MAX_OUTPUT_PIXELS = int64(1) << 31;

    Vector2 pixel_to_point( GeoTransform const& tx, Vector2 const& pixel ) {
      Vector2 point = web_mercator::lonlat_to_point( tx.forward( pixel ) );
      if (!is_finite( point ))
        tw_throw( ProjectionErr() << "Source pixel " << pixel << " does not project." );
      return point;
    }

    // Renders a block of destination rows.  The ImageViews share their
    // buffers with the caller's, and blocks never overlap.
    class WarpRowsTask : public Task {
      ImageView<uint8> m_src, m_dst, m_mask;
      GeoTransform const& m_tx;
      InterpolationKernel m_kernel;
      BBox2 m_bbox;
      Vector2 m_pixel_size;
      int32 m_row_begin, m_row_end;
      ProgressCallback const& m_progress;
      double m_progress_share;

    public:
      WarpRowsTask( ImageView<uint8> const& src, ImageView<uint8> const& dst, ImageView<uint8> const& mask,
                    GeoTransform const& tx, InterpolationKernel kernel, BBox2 const& bbox,
                    int32 row_begin, int32 row_end, ProgressCallback const& progress, double share )
        : m_src(src), m_dst(dst), m_mask(mask), m_tx(tx), m_kernel(kernel), m_bbox(bbox),
          m_pixel_size( bbox.width() / dst.cols(), bbox.height() / dst.rows() ),
          m_row_begin(row_begin), m_row_end(row_end), m_progress(progress), m_progress_share(share) {}

      // With an alpha band, transparent source pixels are no data.
      bool sample( Vector2 const& uv, uint8* px ) const {
        if (m_src.planes() >= 4)
          return sample_pixel( m_src, uv[0], uv[1], m_kernel, PlaneValid( m_src, 3 ), px );
        return sample_pixel( m_src, uv[0], uv[1], m_kernel, px );
      }

      virtual void operator()() {
        const int32 planes = m_src.planes();
        boost::scoped_array<uint8> px( new uint8[planes] );
        for (int32 j = m_row_begin; j < m_row_end; ++j) {
          double y = m_bbox.max()[1] - (j + 0.5) * m_pixel_size[1];
          for (int32 i = 0; i < m_dst.cols(); ++i) {
            double x = m_bbox.min()[0] + (i + 0.5) * m_pixel_size[0];
            Vector2 uv = m_tx.reverse( web_mercator::point_to_lonlat( Vector2(x, y) ) );
            if (!is_finite( uv ))
              tw_throw( ProjectionErr() << "Destination point (" << x << "," << y
                        << ") has no source location." );
            if (!sample( uv, px.get() ))
              continue;
            for (int32 p = 0; p < planes; ++p)
              m_dst(i, j, p) = px[p];
            m_mask(i, j) = 255;
          }
        }
        m_progress.report_incremental_progress( m_progress_share );
      }
    };

  } // anonymous namespace

  std::ostream& operator<<( std::ostream& os, ProjectedRaster const& r ) {
    return os << "ProjectedRaster(" << r.raster << ", " << r.srs << " " << r.bbox << ")";
  }

  WarpOutput suggest_warp_output( int32 cols, int32 rows, GeoTransform const& tx ) {
    TW_ASSERT( cols > 0 && rows > 0,
               ArgumentErr() << "Cannot warp an empty " << cols << "x" << rows << " raster." );

    BBox2 extent;
    for (int32 s = 0; s <= EDGE_SAMPLES; ++s) {
      double ratio = double(s) / EDGE_SAMPLES;
      extent.grow( pixel_to_point( tx, Vector2( ratio * cols, 0 ) ) );
      extent.grow( pixel_to_point( tx, Vector2( ratio * cols, rows ) ) );
      extent.grow( pixel_to_point( tx, Vector2( 0, ratio * rows ) ) );
      extent.grow( pixel_to_point( tx, Vector2( cols, ratio * rows ) ) );
    }
    std::vector<ControlPoint> const& points = tx.control_points();
    for (size_t i = 0; i < points.size(); ++i)
      extent.grow( web_mercator::lonlat_to_point( points[i].lonlat() ) );

    Vector2 diagonal = pixel_to_point( tx, Vector2(cols, rows) ) - pixel_to_point( tx, Vector2(0, 0) );
    double pixel_size = math::norm_2( diagonal ) / std::sqrt( double(cols)*cols + double(rows)*rows );
    if (!(pixel_size > 0) || !(extent.width() > 0) || !(extent.height() > 0))
      tw_throw( ProjectionErr() << "The source projects to a degenerate extent " << extent << "." );

    WarpOutput output;
    output.bbox = extent;
    double out_cols = std::ceil( extent.width() / pixel_size );
    double out_rows = std::ceil( extent.height() / pixel_size );
    if (out_cols * out_rows > double(MAX_OUTPUT_PIXELS))
      tw_throw( ProjectionErr() << "Warped raster would be " << out_cols << "x" << out_rows << " pixels." );
    output.cols = std::max( int32(out_cols), int32(1) );
    output.rows = std::max( int32(out_rows), int32(1) );

    TW_OUT(DebugMessage, "cartography") << "Warp output: " << output.cols << "x" << output.rows
                                         << " pixels over " << extent << "\n";
    return output;
  }

  ProjectedRaster reproject( RasterImage const& src, GeoTransform const& tx,
                             InterpolationKernel kernel, ProgressCallback const& progress ) {
    if (src.has_color_table() && kernel != NearestPixelKernel) {
      TW_OUT(DebugMessage, "cartography") << "Palette indices are resampled with the nearest pixel.\n";
      kernel = NearestPixelKernel;
    }

    WarpOutput output = suggest_warp_output( src.width(), src.height(), tx );

    ImageView<uint8> dst( output.cols, output.rows, src.band_count() );
    ImageView<uint8> mask( output.cols, output.rows );

    progress.report_progress( 0 );
    {
      FifoWorkQueue queue;
      std::vector<boost::shared_ptr<Task> > tasks;
      const int32 blocks = (output.rows + ROWS_PER_TASK - 1) / ROWS_PER_TASK;
      for (int32 b = 0; b < blocks; ++b) {
        int32 begin = b * ROWS_PER_TASK;
        int32 end = std::min( begin + ROWS_PER_TASK, output.rows );
        boost::shared_ptr<Task> task( new WarpRowsTask( src.bands(), dst, mask, tx, kernel, output.bbox,
                                                        begin, end, progress, 1.0 / blocks ) );
        tasks.push_back( task );
        queue.add_task( task );
      }
      queue.join_all();
      for (size_t i = 0; i < tasks.size(); ++i)
        tasks[i]->rethrow_if_failed();
    }
    progress.report_finished();

    ProjectedRaster result;
    result.raster = src.has_color_table() ? RasterImage( dst, src.color_table() ) : RasterImage( dst );
    result.mask = mask;
    result.bbox = output.bbox;
    result.srs = web_mercator::SRS;

    TW_OUT(DebugMessage, "cartography") << "Reprojected to " << result << "\n";
    return result;
  }

}} // namespace tw::cartography
