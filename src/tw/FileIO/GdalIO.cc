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


#include <tw/FileIO/GdalIO.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/Core/RunOnce.h>
#include <tw/Core/Thread.h>

// GDAL Headers
#include "gdal.h"
#include "gdal_priv.h"
#include "cpl_string.h"
#include "ogr_spatialref.h"

#include <boost/algorithm/string/replace.hpp>
#include <boost/shared_ptr.hpp>

#include <algorithm>

static void CPL_STDCALL gdal_error_handler(CPLErr eErrClass, int nError, const char *pszErrorMsg) {
  tw::MessageLevel lvl;

  switch(eErrClass) {
    case CE_Debug:
      lvl = tw::DebugMessage;
      break;
    case CE_Warning:
      lvl = tw::WarningMessage;
      break;
    default:
      lvl = tw::ErrorMessage;
      break;
  }

  std::string msg;
  if (pszErrorMsg)
    msg = pszErrorMsg;

  boost::replace_all(msg, "\n", " ");

  if (eErrClass == CE_Fatal)
    tw::tw_throw(tw::IOErr() << "GdalIO: " << msg << " (code = " << nError << ")");
  else
    tw::tw_out(lvl, "fileio") << "GdalIO: " << msg << " (code = " << nError << ")" << std::endl;
}

// The lock is created by init_gdal, so gdal_init_once.run(init_gdal)
// must happen before anything else touches GDAL.
namespace {
  tw::RunOnce gdal_init_once = TW_RUNONCE_INIT;
  tw::Mutex *gdal_mutex_ptr = 0;

  void init_gdal() {
    gdal_mutex_ptr = new tw::Mutex();

    // Override GDAL's error handler so it doesn't print to stderr.
    CPLSetErrorHandler(gdal_error_handler);

    // Register all GDAL file readers and writers.
    GDALAllRegister();
  }

  class GdalCloseDatasetDeleter {
  public:
    void operator()(GDALDataset *dataset) {
      GDALClose(dataset);
    }
  };
}

namespace tw {
namespace fileio {

  Mutex& detail::gdal() {
    gdal_init_once.run( init_gdal );
    return *gdal_mutex_ptr;
  }

  RasterImage read_raster( std::string const& filename ) {
    Mutex::Lock lock( detail::gdal() );

    boost::shared_ptr<GDALDataset> dataset(
      static_cast<GDALDataset*>( GDALOpen( filename.c_str(), GA_ReadOnly ) ),
      GdalCloseDatasetDeleter() );
    if (!dataset)
      tw_throw( UnopenableImageErr() << "GdalIO: Failed to open \"" << filename << "\"." );

    const int32 cols = dataset->GetRasterXSize();
    const int32 rows = dataset->GetRasterYSize();
    const int32 bands = dataset->GetRasterCount();
    if (cols <= 0 || rows <= 0)
      tw_throw( UnopenableImageErr() << "GdalIO: \"" << filename << "\" has no pixels." );

    ImageView<uint8> image( cols, rows, bands );
    for (int32 b = 0; b < bands; ++b) {
      GDALRasterBand *band = dataset->GetRasterBand( b + 1 );
      CPLErr err = band->RasterIO( GF_Read, 0, 0, cols, rows,
                                   &image(0, 0, b), cols, rows, GDT_Byte, 0, 0 );
      if (err != CE_None)
        tw_throw( UnopenableImageErr() << "GdalIO: Failed to read band " << (b+1)
                  << " of \"" << filename << "\"." );
    }

    boost::optional<ColorTable> palette;
    if (bands == 1) {
      GDALColorTable *color_table = dataset->GetRasterBand(1)->GetColorTable();
      if (color_table) {
        ColorTable table;
        GDALColorEntry color;
        int num_entries = color_table->GetColorEntryCount();
        for (int i = 0; i < num_entries; ++i) {
          color_table->GetColorEntryAsRGB( i, &color );
          table.push_back( PixelRGB8( uint8(color.c1), uint8(color.c2), uint8(color.c3) ) );
        }
        palette = table;
      }
    }

    RasterImage raster( image, palette );
    TW_OUT(DebugMessage, "fileio") << "GdalIO: Read " << raster << " from " << filename << "\n";
    return raster;
  }

  void write_geotiff( std::string const& filename, RasterImage const& raster,
                      BBox2 const& bbox, std::string const& srs ) {
    TW_ASSERT( raster.band_count() > 0, ArgumentErr() << "write_geotiff: raster has no bands" );

    Mutex::Lock lock( detail::gdal() );

    GDALDriver *driver = GetGDALDriverManager()->GetDriverByName( "GTiff" );
    if (!driver)
      tw_throw( IOErr() << "GdalIO: the GTiff driver is not available." );

    OGRSpatialReference spatial_ref;
    if (spatial_ref.SetFromUserInput( srs.c_str() ) != OGRERR_NONE)
      tw_throw( ArgumentErr() << "GdalIO: Failed to parse: \"" << srs << "\"." );
    char *wkt_tmp = NULL;
    spatial_ref.exportToWkt( &wkt_tmp );
    std::string wkt = wkt_tmp ? wkt_tmp : "";
    CPLFree( wkt_tmp );

    char **options = NULL;
    options = CSLSetNameValue( options, "COMPRESS", "DEFLATE" );
    if (raster.band_count() == 4)
      options = CSLSetNameValue( options, "ALPHA", "YES" );

    boost::shared_ptr<GDALDataset> dataset(
      driver->Create( filename.c_str(), raster.width(), raster.height(),
                      raster.band_count(), GDT_Byte, options ),
      GdalCloseDatasetDeleter() );
    CSLDestroy( options );
    if (!dataset)
      tw_throw( IOErr() << "GdalIO: Failed to create \"" << filename << "\"." );

    double geo_transform[6];
    geo_transform[0] = bbox.min()[0];
    geo_transform[1] = bbox.width() / raster.width();
    geo_transform[2] = 0;
    geo_transform[3] = bbox.max()[1];
    geo_transform[4] = 0;
    geo_transform[5] = -bbox.height() / raster.height();
    dataset->SetGeoTransform( geo_transform );
    dataset->SetProjection( wkt.c_str() );

    // RasterIO wants a mutable buffer even for writes.
    ImageView<uint8> bands = copy( raster.bands() );
    for (int32 b = 0; b < raster.band_count(); ++b) {
      CPLErr err = dataset->GetRasterBand( b + 1 )->RasterIO(
        GF_Write, 0, 0, raster.width(), raster.height(),
        &bands(0, 0, b), raster.width(), raster.height(), GDT_Byte, 0, 0 );
      if (err != CE_None)
        tw_throw( IOErr() << "GdalIO: Failed to write band " << (b+1) << " of \"" << filename << "\"." );
    }

    if (raster.has_color_table()) {
      GDALColorTable table;
      ColorTable const& palette = raster.color_table();
      // A byte band addresses at most 256 entries.
      const size_t entries = std::min( palette.size(), size_t(256) );
      for (size_t i = 0; i < entries; ++i) {
        PixelRGB8 c = palette.lookup( uint8(i) );
        GDALColorEntry entry;
        entry.c1 = c.r(); entry.c2 = c.g(); entry.c3 = c.b(); entry.c4 = 255;
        table.SetColorEntry( int(i), &entry );
      }
      dataset->GetRasterBand(1)->SetColorTable( &table );
    }

    TW_OUT(DebugMessage, "fileio") << "GdalIO: Wrote " << raster << " to " << filename << "\n";
  }

}} // namespace tw::fileio
