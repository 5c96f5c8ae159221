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


/// \file GdalIO.h
///
/// Raster input and GeoTIFF output through GDAL.
///
/// GDAL is not thread-safe, so every call into it is made while
/// holding the lock returned by fileio::detail::gdal().  GDAL's own
/// error printing is replaced by a handler that writes to the
/// "fileio" log namespace.
///
#ifndef __TW_FILEIO_GDALIO_H__
#define __TW_FILEIO_GDALIO_H__

#include <tw/Image/RasterImage.h>
#include <tw/Math/BBox.h>

#include <string>

namespace tw {
  class Mutex;

namespace fileio {
namespace detail {

  /// The global GDAL lock.  Initializes GDAL on first use.
  Mutex& gdal();

} // namespace detail

  /// Decodes any raster format GDAL can open into an 8-bit
  /// RasterImage.  Samples of wider types are converted by GDAL.  A
  /// single-band image whose band carries a color table keeps it.
  /// Throws UnopenableImageErr if the file cannot be opened or read.
  RasterImage read_raster( std::string const& filename );

  /// Writes a raster as a GeoTIFF whose pixels cover bbox in the given
  /// coordinate system (any string OGRSpatialReference accepts, such
  /// as "EPSG:3857").  Row 0 is the north edge of bbox.  Throws IOErr
  /// on failure.
  void write_geotiff( std::string const& filename, RasterImage const& raster,
                      BBox2 const& bbox, std::string const& srs = "EPSG:3857" );

}} // namespace tw::fileio

#endif // __TW_FILEIO_GDALIO_H__
