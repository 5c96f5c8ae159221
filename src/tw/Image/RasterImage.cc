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


#include <tw/Image/RasterImage.h>

namespace tw {

  RasterImage::RasterImage( ImageView<uint8> const& bands,
                            boost::optional<ColorTable> const& color_table )
    : m_bands( copy(bands) ), m_color_table( color_table ) {
    TW_ASSERT( !m_color_table || m_bands.planes() == 1,
               ArgumentErr() << "A color table requires a single-band raster, got "
               << m_bands.planes() << " bands" );
  }

  ColorTable const& RasterImage::color_table() const {
    TW_ASSERT( m_color_table, LogicErr() << "RasterImage has no color table" );
    return *m_color_table;
  }

  std::ostream& operator<<( std::ostream& os, RasterImage const& raster ) {
    os << "RasterImage(" << raster.width() << "x" << raster.height()
       << ", " << raster.band_count() << " band" << (raster.band_count() == 1 ? "" : "s");
    if (raster.has_color_table())
      os << ", " << raster.color_table().size() << " color table entries";
    return os << ")";
  }

} // namespace tw
