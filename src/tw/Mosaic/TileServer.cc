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


#include <tw/Mosaic/TileServer.h>
#include <tw/Mosaic/TileAddress.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/FileIO/PngIO.h>

namespace tw {
namespace mosaic {

  TileServer::TileServer( TileStore const& store, int32 tile_size )
    : m_store(store) {
    TW_ASSERT( tile_size > 0, ArgumentErr() << "Invalid tile size " << tile_size << "." );
    m_placeholder = fileio::encode_png( ImageView<PixelRGBA8>( tile_size, tile_size ) );
  }

  std::string TileServer::get_tile( std::string const& id, int32 zoom, int32 col, int32 north_row ) const {
    if (!tile_address_in_range( zoom, col, north_row )) {
      TW_OUT(WarningMessage, "tile_server") << "Tile " << zoom << "/" << col << "/" << north_row
                                            << " of " << id << " is off the world.\n";
      return m_placeholder;
    }

    try {
      if (!m_store.exists( id )) {
        TW_OUT(WarningMessage, "tile_server") << "Unknown namespace \"" << id << "\".\n";
        return m_placeholder;
      }
      TileIndex index = index_from_xyz( zoom, col, north_row );
      boost::optional<std::string> bytes = m_store.read_tile( id, index );
      if (bytes)
        return *bytes;
      // The pyramid is sparse, so a miss is routine.
      TW_OUT(DebugMessage, "tile_server") << "No " << index << " in " << id << ".\n";
    } catch ( const Exception& e ) {
      TW_OUT(WarningMessage, "tile_server") << "Reading " << zoom << "/" << col << "/" << north_row
                                            << " of " << id << " failed: " << e << "\n";
    } catch ( const std::exception& e ) {
      TW_OUT(WarningMessage, "tile_server") << "Reading " << zoom << "/" << col << "/" << north_row
                                            << " of " << id << " failed: " << e.what() << "\n";
    }
    return m_placeholder;
  }

}} // namespace tw::mosaic
