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


#include <tw/Mosaic/TileStore.h>
#include <tw/Mosaic/TileAddress.h>
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/Core/Settings.h>
#include <tw/Core/System.h>
#include <tw/FileIO/PngIO.h>

#include <boost/filesystem/operations.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fstream>
#include <sstream>

namespace fs = boost::filesystem;

namespace tw {
namespace mosaic {

  namespace {

    void write_file( fs::path const& path, std::string const& bytes ) {
      std::ofstream f( path.string().c_str(), std::ios::out | std::ios::binary );
      if (!f)
        tw_throw( IOErr() << "Unable to open \"" << path.string() << "\" for writing." );
      f.write( bytes.data(), bytes.size() );
      f.close();
      if (!f)
        tw_throw( IOErr() << "Failed to write \"" << path.string() << "\"." );
    }

    void write_tiles( fs::path const& staging, TilePyramid const& pyramid ) {
      fs::remove_all( staging );
      fs::create_directories( staging / "tiles" );
      for (TilePyramid::const_iterator it = pyramid.begin(); it != pyramid.end(); ++it) {
        fs::path path = staging / "tiles" / tile_path( it->first );
        fs::create_directories( path.parent_path() );
        write_file( path, fileio::encode_png( it->second.pixels() ) );
      }
    }

    void remove_staging( fs::path const& staging ) {
      boost::system::error_code ec;
      fs::remove_all( staging, ec );
      if (ec)
        TW_OUT(WarningMessage, "storage") << "Could not remove " << staging.string()
                                          << ": " << ec.message() << "\n";
    }

  } // anonymous namespace

  TileStore::TileStore( std::string const& root )
    : m_root(root), m_retries( tw_settings().storage_retries() ) {
    TW_ASSERT( !root.empty(), ArgumentErr() << "TileStore needs a root directory." );
  }

  std::string TileStore::allocate_namespace() const {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string( generator() );
  }

  bool TileStore::valid_namespace( std::string const& id ) {
    return !id.empty() && id[0] != '.' && id.find_first_of( "/\\" ) == std::string::npos;
  }

  void TileStore::publish( std::string const& id, TilePyramid const& pyramid ) const {
    TW_ASSERT( valid_namespace( id ), ArgumentErr() << "\"" << id << "\" is not a namespace id." );

    const fs::path target = m_root / id;
    const fs::path staging = m_root / ("." + id + ".partial");

    std::string error;
    for (uint32 attempt = 0; attempt <= m_retries; ++attempt) {
      try {
        if (fs::exists( target ))
          tw_throw( StorageErr() << "Namespace " << id << " already exists in " << m_root.string() << "." );
        write_tiles( staging, pyramid );
        fs::rename( staging, target );
        TW_OUT(InfoMessage, "storage") << "Published " << pyramid << " as " << target.string() << "\n";
        return;
      } catch ( const IOErr& e ) {
        error = e.what();
      } catch ( const fs::filesystem_error& e ) {
        error = e.what();
      }
      TW_OUT(WarningMessage, "storage") << "Publish attempt " << (attempt+1) << " of " << id
                                        << " failed: " << error << "\n";
      remove_staging( staging );
    }
    tw_throw( StorageErr() << "Could not publish " << id << " after " << (m_retries+1)
              << " attempts: " << error );
  }

  bool TileStore::exists( std::string const& id ) const {
    if (!valid_namespace( id ))
      return false;
    return fs::is_directory( m_root / id );
  }

  boost::optional<std::string> TileStore::read_tile( std::string const& id, TileIndex const& index ) const {
    if (!valid_namespace( id ) || !tile_address_in_range( index.zoom, index.col, index.row ))
      return boost::none;

    const fs::path path = m_root / id / "tiles" / tile_path( index );
    if (!fs::is_regular_file( path ))
      return boost::none;

    std::ifstream f( path.string().c_str(), std::ios::in | std::ios::binary );
    if (!f)
      tw_throw( IOErr() << "Unable to open \"" << path.string() << "\"." );
    std::ostringstream bytes;
    bytes << f.rdbuf();
    if (f.bad())
      tw_throw( IOErr() << "Failed to read \"" << path.string() << "\"." );
    return bytes.str();
  }

}} // namespace tw::mosaic
