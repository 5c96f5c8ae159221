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


/// \file TileServer.h
///
/// Answers north-up (XYZ) tile requests from a TileStore.  Every
/// request gets a PNG: the stored tile if there is one, and a fully
/// transparent placeholder of the same size otherwise.
///
#ifndef __TW_MOSAIC_TILESERVER_H__
#define __TW_MOSAIC_TILESERVER_H__

#include <tw/Core/Settings.h>
#include <tw/Core/System.h>
#include <tw/Mosaic/TileStore.h>

#include <string>

namespace tw {
namespace mosaic {

  /// Safe to share between threads once constructed.
  class TileServer {
    TileStore m_store;
    std::string m_placeholder;

  public:
    explicit TileServer( TileStore const& store, int32 tile_size = tw_settings().tile_size() );

    /// The PNG for the given address.  Never throws: a missing tile,
    /// an unknown namespace, an address off the world, or a failed
    /// read all give the placeholder.
    std::string get_tile( std::string const& id, int32 zoom, int32 col, int32 north_row ) const;

    bool namespace_exists( std::string const& id ) const { return m_store.exists( id ); }

    /// The encoded transparent tile.
    std::string const& placeholder() const { return m_placeholder; }
  };

}} // namespace tw::mosaic

#endif // __TW_MOSAIC_TILESERVER_H__
