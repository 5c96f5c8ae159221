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


/// \file TileStore.h
///
/// Published tile pyramids on the local filesystem.
///
/// Every pyramid lives in its own namespace, a directory named by a
/// random UUID under the store root:
///
///   {root}/{id}/tiles/{zoom}/{col}/{south_row}.png
///
/// A namespace is written under a hidden staging directory and renamed
/// into place once every tile is on disk, so {root}/{id} either holds a
/// complete pyramid or does not exist.
///
#ifndef __TW_MOSAIC_TILESTORE_H__
#define __TW_MOSAIC_TILESTORE_H__

#include <tw/Mosaic/TilePyramid.h>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include <string>

namespace tw {
namespace mosaic {

  class TileStore {
    boost::filesystem::path m_root;
    uint32 m_retries;

  public:
    /// The number of publish retries starts out at
    /// tw_settings().storage_retries().
    explicit TileStore( std::string const& root );

    std::string root() const { return m_root.string(); }

    uint32 get_retries() const { return m_retries; }
    void set_retries( uint32 retries ) { m_retries = retries; }

    /// A fresh random namespace id.
    std::string allocate_namespace() const;

    /// True if id can name a namespace: a single path component that
    /// does not start with a dot.
    static bool valid_namespace( std::string const& id );

    /// Writes every tile of the pyramid under the given namespace.  A
    /// failed attempt is cleaned up and retried get_retries() times
    /// before StorageErr is thrown.  Publishing to a namespace that
    /// already exists is a StorageErr.
    void publish( std::string const& id, TilePyramid const& pyramid ) const;

    /// True if the namespace has been published.
    bool exists( std::string const& id ) const;

    /// The PNG bytes of a stored tile, or nothing if it is not there.
    /// Throws IOErr if the tile exists but cannot be read.
    boost::optional<std::string> read_tile( std::string const& id, TileIndex const& index ) const;
  };

}} // namespace tw::mosaic

#endif // __TW_MOSAIC_TILESTORE_H__
