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


/// \file PixelTypes.h
///
/// Defines the RGB and RGBA pixel types used by rasters and tiles.
///
#ifndef __TW_IMAGE_PIXELTYPES_H__
#define __TW_IMAGE_PIXELTYPES_H__

#include <tw/Core/FundamentalTypes.h>

#include <boost/integer_traits.hpp>

#include <ostream>

namespace tw {

  /// An RGB color pixel, as stored in a color table.
  template <class ChannelT>
  class PixelRGB {
    ChannelT m_ch[3];

  public:
    typedef ChannelT channel_type;

    // Default constructor (zero value, i.e. black).
    PixelRGB() { m_ch[0]=m_ch[1]=m_ch[2]=0; }

    /// Constructs a pixel with the given channel values.
    PixelRGB( ChannelT const& r, ChannelT const& g, ChannelT const& b ) {
      m_ch[0]=r; m_ch[1]=g; m_ch[2]=b;
    }

    ChannelT& operator[](int i) { return m_ch[i]; }
    ChannelT const& operator[](int i) const { return m_ch[i]; }

    ChannelT& r() { return m_ch[0]; }
    ChannelT const& r() const { return m_ch[0]; }
    ChannelT& g() { return m_ch[1]; }
    ChannelT const& g() const { return m_ch[1]; }
    ChannelT& b() { return m_ch[2]; }
    ChannelT const& b() const { return m_ch[2]; }
  };

  /// An RGB color pixel with an alpha channel.
  template <class ChannelT>
  class PixelRGBA {
    ChannelT m_ch[4];

  public:
    typedef ChannelT channel_type;

    // Default constructor (zero value, i.e. transparent).
    PixelRGBA() { m_ch[0]=m_ch[1]=m_ch[2]=m_ch[3]=0; }

    /// Constructs an opaque gray pixel from the raw luminance value.
    /// This is marked as explicit to prevent you from accidentially
    /// initializing a pixel to zero when what you really want is the
    /// default-constructed value.
    explicit PixelRGBA( ChannelT const& v ) {
      m_ch[0]=m_ch[1]=m_ch[2]=v;
      m_ch[3]=boost::integer_traits<ChannelT>::const_max;
    }

    /// Constructs a pixel with the given channel values.
    PixelRGBA( ChannelT const& r, ChannelT const& g, ChannelT const& b, ChannelT const& a ) {
      m_ch[0]=r; m_ch[1]=g; m_ch[2]=b; m_ch[3]=a;
    }

    /// Constructs a pixel from a color and an alpha value.
    PixelRGBA( PixelRGB<ChannelT> const& rgb, ChannelT const& a ) {
      m_ch[0]=rgb[0]; m_ch[1]=rgb[1]; m_ch[2]=rgb[2]; m_ch[3]=a;
    }

    ChannelT& operator[](int i) { return m_ch[i]; }
    ChannelT const& operator[](int i) const { return m_ch[i]; }

    ChannelT& r() { return m_ch[0]; }
    ChannelT const& r() const { return m_ch[0]; }
    ChannelT& g() { return m_ch[1]; }
    ChannelT const& g() const { return m_ch[1]; }
    ChannelT& b() { return m_ch[2]; }
    ChannelT const& b() const { return m_ch[2]; }
    ChannelT& a() { return m_ch[3]; }
    ChannelT const& a() const { return m_ch[3]; }
  };

  template <class ChannelT>
  inline bool operator==( PixelRGB<ChannelT> const& a, PixelRGB<ChannelT> const& b ) {
    return a[0]==b[0] && a[1]==b[1] && a[2]==b[2];
  }

  template <class ChannelT>
  inline bool operator!=( PixelRGB<ChannelT> const& a, PixelRGB<ChannelT> const& b ) {
    return !( a == b );
  }

  template <class ChannelT>
  inline bool operator==( PixelRGBA<ChannelT> const& a, PixelRGBA<ChannelT> const& b ) {
    return a[0]==b[0] && a[1]==b[1] && a[2]==b[2] && a[3]==b[3];
  }

  template <class ChannelT>
  inline bool operator!=( PixelRGBA<ChannelT> const& a, PixelRGBA<ChannelT> const& b ) {
    return !( a == b );
  }

  // Channels are promoted so that uint8 prints as a number.
  template <class ChannelT>
  inline std::ostream& operator<<( std::ostream& os, PixelRGB<ChannelT> const& p ) {
    return os << "PixelRGB(" << +p[0] << "," << +p[1] << "," << +p[2] << ")";
  }

  template <class ChannelT>
  inline std::ostream& operator<<( std::ostream& os, PixelRGBA<ChannelT> const& p ) {
    return os << "PixelRGBA(" << +p[0] << "," << +p[1] << "," << +p[2] << "," << +p[3] << ")";
  }

  typedef PixelRGB<uint8>  PixelRGB8;
  typedef PixelRGBA<uint8> PixelRGBA8;

} // namespace tw

#endif // __TW_IMAGE_PIXELTYPES_H__
