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


/// \file Core/Exception.h
///
/// Base exception classes and related macros.
///
/// The tw::Exception class serves as a base class for all TileWarp
/// error types.  It is designed to make it easy to throw exceptions
/// with meaningful error messages.  For example, this invocation:
///
///   <TT>tw_throw( IOErr() << "Unable to open file \"" << filename << "\"!" );</TT>
///
/// might generate a message like this:
///
///  <TT>terminate called after throwing an instance of 'tw::IOErr'</TT>
///
///  <TT>     what():  Unable to open file "somefile.foo"! </TT>
///
/// Exceptions should always be raised with tw_throw() rather than a
/// bare throw statement.  tw_throw() hands the exception to the
/// currently installed ExceptionHandler, which by default throws it
/// with its most-derived type intact.
///
/// The error taxonomy of the georeferencing pipeline is declared at
/// the bottom of this file.  Callers that need to distinguish stages
/// should catch InputErr, GeometryErr, UnsupportedBandLayoutErr and
/// StorageErr.
///
#ifndef __TW_CORE_EXCEPTION_H__
#define __TW_CORE_EXCEPTION_H__

#include <exception>
#include <string>
#include <sstream>
#include <ostream>

#if defined(__GNUC__)
#define TW_NORETURN __attribute__((noreturn))
#else
#define TW_NORETURN
#endif

namespace tw {

  /// The core exception class.
  struct Exception : public std::exception {

    /// The default constructor generates exceptions with empty error
    /// message text.  This is the cleanest approach if you intend to
    /// use streaming (via operator <<) to generate your message.
    Exception() throw() {}

    /// Generates exceptions with the given error message text.
    Exception( std::string const& s ) throw() { m_desc << s; }

    virtual ~Exception() throw() {}

    /// Copy Constructor
    Exception( Exception const& e ) throw() {
      m_desc << e.m_desc.str();
    }

    /// Assignment operator copies the error string.
    Exception& operator=( Exception const& e ) throw() {
      m_desc.str( e.m_desc.str() );
      return *this;
    }

    /// Returns a the error message text for display to the user.  The
    /// returned pointer must be used immediately; other operations on
    /// the exception may invalidate it.  If you need the data for
    /// later, you must save it to a local buffer of your own.
    virtual const char* what() const throw() {
      m_what_buf = m_desc.str();
      return m_what_buf.c_str();
    }

    /// Returns the error message text as a std::string.
    std::string desc() const { return m_desc.str(); }

    /// Returns a string containing the exception class name.
    virtual std::string name() const { return "Exception"; }

    /// Throws this exception with its most-derived type.  Subclasses
    /// generated by TW_DEFINE_EXCEPTION override this.
    virtual void default_throw() const { throw *this; }

  protected:
    // The error message text.
    std::ostringstream m_desc;

    // A buffer for storing the full exception description returned by
    // the what() method, which must generate its return value from
    // the current value of m_desc.
    mutable std::string m_what_buf;
  };

  /// Print an exception to a stream as "Name: description".
  inline std::ostream& operator<<( std::ostream& os, Exception const& e ) {
    return os << e.name() << ": " << e.desc();
  }

  /// Macro for quickly creating a hierarchy of exceptions, all of
  /// which share the same functionality.
  ///
  /// The streaming operator (<<) makes it possible to quickly
  /// generate error message text, set() replaces the text and reset()
  /// clears it.  All three return the subclass type so they can be
  /// chained inside a tw_throw() call.
  #define TW_DEFINE_EXCEPTION(exception_type,base)                      \
  struct exception_type : public base {                                 \
    exception_type() throw() : base() {}                                \
    exception_type(std::string const& s) throw() : base(s) {}           \
    exception_type( exception_type const& e ) throw() : base( e ) {}    \
    virtual ~exception_type() throw() {}                                \
                                                                        \
    inline exception_type& operator=( exception_type const& e ) throw() { \
      base::operator=( e );                                             \
      return *this;                                                     \
    }                                                                   \
                                                                        \
    template <class T>                                                  \
    exception_type& operator<<( T const& t ) { m_desc << t; return *this; } \
                                                                        \
    exception_type& set( std::string const& s ) { m_desc.str(s); return *this; } \
                                                                        \
    exception_type& reset() { m_desc.str(""); return *this; }           \
                                                                        \
    virtual std::string name() const { return #exception_type; }        \
    virtual void default_throw() const { throw *this; }                 \
  }

  /// The abstract exception handler base class, which users
  /// can subclass to install an alternative exception handler.
  class ExceptionHandler {
  public:
    virtual void handle( Exception const& e ) const TW_NORETURN = 0;
    virtual ~ExceptionHandler() {}
  };

  /// Sets the application-wide exception handler.  Pass zero
  /// as an argument to reinstate the default handler.  The
  /// default behavior is to throw the exception.
  void set_exception_handler( ExceptionHandler const* eh );

  /// Throws an exception via the TileWarp exception handling
  /// mechanism, which may not actually involve throwing an
  /// exception in the usual C++ sense.
  void tw_throw( Exception const& e ) TW_NORETURN;

  /// Invalid function argument exception
  TW_DEFINE_EXCEPTION(ArgumentErr, Exception);

  /// Incorrect program logic exception
  TW_DEFINE_EXCEPTION(LogicErr, Exception);

  /// Invalid program input exception
  TW_DEFINE_EXCEPTION(InputErr, Exception);

  /// IO failure exception
  TW_DEFINE_EXCEPTION(IOErr, Exception);

  /// Arithmetic failure exception
  TW_DEFINE_EXCEPTION(MathErr, Exception);

  /// Not found exception
  TW_DEFINE_EXCEPTION(NotFoundErr, Exception);

  /// The source raster could not be opened or decoded.
  TW_DEFINE_EXCEPTION(UnopenableImageErr, InputErr);

  /// Base class for failures of the spatial model: control point
  /// geometry or the projection of the warped raster.
  TW_DEFINE_EXCEPTION(GeometryErr, Exception);

  /// Fewer than three usable control points were supplied.
  TW_DEFINE_EXCEPTION(InsufficientControlPointsErr, GeometryErr);

  /// The control points are collinear or otherwise make the spline
  /// system singular.
  TW_DEFINE_EXCEPTION(DegenerateControlPointsErr, GeometryErr);

  /// The inverse transform could not be evaluated over the
  /// destination extent.
  TW_DEFINE_EXCEPTION(ProjectionErr, GeometryErr);

  /// The raster's band count / palette combination has no RGBA mapping.
  TW_DEFINE_EXCEPTION(UnsupportedBandLayoutErr, Exception);

  /// A tile pyramid could not be written to storage.
  TW_DEFINE_EXCEPTION(StorageErr, Exception);

} // namespace tw

/// The TW_ASSERT macro throws the given exception if the given
/// condition is not met.  The TW_DEBUG_ASSERT macro does the
/// same thing, but is disabled if __TW_DEBUG_LEVEL__ is zero.
/// The default value for __TW_DEBUG_LEVEL__ is guessed based
/// on whether or not NDEBUG is defined.
#ifndef __TW_DEBUG_LEVEL__
#ifdef NDEBUG
#define __TW_DEBUG_LEVEL__ 0
#else
#define __TW_DEBUG_LEVEL__ 1
#endif
#endif

#define TW_ASSERT(cond,excep) do { if(!(cond)) ::tw::tw_throw(excep); } while(0)
#if __TW_DEBUG_LEVEL__ == 0
#define TW_DEBUG_ASSERT(cond,excep) do {} while(0)
#else
#define TW_DEBUG_ASSERT(cond,excep) do { if(!(cond)) ::tw::tw_throw(excep); } while(0)
#endif

#endif // __TW_CORE_EXCEPTION_H__
