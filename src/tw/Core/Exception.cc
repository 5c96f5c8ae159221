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


#include <tw/Core/Exception.h>

#include <cstdlib>

namespace tw {

namespace {

  // Rethrows with the most-derived type.
  class RethrowHandler : public ExceptionHandler {
  public:
    virtual void handle( Exception const& e ) const TW_NORETURN {
      e.default_throw();
      std::abort(); // default_throw() always throws
    }
  };

  RethrowHandler g_rethrow_handler;
  ExceptionHandler const* g_handler = &g_rethrow_handler;
}

void set_exception_handler( ExceptionHandler const* eh ) {
  g_handler = eh ? eh : &g_rethrow_handler;
}

void tw_throw( Exception const& e ) {
  g_handler->handle( e );
  // A handler must not return.
  std::abort();
}

} // namespace tw
