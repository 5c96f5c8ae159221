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


/// \file tile_fetch.cc
///
/// Fetches one tile of a published namespace by its north-up XYZ
/// address, the way a map client would request it.
///
#include <tw/Core/Exception.h>
#include <tw/Mosaic/TileServer.h>
#include <tw/Mosaic/TileStore.h>
#include <tw/tools/Common.h>

#include <boost/program_options.hpp>

#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace tw;
using namespace tw::mosaic;
namespace po = boost::program_options;

struct Options {
  std::string root, id, output;
  int32 zoom, col, row;
  bool check, help;

  void validate() {
    TW_ASSERT( !help, tools::Usage() );
    TW_ASSERT( !root.empty(), tools::Usage() << "Need a tile root (--root)" );
    TW_ASSERT( !id.empty(), tools::Usage() << "Need a namespace id (--id)" );
    TW_ASSERT( check || (zoom >= 0 && col >= 0 && row >= 0),
               tools::Usage() << "Need a tile address (--zoom, --col, --row)" );
  }
};

int handle_options( int argc, char *argv[], Options& opt ) {
  po::options_description general_options("Description: Writes one north-up XYZ tile of a published namespace\n\nGeneral options");
  general_options.add_options()
    ("root,r"   , po::value(&opt.root)                        , "The directory that holds published tile namespaces")
    ("id"       , po::value(&opt.id)                          , "The namespace id printed by georef2tiles")
    ("zoom,z"   , po::value(&opt.zoom)->default_value(-1)     , "Zoom level")
    ("col,x"    , po::value(&opt.col)->default_value(-1)      , "Tile column, counted from the west")
    ("row,y"    , po::value(&opt.row)->default_value(-1)      , "Tile row, counted from the north")
    ("output,o" , po::value(&opt.output)                      , "Write the PNG here instead of to stdout")
    ("check"    , po::bool_switch(&opt.check)                 , "Only report whether the namespace exists")
    ("help,h"   , po::bool_switch(&opt.help)                  , "Display this help message");

  std::ostringstream usage;
  usage << "Usage: tile_fetch --root <dir> --id <id> -z <zoom> -x <col> -y <row> [-o <file.png>]" << std::endl << std::endl;
  usage << general_options << std::endl;

  try {
    namespace ps = po::command_line_style;
    int style = ps::unix_style & ~ps::allow_guessing;
    po::variables_map vm;
    po::store( po::command_line_parser( argc, argv ).style(style).options(general_options).run(), vm );
    po::notify( vm );
    opt.validate();
  } catch (const po::error& e) {
    std::cerr << usage.str() << std::endl
              << "Failed to parse command line arguments:" << std::endl
              << "\t" << e.what() << std::endl;
    return false;
  } catch (const tools::Usage& e) {
    const char* msg = e.what();
    std::cerr << usage.str() << std::endl;
    if (strlen(msg) > 0) {
      std::cerr << std::endl
                << "Invalid argument:" << std::endl
                << "\t" << msg << std::endl;
    }
    return false;
  }
  return true;
}

// Returns the process exit code: 0 on success, 2 when --check finds
// no such namespace.
int run( Options const& opt ) {
  TileStore store( opt.root );
  TileServer server( store );

  if (opt.check) {
    bool found = server.namespace_exists( opt.id );
    std::cout << opt.id << (found ? " exists" : " does not exist") << std::endl;
    return found ? 0 : 2;
  }

  std::string png = server.get_tile( opt.id, opt.zoom, opt.col, opt.row );
  if (opt.output.empty()) {
    std::cout.write( png.data(), png.size() );
    return std::cout ? 0 : 1;
  }

  std::ofstream out( opt.output.c_str(), std::ios::binary );
  if (!out)
    tw_throw( IOErr() << "Could not open " << opt.output << " for writing." );
  out.write( png.data(), png.size() );
  if (!out)
    tw_throw( IOErr() << "Failed to write " << opt.output << "." );
  return 0;
}

int main( int argc, char **argv ) {
  Options opt;
  if (!handle_options( argc, argv, opt ))
    return 1;

  try {
    return run( opt );
  } catch ( const Exception& e ) {
    std::cerr << "\n\nError: " << e << std::endl;
  } catch ( const std::exception& e ) {
    std::cerr << "\n\nError: " << e.what() << std::endl;
  }
  return 1;
}
