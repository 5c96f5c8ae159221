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


/// \file georef2tiles.cc
///
/// Georeferences an image from control points and publishes it as a
/// Web Mercator tile pyramid.  Prints the namespace id on success.
///
#include <tw/Core/Exception.h>
#include <tw/Core/Log.h>
#include <tw/Core/ProgressCallback.h>
#include <tw/Core/Settings.h>
#include <tw/Core/System.h>
#include <tw/Pipeline/GeorefPipeline.h>
#include <tw/tools/Common.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>

#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

using namespace tw;
using namespace tw::pipeline;
namespace po = boost::program_options;

struct Options {
  std::string image, points, output_root, resample, config;
  int32 min_zoom, max_zoom, tile_size;
  uint32 threads;
  bool keep_intermediate, help;

  void validate() {
    TW_ASSERT( !help, tools::Usage() );
    TW_ASSERT( !image.empty(), tools::Usage() << "Need an input image (--image)" );
    TW_ASSERT( !points.empty(), tools::Usage() << "Need control points (--points)" );
    TW_ASSERT( !output_root.empty(), tools::Usage() << "Need an output directory (--output-root)" );
  }
};

int handle_options( int argc, char *argv[], Options& opt ) {
  po::options_description general_options("Description: Georeferences an image from control points and cuts it into Web Mercator tiles\n\nGeneral options");
  general_options.add_options()
    ("image,i"          , po::value(&opt.image)                        , "The image to georeference")
    ("points,p"         , po::value(&opt.points)                       , "Control points: a JSON file, or the JSON text itself")
    ("output-root,o"    , po::value(&opt.output_root)                  , "The directory that holds published tile namespaces")
    ("config"           , po::value(&opt.config)                       , "Read settings from this file instead of ~/.twrc")
    ("threads"          , po::value(&opt.threads)->default_value(0)    , "Number of worker threads (0 keeps the configured count)")
    ("keep-intermediate", po::bool_switch(&opt.keep_intermediate)      , "Keep the warped and RGBA GeoTIFFs under the tmp directory")
    ("help,h"           , po::bool_switch(&opt.help)                   , "Display this help message");

  po::options_description tile_options("Tiling options");
  tile_options.add_options()
    ("min-zoom"         , po::value(&opt.min_zoom)->default_value(-1)  , "Shallowest zoom level (default from settings, 9)")
    ("max-zoom"         , po::value(&opt.max_zoom)->default_value(-1)  , "Deepest zoom level (default from settings, 16)")
    ("tile-size"        , po::value(&opt.tile_size)->default_value(0)  , "Tile size in pixels (default from settings, 256)")
    ("resample"         , po::value(&opt.resample)                     , "Interpolation kernel [bilinear, nearest]");

  po::options_description options("Allowed options");
  options.add(general_options).add(tile_options);

  std::ostringstream usage;
  usage << "Usage: georef2tiles [options] --image <file> --points <json> --output-root <dir>" << std::endl << std::endl;
  usage << general_options << std::endl;
  usage << tile_options    << std::endl;

  try {
    namespace ps = po::command_line_style;
    int style = ps::unix_style & ~ps::allow_guessing;
    po::variables_map vm;
    po::store( po::command_line_parser( argc, argv ).style(style).options(options).run(), vm );
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

cartography::ControlPointSet load_points( std::string const& arg ) {
  std::string text = boost::trim_copy( arg );
  if (!text.empty() && text[0] == '{')
    return cartography::ControlPointSet::from_json( text );
  return cartography::ControlPointSet::from_json_file( arg );
}

void run( Options const& opt ) {
  if (!opt.config.empty())
    tw_settings().set_rc_filename( opt.config );
  if (opt.threads > 0)
    tw_settings().set_default_num_threads( opt.threads );

  PipelineOptions options;
  if (opt.min_zoom >= 0)
    options.min_zoom = opt.min_zoom;
  if (opt.max_zoom >= 0)
    options.max_zoom = opt.max_zoom;
  if (opt.tile_size > 0)
    options.tile_size = opt.tile_size;
  if (!opt.resample.empty())
    options.kernel = interpolation_kernel_from_string( opt.resample );
  options.keep_intermediate = opt.keep_intermediate;

  cartography::ControlPointSet points = load_points( opt.points );
  mosaic::TileStore store( opt.output_root );

  TerminalProgressCallback tpc( "pipeline", "Tiling:" );
  std::string id = run_pipeline( opt.image, points, options, store, tpc );
  std::cout << id << std::endl;
}

int main( int argc, char **argv ) {
  Options opt;
  if (!handle_options( argc, argv, opt ))
    return 1;

  try {
    run( opt );
  } catch ( const ArgumentErr& e ) {
    std::cerr << "Invalid argument: " << e.what() << std::endl;
    return 1;
  } catch ( const Exception& e ) {
    std::cerr << "\n\nError: " << e << std::endl;
    return 1;
  } catch ( const std::bad_alloc& e ) {
    std::cerr << "\n\nError: Ran out of Memory!" << std::endl;
    return 1;
  } catch ( const std::exception& e ) {
    std::cerr << "\n\nError: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
