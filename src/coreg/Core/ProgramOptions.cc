// __BEGIN_LICENSE__
//  Copyright (c) 2009-2013, United States Government as represented by the
//  Administrator of the National Aeronautics and Space Administration. All
//  rights reserved.
//
//  The NGT platform is licensed under the Apache License, Version 2.0 (the
//  "License"); you may not use this file except in compliance with the
//  License. You may obtain a copy of the License at
//  http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.
// __END_LICENSE__

#include <coreg/Core/ProgramOptions.h>
#include <coreg/coreg_config.h>

#include <vw/config.h>
#include <vw/Core/Log.h>
#include <vw/Core/Exception.h>

#include <gdal_version.h>

#include <sstream>
#include <cstdlib>

namespace po = boost::program_options;

std::string coreg::version_string() {
  std::ostringstream os;
  os << COREG_PACKAGE_STRING << "\n"
     << "  Build date: " << COREG_BUILD_DATE << "\n\n"
     << "Built against:\n"
     << "  " << VW_PACKAGE_STRING << "\n"
     << "  Boost C++ Libraries " << COREG_BOOST_VERSION << "\n"
     << "  GDAL " << GDAL_RELEASE_NAME << " | " << GDAL_RELEASE_DATE << "\n";
  return os.str();
}

po::variables_map
coreg::check_command_line(int argc, char *argv[], vw::GdalWriteOptions& opt,
                          po::options_description const& public_options,
                          po::options_description const& all_public_options,
                          po::options_description const& positional_options,
                          po::positional_options_description const& positional_desc,
                          std::string & usage_comment) {

  usage_comment = "Usage: " + std::string(argv[0]) + " " + usage_comment + "\n\n"
    + "  [" + COREG_PACKAGE_STRING + ", built " + COREG_BUILD_DATE + "]\n\n";

  // All of all_public_options is parsed, but only public_options is shown
  // in the help message.
  po::options_description all_options;
  all_options.add(all_public_options).add(positional_options);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(all_options)
              .positional(positional_desc)
              .style(po::command_line_style::unix_style).run(), vm);
    po::notify(vm);
  } catch (po::error const& e) {
    vw::vw_throw(vw::ArgumentErr() << "Error parsing input:\n"
                 << e.what() << "\n" << usage_comment << public_options);
  }

  if (vm.count("help")) {
    vw::vw_out() << usage_comment << public_options << "\n";
    exit(0);
  }

  if (vm.count("version")) {
    vw::vw_out() << version_string() << "\n";
    exit(0);
  }

  // Few viewers read BIGTIFF, so only use it when the output needs it
  opt.gdal_options["BIGTIFF"] = vm.count("no-bigtiff") ? "NO" : "IF_SAFER";

  opt.setVwSettingsFromOpt();

  return vm;
}
