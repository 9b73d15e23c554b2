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


/// \file ProgramOptions.h
///

#ifndef __COREG_CORE_PROGRAM_OPTIONS_H__
#define __COREG_CORE_PROGRAM_OPTIONS_H__

#include <vw/FileIO/GdalWriteOptions.h>

#include <boost/program_options.hpp>

#include <string>
#include <vector>

namespace coreg {

  /// The package, build date, and versions of the libraries it was built
  /// against.
  std::string version_string();

  /// Parse the command line. Handles --help and --version, copies the GDAL
  /// write options into the VW settings, and throws vw::ArgumentErr with the
  /// usage on a parse failure. The caller only puts the arguments of its
  /// application in usage_comment; the rest is filled in here.
  boost::program_options::variables_map
  check_command_line(int argc, char *argv[], vw::GdalWriteOptions& opt,
                     boost::program_options::options_description const& public_options,
                     boost::program_options::options_description const& all_public_options,
                     boost::program_options::options_description const& positional_options,
                     boost::program_options::positional_options_description
                     const& positional_desc,
                     std::string & usage_comment);

} // end namespace coreg

#endif//__COREG_CORE_PROGRAM_OPTIONS_H__
