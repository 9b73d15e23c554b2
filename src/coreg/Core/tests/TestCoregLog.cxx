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


#include <test/Helpers.h>
#include <coreg/Core/CoregLog.h>
#include <coreg/Core/ProgramOptions.h>
#include <coreg/coreg_config.h>

#include <boost/algorithm/string/predicate.hpp>

using namespace coreg;

TEST(CoregLog, ExtractProgName) {
  EXPECT_EQ("dem_coreg", extract_prog_name("/usr/local/bin/dem_coreg"));
  EXPECT_EQ("dem_coreg", extract_prog_name("./lt-dem_coreg"));
  EXPECT_EQ("dem_coreg", extract_prog_name("dem_coreg.exe"));
}

TEST(CoregLog, LogFileName) {
  std::string name = log_file_name("run/out", "dem_coreg");
  EXPECT_TRUE(boost::algorithm::starts_with(name, "run/out-log-dem_coreg-"));
  EXPECT_TRUE(boost::algorithm::ends_with(name, ".txt"));
}

TEST(ProgramOptions, VersionString) {
  std::string version = version_string();
  EXPECT_NE(std::string::npos, version.find(COREG_PACKAGE_STRING));
  EXPECT_NE(std::string::npos, version.find("GDAL"));
}
