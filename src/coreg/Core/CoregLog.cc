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

#include <coreg/Core/CoregLog.h>
#include <coreg/coreg_config.h>

#include <vw/config.h>
#include <vw/Core/Log.h>
#include <vw/Core/Settings.h>
#include <vw/Core/Exception.h>
#include <vw/FileIO/FileUtils.h>

#include <gdal_version.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/shared_ptr.hpp>

#include <sstream>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = boost::filesystem;

void coreg::run_cmd_app_to_file(std::string cmd, std::string file) {
  std::string full_cmd;
  full_cmd = "echo '" + cmd + "' >> " + file; // echo the command to run
  int code = system(full_cmd.c_str());
  full_cmd = cmd + " >> " + file + " 2>&1";
  code = system(full_cmd.c_str());
  if (code != 0)
    vw::vw_out(vw::DebugMessage) << "Command returned " << code << ": " << cmd << "\n";
  full_cmd = "echo '' >> " + file; // append a newline
  code = system(full_cmd.c_str());
}

std::string coreg::extract_prog_name(std::string const& prog_str) {

  // Get program name without path and leading 'lt-'.
  std::string prog_name = fs::path(prog_str).stem().string();
  std::string pref = "lt-";
  size_t lp = pref.size();
  if (prog_name.size() >= lp && prog_name.substr(0, lp) == pref)
    prog_name = prog_name.substr(lp, prog_name.size() - lp);

  return prog_name;
}

std::string coreg::log_file_name(std::string const& out_prefix,
                                 std::string const& prog_name) {

  std::string timestamp =
      boost::posix_time::to_iso_string(boost::posix_time::second_clock::local_time());
  std::string clean_timestamp = timestamp.substr(4, 9); // Trim off the year
  clean_timestamp.replace(4, 1, 1, '-'); // Replace T with -
  clean_timestamp.insert (2, 1,    '-'); // Insert - between month and day

  std::ostringstream os;
  os << out_prefix << "-log-" << prog_name << "-"
     << clean_timestamp << "-" << getpid() << ".txt";
  return os.str();
}

// Quote an argument that has blanks, so the logged command can be rerun
static std::string quoted_arg(std::string const& arg) {
  if (arg.find_first_of(" \t") == std::string::npos)
    return arg;
  return '"' + arg + '"';
}

void coreg::log_to_file(int argc, char *argv[], std::string const& out_prefix) {

  if (out_prefix == "")
    vw::vw_throw(vw::ArgumentErr() << "Output prefix was not set.\n");

  // Create the output directory if not present
  vw::create_out_dir(out_prefix);

  std::string log_file = log_file_name(out_prefix, extract_prog_name(argv[0]));
  vw::vw_out() << "Writing log: " << log_file << std::endl;

  {
    // The handle must be closed before the commands below append to the file
    std::ofstream lg(log_file.c_str());
    if (!lg.good())
      vw::vw_throw(vw::IOErr() << "Cannot write: " << log_file << "\n");

    lg << COREG_PACKAGE_STRING << "\n"
       << "Build date: " << COREG_BUILD_DATE << "\n"
       << "Built against: " << VW_PACKAGE_STRING << ", GDAL " << GDAL_RELEASE_NAME
       << ", Boost " << COREG_BOOST_VERSION << "\n"
       << "Threads: " << vw::vw_settings().default_num_threads() << "\n\n";

    for (int s = 0; s < argc; s++) {
      std::string token(argv[s]);
      if (token != " ")
        lg << quoted_arg(token) << " ";
    }
    lg << "\n\n";
  }

  // Machine info. Not all of these exist everywhere.
  const char* sys_cmds[] = {
    "uname -a",
    "cat /proc/meminfo 2>/dev/null | grep MemTotal",
    "cat /proc/cpuinfo 2>/dev/null | grep 'model name' | head -n 1"
  };
  for (size_t it = 0; it < sizeof(sys_cmds)/sizeof(sys_cmds[0]); it++)
    coreg::run_cmd_app_to_file(sys_cmds[it], log_file);

  // Copy all the info going to the console to log_file as well,
  // except the progress bar.
  boost::shared_ptr<vw::LogInstance> current_log(new vw::LogInstance(log_file));
  current_log->rule_set() = vw::vw_log().console_log().rule_set();
  current_log->rule_set().add_rule(0, "*.progress");
  vw::vw_log().add(current_log);
}
