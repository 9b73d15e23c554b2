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


// Fine co-registration of two DEMs with the method of Nuth and Kaab (2011):
// iterative estimation of the horizontal shift from the correlation of the
// elevation difference with terrain aspect, followed by removal of a planar
// vertical trend.

#include <coreg/Core/Macros.h>
#include <coreg/Core/ProgramOptions.h>
#include <coreg/Core/CoregLog.h>
#include <coreg/NuthAlign/DemIO.h>
#include <coreg/NuthAlign/CoregLoop.h>
#include <coreg/NuthAlign/Deramp.h>

#include <vw/Core/Exception.h>
#include <vw/Core/Log.h>
#include <vw/FileIO/GdalWriteOptions.h>
#include <vw/Cartography/GeoReference.h>

#include <boost/program_options.hpp>
#include <boost/filesystem/path.hpp>
#include <omp.h>

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace po = boost::program_options;
namespace fs = boost::filesystem;

struct Options: vw::GdalWriteOptions {
  std::string master_dem, slave_dem, outfile, mask_file, out_prefix;
  int num_iter;
  double nodata1, nodata2, zmin, zmax, resmax, nmad_tol, output_nodata;
  bool plot, no_deramp;
  Options(): num_iter(5), nodata1(0), nodata2(0), zmin(0), zmax(0), resmax(0),
             nmad_tol(0), output_nodata(0), plot(false), no_deramp(false) {}
};

void handle_arguments(int argc, char *argv[], Options& opt) {

  double nan = std::numeric_limits<double>::quiet_NaN();

  po::options_description general_options("General options");
  general_options.add_options()
    ("iter", po::value(&opt.num_iter)->default_value(5),
     "Number of iterations.")
    ("mask", po::value(&opt.mask_file)->default_value(""),
     "A mask of the same size as the master DEM, to filter out unstable areas "
     "such as glaciers. Points with mask > 0 are not used.")
    ("nodata1", po::value(&opt.nodata1)->default_value(nan, "none"),
     "Nodata value for the master DEM, if not the one in the file.")
    ("nodata2", po::value(&opt.nodata2)->default_value(nan, "none"),
     "Nodata value for the slave DEM, if not the one in the file.")
    ("zmax", po::value(&opt.zmax)->default_value(nan, "none"),
     "Points with master elevation above this are not used to find the ramp, "
     "for example snow covered areas.")
    ("zmin", po::value(&opt.zmin)->default_value(nan, "none"),
     "Points with master elevation below this are not used to find the ramp, "
     "for example points on the sea.")
    ("resmax", po::value(&opt.resmax)->default_value(nan, "none"),
     "Points where the absolute elevation difference is larger than this are "
     "considered outliers and are removed.")
    ("nmad-tol", po::value(&opt.nmad_tol)->default_value(0.0),
     "Stop before the last iteration if the NMAD of the difference changes by less "
     "than this percentage. Set to 0 to always run all iterations.")
    ("output-nodata", po::value(&opt.output_nodata)->default_value(nan, "none"),
     "Nodata value for the output DEM. The default is the one of the master DEM, "
     "then the one of the slave DEM, then the smallest float.")
    ("no-deramp", po::bool_switch(&opt.no_deramp)->default_value(false),
     "Do not remove a planar trend after the horizontal alignment.")
    ("plot", po::bool_switch(&opt.plot)->default_value(false),
     "Save the binned differences, the fitted curves, and the ramp as text files "
     "next to the output, for plotting.");
  general_options.add(vw::GdalWriteOptionsDescription(opt));

  po::options_description positional("");
  positional.add_options()
    ("master-dem", po::value(&opt.master_dem))
    ("slave-dem",  po::value(&opt.slave_dem))
    ("outfile",    po::value(&opt.outfile));

  po::positional_options_description positional_desc;
  positional_desc.add("master-dem", 1);
  positional_desc.add("slave-dem",  1);
  positional_desc.add("outfile",    1);

  std::string usage("master_dem.tif slave_dem.tif output.tif [options]\n");
  po::variables_map vm =
    coreg::check_command_line(argc, argv, opt, general_options, general_options,
                              positional, positional_desc, usage);

  if (opt.master_dem == "" || opt.slave_dem == "" || opt.outfile == "")
    vw::vw_throw(vw::ArgumentErr() << "The master DEM, slave DEM, and output "
                 << "file must be provided.\n" << usage << general_options);

  if (opt.num_iter < 1)
    vw::vw_throw(vw::ArgumentErr() << "The number of iterations must be positive.\n");

  if (opt.nmad_tol < 0.0)
    vw::vw_throw(vw::ArgumentErr() << "The NMAD tolerance must be non-negative.\n");

  if (!std::isnan(opt.resmax) && opt.resmax <= 0.0)
    vw::vw_throw(vw::ArgumentErr() << "The value of --resmax must be positive.\n");

  if (!std::isnan(opt.zmin) && !std::isnan(opt.zmax) && opt.zmin >= opt.zmax)
    vw::vw_throw(vw::ArgumentErr() << "The value of --zmin must be less than --zmax.\n");

  if (opt.num_threads > 0) {
    omp_set_dynamic(0);
    omp_set_num_threads(opt.num_threads);
  }

  // Other files are named after the output DEM
  opt.out_prefix = fs::path(opt.outfile).replace_extension("").string();

  // Turn on logging to file
  coreg::log_to_file(argc, argv, opt.out_prefix);
}

// Save the binned medians and the fitted curve of one iteration
void writeShiftDiagnostics(std::string const& out_prefix, int iter,
                           coreg::NuthDiagnostics const& diag) {

  std::ostringstream os;
  os << out_prefix << "-shift-fit-" << iter << ".txt";
  std::string file = os.str();

  vw::vw_out() << "Writing: " << file << "\n";
  std::ofstream ofs(file.c_str());
  if (!ofs.good())
    vw::vw_throw(vw::IOErr() << "Cannot write: " << file << "\n");

  ofs << std::setprecision(17);
  ofs << "# aspect_bin_center_rad bin_median_dh_over_slope fitted_value sample_count\n";
  for (size_t i = 0; i < diag.bin_centers.size(); i++)
    ofs << diag.bin_centers[i] << " " << diag.bin_median[i] << " "
        << diag.bin_fit[i] << " " << diag.bin_count[i] << "\n";
}

void writeRamp(std::string const& out_prefix, coreg::RampModel const& ramp) {

  std::string file = out_prefix + "-ramp.txt";
  vw::vw_out() << "Writing: " << file << "\n";
  std::ofstream ofs(file.c_str());
  if (!ofs.good())
    vw::vw_throw(vw::IOErr() << "Cannot write: " << file << "\n");

  ofs << std::setprecision(17);
  ofs << "# ramp = a0 + ax * X + ay * Y, with X and Y projected coordinates\n";
  ofs << "a0 " << ramp.a0() << "\n";
  ofs << "ax " << ramp.ax() << "\n";
  ofs << "ay " << ramp.ay() << "\n";
}

void run_coreg(Options const& opt) {

  vw::vw_out() << "Master DEM: " << opt.master_dem << "\n";
  vw::vw_out() << "Slave DEM:  " << opt.slave_dem << "\n";

  vw::cartography::GeoReference master_georef, slave_georef;
  bool has_master_nodata = false, has_slave_nodata = false;
  double master_nodata = 0.0, slave_nodata = 0.0;
  coreg::DoubleGrid master = coreg::readDem(opt.master_dem, opt.nodata1, master_georef,
                                            has_master_nodata, master_nodata);
  coreg::DoubleGrid slave = coreg::readDem(opt.slave_dem, opt.nodata2, slave_georef,
                                           has_slave_nodata, slave_nodata);

  // Put the slave on the master grid
  if (master.cols() != slave.cols() || master.rows() != slave.rows()) {
    vw::vw_out() << "Regridding the slave DEM to the master DEM grid.\n";
    slave = coreg::regridToReference(slave, slave_georef, master_georef,
                                     master.cols(), master.rows());
  }

  if (opt.mask_file != "")
    coreg::applyMaskFile(master, opt.mask_file);

  if (!std::isnan(opt.resmax))
    coreg::residualFilter(master, slave, opt.resmax);

  coreg::CoregOptions coreg_opt;
  coreg_opt.num_iter = opt.num_iter;
  coreg_opt.nmad_tol = opt.nmad_tol;
  coreg_opt.save_diagnostics = opt.plot;
  coreg::CoregResult result = coreg::coregisterDems(master, slave, coreg_opt);

  if (opt.plot) {
    for (size_t it = 0; it < result.diagnostics.size(); it++)
      writeShiftDiagnostics(opt.out_prefix, it + 1, result.diagnostics[it]);
  }

  coreg::DoubleGrid aligned = result.aligned;
  if (!opt.no_deramp) {
    vw::vw_out() << "deramping\n";

    coreg::DoubleGrid X, Y;
    coreg::worldCoordinates(master_georef, master.cols(), master.rows(), X, Y);
    vw::Vector2 grid_size = coreg::pixelResolution(master_georef);

    coreg::DerampOptions deramp_opt;
    deramp_opt.zmin = opt.zmin;
    deramp_opt.zmax = opt.zmax;
    coreg::RampModel ramp;
    aligned = coreg::derampAligned(aligned, master, X, Y, grid_size[0], grid_size[1],
                                   deramp_opt, ramp);

    if (opt.plot)
      writeRamp(opt.out_prefix, ramp);
  }

  coreg::RobustStats stats = coreg::robustStats(coreg::differenceGrid(aligned, master));
  std::ostringstream os;
  os << std::fixed << std::setprecision(2);
  os << "Final DEM\n";
  os << "Median : " << stats.median << ", NMAD = " << stats.nmad << "\n";
  vw::vw_out() << os.str();

  double nodata = -std::numeric_limits<float>::max();
  if (!std::isnan(opt.output_nodata))
    nodata = opt.output_nodata;
  else if (has_master_nodata)
    nodata = master_nodata;
  else if (has_slave_nodata)
    nodata = slave_nodata;

  coreg::writeDem(opt.outfile, aligned, master_georef, nodata, opt);
}

int main(int argc, char *argv[]) {

  Options opt;
  try {
    handle_arguments(argc, argv, opt);
    run_coreg(opt);
  } COREG_STANDARD_CATCHES;

  return 0;
}
