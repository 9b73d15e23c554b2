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

#include <coreg/NuthAlign/CoregLoop.h>
#include <coreg/NuthAlign/SlopeAspect.h>
#include <coreg/NuthAlign/Resample.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>
#include <vw/Core/Log.h>

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace coreg {

// Subtract a constant from every cell. NaN cells stay NaN.
static void subtractBias(DoubleGrid & grid, double bias) {
  #pragma omp parallel for
  for (int col = 0; col < grid.cols(); col++) {
    for (int row = 0; row < grid.rows(); row++)
      grid(col, row) -= bias;
  }
}

CoregResult coregisterDems(DoubleGrid const& master, DoubleGrid const& slave,
                           CoregOptions const& opt) {

  checkSameSize(master, slave, "Master and slave DEMs");

  if (opt.num_iter < 1)
    vw::vw_throw(InvalidInputErr() << "The number of iterations must be positive. Got: "
                 << opt.num_iter << ".\n");
  if (!std::isfinite(opt.nmad_tol) || opt.nmad_tol < 0.0)
    vw::vw_throw(InvalidInputErr() << "The NMAD tolerance must be non-negative. Got: "
                 << opt.nmad_tol << ".\n");

  CoregResult result;
  result.offset = vw::Vector2(0, 0);
  result.initial = robustStats(differenceGrid(slave, master));

  std::ostringstream os;
  os << std::fixed << std::setprecision(6);
  os << "Statistics on initial dh\n";
  os << "Median : " << result.initial.median << ", NMAD : " << result.initial.nmad << "\n";
  vw::vw_out() << os.str();

  // The terrain does not move, only the slave does
  DoubleGrid slope, aspect;
  calcSlopeAspect(master, slope, aspect);

  // The original slave is resampled each time at the total offset
  ShiftResampler resampler(slave);
  DoubleGrid current = vw::copy(slave);

  double median = result.initial.median, nmad_old = result.initial.nmad;

  vw::vw_out() << "Iteratively estimate DEMs shift\n";
  for (int it = 0; it < opt.num_iter; it++) {

    // Remove the bias, so it does not enter the horizontal estimate
    subtractBias(current, median);

    DoubleGrid dh = differenceGrid(master, current);
    NuthShift shift = horizontalShift(dh, slope, aspect, opt.save_diagnostics);

    os.str("");
    os << std::fixed << std::setprecision(6);
    os << "#" << it + 1 << " - Offset in pixels : ("
       << shift.east << "," << shift.north << ")\n";
    vw::vw_out() << os.str();

    result.offset += vw::Vector2(shift.east, shift.north);
    current = resampler(result.offset[0], result.offset[1]);

    RobustStats stats = robustStats(differenceGrid(current, master));

    IterationStats iter_stats;
    iter_stats.east   = shift.east;
    iter_stats.north  = shift.north;
    iter_stats.median = stats.median;
    iter_stats.nmad   = stats.nmad;
    iter_stats.gain   = std::numeric_limits<double>::quiet_NaN();
    if (nmad_old != 0.0)
      iter_stats.gain = (stats.nmad - nmad_old) / nmad_old * 100.0;
    result.iterations.push_back(iter_stats);
    if (opt.save_diagnostics)
      result.diagnostics.push_back(shift.diagnostics);

    os.str("");
    os << std::fixed << std::setprecision(2);
    os << "Median : " << stats.median << ", NMAD = " << stats.nmad
       << ", Gain : " << iter_stats.gain << "%\n";
    vw::vw_out() << os.str();

    median = stats.median;
    nmad_old = stats.nmad;

    if (opt.nmad_tol > 0.0 && std::isfinite(iter_stats.gain) &&
        std::abs(iter_stats.gain) < opt.nmad_tol) {
      vw::vw_out() << "The NMAD changed by less than " << opt.nmad_tol
                   << "%. Stopping after " << it + 1 << " iterations.\n";
      break;
    }
  }

  os.str("");
  os << std::fixed << std::setprecision(6);
  os << "Final Offset in pixels (east, north) : ("
     << result.offset[0] << "," << result.offset[1] << ")\n";
  vw::vw_out() << os.str();

  result.aligned = current;
  return result;
}

} // end namespace coreg
