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

#include <coreg/NuthAlign/ShiftEstimator.h>
#include <coreg/NuthAlign/NuthFit.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>

#include <cmath>

namespace coreg {

NuthShift horizontalShift(DoubleGrid const& dh,
                          DoubleGrid const& slope,
                          DoubleGrid const& aspect,
                          bool save_diagnostics) {

  checkSameSize(dh, slope, "Shift estimation");
  checkSameSize(dh, aspect, "Shift estimation");

  // Normalize by the slope, so only the dependence on aspect is left. The
  // ratio is Inf or NaN on flat ground and is filtered below.
  std::vector<double> x, y;
  for (int col = 0; col < dh.cols(); col++) {
    for (int row = 0; row < dh.rows(); row++) {
      if (!std::isfinite(dh(col, row)))
        continue;
      x.push_back(aspect(col, row));
      y.push_back(dh(col, row) / slope(col, row));
    }
  }

  NuthShift shift;
  NuthDiagnostics & diag = shift.diagnostics;
  binnedMedians(x, y, NUM_ASPECT_BINS, vw::Vector2(0.0, 2.0 * M_PI),
                -MAX_ABS_TARGET, MAX_ABS_TARGET,
                diag.bin_median, diag.bin_centers, diag.bin_count); // outputs

  for (size_t i = 0; i < diag.bin_median.size(); i++) {
    if (std::isfinite(diag.bin_median[i]))
      shift.num_bins++;
  }
  if (shift.num_bins < 3)
    vw::vw_throw(InsufficientDataErr() << "Only " << shift.num_bins
                 << " aspect bins have data. Need at least 3 to find the shift.\n");

  // Keep the finite pairs, then trim to the 1st and 99th percentile. The
  // bounds are inclusive, so a constant series survives.
  std::vector<double> xf, yf;
  for (size_t i = 0; i < x.size(); i++) {
    if (std::isfinite(x[i]) && std::isfinite(y[i])) {
      xf.push_back(x[i]);
      yf.push_back(y[i]);
    }
  }
  diag.p1  = nanPercentile(yf, 1.0);
  diag.p99 = nanPercentile(yf, 99.0);
  for (size_t i = 0; i < yf.size(); i++) {
    if (yf[i] >= diag.p1 && yf[i] <= diag.p99) {
      diag.trimmed_aspect.push_back(xf[i]);
      diag.trimmed_target.push_back(yf[i]);
    }
  }

  // First guess
  double mean = nanMean(diag.trimmed_target);
  double std_dev = nanStdDev(diag.trimmed_target, mean);
  vw::Vector3 fit_params(3.0 * std_dev / sqrt(2.0), 0.0, mean);

  if (!nuthFit(diag.bin_centers, diag.bin_median, NUTH_FIT_MAX_ITER, fit_params))
    vw::vw_throw(SingularFitErr() << "The fit of the elevation difference "
                 << "against terrain aspect did not converge.\n");

  double a = fit_params[0], b = fit_params[1];
  shift.c = fit_params[2];

  // b = 0 when the shift points north
  shift.east  = a * sin(b);
  shift.north = a * cos(b);

  if (save_diagnostics) {
    shift.has_diagnostics = true;
    diag.bin_fit.resize(diag.bin_centers.size());
    for (size_t i = 0; i < diag.bin_centers.size(); i++)
      diag.bin_fit[i] = nuthFunc(diag.bin_centers[i], a, b, shift.c);
  } else {
    shift.diagnostics = NuthDiagnostics();
  }

  return shift;
}

} // end namespace coreg
