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


/// \file ShiftEstimator.h
///
/// Horizontal shift between two DEMs from the correlation of the elevation
/// difference with terrain aspect, after Nuth and Kaab (2011).

#ifndef __COREG_NUTH_ALIGN_SHIFT_ESTIMATOR_H__
#define __COREG_NUTH_ALIGN_SHIFT_ESTIMATOR_H__

#include <coreg/NuthAlign/NanImageAlgs.h>

#include <vector>

namespace coreg {

const int    NUM_ASPECT_BINS = 72;    // 5 degree bins over the full circle
const double MAX_ABS_TARGET  = 200.0; // larger dh/slope values are left out of bins
const int    NUTH_FIT_MAX_ITER = 100;

/// The series behind a shift estimate, for plotting by the caller.
struct NuthDiagnostics {
  std::vector<double> bin_centers, bin_median, bin_fit;
  std::vector<long long> bin_count;
  // Finite (aspect, dh/slope) pairs between the 1st and 99th percentile
  std::vector<double> trimmed_aspect, trimmed_target;
  double p1, p99;
  NuthDiagnostics(): p1(0.0), p99(0.0) {}
};

/// A shift estimate in pixels. The fit constant c relates to the vertical
/// bias and is not used to move the grid.
struct NuthShift {
  double east, north, c;
  int num_bins; // bins with a finite median
  bool has_diagnostics;
  NuthDiagnostics diagnostics;
  NuthShift(): east(0.0), north(0.0), c(0.0), num_bins(0), has_diagnostics(false) {}
};

/// Estimate the shift of the slave relative to the master, with dh = master -
/// slave and the master slope and aspect. The slave content at (col, row)
/// is found in the master at (col - east, row + north). Throws
/// InsufficientDataErr when fewer than 3 aspect bins have data and
/// SingularFitErr when the sinusoid fit fails.
NuthShift horizontalShift(DoubleGrid const& dh,
                          DoubleGrid const& slope,
                          DoubleGrid const& aspect,
                          bool save_diagnostics = false);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_SHIFT_ESTIMATOR_H__
