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


/// \file CoregLoop.h
///
/// Iterative estimation and removal of the horizontal shift between a
/// master DEM and a slave DEM on the same grid.

#ifndef __COREG_NUTH_ALIGN_COREG_LOOP_H__
#define __COREG_NUTH_ALIGN_COREG_LOOP_H__

#include <coreg/NuthAlign/NanImageAlgs.h>
#include <coreg/NuthAlign/ShiftEstimator.h>

#include <vw/Math/Vector.h>

#include <vector>

namespace coreg {

struct CoregOptions {
  int num_iter;
  // Stop early when the NMAD changes by less than this percentage. Not
  // used when zero.
  double nmad_tol;
  bool save_diagnostics;
  CoregOptions(): num_iter(5), nmad_tol(0.0), save_diagnostics(false) {}
};

/// What one iteration found. The gain is the relative NMAD change in
/// percent, NaN if the previous NMAD was zero.
struct IterationStats {
  double east, north;
  double median, nmad, gain;
};

struct CoregResult {
  DoubleGrid aligned;  // slave resampled at the total offset
  vw::Vector2 offset;  // total (east, north) shift in pixels
  RobustStats initial; // of slave - master before alignment
  std::vector<IterationStats> iterations;
  std::vector<NuthDiagnostics> diagnostics; // one per iteration, if requested
};

/// Run the Nuth and Kaab iterations. The master slope and aspect are found
/// once. Each iteration removes the current median bias, estimates the
/// remaining shift from master - slave, and resamples the original slave at
/// the accumulated shift. Statistics are reported with vw_out(). The
/// slave is not modified.
CoregResult coregisterDems(DoubleGrid const& master, DoubleGrid const& slave,
                           CoregOptions const& opt);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_COREG_LOOP_H__
