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


/// \file NuthFit.h
/// Best fit function for Nuth and Kaab alignment.

#ifndef __COREG_NUTH_ALIGN_NUTH_FIT_H__
#define __COREG_NUTH_ALIGN_NUTH_FIT_H__

#include <vw/Math/Vector.h>

#include <vector>

namespace coreg {

/// The curve a * cos(b - x) + c, with angles in radians.
inline double nuthFunc(double x, double a, double b, double c) {
  return a * cos(b - x) + c;
}

/// Fit nuthFunc() to the bin medians at the bin centers with Ceres. Bins
/// with a NaN median are left out of the problem. On input fit_params has
/// the initial guess (a, b, c), on output the solution. Returns true if the
/// solver converged to a usable solution. Each call sets up its own problem,
/// so nothing is kept across calls. Throws InsufficientDataErr if fewer than
/// 3 bins have a finite median.
bool nuthFit(std::vector<double> const& bin_centers,
             std::vector<double> const& bin_median,
             int max_iter,
             vw::Vector3 & fit_params);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_NUTH_FIT_H__
