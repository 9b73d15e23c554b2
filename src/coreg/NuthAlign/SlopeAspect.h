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


/// \file SlopeAspect.h
///
/// Terrain slope and aspect of an elevation grid with NaN as nodata.

#ifndef __COREG_NUTH_ALIGN_SLOPE_ASPECT_H__
#define __COREG_NUTH_ALIGN_SLOPE_ASPECT_H__

#include <coreg/NuthAlign/NanImageAlgs.h>

#include <cmath>
#include <limits>

namespace coreg {

/// Aspect in radians in [0, 2*pi) from the elevation derivatives along a row
/// (eastward) and along a column (southward). Zero points north, and the
/// angle grows clockwise toward the direction of steepest ascent. NaN for a
/// flat cell or a non-finite derivative. atan2() + pi can reach exactly 2*pi,
/// which is folded to 0.
inline double aspectFromGradient(double dz_dcol, double dz_drow) {

  if (!std::isfinite(dz_dcol) || !std::isfinite(dz_drow) ||
      (dz_dcol == 0.0 && dz_drow == 0.0))
    return std::numeric_limits<double>::quiet_NaN();

  double aspect = atan2(-dz_dcol, dz_drow) + M_PI;
  if (aspect >= 2.0 * M_PI)
    aspect -= 2.0 * M_PI;

  return aspect;
}

/// Derivatives along each axis. Central differences in the interior and
/// one-sided differences at the first and last column and row. Each
/// dimension must be at least 2.
void gridGradient(DoubleGrid const& dem,
                  // Outputs
                  DoubleGrid & dz_dcol, DoubleGrid & dz_drow);

/// Slope magnitude in elevation units per pixel, and aspect as in
/// aspectFromGradient(). Both are NaN at NaN cells of the input and where
/// the gradient stencil touches one.
void calcSlopeAspect(DoubleGrid const& dem,
                     // Outputs
                     DoubleGrid & slope, DoubleGrid & aspect);

/// Slope angle in radians, using the pixel sizes in world units.
DoubleGrid calcTrueSlope(DoubleGrid const& dem, double grid_x, double grid_y);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_SLOPE_ASPECT_H__
