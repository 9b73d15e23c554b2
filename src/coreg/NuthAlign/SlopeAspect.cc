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

#include <coreg/NuthAlign/SlopeAspect.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>

#include <omp.h>

namespace coreg {

// Derivative at one sample of a line of n values, given the values before,
// at, and after it.
inline double lineDerivative(int i, int n, double prev, double curr, double next) {
  if (i == 0)
    return next - curr;
  if (i == n - 1)
    return curr - prev;
  return (next - prev) / 2.0;
}

void gridGradient(DoubleGrid const& dem,
                  // Outputs
                  DoubleGrid & dz_dcol, DoubleGrid & dz_drow) {

  int num_cols = dem.cols(), num_rows = dem.rows();
  if (num_cols < 2 || num_rows < 2)
    vw::vw_throw(vw::ArgumentErr() << "Cannot compute the gradient of a grid of size "
                 << num_cols << " x " << num_rows << ". Need at least 2 x 2.\n");

  dz_dcol.set_size(num_cols, num_rows);
  dz_drow.set_size(num_cols, num_rows);

  #pragma omp parallel for
  for (int col = 0; col < num_cols; col++) {
    for (int row = 0; row < num_rows; row++) {

      double curr = dem(col, row);

      double left  = (col > 0) ? dem(col - 1, row) : curr;
      double right = (col < num_cols - 1) ? dem(col + 1, row) : curr;
      dz_dcol(col, row) = lineDerivative(col, num_cols, left, curr, right);

      double up   = (row > 0) ? dem(col, row - 1) : curr;
      double down = (row < num_rows - 1) ? dem(col, row + 1) : curr;
      dz_drow(col, row) = lineDerivative(row, num_rows, up, curr, down);
    }
  }
}

void calcSlopeAspect(DoubleGrid const& dem,
                     // Outputs
                     DoubleGrid & slope, DoubleGrid & aspect) {

  DoubleGrid dz_dcol, dz_drow;
  gridGradient(dem, dz_dcol, dz_drow);

  slope.set_size(dem.cols(), dem.rows());
  aspect.set_size(dem.cols(), dem.rows());
  double nan = std::numeric_limits<double>::quiet_NaN();

  #pragma omp parallel for
  for (int col = 0; col < dem.cols(); col++) {
    for (int row = 0; row < dem.rows(); row++) {

      // A central difference skips the center value, so check it here
      if (!std::isfinite(dem(col, row))) {
        slope(col, row) = nan;
        aspect(col, row) = nan;
        continue;
      }

      double gc = dz_dcol(col, row), gr = dz_drow(col, row);
      slope(col, row) = sqrt(gc * gc + gr * gr);
      aspect(col, row) = aspectFromGradient(gc, gr);
    }
  }
}

DoubleGrid calcTrueSlope(DoubleGrid const& dem, double grid_x, double grid_y) {

  if (!(grid_x > 0.0) || !(grid_y > 0.0) || !std::isfinite(grid_x) || !std::isfinite(grid_y))
    vw::vw_throw(InvalidInputErr() << "The grid sizes must be positive. Got: "
                 << grid_x << ", " << grid_y << ".\n");

  DoubleGrid dz_dcol, dz_drow;
  gridGradient(dem, dz_dcol, dz_drow);

  DoubleGrid slope(dem.cols(), dem.rows());
  double nan = std::numeric_limits<double>::quiet_NaN();

  #pragma omp parallel for
  for (int col = 0; col < dem.cols(); col++) {
    for (int row = 0; row < dem.rows(); row++) {
      if (!std::isfinite(dem(col, row))) {
        slope(col, row) = nan;
        continue;
      }
      double dx = dz_dcol(col, row) / grid_x;
      double dy = dz_drow(col, row) / grid_y;
      slope(col, row) = atan(sqrt(dx * dx + dy * dy));
    }
  }

  return slope;
}

} // end namespace coreg
