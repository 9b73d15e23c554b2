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

#include <coreg/NuthAlign/Resample.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>
#include <vw/Image/Interpolation.h>
#include <vw/Image/EdgeExtension.h>

#include <cmath>
#include <limits>

namespace coreg {

const double ShiftResampler::FILL_VALUE = -9999.0;

ShiftResampler::ShiftResampler(DoubleGrid const& grid):
  m_filled(grid.cols(), grid.rows()), m_nodata(grid.cols(), grid.rows()) {

  #pragma omp parallel for
  for (int col = 0; col < grid.cols(); col++) {
    for (int row = 0; row < grid.rows(); row++) {
      bool is_nan = std::isnan(grid(col, row));
      m_filled(col, row) = is_nan ? FILL_VALUE : grid(col, row);
      m_nodata(col, row) = is_nan ? 1.0 : 0.0;
    }
  }
}

DoubleGrid ShiftResampler::operator()(double east, double north) const {

  if (!std::isfinite(east) || !std::isfinite(north))
    vw::vw_throw(InvalidInputErr() << "Cannot resample at a non-finite shift: ("
                 << east << ", " << north << ").\n");

  auto filled_interp = vw::interpolate(m_filled, vw::BilinearInterpolation(),
                                       vw::ConstantEdgeExtension());
  auto nodata_interp = vw::interpolate(m_nodata, vw::BilinearInterpolation(),
                                       vw::ConstantEdgeExtension());

  int num_cols = m_filled.cols(), num_rows = m_filled.rows();
  DoubleGrid out(num_cols, num_rows);
  double nan = std::numeric_limits<double>::quiet_NaN();

  #pragma omp parallel for
  for (int col = 0; col < num_cols; col++) {
    for (int row = 0; row < num_rows; row++) {
      double x = col + east, y = row - north;
      if (nodata_interp(x, y) != 0.0)
        out(col, row) = nan;
      else
        out(col, row) = filled_interp(x, y);
    }
  }

  return out;
}

DoubleGrid shiftGrid(DoubleGrid const& grid, double east, double north) {
  ShiftResampler resampler(grid);
  return resampler(east, north);
}

} // end namespace coreg
