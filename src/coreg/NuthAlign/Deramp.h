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


/// \file Deramp.h
///
/// Fit and removal of a planar vertical trend from an elevation difference.

#ifndef __COREG_NUTH_ALIGN_DERAMP_H__
#define __COREG_NUTH_ALIGN_DERAMP_H__

#include <coreg/NuthAlign/NanImageAlgs.h>

#include <limits>

namespace coreg {

/// The plane a0 + ax * X + ay * Y over world coordinates.
class RampModel {
public:
  RampModel(): m_a0(0.0), m_ax(0.0), m_ay(0.0) {}
  RampModel(double a0, double ax, double ay): m_a0(a0), m_ax(ax), m_ay(ay) {}

  double operator()(double x, double y) const { return m_a0 + m_ax * x + m_ay * y; }

  /// Evaluate at every cell of the coordinate grids
  DoubleGrid operator()(DoubleGrid const& X, DoubleGrid const& Y) const;

  double a0() const { return m_a0; }
  double ax() const { return m_ax; }
  double ay() const { return m_ay; }

private:
  double m_a0, m_ax, m_ay;
};

/// Which cells of the difference take part in the plane fit. NaN elevation
/// bounds are not applied.
struct DerampOptions {
  double zmin, zmax;
  double max_slope_deg;  // cells at or above this slope are excluded
  double outlier_factor; // in units of NMAD around the median
  DerampOptions(): zmin(std::numeric_limits<double>::quiet_NaN()),
                   zmax(std::numeric_limits<double>::quiet_NaN()),
                   max_slope_deg(20.0), outlier_factor(3.0) {}
};

/// Copy of the difference with NaN where the master elevation is above zmax
/// or below zmin, where the master slope (radians) is at least the limit or
/// undefined, and finally where the remaining values are outliers.
DoubleGrid maskForDeramp(DoubleGrid const& diff,
                         DoubleGrid const& master,
                         DoubleGrid const& master_slope,
                         DerampOptions const& opt);

/// Least squares plane through the finite cells of the difference. Throws
/// InsufficientDataErr with fewer than 3 such cells, and SingularFitErr if
/// they do not determine a plane.
RampModel fitRamp(DoubleGrid const& diff, DoubleGrid const& X, DoubleGrid const& Y);

/// The grid minus the ramp evaluated at each cell.
DoubleGrid removeRamp(DoubleGrid const& grid, RampModel const& ramp,
                      DoubleGrid const& X, DoubleGrid const& Y);

/// The deramping stage after horizontal alignment. Fits a ramp to aligned -
/// master over the cells kept by maskForDeramp(), with the master slope found
/// from the pixel sizes grid_x and grid_y, and returns the aligned grid minus
/// that ramp at every cell. The ramp is also returned, for reporting.
DoubleGrid derampAligned(DoubleGrid const& aligned, DoubleGrid const& master,
                         DoubleGrid const& X, DoubleGrid const& Y,
                         double grid_x, double grid_y,
                         DerampOptions const& opt,
                         // Output
                         RampModel & ramp);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_DERAMP_H__
