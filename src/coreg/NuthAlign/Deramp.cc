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

#include <coreg/NuthAlign/Deramp.h>
#include <coreg/NuthAlign/SlopeAspect.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>
#include <vw/Core/Log.h>

#include <Eigen/Dense>

#include <cmath>

namespace coreg {

DoubleGrid RampModel::operator()(DoubleGrid const& X, DoubleGrid const& Y) const {

  checkSameSize(X, Y, "Ramp evaluation");

  DoubleGrid out(X.cols(), X.rows());
  #pragma omp parallel for
  for (int col = 0; col < X.cols(); col++) {
    for (int row = 0; row < X.rows(); row++)
      out(col, row) = (*this)(X(col, row), Y(col, row));
  }

  return out;
}

DoubleGrid maskForDeramp(DoubleGrid const& diff,
                         DoubleGrid const& master,
                         DoubleGrid const& master_slope,
                         DerampOptions const& opt) {

  checkSameSize(diff, master, "Deramp masking");
  checkSameSize(diff, master_slope, "Deramp masking");

  if (!std::isfinite(opt.max_slope_deg) || opt.max_slope_deg <= 0.0)
    vw::vw_throw(InvalidInputErr() << "The maximum slope must be positive. Got: "
                 << opt.max_slope_deg << ".\n");
  if (!std::isfinite(opt.outlier_factor) || opt.outlier_factor <= 0.0)
    vw::vw_throw(InvalidInputErr() << "The outlier factor must be positive. Got: "
                 << opt.outlier_factor << ".\n");

  double max_slope = opt.max_slope_deg * M_PI / 180.0;
  double nan = std::numeric_limits<double>::quiet_NaN();
  DoubleGrid masked = vw::copy(diff);

  #pragma omp parallel for
  for (int col = 0; col < masked.cols(); col++) {
    for (int row = 0; row < masked.rows(); row++) {

      double z = master(col, row), s = master_slope(col, row);

      // Snow covered areas and the like
      if (!std::isnan(opt.zmax) && z > opt.zmax)
        masked(col, row) = nan;
      // Sea, lakes
      if (!std::isnan(opt.zmin) && z < opt.zmin)
        masked(col, row) = nan;
      // Steep terrain is more error-prone
      if (std::isnan(s) || s >= max_slope)
        masked(col, row) = nan;
    }
  }

  madFilter(masked, opt.outlier_factor);

  return masked;
}

RampModel fitRamp(DoubleGrid const& diff, DoubleGrid const& X, DoubleGrid const& Y) {

  checkSameSize(diff, X, "Ramp fit");
  checkSameSize(diff, Y, "Ramp fit");

  std::vector<Eigen::Vector3d> pts;
  for (int col = 0; col < diff.cols(); col++) {
    for (int row = 0; row < diff.rows(); row++) {
      double x = X(col, row), y = Y(col, row), z = diff(col, row);
      if (std::isfinite(x) && std::isfinite(y) && std::isfinite(z))
        pts.push_back(Eigen::Vector3d(x, y, z));
    }
  }

  size_t num_points = pts.size();
  if (num_points < 3)
    vw::vw_throw(InsufficientDataErr() << "Only " << num_points
                 << " valid samples are left for the ramp fit. Need at least 3.\n");

  // Subtract the centroid of the coordinates, for better conditioning
  Eigen::Vector2d centroid(0.0, 0.0);
  for (size_t i = 0; i < num_points; i++)
    centroid += pts[i].head<2>();
  centroid /= double(num_points);

  Eigen::MatrixXd A(num_points, 3);
  Eigen::VectorXd b(num_points);
  for (size_t i = 0; i < num_points; i++) {
    A(i, 0) = 1.0;
    A(i, 1) = pts[i][0] - centroid[0];
    A(i, 2) = pts[i][1] - centroid[1];
    b(i) = pts[i][2];
  }

  Eigen::JacobiSVD<Eigen::MatrixXd> svd(A, Eigen::ComputeThinU | Eigen::ComputeThinV);
  if (svd.rank() < 3)
    vw::vw_throw(SingularFitErr() << "The valid samples do not determine a plane. "
                 << "They may all lie on a line.\n");

  Eigen::Vector3d p = svd.solve(b);
  double ax = p[1], ay = p[2];
  double a0 = p[0] - ax * centroid[0] - ay * centroid[1];

  vw::vw_out(vw::DebugMessage) << "Ramp fit with " << num_points << " samples: "
                               << a0 << " " << ax << " " << ay << "\n";

  return RampModel(a0, ax, ay);
}

DoubleGrid removeRamp(DoubleGrid const& grid, RampModel const& ramp,
                      DoubleGrid const& X, DoubleGrid const& Y) {

  checkSameSize(grid, X, "Ramp removal");
  checkSameSize(grid, Y, "Ramp removal");

  DoubleGrid out(grid.cols(), grid.rows());
  #pragma omp parallel for
  for (int col = 0; col < grid.cols(); col++) {
    for (int row = 0; row < grid.rows(); row++)
      out(col, row) = grid(col, row) - ramp(X(col, row), Y(col, row));
  }

  return out;
}

DoubleGrid derampAligned(DoubleGrid const& aligned, DoubleGrid const& master,
                         DoubleGrid const& X, DoubleGrid const& Y,
                         double grid_x, double grid_y,
                         DerampOptions const& opt,
                         // Output
                         RampModel & ramp) {

  checkSameSize(aligned, master, "Deramping");

  DoubleGrid master_slope = calcTrueSlope(master, grid_x, grid_y);
  DoubleGrid diff = differenceGrid(aligned, master);
  DoubleGrid masked = maskForDeramp(diff, master, master_slope, opt);
  ramp = fitRamp(masked, X, Y);

  return removeRamp(aligned, ramp, X, Y);
}

} // end namespace coreg
