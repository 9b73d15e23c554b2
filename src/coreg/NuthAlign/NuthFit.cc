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

#include <coreg/NuthAlign/NuthFit.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>
#include <vw/Core/Log.h>

#include <ceres/ceres.h>

#include <algorithm>
#include <cmath>

namespace coreg {

// Residual of one aspect bin: the curve at the bin center minus the bin
// median. The parameter block is (a, b, c).
struct NuthResidual {

  NuthResidual(double x, double y): m_x(x), m_y(y) {}

  template <typename T>
  bool operator()(const T* const params, T* residuals) const {
    using std::cos;
    residuals[0] = params[0] * cos(params[1] - T(m_x)) + params[2] - T(m_y);
    return true;
  }

  static ceres::CostFunction* Create(double x, double y) {
    return (new ceres::AutoDiffCostFunction<NuthResidual, 1, 3>
            (new NuthResidual(x, y)));
  }

  double m_x, m_y;
}; // End class NuthResidual

bool nuthFit(std::vector<double> const& bin_centers,
             std::vector<double> const& bin_median,
             int max_iter,
             vw::Vector3 & fit_params) {

  if (bin_centers.size() != bin_median.size())
    vw::vw_throw(vw::ArgumentErr() << "The bin centers and medians must have the same size.\n");

  for (int i = 0; i < 3; i++) {
    if (!std::isfinite(fit_params[i]))
      vw::vw_throw(InvalidInputErr() << "The initial guess for the Nuth fit is not finite: "
                   << fit_params << ".\n");
  }

  ceres::Problem problem;

  int num_bins = bin_centers.size();
  int num_used = 0;
  for (int i = 0; i < num_bins; i++) {

    // Empty bins do not contribute
    if (!std::isfinite(bin_median[i]) || !std::isfinite(bin_centers[i]))
      continue;

    // The bin medians are already robust to outliers, so no loss function
    problem.AddResidualBlock(NuthResidual::Create(bin_centers[i], bin_median[i]),
                             NULL, &fit_params[0]);
    num_used++;
  }

  if (num_used < 3)
    vw::vw_throw(InsufficientDataErr() << "Only " << num_used
                 << " aspect bins have data. Need at least 3 to fit the shift.\n");

  ceres::Solver::Options options;
  options.gradient_tolerance  = 1e-16;
  options.function_tolerance  = 1e-16;
  options.parameter_tolerance = 1e-12;
  options.max_num_iterations  = max_iter;
  options.max_num_consecutive_invalid_steps = std::max(5, max_iter/5);
  options.num_threads = 1;
  options.linear_solver_type = ceres::DENSE_QR;

  ceres::Solver::Summary summary;
  ceres::Solve(options, &problem, &summary);
  vw::vw_out(vw::DebugMessage) << summary.BriefReport() << "\n";

  if (!summary.IsSolutionUsable() || summary.termination_type != ceres::CONVERGENCE)
    return false;

  for (int i = 0; i < 3; i++) {
    if (!std::isfinite(fit_params[i]))
      return false;
  }

  return true;
}

} // end namespace coreg
