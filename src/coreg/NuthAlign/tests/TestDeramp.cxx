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


#include <test/Helpers.h>
#include <coreg/NuthAlign/Deramp.h>
#include <coreg/Core/Exceptions.h>

#include <limits>
#include <random>

using namespace coreg;

namespace {

const int COLS = 100, ROWS = 90;

// Projected coordinates of a 30 m grid, with y going down the rows
void makeCoords(DoubleGrid & X, DoubleGrid & Y) {
  X.set_size(COLS, ROWS);
  Y.set_size(COLS, ROWS);
  for (int col = 0; col < COLS; col++) {
    for (int row = 0; row < ROWS; row++) {
      X(col, row) = 500000.0 + 30.0 * col;
      Y(col, row) = 4100000.0 - 30.0 * row;
    }
  }
}

DoubleGrid noisyPlane(DoubleGrid const& X, DoubleGrid const& Y, RampModel const& ramp,
                      double sigma) {
  std::mt19937 gen(t::get_random_seed());
  std::normal_distribution<double> noise(0.0, sigma);
  DoubleGrid diff(COLS, ROWS);
  for (int col = 0; col < COLS; col++)
    for (int row = 0; row < ROWS; row++)
      diff(col, row) = ramp(X(col, row), Y(col, row)) + noise(gen);
  return diff;
}

DoubleGrid constantGrid(double val) {
  DoubleGrid grid(COLS, ROWS);
  for (int col = 0; col < COLS; col++)
    for (int row = 0; row < ROWS; row++)
      grid(col, row) = val;
  return grid;
}

}

TEST(Deramp, RecoversPlane) {
  DoubleGrid X, Y;
  makeCoords(X, Y);
  RampModel truth(2.5 + 0.001 * 500000.0 - 0.002 * 4100000.0, -0.001, 0.002);
  double sigma = 0.1;
  DoubleGrid diff = noisyPlane(X, Y, truth, sigma);

  RampModel ramp = fitRamp(diff, X, Y);
  EXPECT_NEAR(truth.ax(), ramp.ax(), 1e-4);
  EXPECT_NEAR(truth.ay(), ramp.ay(), 1e-4);
  // Compare the intercepts where the data is
  double xc = X(COLS/2, ROWS/2), yc = Y(COLS/2, ROWS/2);
  EXPECT_NEAR(truth(xc, yc), ramp(xc, yc), 0.02);

  // Only the noise is left
  DoubleGrid residual = removeRamp(diff, ramp, X, Y);
  RobustStats before = robustStats(diff), after = robustStats(residual);
  EXPECT_LT(after.nmad, 1.3 * sigma);
  EXPECT_LT(after.nmad, before.nmad);
  EXPECT_NEAR(0.0, after.median, 0.02);
}

TEST(Deramp, RobustToOutliers) {
  DoubleGrid X, Y;
  makeCoords(X, Y);
  RampModel truth(1.0 + 0.0005 * 500000.0, -0.0005, 0.0);
  DoubleGrid diff = noisyPlane(X, Y, truth, 0.05);

  // Blunders in 1% of the cells
  for (int col = 0; col < COLS; col++)
    for (int row = 0; row < ROWS; row++)
      if ((col * ROWS + row) % 100 == 3)
        diff(col, row) += 80.0;

  DoubleGrid master = constantGrid(1000.0);
  DoubleGrid slope = constantGrid(0.0);
  DoubleGrid masked = maskForDeramp(diff, master, slope, DerampOptions());
  EXPECT_EQ(COLS * ROWS - COLS * ROWS / 100, finiteCount(masked));

  RampModel ramp = fitRamp(masked, X, Y);
  EXPECT_NEAR(truth.ax(), ramp.ax(), 1e-5);
  EXPECT_NEAR(truth.ay(), ramp.ay(), 1e-5);
  double xc = X(COLS/2, ROWS/2), yc = Y(COLS/2, ROWS/2);
  EXPECT_NEAR(truth(xc, yc), ramp(xc, yc), 0.02);
}

TEST(Deramp, MaskingSteps) {
  DoubleGrid diff = constantGrid(0.0);
  for (int col = 0; col < COLS; col++)
    for (int row = 0; row < ROWS; row++)
      diff(col, row) = 0.01 * ((col + row) % 7);

  DoubleGrid master = constantGrid(500.0);
  master(1, 1) = 5000.0;  // above zmax
  master(2, 2) = -20.0;   // below zmin
  DoubleGrid slope = constantGrid(10.0 * M_PI / 180.0);
  slope(3, 3) = 20.0 * M_PI / 180.0;  // at the limit
  slope(4, 4) = std::numeric_limits<double>::quiet_NaN();

  DerampOptions opt;
  opt.zmin = 0.0;
  opt.zmax = 3000.0;
  DoubleGrid masked = maskForDeramp(diff, master, slope, opt);

  EXPECT_TRUE(std::isnan(masked(1, 1)));
  EXPECT_TRUE(std::isnan(masked(2, 2)));
  EXPECT_TRUE(std::isnan(masked(3, 3)));
  EXPECT_TRUE(std::isnan(masked(4, 4)));
  EXPECT_EQ(COLS * ROWS - 4, finiteCount(masked));
  // The input is not changed
  EXPECT_FALSE(std::isnan(diff(1, 1)));

  // Without elevation bounds only the slope applies
  masked = maskForDeramp(diff, master, slope, DerampOptions());
  EXPECT_FALSE(std::isnan(masked(1, 1)));
  EXPECT_FALSE(std::isnan(masked(2, 2)));
  EXPECT_EQ(COLS * ROWS - 2, finiteCount(masked));

  opt.max_slope_deg = 0.0;
  EXPECT_THROW(maskForDeramp(diff, master, slope, opt), InvalidInputErr);
  EXPECT_THROW(maskForDeramp(diff, DoubleGrid(3, 3), slope, opt), ShapeMismatchErr);
}

TEST(Deramp, TooFewPoints) {
  DoubleGrid X, Y;
  makeCoords(X, Y);
  DoubleGrid diff = constantGrid(std::numeric_limits<double>::quiet_NaN());
  diff(5, 5) = 1.0;
  diff(6, 7) = 2.0;
  EXPECT_THROW(fitRamp(diff, X, Y), InsufficientDataErr);

  // Three points on a line do not make a plane
  for (int col = 0; col < COLS; col++)
    diff(col, 10) = 0.3 * col;
  diff(5, 5) = std::numeric_limits<double>::quiet_NaN();
  diff(6, 7) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(fitRamp(diff, X, Y), SingularFitErr);

  // One more point off the line is enough
  diff(3, 40) = 1.0;
  RampModel ramp = fitRamp(diff, X, Y);
  EXPECT_NEAR(0.01, ramp.ax(), 1e-9);
}

TEST(Deramp, EvaluateOnGrid) {
  DoubleGrid X, Y;
  makeCoords(X, Y);
  RampModel ramp(1.0, 2.0, -3.0);
  DoubleGrid values = ramp(X, Y);
  EXPECT_NEAR(1.0 + 2.0 * X(7, 8) - 3.0 * Y(7, 8), values(7, 8), 1e-6);

  DoubleGrid grid = constantGrid(10.0);
  grid(0, 0) = std::numeric_limits<double>::quiet_NaN();
  DoubleGrid out = removeRamp(grid, RampModel(4.0, 0.0, 0.0), X, Y);
  EXPECT_EQ(6.0, out(1, 1));
  EXPECT_TRUE(std::isnan(out(0, 0)));
}
