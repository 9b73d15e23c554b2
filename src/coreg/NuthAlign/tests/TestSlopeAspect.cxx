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
#include <coreg/NuthAlign/SlopeAspect.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>

#include <limits>

using namespace coreg;

namespace {

DoubleGrid planeGrid(int cols, int rows, double gc, double gr) {
  DoubleGrid grid(cols, rows);
  for (int col = 0; col < cols; col++)
    for (int row = 0; row < rows; row++)
      grid(col, row) = 100.0 + gc * col + gr * row;
  return grid;
}

}

TEST(SlopeAspect, RisingEastward) {
  DoubleGrid slope, aspect;
  calcSlopeAspect(planeGrid(5, 4, 2.0, 0.0), slope, aspect);

  for (int col = 0; col < 5; col++) {
    for (int row = 0; row < 4; row++) {
      EXPECT_NEAR(2.0, slope(col, row), 1e-12);
      EXPECT_NEAR(M_PI / 2.0, aspect(col, row), 1e-12);
    }
  }
}

TEST(SlopeAspect, RisingNorthwardIsZero) {
  // The row index grows to the south
  DoubleGrid slope, aspect;
  calcSlopeAspect(planeGrid(4, 6, 0.0, -3.0), slope, aspect);

  for (int col = 0; col < 4; col++) {
    for (int row = 0; row < 6; row++) {
      EXPECT_NEAR(3.0, slope(col, row), 1e-12);
      EXPECT_EQ(0.0, aspect(col, row));
    }
  }

  // Rising southward and westward
  calcSlopeAspect(planeGrid(4, 6, 0.0, 3.0), slope, aspect);
  EXPECT_NEAR(M_PI, aspect(2, 2), 1e-12);
  calcSlopeAspect(planeGrid(4, 6, -1.0, 0.0), slope, aspect);
  EXPECT_NEAR(1.5 * M_PI, aspect(2, 2), 1e-12);
}

TEST(SlopeAspect, AspectWrapsAtTwoPi) {
  // This is the one input for which atan2() + pi is exactly 2 * pi
  EXPECT_EQ(2.0 * M_PI, atan2(0.0, -1.0) + M_PI);
  EXPECT_EQ(0.0, aspectFromGradient(-0.0, -1.0));

  // The whole circle lands in [0, 2 * pi)
  for (int i = 0; i <= 3600; i++) {
    double phi = i * M_PI / 1800.0;
    double aspect = aspectFromGradient(cos(phi), sin(phi));
    EXPECT_GE(aspect, 0.0);
    EXPECT_LT(aspect, 2.0 * M_PI);
  }
}

TEST(SlopeAspect, FlatGroundHasNoAspect) {
  DoubleGrid slope, aspect;
  calcSlopeAspect(planeGrid(3, 3, 0.0, 0.0), slope, aspect);
  EXPECT_EQ(0.0, slope(1, 1));
  EXPECT_TRUE(std::isnan(aspect(1, 1)));
  EXPECT_TRUE(std::isnan(aspectFromGradient(0.0, 0.0)));
}

TEST(SlopeAspect, NaNPropagatesThroughStencil) {
  DoubleGrid dem = planeGrid(7, 7, 1.0, 2.0);
  double nan = std::numeric_limits<double>::quiet_NaN();
  dem(3, 3) = nan;
  dem(0, 0) = nan;

  DoubleGrid slope, aspect;
  calcSlopeAspect(dem, slope, aspect);

  // The cell itself and its four neighbors
  int cells[][2] = {{3, 3}, {2, 3}, {4, 3}, {3, 2}, {3, 4},
                    {0, 0}, {1, 0}, {0, 1}};
  for (auto const& c: cells) {
    EXPECT_TRUE(std::isnan(slope(c[0], c[1]))) << c[0] << " " << c[1];
    EXPECT_TRUE(std::isnan(aspect(c[0], c[1]))) << c[0] << " " << c[1];
  }

  // Diagonal neighbors are not in the stencil
  EXPECT_NEAR(sqrt(5.0), slope(2, 2), 1e-12);
  EXPECT_NEAR(sqrt(5.0), slope(4, 4), 1e-12);
  EXPECT_NEAR(sqrt(5.0), slope(1, 1), 1e-12);
  EXPECT_FALSE(std::isnan(aspect(6, 6)));
}

TEST(SlopeAspect, GradientNeedsTwoSamples) {
  DoubleGrid slope, aspect;
  EXPECT_THROW(calcSlopeAspect(DoubleGrid(1, 5), slope, aspect), vw::ArgumentErr);
  EXPECT_THROW(calcSlopeAspect(DoubleGrid(5, 1), slope, aspect), vw::ArgumentErr);

  // A 2 x 2 grid uses one-sided differences only
  calcSlopeAspect(planeGrid(2, 2, 4.0, 0.0), slope, aspect);
  EXPECT_NEAR(4.0, slope(0, 0), 1e-12);
  EXPECT_NEAR(4.0, slope(1, 1), 1e-12);
}

TEST(SlopeAspect, TrueSlopeUsesGridSize) {
  DoubleGrid dem = planeGrid(5, 5, 1.0, 0.0);
  DoubleGrid slope = calcTrueSlope(dem, 1.0, 1.0);
  EXPECT_NEAR(M_PI / 4.0, slope(2, 2), 1e-12);

  slope = calcTrueSlope(dem, 2.0, 30.0);
  EXPECT_NEAR(atan(0.5), slope(2, 2), 1e-12);

  dem(2, 2) = std::numeric_limits<double>::quiet_NaN();
  slope = calcTrueSlope(dem, 1.0, 1.0);
  EXPECT_TRUE(std::isnan(slope(2, 2)));

  EXPECT_THROW(calcTrueSlope(dem, 0.0, 1.0), InvalidInputErr);
}
