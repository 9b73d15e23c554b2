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


#ifndef __COREG_TEST_HELPERS_H__
#define __COREG_TEST_HELPERS_H__

#include <coreg/NuthAlign/NanImageAlgs.h>

#include <vw/Core/Log.h>
#include <vw/Math/Vector.h>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <functional>
#include <string>

namespace coreg { namespace test { }}
namespace t = coreg::test;

namespace coreg {
  namespace test {

using namespace ::testing;

#ifndef TEST_OBJDIR
#error TEST_OBJDIR is not defined! Define it before including this header.
#endif

// Create a temporary filename that is unlinked when constructed and destructed
class UnlinkName : public std::string {
  public:
    UnlinkName() {}
    UnlinkName(const std::string& base, const std::string& directory=TEST_OBJDIR);
    UnlinkName(const char *base,        const std::string& directory=TEST_OBJDIR);
    ~UnlinkName();
};

// Fetch the seed we used. Use it to seed a local random number generator.
// Do NOT use this to reseed a global random number generator.
uint32_t get_random_seed();

// Elevation at a fractional (col, row) position
typedef std::function<double(double, double)> Surface;

// Smooth terrain with slopes facing every direction: a gentle tilt plus
// a few hills of different size
inline double syntheticTerrain(double col, double row) {
  return 0.05 * col - 0.03 * row
    + 40.0 * sin(2.0 * M_PI * col / 47.0) * cos(2.0 * M_PI * row / 53.0)
    + 25.0 * exp(-((col - 60.0) * (col - 60.0) + (row - 45.0) * (row - 45.0)) / 300.0);
}

// Sample a surface on a grid
inline DoubleGrid sampleSurface(Surface const& f, int cols, int rows) {
  DoubleGrid grid(cols, rows);
  for (int col = 0; col < cols; col++)
    for (int row = 0; row < rows; row++)
      grid(col, row) = f(col, row);
  return grid;
}

// A slave DEM whose content is displaced by (east, north) pixels relative
// to the master, with an optional vertical bias. A feature at master
// (col, row) appears in the slave at (col + east, row - north).
inline DoubleGrid shiftedSurface(Surface const& f, int cols, int rows,
                                 double east, double north, double bias = 0.0) {
  DoubleGrid grid(cols, rows);
  for (int col = 0; col < cols; col++)
    for (int row = 0; row < rows; row++)
      grid(col, row) = f(col - east, row + north) + bias;
  return grid;
}

}} // namespace coreg::test

#endif
