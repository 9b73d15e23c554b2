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

/// \file NanImageAlgs.h
///
/// Reductions and filters over double-precision grids in which NaN marks
/// an invalid cell. Every reduction skips non-finite values and throws
/// InsufficientDataErr when nothing is left. Elementwise operations
/// propagate NaN.
///
#ifndef __COREG_NUTH_ALIGN_NAN_IMAGE_ALGS_H__
#define __COREG_NUTH_ALIGN_NAN_IMAGE_ALGS_H__

#include <vw/Image/ImageView.h>
#include <vw/Math/Vector.h>

#include <vector>

namespace coreg {

typedef vw::ImageView<double> DoubleGrid;

/// Normalization that makes the MAD equivalent to the standard deviation
/// for normally distributed data.
const double NMAD_FACTOR = 1.4826;

/// Median and normalized median absolute deviation of the finite cells.
struct RobustStats {
  double median;
  double nmad;
  long long count;
  RobustStats(): median(0.0), nmad(0.0), count(0) {}
};

// Collect the finite values. Use long long counts, to avoid integer overflow.
std::vector<double> finiteValues(DoubleGrid const& img);
long long finiteCount(DoubleGrid const& img);

// Median of the finite values. The input vector is reordered.
double nanMedian(std::vector<double> & vals);
double nanMedian(DoubleGrid const& img);

// Population mean and standard deviation of the finite values
double nanMean(std::vector<double> const& vals);
double nanStdDev(std::vector<double> const& vals, double mean);

/// Percentile in [0, 100] of the finite values, interpolating linearly
/// between the two closest ranks.
double nanPercentile(std::vector<double> const& vals, double percentile);

/// 1.4826 * median(|x - median|) over the finite values.
double nmad(std::vector<double> const& vals, double median);

/// Median and NMAD of the finite cells of a grid.
RobustStats robustStats(DoubleGrid const& img);

/// Elementwise a - b. The two grids must have the same size.
DoubleGrid differenceGrid(DoubleGrid const& a, DoubleGrid const& b);

/// Throw ShapeMismatchErr unless the grids have the same size.
void checkSameSize(DoubleGrid const& a, DoubleGrid const& b, const char* what);

// Set to NaN the cells outside [min_val, max_val]
void rangeFilter(DoubleGrid & img, double min_val, double max_val);

/// Set to NaN the cells farther than outlier_factor * NMAD from the median.
void madFilter(DoubleGrid & img, double outlier_factor);

/// Median of y within each of nbins equal half-open bins of x over
/// bin_range. Only y values strictly inside (y_min, y_max) are used.
/// An empty bin gets a NaN median.
void binnedMedians(std::vector<double> const& x,
                   std::vector<double> const& y,
                   int nbins, vw::Vector2 const& bin_range,
                   double y_min, double y_max,
                   // Outputs
                   std::vector<double> & bin_median,
                   std::vector<double> & bin_centers,
                   std::vector<long long> & bin_count);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_NAN_IMAGE_ALGS_H__
