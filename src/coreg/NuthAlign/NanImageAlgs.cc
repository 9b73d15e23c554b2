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

/// \file NanImageAlgs.cc
///
#include <coreg/NuthAlign/NanImageAlgs.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Math/Statistics.h>
#include <vw/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace coreg {

std::vector<double> finiteValues(DoubleGrid const& img) {

  // Allocate enough space first
  std::vector<double> vals;
  vals.reserve(size_t(img.cols()) * size_t(img.rows()));

  for (int col = 0; col < img.cols(); col++) {
    for (int row = 0; row < img.rows(); row++) {
      if (std::isfinite(img(col, row)))
        vals.push_back(img(col, row));
    }
  }

  return vals;
}

long long finiteCount(DoubleGrid const& img) {

  long long count = 0;
  for (int col = 0; col < img.cols(); col++) {
    for (int row = 0; row < img.rows(); row++) {
      if (std::isfinite(img(col, row)))
        count++;
    }
  }

  return count;
}

// Remove in place the entries which are NaN or Inf
static void dropNonFinite(std::vector<double> & vals) {
  vals.erase(std::remove_if(vals.begin(), vals.end(),
                            [](double v) { return !std::isfinite(v); }),
             vals.end());
}

double nanMedian(std::vector<double> & vals) {

  dropNonFinite(vals);
  if (vals.empty())
    vw::vw_throw(InsufficientDataErr() << "No finite values found in median calculation.\n");

  return vw::math::destructive_median(vals);
}

double nanMedian(DoubleGrid const& img) {
  std::vector<double> vals = finiteValues(img);
  return nanMedian(vals);
}

double nanMean(std::vector<double> const& vals) {

  double sum = 0.0;
  long long count = 0;
  for (size_t i = 0; i < vals.size(); i++) {
    if (std::isfinite(vals[i])) {
      sum += vals[i];
      count++;
    }
  }

  if (count == 0)
    vw::vw_throw(InsufficientDataErr() << "No finite values found in mean calculation.\n");

  return sum / count;
}

double nanStdDev(std::vector<double> const& vals, double mean) {

  double sum = 0.0;
  long long count = 0;
  for (size_t i = 0; i < vals.size(); i++) {
    if (std::isfinite(vals[i])) {
      sum += (vals[i] - mean) * (vals[i] - mean);
      count++;
    }
  }

  if (count == 0)
    vw::vw_throw(InsufficientDataErr()
                 << "No finite values found in standard deviation calculation.\n");

  return sqrt(sum / count);
}

double nanPercentile(std::vector<double> const& vals, double percentile) {

  if (!std::isfinite(percentile) || percentile < 0.0 || percentile > 100.0)
    vw::vw_throw(InvalidInputErr() << "The percentile must be in [0, 100]. Got: "
                 << percentile << ".\n");

  std::vector<double> sorted = vals;
  dropNonFinite(sorted);
  if (sorted.empty())
    vw::vw_throw(InsufficientDataErr()
                 << "No finite values found in percentile calculation.\n");

  std::sort(sorted.begin(), sorted.end());

  double pos = (percentile / 100.0) * (sorted.size() - 1);
  size_t lo = size_t(std::floor(pos));
  size_t hi = std::min(lo + 1, sorted.size() - 1);
  double frac = pos - lo;

  return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

double nmad(std::vector<double> const& vals, double median) {

  std::vector<double> dev;
  dev.reserve(vals.size());
  for (size_t i = 0; i < vals.size(); i++) {
    if (std::isfinite(vals[i]))
      dev.push_back(std::abs(vals[i] - median));
  }

  if (dev.empty())
    vw::vw_throw(InsufficientDataErr() << "No finite values found in MAD calculation.\n");

  return NMAD_FACTOR * vw::math::destructive_median(dev);
}

RobustStats robustStats(DoubleGrid const& img) {

  std::vector<double> vals = finiteValues(img);

  RobustStats stats;
  stats.count = vals.size();
  // The median calculation reorders the values but keeps all of them
  stats.median = nanMedian(vals);
  stats.nmad = nmad(vals, stats.median);

  return stats;
}

void checkSameSize(DoubleGrid const& a, DoubleGrid const& b, const char* what) {
  if (a.cols() != b.cols() || a.rows() != b.rows())
    vw::vw_throw(ShapeMismatchErr() << what << ": grid dimensions differ: "
                 << a.cols() << " x " << a.rows() << " vs "
                 << b.cols() << " x " << b.rows() << ".\n");
}

DoubleGrid differenceGrid(DoubleGrid const& a, DoubleGrid const& b) {

  checkSameSize(a, b, "Elevation difference");

  DoubleGrid diff(a.cols(), a.rows());
  #pragma omp parallel for
  for (int col = 0; col < a.cols(); col++) {
    for (int row = 0; row < a.rows(); row++)
      diff(col, row) = a(col, row) - b(col, row);
  }

  return diff;
}

void rangeFilter(DoubleGrid & img, double min_val, double max_val) {

  double nan = std::numeric_limits<double>::quiet_NaN();

  #pragma omp parallel for
  for (int col = 0; col < img.cols(); col++) {
    for (int row = 0; row < img.rows(); row++) {
      if (img(col, row) < min_val || img(col, row) > max_val)
        img(col, row) = nan;
    }
  }
}

void madFilter(DoubleGrid & img, double outlier_factor) {

  RobustStats stats = robustStats(img);
  double min_val = stats.median - outlier_factor * stats.nmad;
  double max_val = stats.median + outlier_factor * stats.nmad;
  rangeFilter(img, min_val, max_val);
}

// This follows scipy.stats.binned_statistic with the median statistic, but
// the last bin is half-open as well, and bins with no samples get NaN.
void binnedMedians(std::vector<double> const& x,
                   std::vector<double> const& y,
                   int nbins, vw::Vector2 const& bin_range,
                   double y_min, double y_max,
                   // Outputs
                   std::vector<double> & bin_median,
                   std::vector<double> & bin_centers,
                   std::vector<long long> & bin_count) {

  if (x.size() != y.size())
    vw::vw_throw(vw::ArgumentErr() << "The x and y values must have the same size.\n");
  if (nbins <= 0 || !(bin_range[1] > bin_range[0]))
    vw::vw_throw(InvalidInputErr() << "Invalid binning: " << nbins << " bins over ["
                 << bin_range[0] << ", " << bin_range[1] << ").\n");

  double bin_width = (bin_range[1] - bin_range[0]) / nbins;

  bin_median.assign(nbins, std::numeric_limits<double>::quiet_NaN());
  bin_centers.resize(nbins);
  bin_count.assign(nbins, 0);
  for (int i = 0; i < nbins; i++)
    bin_centers[i] = bin_range[0] + i * bin_width + bin_width / 2.0;

  std::vector<std::vector<double>> bin_values(nbins);
  for (size_t it = 0; it < x.size(); it++) {

    double xv = x[it], yv = y[it];
    if (!std::isfinite(xv) || !std::isfinite(yv))
      continue;
    if (xv < bin_range[0] || xv >= bin_range[1])
      continue;
    if (!(yv > y_min && yv < y_max))
      continue;

    int bin_index = (int)std::floor((xv - bin_range[0]) / bin_width);
    if (bin_index >= nbins) // This can happen due to numerical errors
      bin_index = nbins - 1;
    if (bin_index < 0)
      bin_index = 0;

    bin_values[bin_index].push_back(yv);
  }

  for (int i = 0; i < nbins; i++) {
    bin_count[i] = bin_values[i].size();
    if (!bin_values[i].empty())
      bin_median[i] = vw::math::destructive_median(bin_values[i]);
  }
}

} // end namespace coreg
