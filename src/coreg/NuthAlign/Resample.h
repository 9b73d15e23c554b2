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


/// \file Resample.h
///
/// Bilinear resampling of an elevation grid at a fractional shift.

#ifndef __COREG_NUTH_ALIGN_RESAMPLE_H__
#define __COREG_NUTH_ALIGN_RESAMPLE_H__

#include <coreg/NuthAlign/NanImageAlgs.h>

namespace coreg {

/// Holds a grid with its NaN cells filled in, and a 0/1 grid marking those
/// cells. Both are interpolated bilinearly at the same locations, and an
/// output cell is NaN whenever the interpolated marker is not zero, so that
/// no output value depends on a filled-in sample. Locations outside the grid
/// are clamped to the nearest edge.
class ShiftResampler {
public:

  /// Value written in the NaN cells before interpolation
  static const double FILL_VALUE;

  explicit ShiftResampler(DoubleGrid const& grid);

  /// The output at (col, row) is the input at (col + east, row - north), so
  /// a positive north shift samples further south.
  DoubleGrid operator()(double east, double north) const;

private:
  DoubleGrid m_filled, m_nodata;
};

/// Convenience wrapper for a one-time shift.
DoubleGrid shiftGrid(DoubleGrid const& grid, double east, double north);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_RESAMPLE_H__
