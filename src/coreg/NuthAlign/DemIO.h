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


/// \file DemIO.h
///
/// Loading, regridding, masking and writing of DEMs as double grids with
/// NaN in place of the nodata value.

#ifndef __COREG_NUTH_ALIGN_DEM_IO_H__
#define __COREG_NUTH_ALIGN_DEM_IO_H__

#include <coreg/NuthAlign/NanImageAlgs.h>

#include <vw/Cartography/GeoReference.h>
#include <vw/Math/Vector.h>

#include <string>

namespace vw {
  struct GdalWriteOptions;
}

namespace coreg {

/// Read the first band of a georeferenced DEM. The nodata value is the
/// given override when it is not NaN, otherwise the one in the file, if
/// any. Cells equal to it at float precision become NaN.
DoubleGrid readDem(std::string const& dem_file, double nodata_override,
                   // Outputs
                   vw::cartography::GeoReference & georef,
                   bool & has_nodata, double & nodata);

/// Bilinear interpolation of a DEM onto the grid of another one. A cell is
/// NaN if it falls outside the source or next to a NaN source cell.
DoubleGrid regridToReference(DoubleGrid const& src,
                             vw::cartography::GeoReference const& src_georef,
                             vw::cartography::GeoReference const& ref_georef,
                             int ref_cols, int ref_rows);

/// Set to NaN the cells where the mask in the given file is positive. The
/// mask must have the size of the DEM.
void applyMaskFile(DoubleGrid & dem, std::string const& mask_file);

/// Set to NaN the cells of the master where it differs from the slave by
/// more than resmax in absolute value.
void residualFilter(DoubleGrid & master, DoubleGrid const& slave, double resmax);

/// Projected coordinates of each pixel.
void worldCoordinates(vw::cartography::GeoReference const& georef,
                      int cols, int rows,
                      // Outputs
                      DoubleGrid & X, DoubleGrid & Y);

/// Absolute pixel size in x and y, in projected units.
vw::Vector2 pixelResolution(vw::cartography::GeoReference const& georef);

/// Write a single-band float GeoTIFF, with NaN cells set to nodata.
void writeDem(std::string const& dem_file, DoubleGrid const& dem,
              vw::cartography::GeoReference const& georef, double nodata,
              vw::GdalWriteOptions const& opt);

} // end namespace coreg

#endif // __COREG_NUTH_ALIGN_DEM_IO_H__
