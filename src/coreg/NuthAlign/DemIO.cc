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

#include <coreg/NuthAlign/DemIO.h>
#include <coreg/Core/Exceptions.h>

#include <vw/Core/Exception.h>
#include <vw/Core/Log.h>
#include <vw/Core/ProgressCallback.h>
#include <vw/Image/PixelMask.h>
#include <vw/Image/Interpolation.h>
#include <vw/Image/EdgeExtension.h>
#include <vw/FileIO/DiskImageView.h>
#include <vw/FileIO/DiskImageResourceGDAL.h>
#include <vw/FileIO/GdalWriteOptions.h>
#include <vw/Cartography/GeoTransform.h>
#include <vw/Cartography/GeoReferenceUtils.h>

#include <cmath>
#include <limits>

namespace coreg {

DoubleGrid readDem(std::string const& dem_file, double nodata_override,
                   // Outputs
                   vw::cartography::GeoReference & georef,
                   bool & has_nodata, double & nodata) {

  if (!vw::cartography::read_georeference(georef, dem_file))
    vw::vw_throw(vw::ArgumentErr() << "The DEM " << dem_file
                 << " has no georeference.\n");

  has_nodata = false;
  nodata = -std::numeric_limits<double>::max();
  {
    // Use a scope to free up fast this handle
    vw::DiskImageResourceGDAL rsrc(dem_file);
    if (rsrc.channels() != 1)
      vw::vw_throw(vw::ArgumentErr() << "The DEM " << dem_file
                   << " must have a single channel.\n");
    if (rsrc.has_nodata_read()) {
      has_nodata = true;
      nodata = rsrc.nodata_read();
    }
  }

  if (!std::isnan(nodata_override)) {
    has_nodata = true;
    nodata = nodata_override;
  }

  if (has_nodata)
    vw::vw_out() << "Nodata value for " << dem_file << ": " << nodata << "\n";

  // Read fully in memory
  DoubleGrid dem = vw::DiskImageView<double>(dem_file);

  if (has_nodata) {
    // DEMs are mostly Float32, with the nodata tag reported as a double.
    // Compare at float precision, so a value like -9999.9 still matches.
    float nodata_f = float(nodata);
    double nan = std::numeric_limits<double>::quiet_NaN();
    #pragma omp parallel for
    for (int col = 0; col < dem.cols(); col++) {
      for (int row = 0; row < dem.rows(); row++) {
        if (float(dem(col, row)) == nodata_f)
          dem(col, row) = nan;
      }
    }
  }

  return dem;
}

DoubleGrid regridToReference(DoubleGrid const& src,
                             vw::cartography::GeoReference const& src_georef,
                             vw::cartography::GeoReference const& ref_georef,
                             int ref_cols, int ref_rows) {

  // Use PixelMask, as bilinear interpolation of masked pixels produces an
  // invalid result whenever an input pixel is invalid.
  vw::ImageView<vw::PixelMask<double>> masked(src.cols(), src.rows());
  for (int col = 0; col < src.cols(); col++) {
    for (int row = 0; row < src.rows(); row++) {
      masked(col, row) = vw::PixelMask<double>(src(col, row));
      if (std::isnan(src(col, row)))
        masked(col, row).invalidate();
    }
  }

  // Points outside the source are rejected below, so the edge extension
  // only matters on the last column and row
  auto src_interp = vw::interpolate(masked, vw::BilinearInterpolation(),
                                    vw::ConstantEdgeExtension());

  vw::cartography::GeoTransform gt(ref_georef, src_georef);
  DoubleGrid out(ref_cols, ref_rows);
  double nan = std::numeric_limits<double>::quiet_NaN();

  #pragma omp parallel for
  for (int col = 0; col < ref_cols; col++) {
    for (int row = 0; row < ref_rows; row++) {
      vw::Vector2 src_pix = gt.forward(vw::Vector2(col, row));
      if (!std::isfinite(src_pix[0]) || !std::isfinite(src_pix[1]) ||
          src_pix[0] < 0 || src_pix[0] > src.cols() - 1 ||
          src_pix[1] < 0 || src_pix[1] > src.rows() - 1) {
        out(col, row) = nan;
        continue;
      }
      vw::PixelMask<double> val = src_interp(src_pix[0], src_pix[1]);
      out(col, row) = is_valid(val) ? val.child() : nan;
    }
  }

  return out;
}

void applyMaskFile(DoubleGrid & dem, std::string const& mask_file) {

  DoubleGrid mask = vw::DiskImageView<double>(mask_file);
  checkSameSize(dem, mask, "Mask and master DEM");

  double nan = std::numeric_limits<double>::quiet_NaN();
  long long count = 0;
  for (int col = 0; col < dem.cols(); col++) {
    for (int row = 0; row < dem.rows(); row++) {
      if (mask(col, row) > 0) {
        dem(col, row) = nan;
        count++;
      }
    }
  }

  vw::vw_out() << "Masked " << count << " pixels using: " << mask_file << "\n";
}

void residualFilter(DoubleGrid & master, DoubleGrid const& slave, double resmax) {

  checkSameSize(master, slave, "Residual filter");
  if (!std::isfinite(resmax) || resmax <= 0.0)
    vw::vw_throw(InvalidInputErr() << "The maximum residual must be positive. Got: "
                 << resmax << ".\n");

  double nan = std::numeric_limits<double>::quiet_NaN();
  #pragma omp parallel for
  for (int col = 0; col < master.cols(); col++) {
    for (int row = 0; row < master.rows(); row++) {
      if (std::abs(master(col, row) - slave(col, row)) > resmax)
        master(col, row) = nan;
    }
  }
}

void worldCoordinates(vw::cartography::GeoReference const& georef,
                      int cols, int rows,
                      // Outputs
                      DoubleGrid & X, DoubleGrid & Y) {

  X.set_size(cols, rows);
  Y.set_size(cols, rows);

  #pragma omp parallel for
  for (int col = 0; col < cols; col++) {
    for (int row = 0; row < rows; row++) {
      vw::Vector2 pt = georef.pixel_to_point(vw::Vector2(col, row));
      X(col, row) = pt[0];
      Y(col, row) = pt[1];
    }
  }
}

vw::Vector2 pixelResolution(vw::cartography::GeoReference const& georef) {
  return vw::Vector2(std::abs(georef.transform()(0, 0)),
                     std::abs(georef.transform()(1, 1)));
}

void writeDem(std::string const& dem_file, DoubleGrid const& dem,
              vw::cartography::GeoReference const& georef, double nodata,
              vw::GdalWriteOptions const& opt) {

  vw::ImageView<float> out(dem.cols(), dem.rows());
  for (int col = 0; col < dem.cols(); col++) {
    for (int row = 0; row < dem.rows(); row++)
      out(col, row) = std::isnan(dem(col, row)) ? nodata : dem(col, row);
  }

  bool has_nodata = true, has_georef = true;
  vw::vw_out() << "Writing: " << dem_file << "\n";
  vw::TerminalProgressCallback tpc("coreg", ": ");
  vw::cartography::block_write_gdal_image(dem_file, out, has_georef, georef,
                                          has_nodata, nodata, opt, tpc);
}

} // end namespace coreg
