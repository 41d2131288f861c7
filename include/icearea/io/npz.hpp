// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * npz.hpp
 *
 * NumPy .npz scene archives: one 2-D backscatter array per channel
 * (hh.npy, hv.npy), an optional incidence angle layer (ia.npy, degrees)
 * and a meta.npy JSON string holding the geotransform and nodata value.
 *
 * Written archives are uncompressed (ZIP STORE) and load with numpy.load().
 * Archives from numpy.savez() load back as long as they are uncompressed;
 * meta may be a bytes ('|S') or str ('<U', UTF-32LE) scalar.
 */

#ifndef ICEAREA_IO_NPZ_HPP
#define ICEAREA_IO_NPZ_HPP

#include <Eigen/Core>
#include <string>

#include "icearea/raster.hpp"

namespace icearea {
namespace io {

/// Save every raster of the scene + metadata as an uncompressed .npz.
/// All rasters must share one shape; geotransform/nodata of the first
/// raster are written.
bool saveScene(const std::string& filename, const RasterSet& rasters);

/// As above, with an incidence angle layer of the rasters' shape (an empty
/// matrix writes no ia.npy).
bool saveScene(const std::string& filename, const RasterSet& rasters,
               const Eigen::MatrixXf& incidence_angle);

/// Load the channel arrays of an .npz scene (float32 or float64, C or
/// Fortran order). Replaces the content of rasters on success.
bool loadScene(const std::string& filename, RasterSet& rasters);

/// As above, also returning ia.npy (empty matrix when the archive has none).
bool loadScene(const std::string& filename, RasterSet& rasters,
               Eigen::MatrixXf& incidence_angle);

}  // namespace io
}  // namespace icearea

#endif  // ICEAREA_IO_NPZ_HPP
