// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef ICEAREA_CONFIG_CORRECTION_HPP
#define ICEAREA_CONFIG_CORRECTION_HPP

namespace icearea {

/// Replacement for negative (extrapolated) area predictions.
enum class NegativeAreaPolicy {
  Zero,     ///< Clamp to 0
  OnePixel  ///< Clamp to the area of one pixel
};

namespace config {

/// Blob filtering applied before feature extraction.
struct Blobs {
  int min_pixel_count = 1;      ///< Drop objects with fewer pixels
  bool drop_truncated = false;  ///< Drop objects touching the raster border
};

/// Regression-based area correction.
struct Correction {
  NegativeAreaPolicy negative_area_policy = NegativeAreaPolicy::Zero;
};

/// HH/HV de-duplication after both channels are processed.
struct Merge {
  bool enabled = true;
  double buffer_distance = 20.0;  ///< Max outline distance for overlap [map units]
};

}  // namespace config
}  // namespace icearea

#endif  // ICEAREA_CONFIG_CORRECTION_HPP
