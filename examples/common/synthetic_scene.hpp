// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * synthetic_scene.hpp
 *
 * Gamma-speckled open-water scenes with bright rectangular targets.
 */

#ifndef EXAMPLES_COMMON_SYNTHETIC_SCENE_HPP
#define EXAMPLES_COMMON_SYNTHETIC_SCENE_HPP

#include <icearea/raster.hpp>
#include <random>
#include <vector>

namespace examples {

struct Target {
  int row;
  int col;
  int height;
  int width;
  float intensity;  ///< Linear backscatter of the target
};

/// L-look gamma clutter with mean `sea_mean`, targets painted on top.
inline icearea::Raster makeScene(icearea::Channel channel, int rows, int cols,
                                 float sea_mean, float looks,
                                 const std::vector<Target>& targets,
                                 const icearea::GeoTransform& transform,
                                 unsigned seed = 42) {
  std::mt19937 rng(seed);
  std::gamma_distribution<float> speckle(looks, sea_mean / looks);

  Eigen::MatrixXf values(rows, cols);
  for (int c = 0; c < cols; ++c) {
    for (int r = 0; r < rows; ++r) values(r, c) = speckle(rng);
  }
  for (const auto& t : targets) {
    values.block(t.row, t.col, t.height, t.width).setConstant(t.intensity);
  }
  return icearea::Raster(channel, std::move(values), transform);
}

}  // namespace examples

#endif  // EXAMPLES_COMMON_SYNTHETIC_SCENE_HPP
