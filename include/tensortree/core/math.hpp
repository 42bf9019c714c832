#pragma once

#include <Eigen/Dense>

// Introduce 'eig' namespace shorthand in the tensortree namespace
namespace tt {
  namespace eig = Eigen;

  // Shorthand unsigned types
  using uint = unsigned int;

  // Incident grid position; x and y are normalized to [-1, 1]. The
  // isotropic variant only reads the x component
  using Query = eig::Array2d;
} // namespace tt
