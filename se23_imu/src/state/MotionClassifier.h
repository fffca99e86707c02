/*
 * OpenVINS: An Open Platform for Visual-Inertial Research
 * Copyright (C) 2018-2023 Patrick Geneva
 * Copyright (C) 2018-2023 Guoquan Huang
 * Copyright (C) 2018-2023 OpenVINS Contributors
 * Copyright (C) 2018-2019 Kevin Eckenhoff
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef SE23_IMU_MOTION_CLASSIFIER_H
#define SE23_IMU_MOTION_CLASSIFIER_H

#include <Eigen/Eigen>

#include "utils/sensor_data.h"

namespace se23_imu {

/**
 * @brief Thresholds angular and linear velocity into rest markers
 *
 * Fed with ground truth it gives the synthetic markers used for pseudo-measurements.
 * Fed with the filter's own estimate it acts as a simple zero velocity detector.
 */
class MotionClassifier {

public:
  /**
   * @brief Default constructor
   * @param zero_omega_epsilon Angular velocity norm below which the body is not rotating (rad/s)
   * @param zero_velocity_epsilon Velocity norm below which the body is at rest (m/s)
   */
  MotionClassifier(double zero_omega_epsilon, double zero_velocity_epsilon)
      : _zero_omega_epsilon(zero_omega_epsilon), _zero_velocity_epsilon(zero_velocity_epsilon) {}

  /**
   * @brief Classify one step
   * @param omega Angular velocity over the step (rad/s)
   * @param velocity Velocity of the body (m/s)
   * @return Rest markers for the step
   */
  ImuMarker classify(const Eigen::Vector3d &omega, const Eigen::Vector3d &velocity) const {
    return ImuMarker(omega.norm() < _zero_omega_epsilon, velocity.norm() < _zero_velocity_epsilon);
  }

private:
  /// Angular rest threshold
  double _zero_omega_epsilon;

  /// Linear rest threshold
  double _zero_velocity_epsilon;
};

} // namespace se23_imu

#endif // SE23_IMU_MOTION_CLASSIFIER_H
