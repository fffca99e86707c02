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

#ifndef SE23_IMU_SENSOR_DATA_H
#define SE23_IMU_SENSOR_DATA_H

#include <Eigen/Eigen>
#include <vector>

namespace se23_imu {

/**
 * @brief Struct for a single imu measurement (time, wm, am)
 */
struct ImuData {

  /// Timestamp of the reading
  double timestamp;

  /// Gyroscope reading, angular velocity (rad/s)
  Eigen::Matrix<double, 3, 1> wm;

  /// Accelerometer reading, specific force (m/s^2)
  Eigen::Matrix<double, 3, 1> am;

  /// Sort function to allow for using of STL containers
  bool operator<(const ImuData &other) const { return timestamp < other.timestamp; }
};

/**
 * @brief The input u to the process models for one trajectory over one step
 *
 * These are the measurements after the current bias estimates have been removed.
 * They are held constant over the step.
 */
struct ImuInput {

  /// Angular velocity of the body expressed in the body frame (rad/s)
  Eigen::Matrix<double, 3, 1> omega = Eigen::Matrix<double, 3, 1>::Zero();

  /// Specific force of the body expressed in the body frame (m/s^2)
  Eigen::Matrix<double, 3, 1> acc = Eigen::Matrix<double, 3, 1>::Zero();

  ImuInput() {}

  ImuInput(const Eigen::Matrix<double, 3, 1> &omega_, const Eigen::Matrix<double, 3, 1> &acc_) : omega(omega_), acc(acc_) {}
};

/**
 * @brief Rest classification for a single step
 *
 * These are produced by an external classifier and passed with each call.
 * The models never store them.
 */
struct ImuMarker {

  /// If the body is not rotating over this step
  bool angular_rest = false;

  /// If the body has zero velocity over this step
  bool linear_rest = false;

  ImuMarker() {}

  ImuMarker(bool angular_rest_, bool linear_rest_) : angular_rest(angular_rest_), linear_rest(linear_rest_) {}
};

/// Inputs for a batch of independent trajectories
typedef std::vector<ImuInput> InputBatch;

/// Markers for a batch of independent trajectories
typedef std::vector<ImuMarker> MarkerBatch;

} // namespace se23_imu

#endif // SE23_IMU_SENSOR_DATA_H
