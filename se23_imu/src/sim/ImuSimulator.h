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

#ifndef SE23_IMU_IMU_SIMULATOR_H
#define SE23_IMU_IMU_SIMULATOR_H

#include <Eigen/Eigen>
#include <random>
#include <vector>

#include "sim/SimulatorOptions.h"
#include "state/MotionClassifier.h"
#include "state/PropagatorOptions.h"
#include "utils/sensor_data.h"

namespace se23_imu {

/**
 * @brief Inertial simulator of a rest, motion, rest trajectory.
 *
 * The body first sits still, then rotates and accelerates along a smooth profile whose world acceleration integrates to zero,
 * and finally comes to rest again once its remaining velocity has been damped out.
 * Each reading is held constant until the next, and the true state is integrated with the exact constant input increment.
 * The process models therefore reproduce the truth to round-off when noise and bias walk are disabled.
 */
class ImuSimulator {

public:
  /**
   * @brief Default constructor, will generate the first state
   * @param prop Propagation options (imu rate, gravity, noise densities, rest thresholds)
   * @param sim Simulation options
   */
  ImuSimulator(const PropagatorOptions &prop, const SimulatorOptions &sim);

  /// Returns if we are actively simulating
  bool ok() const { return is_running; }

  /// Gets the timestamp we have simulated up too
  double current_timestamp() const { return timestamp; }

  /**
   * @brief Gets the next inertial reading if we have one.
   *
   * The reading is valid from the returned time until the time of the next reading.
   *
   * @param time_imu Time that this measurement occured at
   * @param wm Angular velocity measurement in the inertial frame
   * @param am Linear velocity in the inertial frame
   * @return True if we have a measurement
   */
  bool get_next_imu(double &time_imu, Eigen::Vector3d &wm, Eigen::Vector3d &am);

  /**
   * @brief Get the true state at a simulated time
   * @param desired_time Timestamp we want to get the state at
   * @param x SE_2(3) state at that time
   * @return True if we have a state
   */
  bool get_state(double desired_time, Eigen::Matrix<double, 5, 5> &x) const;

  /**
   * @brief Get the true biases of the reading at a simulated time
   * @param desired_time Timestamp of the reading
   * @param bg True gyroscope bias
   * @param ba True accelerometer bias
   * @return True if a reading was generated at that time
   */
  bool get_true_bias(double desired_time, Eigen::Vector3d &bg, Eigen::Vector3d &ba) const;

  /**
   * @brief Get the ground truth rest markers over the interval starting at a reading
   * @param desired_time Timestamp of the reading
   * @param marker True rest classification of that interval
   * @return True if a reading was generated at that time
   */
  bool get_marker(double desired_time, ImuMarker &marker) const;

  /// Time of the first state
  double initial_timestamp() const { return hist_time.at(0); }

  /// Rate we generate readings at
  double imu_frequency() const { return freq_imu; }

protected:
  /**
   * @brief True angular velocity and world frame acceleration of the motion segment
   * @param tau Time since the motion started
   * @param omega Angular velocity in the body frame
   * @param accel Acceleration in the world frame
   */
  void motion_profile(double tau, Eigen::Vector3d &omega, Eigen::Vector3d &accel) const;

  /// Index into our history of a simulated time, -1 if there is none
  int history_index(double desired_time) const;

  /// Simulation options
  SimulatorOptions sim_params;

  /// Gravity in the world frame
  Eigen::Vector3d gravity;

  /// Noise densities
  double sigma_w, sigma_a, sigma_wb, sigma_ab;

  /// Rate of the readings
  double freq_imu;

  /// Ground truth rest classifier
  MotionClassifier classifier;

  /// Mersenne twister PRNG for measurements (IMU)
  std::mt19937 gen_meas_imu;

  /// If our simulation is running
  bool is_running = true;

  /// Current timestamp of the system
  double timestamp;

  /// Number of readings generated so far
  size_t num_readings = 0;

  /// Current true biases
  Eigen::Vector3d true_bias_gyro, true_bias_accel;

  /// True state at every reading time (plus the one after the last reading)
  std::vector<double> hist_time;
  std::vector<Eigen::Matrix<double, 5, 5>, Eigen::aligned_allocator<Eigen::Matrix<double, 5, 5>>> hist_state;

  /// True biases and rest markers of each reading
  std::vector<Eigen::Vector3d, Eigen::aligned_allocator<Eigen::Vector3d>> hist_true_bias_gyro;
  std::vector<Eigen::Vector3d, Eigen::aligned_allocator<Eigen::Vector3d>> hist_true_bias_accel;
  std::vector<ImuMarker> hist_marker;
};

} // namespace se23_imu

#endif // SE23_IMU_IMU_SIMULATOR_H
