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

#ifndef SE23_IMU_SIMULATOR_OPTIONS_H
#define SE23_IMU_SIMULATOR_OPTIONS_H

#include <Eigen/Eigen>
#include <memory>

#include "utils/colors.h"
#include "utils/opencv_yaml_parse.h"
#include "utils/print.h"

namespace se23_imu {

/**
 * @brief Struct which stores all our simulation parameters
 */
struct SimulatorOptions {

  /// Seed for the measurement noise and bias random walk
  int sim_seed_measurements = 0;

  /// Total length of the simulated trajectory (sec)
  double sim_duration = 20.0;

  /// Length of the rest segments at the start and end of the trajectory (sec)
  double sim_rest_duration = 2.0;

  /// If white noise should be added to the readings
  bool sim_add_noise = true;

  /// If the true biases should follow a random walk
  bool sim_bias_walk = true;

  /// Peak angular velocity of the motion segment (rad/s)
  double sim_max_omega = 0.8;

  /// Peak world frame acceleration of the motion segment (m/s^2)
  double sim_max_accel = 1.5;

  /// True gyroscope bias at the start
  Eigen::Vector3d sim_bias_gyro_init = Eigen::Vector3d(0.002, -0.001, 0.0015);

  /// True accelerometer bias at the start
  Eigen::Vector3d sim_bias_acc_init = Eigen::Vector3d(0.02, -0.03, 0.01);

  /// Nice print function of what parameters we have loaded
  void print(const std::shared_ptr<YamlParser> &parser = nullptr) {
    if (parser != nullptr) {
      parser->parse_config("sim_seed_measurements", sim_seed_measurements);
      parser->parse_config("sim_duration", sim_duration);
      parser->parse_config("sim_rest_duration", sim_rest_duration);
      parser->parse_config("sim_add_noise", sim_add_noise);
      parser->parse_config("sim_bias_walk", sim_bias_walk);
      parser->parse_config("sim_max_omega", sim_max_omega, false);
      parser->parse_config("sim_max_accel", sim_max_accel, false);
      parser->parse_config("sim_bias_gyro_init", sim_bias_gyro_init, false);
      parser->parse_config("sim_bias_acc_init", sim_bias_acc_init, false);
    }
    if (sim_rest_duration < 0.0 || sim_duration <= 2.0 * sim_rest_duration) {
      PRINT_ERROR(RED "invalid simulation length, need sim_duration (%.2f) > 2 * sim_rest_duration (%.2f)\n" RESET, sim_duration,
                  sim_rest_duration);
      std::exit(EXIT_FAILURE);
    }
    PRINT_DEBUG("SIMULATION PARAMETERS:\n");
    PRINT_DEBUG("  - sim_seed_measurements: %d\n", sim_seed_measurements);
    PRINT_DEBUG("  - sim_duration: %.2f\n", sim_duration);
    PRINT_DEBUG("  - sim_rest_duration: %.2f\n", sim_rest_duration);
    PRINT_DEBUG("  - sim_add_noise: %d\n", (int)sim_add_noise);
    PRINT_DEBUG("  - sim_bias_walk: %d\n", (int)sim_bias_walk);
    PRINT_DEBUG("  - sim_max_omega: %.3f\n", sim_max_omega);
    PRINT_DEBUG("  - sim_max_accel: %.3f\n", sim_max_accel);
    PRINT_DEBUG("  - sim_bias_gyro_init: %.4f, %.4f, %.4f\n", sim_bias_gyro_init(0), sim_bias_gyro_init(1), sim_bias_gyro_init(2));
    PRINT_DEBUG("  - sim_bias_acc_init: %.4f, %.4f, %.4f\n", sim_bias_acc_init(0), sim_bias_acc_init(1), sim_bias_acc_init(2));
  }
};

} // namespace se23_imu

#endif // SE23_IMU_SIMULATOR_OPTIONS_H
