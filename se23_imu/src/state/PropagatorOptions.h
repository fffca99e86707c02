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

#ifndef SE23_IMU_PROPAGATOR_OPTIONS_H
#define SE23_IMU_PROPAGATOR_OPTIONS_H

#include <memory>
#include <string>

#include "model/ModelOptions.h"
#include "utils/colors.h"
#include "utils/opencv_yaml_parse.h"
#include "utils/print.h"

namespace se23_imu {

/**
 * @brief Struct which stores all our propagation options
 */
struct PropagatorOptions {

  /// Process models the propagator can run
  enum PropagationMethod { SINGLE_STEP, PREINTEGRATED, NULL_ON_UPDATE };

  /// Which process model is used to move the state and covariance forward
  PropagationMethod method = PropagationMethod::PREINTEGRATED;

  /// Nominal rate of the IMU (hz)
  double imu_frequency = 400.0;

  /// Rate at which the owning filter corrects and resets (hz)
  double update_frequency = 10.0;

  /// Velocity norm below which the body is classified as at rest (m/s)
  double zero_velocity_epsilon = 0.01;

  /// Angular velocity norm below which the body is classified as not rotating (rad/s)
  double zero_omega_epsilon = 0.005;

  /// Parameters of the process model itself
  ModelOptions model;

  /// Initial covariance
  InitOptions init;

  /// Returns a string representation of the method
  static std::string as_string(PropagationMethod method) {
    if (method == SINGLE_STEP)
      return "single_step";
    if (method == PREINTEGRATED)
      return "preintegrated";
    if (method == NULL_ON_UPDATE)
      return "null_on_update";
    return "unknown";
  }

  /// Nice print function of what parameters we have loaded
  void print(const std::shared_ptr<YamlParser> &parser = nullptr) {
    if (parser != nullptr) {
      std::string method_str = as_string(method);
      parser->parse_config("propagation", method_str);
      if (method_str == "single_step") {
        method = PropagationMethod::SINGLE_STEP;
      } else if (method_str == "preintegrated") {
        method = PropagationMethod::PREINTEGRATED;
      } else if (method_str == "null_on_update") {
        method = PropagationMethod::NULL_ON_UPDATE;
      } else {
        PRINT_ERROR(RED "invalid propagation method: %s\n" RESET, method_str.c_str());
        PRINT_ERROR(RED "please select a valid method: single_step, preintegrated, null_on_update\n" RESET);
        std::exit(EXIT_FAILURE);
      }
      parser->parse_config("imu_frequency", imu_frequency);
      parser->parse_config("update_frequency", update_frequency);
      parser->parse_config("zero_velocity_epsilon", zero_velocity_epsilon, false);
      parser->parse_config("zero_omega_epsilon", zero_omega_epsilon, false);
      if (imu_frequency <= 0.0 || update_frequency <= 0.0 || update_frequency > imu_frequency) {
        PRINT_ERROR(RED "invalid rates, need 0 < update_frequency (%.2f) <= imu_frequency (%.2f)\n" RESET, update_frequency,
                    imu_frequency);
        std::exit(EXIT_FAILURE);
      }
    }
    PRINT_DEBUG("PROPAGATOR PARAMETERS:\n");
    PRINT_DEBUG("  - propagation: %s\n", as_string(method).c_str());
    PRINT_DEBUG("  - imu_frequency: %.2f\n", imu_frequency);
    PRINT_DEBUG("  - update_frequency: %.2f\n", update_frequency);
    PRINT_DEBUG("  - zero_velocity_epsilon: %.4f\n", zero_velocity_epsilon);
    PRINT_DEBUG("  - zero_omega_epsilon: %.4f\n", zero_omega_epsilon);
    model.print(parser);
    init.print(parser);
  }
};

} // namespace se23_imu

#endif // SE23_IMU_PROPAGATOR_OPTIONS_H
