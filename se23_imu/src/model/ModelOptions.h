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

#ifndef SE23_IMU_MODEL_OPTIONS_H
#define SE23_IMU_MODEL_OPTIONS_H

#include <Eigen/Eigen>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "model/Perturbation.h"
#include "utils/colors.h"
#include "utils/opencv_yaml_parse.h"
#include "utils/print.h"

namespace se23_imu {

/**
 * @brief Struct which stores the parameters every process model is constructed with
 *
 * These are fixed for the lifetime of a model, the models copy what they need on construction.
 */
struct ModelOptions {

  /// Error-state convention all Jacobians are expressed in
  Perturbation::Type perturbation = Perturbation::LEFT;

  /// Gyroscope white noise (rad/s/sqrt(hz))
  double sigma_w = 1.745e-4;

  /// Accelerometer white noise (m/s^2/sqrt(hz))
  double sigma_a = 6.0e-4;

  /// Gyroscope random walk (rad/s^2/sqrt(hz))
  double sigma_wb = 4.848e-5;

  /// Accelerometer random walk (m/s^3/sqrt(hz))
  double sigma_ab = 1.5e-4;

  /// Gravity in the world frame (z-up), must have exactly three entries
  Eigen::VectorXd gravity = (Eigen::VectorXd(3) << 0.0, 0.0, -9.80665).finished();

  /**
   * @brief Continuous-time noise spectral density
   *
   * Ordered as gyroscope, accelerometer, gyroscope random walk, accelerometer random walk.
   *
   * @return 12x12 diagonal covariance
   */
  Eigen::Matrix<double, 12, 12> Q_c() const {
    Eigen::Matrix<double, 12, 12> Q = Eigen::Matrix<double, 12, 12>::Zero();
    Q.block(0, 0, 3, 3) = std::pow(sigma_w, 2) * Eigen::Matrix3d::Identity();
    Q.block(3, 3, 3, 3) = std::pow(sigma_a, 2) * Eigen::Matrix3d::Identity();
    Q.block(6, 6, 3, 3) = std::pow(sigma_wb, 2) * Eigen::Matrix3d::Identity();
    Q.block(9, 9, 3, 3) = std::pow(sigma_ab, 2) * Eigen::Matrix3d::Identity();
    return Q;
  }

  /// Nice print function of what parameters we have loaded
  void print(const std::shared_ptr<YamlParser> &parser = nullptr) {
    if (parser != nullptr) {
      std::string perturbation_str = Perturbation::as_string(perturbation);
      parser->parse_config("perturbation", perturbation_str);
      perturbation = Perturbation::from_string(perturbation_str);
      if (perturbation == Perturbation::UNKNOWN) {
        PRINT_ERROR(RED "invalid perturbation: %s\n" RESET, perturbation_str.c_str());
        PRINT_ERROR(RED "please select a valid convention: left, right\n" RESET);
        std::exit(EXIT_FAILURE);
      }
      parser->parse_config("gyroscope_noise_density", sigma_w);
      parser->parse_config("accelerometer_noise_density", sigma_a);
      parser->parse_config("gyroscope_random_walk", sigma_wb);
      parser->parse_config("accelerometer_random_walk", sigma_ab);

      // Read gravity as a raw list so a malformed one is caught here
      std::vector<double> gravity_list(gravity.data(), gravity.data() + gravity.size());
      parser->parse_config("gravity", gravity_list);
      if (gravity_list.size() != 3) {
        PRINT_ERROR(RED "gravity must have 3 entries, %d were given\n" RESET, (int)gravity_list.size());
        std::exit(EXIT_FAILURE);
      }
      gravity = Eigen::Map<Eigen::VectorXd>(gravity_list.data(), 3);
    }
    PRINT_DEBUG("MODEL PARAMETERS:\n");
    PRINT_DEBUG("  - perturbation: %s\n", Perturbation::as_string(perturbation).c_str());
    PRINT_DEBUG("  - gyroscope_noise_density: %.6f\n", sigma_w);
    PRINT_DEBUG("  - accelerometer_noise_density: %.5f\n", sigma_a);
    PRINT_DEBUG("  - gyroscope_random_walk: %.7f\n", sigma_wb);
    PRINT_DEBUG("  - accelerometer_random_walk: %.6f\n", sigma_ab);
    if (gravity.rows() == 3) {
      PRINT_DEBUG("  - gravity: %.5f, %.5f, %.5f\n", gravity(0), gravity(1), gravity(2));
    }
  }
};

/**
 * @brief Struct of the initial standard deviations of the 15 dof error state
 */
struct InitOptions {

  /// Attitude (rad)
  double sigma_theta_init = 1.0 * M_PI / 180.0;

  /// Velocity (m/s)
  double sigma_velocity_init = 0.25;

  /// Position (m)
  double sigma_position_init = 0.1;

  /// Gyroscope bias (rad/s)
  double sigma_bias_gyro_init = 1.1e-4;

  /// Accelerometer bias (m/s^2)
  double sigma_bias_acc_init = 0.2;

  /**
   * @brief Initial covariance in the [phi, nu, rho, bg, ba] ordering
   * @return 15x15 diagonal covariance
   */
  Eigen::Matrix<double, 15, 15> P0() const {
    Eigen::Matrix<double, 15, 1> diag;
    diag.block(0, 0, 3, 1).setConstant(std::pow(sigma_theta_init, 2));
    diag.block(3, 0, 3, 1).setConstant(std::pow(sigma_velocity_init, 2));
    diag.block(6, 0, 3, 1).setConstant(std::pow(sigma_position_init, 2));
    diag.block(9, 0, 3, 1).setConstant(std::pow(sigma_bias_gyro_init, 2));
    diag.block(12, 0, 3, 1).setConstant(std::pow(sigma_bias_acc_init, 2));
    return Eigen::Matrix<double, 15, 15>(diag.asDiagonal());
  }

  /// Nice print function of what parameters we have loaded
  void print(const std::shared_ptr<YamlParser> &parser = nullptr) {
    if (parser != nullptr) {
      parser->parse_config("init_sigma_theta", sigma_theta_init, false);
      parser->parse_config("init_sigma_velocity", sigma_velocity_init, false);
      parser->parse_config("init_sigma_position", sigma_position_init, false);
      parser->parse_config("init_sigma_bias_gyro", sigma_bias_gyro_init, false);
      parser->parse_config("init_sigma_bias_acc", sigma_bias_acc_init, false);
    }
    PRINT_DEBUG("INITIAL COVARIANCE:\n");
    PRINT_DEBUG("  - init_sigma_theta: %.5f\n", sigma_theta_init);
    PRINT_DEBUG("  - init_sigma_velocity: %.4f\n", sigma_velocity_init);
    PRINT_DEBUG("  - init_sigma_position: %.4f\n", sigma_position_init);
    PRINT_DEBUG("  - init_sigma_bias_gyro: %.6f\n", sigma_bias_gyro_init);
    PRINT_DEBUG("  - init_sigma_bias_acc: %.4f\n", sigma_bias_acc_init);
  }
};

} // namespace se23_imu

#endif // SE23_IMU_MODEL_OPTIONS_H
