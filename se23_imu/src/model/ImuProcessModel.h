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

#ifndef SE23_IMU_IMU_PROCESS_MODEL_H
#define SE23_IMU_IMU_PROCESS_MODEL_H

#include <Eigen/Eigen>
#include <string>
#include <vector>

#include "model/ModelOptions.h"
#include "model/Perturbation.h"
#include "utils/sensor_data.h"

namespace se23_imu {

/// SE_2(3) states of a batch of independent trajectories
typedef std::vector<Eigen::Matrix<double, 5, 5>, Eigen::aligned_allocator<Eigen::Matrix<double, 5, 5>>> StateBatch;

/// Square 15x15 Jacobians or covariances of a batch of trajectories
typedef std::vector<Eigen::Matrix<double, 15, 15>, Eigen::aligned_allocator<Eigen::Matrix<double, 15, 15>>> JacobianBatch;

/// Noise Jacobians of a batch of trajectories
typedef std::vector<Eigen::Matrix<double, 15, 12>, Eigen::aligned_allocator<Eigen::Matrix<double, 15, 12>>> NoiseJacobianBatch;

/**
 * @brief Base class for IMU process models on SE_2(3)
 *
 * A process model moves a state @f$\mathbf X_{k-1}@f$ to @f$\mathbf X_k@f$ given the bias-corrected IMU reading and the step size,
 * and provides the 15x15 Jacobian and discrete covariance of the [phi, nu, rho, bg, ba] error state.
 * Every call operates over a batch of independent trajectories, the single trajectory versions are convenience wrappers.
 *
 * The convention, gravity and continuous noise are fixed on construction.
 * An unknown convention or a gravity vector that is not 3x1 is a configuration error and will terminate.
 */
class ImuProcessModel {

public:
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  /**
   * @brief Default constructor
   * @param options Convention, gravity and noise parameters
   */
  explicit ImuProcessModel(const ModelOptions &options);

  virtual ~ImuProcessModel() {}

  /**
   * @brief Propagates each state in the batch forward by one step
   * @param x States at k-1
   * @param u Inputs over the step, one per trajectory
   * @param dt Step size in seconds, must be positive
   * @return States at k
   */
  virtual StateBatch evaluate(const StateBatch &x, const InputBatch &u, double dt) = 0;

  /**
   * @brief Jacobian of the error state at k with respect to the error state at k-1
   * @param x States at k-1
   * @param u Inputs over the step
   * @param dt Step size in seconds, must be positive
   * @return 15x15 state transition per trajectory
   */
  virtual JacobianBatch state_jacobian(const StateBatch &x, const InputBatch &u, double dt) = 0;

  /**
   * @brief Discrete process noise covariance added over the step
   * @param x States at k-1
   * @param u Inputs over the step
   * @param dt Step size in seconds, must be positive
   * @return 15x15 covariance per trajectory
   */
  virtual JacobianBatch covariance(const StateBatch &x, const InputBatch &u, double dt) = 0;

  /// Single trajectory version of evaluate()
  Eigen::Matrix<double, 5, 5> evaluate(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt);

  /// Single trajectory version of state_jacobian()
  Eigen::Matrix<double, 15, 15> state_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt);

  /// Single trajectory version of covariance()
  Eigen::Matrix<double, 15, 15> covariance(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt);

  /// Error-state convention of this model
  Perturbation::Type perturbation() const { return _perturbation; }

  /// Gravity in the world frame
  const Eigen::Vector3d &gravity() const { return _g_a; }

  /// Continuous-time noise spectral density (gyro, accel, gyro walk, accel walk)
  const Eigen::Matrix<double, 12, 12> &Q_c() const { return _Q_c; }

  /**
   * @brief Reports if a matrix has any NaN or Inf entries
   *
   * Numerical problems are reported and left to the caller.
   * Re-running the same arithmetic will not change the outcome.
   *
   * @param name Name to print with the warning
   * @param mat Matrix to check
   * @return True if all entries are finite
   */
  static bool check_finite(const std::string &name, const Eigen::MatrixXd &mat);

  /// Terminates if the step size is not positive and finite
  static void check_dt(double dt, const std::string &caller);

protected:

  /// Terminates if the number of states and inputs differ (or there are none)
  static void check_batch(size_t num_states, size_t num_inputs, const std::string &caller);

  /// Error-state convention
  Perturbation::Type _perturbation;

  /// Gravity in the world frame
  Eigen::Vector3d _g_a;

  /// Continuous-time noise spectral density
  Eigen::Matrix<double, 12, 12> _Q_c;
};

} // namespace se23_imu

#endif // SE23_IMU_IMU_PROCESS_MODEL_H
