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

#ifndef SE23_IMU_DECOUPLED_IMU_MODEL_H
#define SE23_IMU_DECOUPLED_IMU_MODEL_H

#include <Eigen/Eigen>
#include <vector>

#include "utils/sensor_data.h"

namespace se23_imu {

/// Flattened [phi, v, r, bg, ba] states of a batch of trajectories
typedef std::vector<Eigen::Matrix<double, 15, 1>, Eigen::aligned_allocator<Eigen::Matrix<double, 15, 1>>> VectorStateBatch;

/**
 * @brief Decoupled IMU kinematics on a flat 15 vector
 *
 * The state is @f$[\boldsymbol\phi, \mathbf v, \mathbf r, \mathbf b_g, \mathbf b_a]@f$ with @f$\mathbf C = \exp(\boldsymbol\phi)@f$.
 * Position and velocity are integrated with the rotation at the start of the step:
 * \f{align*}{
 * \mathbf r_k &= \mathbf r_{k-1} + \Delta t\mathbf v_{k-1} + \frac{\Delta t^2}{2}(\mathbf g + \mathbf C_{k-1}\mathbf a) \\
 * \mathbf v_k &= \mathbf v_{k-1} + \Delta t\mathbf g + \Delta t\mathbf C_{k-1}\mathbf a \\
 * \mathbf C_k &= \mathbf C_{k-1}\exp(\Delta t\boldsymbol\omega)
 * \f}
 *
 * The attitude error is global with @f$\mathbf C = \exp(\delta\boldsymbol\phi)\hat{\mathbf C}@f$,
 * velocity and position errors are true minus estimate, and bias errors are estimate minus true.
 * This model has no internal state, it is used to cross check the SE_2(3) models.
 * With zero angular velocity both give the same state.
 */
class DecoupledImuModel {

public:
  /**
   * @brief Default constructor
   * @param gravity Gravity in the world frame, must be 3x1
   */
  explicit DecoupledImuModel(const Eigen::VectorXd &gravity);

  /**
   * @brief Propagates the state by one step
   * @param x State at k-1
   * @param u Bias-corrected input over the step
   * @param dt Step size in seconds, must be positive
   * @param C_k Rotation at k, without the wrapping of the log map
   * @return State at k
   */
  Eigen::Matrix<double, 15, 1> evaluate(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt, Eigen::Matrix3d &C_k) const;

  /// Propagates the state by one step
  Eigen::Matrix<double, 15, 1> evaluate(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt) const;

  /// Batch version of evaluate()
  VectorStateBatch evaluate(const VectorStateBatch &x, const InputBatch &u, double dt) const;

  /**
   * @brief Jacobian of the error at k with respect to the error at k-1
   * @param x State at k-1
   * @param u Bias-corrected input over the step
   * @param dt Step size in seconds, must be positive
   * @return 15x15 state transition
   */
  Eigen::Matrix<double, 15, 15> state_jacobian(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt) const;

  /**
   * @brief Jacobian of the error at k with respect to the noise (gyro, accel, gyro walk, accel walk)
   * @param x State at k-1
   * @param u Bias-corrected input over the step
   * @param dt Step size in seconds, must be positive
   * @return 15x12 noise Jacobian
   */
  Eigen::Matrix<double, 15, 12> noise_jacobian(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt) const;

  /**
   * @brief Discrete process covariance, @f$\mathbf B\frac{\mathbf Q_c}{\Delta t}\mathbf B^\top@f$
   * @param Q_c Continuous-time noise spectral density
   * @param x State at k-1
   * @param u Bias-corrected input over the step
   * @param dt Step size in seconds, must be positive
   * @return 15x15 covariance
   */
  Eigen::Matrix<double, 15, 15> covariance(const Eigen::Matrix<double, 12, 12> &Q_c, const Eigen::Matrix<double, 15, 1> &x,
                                           const ImuInput &u, double dt) const;

  /// Gravity in the world frame
  const Eigen::Vector3d &gravity() const { return _g_a; }

private:
  /// Gravity in the world frame
  Eigen::Vector3d _g_a;
};

} // namespace se23_imu

#endif // SE23_IMU_DECOUPLED_IMU_MODEL_H
