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

#ifndef SE23_IMU_COUPLED_IMU_MODEL_H
#define SE23_IMU_COUPLED_IMU_MODEL_H

#include "model/ImuProcessModel.h"

namespace se23_imu {

/**
 * @brief Single step IMU kinematics on SE_2(3)
 *
 * The state is propagated by one exact group composition:
 * \f{align*}{
 * \mathbf X_k = \mathbf G_{k-1}\mathbf X_{k-1}\mathbf U_{k-1}
 * \f}
 * where the increment holds the body-frame rotation, velocity and position change for a constant input over the step
 * \f{align*}{
 * \mathbf U_{k-1} = \begin{bmatrix} \exp(\Delta t\boldsymbol\omega) & \Delta t\mathbf J_l(\Delta t\boldsymbol\omega)\mathbf a &
 * \frac{\Delta t^2}{2}\mathbf N(\Delta t\boldsymbol\omega)\mathbf a \\ \mathbf 0 & 1 & \Delta t \\ \mathbf 0 & 0 & 1 \end{bmatrix}
 * \f}
 * and gravity with the elapsed time enters from the left
 * \f{align*}{
 * \mathbf G_{k-1} = \begin{bmatrix} \mathbf I & \Delta t\mathbf g & -\frac{\Delta t^2}{2}\mathbf g \\ \mathbf 0 & 1 & -\Delta t \\
 * \mathbf 0 & 0 & 1 \end{bmatrix}
 * \f}
 *
 * The error state is [phi, nu, rho, bg, ba] and the biases follow a random walk.
 * The bias errors are defined as estimate minus true.
 */
class CoupledImuModel : public ImuProcessModel {

public:
  /**
   * @brief Default constructor
   * @param options Convention, gravity and noise parameters
   */
  explicit CoupledImuModel(const ModelOptions &options) : ImuProcessModel(options) {}

  virtual ~CoupledImuModel() {}

  using ImuProcessModel::covariance;
  using ImuProcessModel::evaluate;
  using ImuProcessModel::state_jacobian;

  StateBatch evaluate(const StateBatch &x, const InputBatch &u, double dt) override;

  /**
   * @brief Jacobian of the error state at k with respect to the error state at k-1
   *
   * Right convention:
   * \f{align*}{
   * \mathbf F = \begin{bmatrix} \mathrm{Ad}(\mathbf U^{-1}) & -\mathbf L \\ \mathbf 0 & \mathbf I \end{bmatrix}
   * \f}
   * Left convention, where the adjoint of the propagated state carries the body-frame coupling into the world frame:
   * \f{align*}{
   * \mathbf F = \begin{bmatrix} \mathrm{Ad}(\mathbf G) & -\mathrm{Ad}(\mathbf X_k)\mathbf L \\ \mathbf 0 & \mathbf I \end{bmatrix}
   * \f}
   */
  JacobianBatch state_jacobian(const StateBatch &x, const InputBatch &u, double dt) override;

  /**
   * @brief Discrete covariance of the step, @f$\mathbf L\frac{\mathbf Q_c}{\Delta t}\mathbf L^\top@f$
   */
  JacobianBatch covariance(const StateBatch &x, const InputBatch &u, double dt) override;

  /**
   * @brief Jacobian of the error state at k with respect to the IMU noise
   *
   * The columns are ordered as gyroscope, accelerometer, gyroscope walk and accelerometer walk.
   * The bias rows are @f$\Delta t\mathbf I@f$.
   *
   * @param x States at k-1
   * @param u Inputs over the step
   * @param dt Step size in seconds, must be positive
   * @return 15x12 noise Jacobian per trajectory
   */
  virtual NoiseJacobianBatch input_jacobian(const StateBatch &x, const InputBatch &u, double dt);

  /// Single trajectory version of input_jacobian()
  Eigen::Matrix<double, 15, 12> input_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt);

  /**
   * @brief Builds the increment U for a constant input over the step
   * @param u Input over the step
   * @param dt Step size
   * @return 5x5 IE3 increment
   */
  static Eigen::Matrix<double, 5, 5> generate_u(const ImuInput &u, double dt);

  /// Inverse of generate_u()
  static Eigen::Matrix<double, 5, 5> generate_u_inverse(const ImuInput &u, double dt);

  /**
   * @brief Builds the gravity and time matrix G
   * @param dt Step size
   * @param g_a Gravity in the world frame
   * @return 5x5 IE3 matrix
   */
  static Eigen::Matrix<double, 5, 5> generate_g(double dt, const Eigen::Vector3d &g_a);

  /**
   * @brief Tangent vector of the increment once the time is split off
   *
   * This is such that @f$\mathbf U = \mathbf T(\Delta t)\exp(\boldsymbol\nu)@f$:
   * \f{align*}{
   * \boldsymbol\nu = \begin{bmatrix} \Delta t\boldsymbol\omega \\ \Delta t\mathbf a \\
   * \frac{\Delta t^2}{2}\mathbf J_l^{-1}(\Delta t\boldsymbol\omega)\mathbf N(\Delta t\boldsymbol\omega)\mathbf a \end{bmatrix}
   * \f}
   *
   * @param u Input over the step
   * @param dt Step size
   * @return 9x1 tangent vector
   */
  static Eigen::Matrix<double, 9, 1> generate_nu(const ImuInput &u, double dt);

  /**
   * @brief Jacobian of generate_nu() with respect to the input
   *
   * The only nontrivial block is the derivative of the position term with respect to the angular velocity.
   * Using the series @f$\mathbf J_l^{-1}\mathbf N = \mathbf I - \frac{1}{6}\boldsymbol\Omega + \frac{1}{360}\boldsymbol\Omega^3 + O(\theta^5)@f$
   * with @f$\boldsymbol\Omega = \lfloor\Delta t\boldsymbol\omega\times\rfloor@f$ this is
   * \f{align*}{
   * \boldsymbol\Upsilon_{30} = \Delta t^3\Big(\frac{1}{12}\lfloor\mathbf a\times\rfloor - \frac{1}{720}\mathbf W\Big),\quad
   * \mathbf W = \boldsymbol\Omega^2\lfloor\mathbf a\times\rfloor + \boldsymbol\Omega\lfloor\boldsymbol\Omega\mathbf a\times\rfloor +
   * \lfloor\boldsymbol\Omega^2\mathbf a\times\rfloor
   * \f}
   * which leaves an error of order @f$\Delta t^3\theta^4|\mathbf a|@f$.
   *
   * @param u Input over the step
   * @param dt Step size
   * @return 9x6 Jacobian, columns are gyroscope then accelerometer
   */
  static Eigen::Matrix<double, 9, 6> generate_upsilon(const ImuInput &u, double dt);

  /**
   * @brief Right Jacobian of the increment with respect to the input, @f$\mathbf L = \mathcal J_l(-\boldsymbol\nu)\boldsymbol\Upsilon@f$
   * @param u Input over the step
   * @param dt Step size
   * @return 9x6 Jacobian, columns are gyroscope then accelerometer
   */
  static Eigen::Matrix<double, 9, 6> input_jacobian_pose(const ImuInput &u, double dt);

  /// Adjoint of an IE3 matrix, see ie3_adj() in lie_ops.h
  static Eigen::Matrix<double, 9, 9> ie3_adj(const Eigen::Matrix<double, 5, 5> &X);

  /// Inverse of an IE3 matrix, see ie3_inv() in lie_ops.h
  static Eigen::Matrix<double, 5, 5> ie3_inv(const Eigen::Matrix<double, 5, 5> &X);

protected:
  /**
   * @brief State transition for one trajectory
   * @param x_next Propagated state, used by the left convention
   * @param U Increment of the step
   * @param G Gravity matrix of the step
   * @param L Pose input Jacobian of the step
   * @return 15x15 state transition
   */
  Eigen::Matrix<double, 15, 15> transition(const Eigen::Matrix<double, 5, 5> &x_next, const Eigen::Matrix<double, 5, 5> &U,
                                           const Eigen::Matrix<double, 5, 5> &G, const Eigen::Matrix<double, 9, 6> &L) const;

  /**
   * @brief Noise Jacobian for one trajectory
   * @param x_next Propagated state, used by the left convention
   * @param L Pose input Jacobian of the step
   * @param dt Step size
   * @return 15x12 noise Jacobian
   */
  Eigen::Matrix<double, 15, 12> noise_map(const Eigen::Matrix<double, 5, 5> &x_next, const Eigen::Matrix<double, 9, 6> &L,
                                          double dt) const;
};

} // namespace se23_imu

#endif // SE23_IMU_COUPLED_IMU_MODEL_H
