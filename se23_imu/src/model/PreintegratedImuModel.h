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

#ifndef SE23_IMU_PREINTEGRATED_IMU_MODEL_H
#define SE23_IMU_PREINTEGRATED_IMU_MODEL_H

#include <vector>

#include "model/ImuProcessModel.h"

namespace se23_imu {

/**
 * @brief Incremental Jacobian chain of one trajectory since the last reset
 *
 * All members are updated together by PreintegratedImuModel::evaluate() and cleared together by reset().
 */
struct IncrementalJacobians {

  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  /// Product of all increments since the reset, U_ij = U_i ... U_{j-1}
  Eigen::Matrix<double, 5, 5> U_ij = Eigen::Matrix<double, 5, 5>::Identity();

  /// Product of all gravity matrices since the reset, G_ij = G_{j-1} ... G_i
  Eigen::Matrix<double, 5, 5> G_ij = Eigen::Matrix<double, 5, 5>::Identity();

  /// Bias coupling in the incremental frame
  Eigen::Matrix<double, 9, 6> B_ij = Eigen::Matrix<double, 9, 6>::Zero();

  /// Process noise accumulated in the incremental frame
  Eigen::Matrix<double, 15, 15> Q_ij = Eigen::Matrix<double, 15, 15>::Zero();

  /// State transition from the reset to now
  Eigen::Matrix<double, 15, 15> A_ij = Eigen::Matrix<double, 15, 15>::Identity();

  /// Maps the incremental noise into the error state convention
  Eigen::Matrix<double, 15, 15> L_ij = Eigen::Matrix<double, 15, 15>::Identity();

  /// Covariance at the reset
  Eigen::Matrix<double, 15, 15> P_i = Eigen::Matrix<double, 15, 15>::Zero();

  /// Covariance at the latest step, only valid after PreintegratedImuModel::propagated_covariance()
  Eigen::Matrix<double, 15, 15> P_j = Eigen::Matrix<double, 15, 15>::Zero();

  /// Number of steps integrated since the reset
  int steps = 0;

  /**
   * @brief Clears the chain and records the covariance at the reset
   * @param P Covariance at the reset
   */
  void reset(const Eigen::Matrix<double, 15, 15> &P) {
    U_ij.setIdentity();
    G_ij.setIdentity();
    B_ij.setZero();
    Q_ij.setZero();
    A_ij.setIdentity();
    L_ij.setIdentity();
    P_i = P;
    P_j = P;
    steps = 0;
  }
};

/**
 * @brief Preintegrated IMU kinematics on SE_2(3) with incremental Jacobians
 *
 * This will propagate the state at sensor rate exactly as CoupledImuModel does, while accumulating
 * the composite increments needed to form the Jacobian and covariance between the last reset and now.
 * Per step the chain is updated as
 * \f{align*}{
 * \mathbf U_{ij} &\leftarrow \mathbf U_{ij}\mathbf U \\
 * \mathbf G_{ij} &\leftarrow \mathbf G\mathbf G_{ij} \\
 * \mathbf B_{ij} &\leftarrow \mathrm{Ad}(\mathbf U^{-1})\mathbf B_{ij} - \mathbf L \\
 * \mathbf Q_{ij} &\leftarrow \mathbf A\mathbf Q_{ij}\mathbf A^\top + \mathbf L_{full}\frac{\mathbf Q_c}{\Delta t}\mathbf L_{full}^\top
 * \f}
 * and the covariance at j is @f$\mathbf P_j = \mathbf A_{ij}\mathbf P_i\mathbf A_{ij}^\top + \mathbf L_{ij}\mathbf Q_{ij}\mathbf L_{ij}^\top@f$.
 *
 * The owning filter must call reset_incremental_jacobians() once after each correction.
 * Without it the chain keeps growing and the linearization gets worse, this is not enforced.
 * One instance serves a fixed number of trajectories and must not be shared between threads.
 */
class PreintegratedImuModel : public ImuProcessModel {

public:
  /**
   * @brief Default constructor
   * @param options Convention, gravity and noise parameters
   * @param num_trajectories Number of independent trajectories in every batch
   */
  PreintegratedImuModel(const ModelOptions &options, size_t num_trajectories = 1);

  virtual ~PreintegratedImuModel() {}

  using ImuProcessModel::covariance;
  using ImuProcessModel::evaluate;
  using ImuProcessModel::state_jacobian;

  /**
   * @brief Propagates each state forward and extends its incremental chain
   */
  StateBatch evaluate(const StateBatch &x, const InputBatch &u, double dt) override;

  /**
   * @brief State transition A_ij from the last reset to now (arguments are unused)
   */
  JacobianBatch state_jacobian(const StateBatch &x, const InputBatch &u, double dt) override;

  /**
   * @brief Process covariance L_ij Q_ij L_ij^T from the last reset to now (arguments are unused)
   */
  JacobianBatch covariance(const StateBatch &x, const InputBatch &u, double dt) override;

  /// Process covariance from the last reset to now
  JacobianBatch covariance() const;

  /// Noise Jacobian L_ij from the last reset to now
  JacobianBatch input_jacobian() const;

  /**
   * @brief Full covariance at the latest step, @f$\mathbf A_{ij}\mathbf P_i\mathbf A_{ij}^\top + \mathbf L_{ij}\mathbf Q_{ij}\mathbf L_{ij}^\top@f$
   *
   * The result is also stored as P_j of each chain.
   *
   * @return 15x15 covariance per trajectory
   */
  JacobianBatch propagated_covariance();

  /**
   * @brief Clears the incremental chains, call after each correction
   * @param P Covariance of each trajectory at the reset
   */
  void reset_incremental_jacobians(const JacobianBatch &P);

  /// Single trajectory version of reset_incremental_jacobians()
  void reset_incremental_jacobians(const Eigen::Matrix<double, 15, 15> &P);

  /// Read access to the chain of one trajectory
  const IncrementalJacobians &incremental(size_t index) const { return _chains.at(index); }

  /// Number of steps trajectory index has integrated since its last reset
  int steps_since_reset(size_t index) const { return _chains.at(index).steps; }

  /// Number of trajectories this model integrates
  size_t num_trajectories() const { return _chains.size(); }

protected:
  /// Terminates if the batch does not match the number of chains
  void check_chains(size_t num_states, const std::string &caller) const;

  /// Recomputes A_ij and L_ij of a chain from its composite increments
  void update_full_jacobians(IncrementalJacobians &chain, const Eigen::Matrix<double, 5, 5> &x_j) const;

  /// One chain per trajectory
  std::vector<IncrementalJacobians, Eigen::aligned_allocator<IncrementalJacobians>> _chains;
};

} // namespace se23_imu

#endif // SE23_IMU_PREINTEGRATED_IMU_MODEL_H
