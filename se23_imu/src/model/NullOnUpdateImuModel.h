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

#ifndef SE23_IMU_NULL_ON_UPDATE_IMU_MODEL_H
#define SE23_IMU_NULL_ON_UPDATE_IMU_MODEL_H

#include "model/CoupledImuModel.h"

namespace se23_imu {

/**
 * @brief Single step SE_2(3) model that suppresses motion flagged as at rest
 *
 * Each call takes one ImuMarker per trajectory from an external classifier:
 * - angular_rest : the rotation increment is forced to identity, rows 0-2 of the Jacobians carry no information
 * - linear_rest : the velocity and position increments are removed and gravity is skipped, so @f$\mathbf X_k = \mathbf X_{k-1}\mathbf U@f$,
 *   rows 3-8 of the Jacobians carry no information
 *
 * Rows that are nulled keep an identity diagonal block so the transition stays a valid (uninformative) map.
 * The markers are only read within the call they are passed to.
 * The overloads without markers behave as if no marker was set.
 */
class NullOnUpdateImuModel : public CoupledImuModel {

public:
  /**
   * @brief Default constructor
   * @param options Convention, gravity and noise parameters
   */
  explicit NullOnUpdateImuModel(const ModelOptions &options) : CoupledImuModel(options) {}

  virtual ~NullOnUpdateImuModel() {}

  using CoupledImuModel::covariance;
  using CoupledImuModel::evaluate;
  using CoupledImuModel::input_jacobian;
  using CoupledImuModel::state_jacobian;

  /**
   * @brief Propagates each state with its rest markers applied
   * @param x States at k-1
   * @param u Inputs over the step
   * @param dt Step size in seconds, must be positive
   * @param markers Rest classification of each trajectory for this step
   * @return States at k
   */
  StateBatch evaluate(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers);

  /// State transition with the rest markers applied
  JacobianBatch state_jacobian(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers);

  /// Noise Jacobian with the rest markers applied
  NoiseJacobianBatch input_jacobian(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers);

  /// Discrete covariance built from the gated noise Jacobian
  JacobianBatch covariance(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers);

  /// Single trajectory version of evaluate()
  Eigen::Matrix<double, 5, 5> evaluate(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt, const ImuMarker &marker);

  /// Single trajectory version of state_jacobian()
  Eigen::Matrix<double, 15, 15> state_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt,
                                               const ImuMarker &marker);

  /// Single trajectory version of input_jacobian()
  Eigen::Matrix<double, 15, 12> input_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt,
                                               const ImuMarker &marker);

  /// Single trajectory version of covariance()
  Eigen::Matrix<double, 15, 15> covariance(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt, const ImuMarker &marker);

  /**
   * @brief Applies the markers to a single increment
   * @param U Increment of the step, modified in place
   * @param marker Rest classification for the step
   */
  static void null_increment(Eigen::Matrix<double, 5, 5> &U, const ImuMarker &marker);

protected:
  /// Terminates if there is not one marker per trajectory
  static void check_markers(size_t num_states, size_t num_markers, const std::string &caller);
};

} // namespace se23_imu

#endif // SE23_IMU_NULL_ON_UPDATE_IMU_MODEL_H
