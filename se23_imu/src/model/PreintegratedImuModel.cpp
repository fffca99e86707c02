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

#include "PreintegratedImuModel.h"

#include "model/CoupledImuModel.h"
#include "utils/colors.h"
#include "utils/lie_ops.h"
#include "utils/print.h"

using namespace se23_imu;

PreintegratedImuModel::PreintegratedImuModel(const ModelOptions &options, size_t num_trajectories) : ImuProcessModel(options) {
  if (num_trajectories == 0) {
    PRINT_ERROR(RED "PreintegratedImuModel(): need at least one trajectory\n" RESET);
    std::exit(EXIT_FAILURE);
  }
  _chains.resize(num_trajectories);
}

StateBatch PreintegratedImuModel::evaluate(const StateBatch &x, const InputBatch &u, double dt) {
  check_dt(dt, "PreintegratedImuModel::evaluate()");
  check_batch(x.size(), u.size(), "PreintegratedImuModel::evaluate()");
  check_chains(x.size(), "PreintegratedImuModel::evaluate()");

  Eigen::Matrix<double, 5, 5> G = CoupledImuModel::generate_g(dt, _g_a);
  Eigen::Matrix<double, 12, 12> Q_d = _Q_c / dt;

  StateBatch x_next;
  x_next.reserve(x.size());
  for (size_t i = 0; i < x.size(); i++) {

    // Move the state itself forward, this is identical to the single step model
    Eigen::Matrix<double, 5, 5> U = CoupledImuModel::generate_u(u.at(i), dt);
    x_next.push_back(G * x.at(i) * U);

    // Extend the composite increments
    IncrementalJacobians &chain = _chains.at(i);
    Eigen::Matrix<double, 9, 9> Ad_U_inv = ie3_adj(ie3_inv(U));
    Eigen::Matrix<double, 9, 6> L = CoupledImuModel::input_jacobian_pose(u.at(i), dt);
    chain.U_ij = chain.U_ij * U;
    chain.G_ij = G * chain.G_ij;
    chain.B_ij = Ad_U_inv * chain.B_ij - L;

    // Recurse the noise in the incremental (right) frame
    Eigen::Matrix<double, 15, 15> A_full = Eigen::Matrix<double, 15, 15>::Identity();
    A_full.block(0, 0, 9, 9) = Ad_U_inv;
    A_full.block(0, 9, 9, 6) = -L;
    Eigen::Matrix<double, 15, 12> L_full = Eigen::Matrix<double, 15, 12>::Zero();
    L_full.block(0, 0, 9, 6) = L;
    L_full.block(9, 6, 6, 6) = dt * Eigen::Matrix<double, 6, 6>::Identity();
    chain.Q_ij = A_full * chain.Q_ij * A_full.transpose() + L_full * Q_d * L_full.transpose();
    chain.Q_ij = 0.5 * (chain.Q_ij + chain.Q_ij.transpose());
    chain.steps++;

    update_full_jacobians(chain, x_next.at(i));
  }
  return x_next;
}

JacobianBatch PreintegratedImuModel::state_jacobian(const StateBatch &x, const InputBatch &u, double dt) {
  check_chains(x.size(), "PreintegratedImuModel::state_jacobian()");
  JacobianBatch A;
  A.reserve(_chains.size());
  for (const auto &chain : _chains) {
    A.push_back(chain.A_ij);
  }
  return A;
}

JacobianBatch PreintegratedImuModel::covariance(const StateBatch &x, const InputBatch &u, double dt) {
  check_chains(x.size(), "PreintegratedImuModel::covariance()");
  return covariance();
}

JacobianBatch PreintegratedImuModel::covariance() const {
  JacobianBatch Q;
  Q.reserve(_chains.size());
  for (const auto &chain : _chains) {
    Eigen::Matrix<double, 15, 15> Q_j = chain.L_ij * chain.Q_ij * chain.L_ij.transpose();
    Q.push_back(0.5 * (Q_j + Q_j.transpose()));
  }
  return Q;
}

JacobianBatch PreintegratedImuModel::input_jacobian() const {
  JacobianBatch L;
  L.reserve(_chains.size());
  for (const auto &chain : _chains) {
    L.push_back(chain.L_ij);
  }
  return L;
}

JacobianBatch PreintegratedImuModel::propagated_covariance() {
  JacobianBatch Q = covariance();
  JacobianBatch P;
  P.reserve(_chains.size());
  for (size_t i = 0; i < _chains.size(); i++) {
    IncrementalJacobians &chain = _chains.at(i);
    chain.P_j = chain.A_ij * chain.P_i * chain.A_ij.transpose() + Q.at(i);
    chain.P_j = 0.5 * (chain.P_j + chain.P_j.transpose());
    P.push_back(chain.P_j);
  }
  return P;
}

void PreintegratedImuModel::reset_incremental_jacobians(const JacobianBatch &P) {
  check_chains(P.size(), "PreintegratedImuModel::reset_incremental_jacobians()");
  for (size_t i = 0; i < _chains.size(); i++) {
    _chains.at(i).reset(P.at(i));
  }
}

void PreintegratedImuModel::reset_incremental_jacobians(const Eigen::Matrix<double, 15, 15> &P) {
  JacobianBatch P_batch = {P};
  reset_incremental_jacobians(P_batch);
}

void PreintegratedImuModel::check_chains(size_t num_states, const std::string &caller) const {
  if (num_states != _chains.size()) {
    PRINT_ERROR(RED "%s: model integrates %d trajectories but %d were given\n" RESET, caller.c_str(), (int)_chains.size(),
                (int)num_states);
    std::exit(EXIT_FAILURE);
  }
}

void PreintegratedImuModel::update_full_jacobians(IncrementalJacobians &chain, const Eigen::Matrix<double, 5, 5> &x_j) const {
  chain.A_ij.setIdentity();
  chain.L_ij.setIdentity();
  if (_perturbation == Perturbation::RIGHT) {
    chain.A_ij.block(0, 0, 9, 9) = ie3_adj(ie3_inv(chain.U_ij));
    chain.A_ij.block(0, 9, 9, 6) = chain.B_ij;
  } else {
    Eigen::Matrix<double, 9, 9> Ad_x = Ad_se23(x_j);
    chain.A_ij.block(0, 0, 9, 9) = ie3_adj(chain.G_ij);
    chain.A_ij.block(0, 9, 9, 6) = Ad_x * chain.B_ij;
    chain.L_ij.block(0, 0, 9, 9) = Ad_x;
  }
}
