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

#include "CoupledImuModel.h"

#include "utils/lie_ops.h"

using namespace se23_imu;

StateBatch CoupledImuModel::evaluate(const StateBatch &x, const InputBatch &u, double dt) {
  check_dt(dt, "CoupledImuModel::evaluate()");
  check_batch(x.size(), u.size(), "CoupledImuModel::evaluate()");
  Eigen::Matrix<double, 5, 5> G = generate_g(dt, _g_a);
  StateBatch x_next;
  x_next.reserve(x.size());
  for (size_t i = 0; i < x.size(); i++) {
    x_next.push_back(G * x.at(i) * generate_u(u.at(i), dt));
  }
  return x_next;
}

JacobianBatch CoupledImuModel::state_jacobian(const StateBatch &x, const InputBatch &u, double dt) {
  check_dt(dt, "CoupledImuModel::state_jacobian()");
  check_batch(x.size(), u.size(), "CoupledImuModel::state_jacobian()");
  Eigen::Matrix<double, 5, 5> G = generate_g(dt, _g_a);
  JacobianBatch F;
  F.reserve(x.size());
  for (size_t i = 0; i < x.size(); i++) {
    Eigen::Matrix<double, 5, 5> U = generate_u(u.at(i), dt);
    F.push_back(transition(G * x.at(i) * U, U, G, input_jacobian_pose(u.at(i), dt)));
  }
  return F;
}

NoiseJacobianBatch CoupledImuModel::input_jacobian(const StateBatch &x, const InputBatch &u, double dt) {
  check_dt(dt, "CoupledImuModel::input_jacobian()");
  check_batch(x.size(), u.size(), "CoupledImuModel::input_jacobian()");
  Eigen::Matrix<double, 5, 5> G = generate_g(dt, _g_a);
  NoiseJacobianBatch L;
  L.reserve(x.size());
  for (size_t i = 0; i < x.size(); i++) {
    L.push_back(noise_map(G * x.at(i) * generate_u(u.at(i), dt), input_jacobian_pose(u.at(i), dt), dt));
  }
  return L;
}

Eigen::Matrix<double, 15, 12> CoupledImuModel::input_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  return input_jacobian(x_batch, u_batch, dt).at(0);
}

JacobianBatch CoupledImuModel::covariance(const StateBatch &x, const InputBatch &u, double dt) {
  NoiseJacobianBatch L = input_jacobian(x, u, dt);
  Eigen::Matrix<double, 12, 12> Q_d = _Q_c / dt;
  JacobianBatch Q;
  Q.reserve(L.size());
  for (size_t i = 0; i < L.size(); i++) {
    Q.push_back(L.at(i) * Q_d * L.at(i).transpose());
  }
  return Q;
}

Eigen::Matrix<double, 5, 5> CoupledImuModel::generate_u(const ImuInput &u, double dt) {
  Eigen::Vector3d phi = dt * u.omega;
  Eigen::Matrix<double, 5, 5> U = se23_from_components(exp_so3(phi), dt * Jl_so3(phi) * u.acc, 0.5 * dt * dt * form_N(phi) * u.acc);
  U(3, 4) = dt;
  return U;
}

Eigen::Matrix<double, 5, 5> CoupledImuModel::generate_u_inverse(const ImuInput &u, double dt) { return ie3_inv(generate_u(u, dt)); }

Eigen::Matrix<double, 5, 5> CoupledImuModel::generate_g(double dt, const Eigen::Vector3d &g_a) {
  Eigen::Matrix<double, 5, 5> G = se23_from_components(Eigen::Matrix3d::Identity(), dt * g_a, -0.5 * dt * dt * g_a);
  G(3, 4) = -dt;
  return G;
}

Eigen::Matrix<double, 9, 1> CoupledImuModel::generate_nu(const ImuInput &u, double dt) {
  Eigen::Vector3d phi = dt * u.omega;
  Eigen::Matrix<double, 9, 1> nu;
  nu.block(0, 0, 3, 1) = phi;
  nu.block(3, 0, 3, 1) = dt * u.acc;
  nu.block(6, 0, 3, 1) = 0.5 * dt * dt * Jl_inv_so3(phi) * form_N(phi) * u.acc;
  return nu;
}

Eigen::Matrix<double, 9, 6> CoupledImuModel::generate_upsilon(const ImuInput &u, double dt) {
  Eigen::Vector3d phi = dt * u.omega;
  Eigen::Matrix3d Om = skew_x(phi);
  Eigen::Matrix3d OmOm = Om * Om;
  Eigen::Matrix3d W = OmOm * skew_x(u.acc) + Om * skew_x(Om * u.acc) + skew_x(OmOm * u.acc);

  // NOTE: W already carries dt^2 through Om
  Eigen::Matrix3d upsilon_30 = std::pow(dt, 3) * (skew_x(u.acc) / 12.0 - W / 720.0);
  Eigen::Matrix3d upsilon_31 = 0.5 * dt * dt * Jl_inv_so3(phi) * form_N(phi);

  Eigen::Matrix<double, 9, 6> upsilon = Eigen::Matrix<double, 9, 6>::Zero();
  upsilon.block(0, 0, 3, 3) = dt * Eigen::Matrix3d::Identity();
  upsilon.block(6, 0, 3, 3) = upsilon_30;
  upsilon.block(3, 3, 3, 3) = dt * Eigen::Matrix3d::Identity();
  upsilon.block(6, 3, 3, 3) = upsilon_31;
  return upsilon;
}

Eigen::Matrix<double, 9, 6> CoupledImuModel::input_jacobian_pose(const ImuInput &u, double dt) {
  Eigen::Matrix<double, 9, 1> nu = generate_nu(u, dt);
  return Jl_se23(-nu) * generate_upsilon(u, dt);
}

Eigen::Matrix<double, 9, 9> CoupledImuModel::ie3_adj(const Eigen::Matrix<double, 5, 5> &X) { return se23_imu::ie3_adj(X); }

Eigen::Matrix<double, 5, 5> CoupledImuModel::ie3_inv(const Eigen::Matrix<double, 5, 5> &X) { return se23_imu::ie3_inv(X); }

Eigen::Matrix<double, 15, 15> CoupledImuModel::transition(const Eigen::Matrix<double, 5, 5> &x_next, const Eigen::Matrix<double, 5, 5> &U,
                                                          const Eigen::Matrix<double, 5, 5> &G, const Eigen::Matrix<double, 9, 6> &L) const {
  Eigen::Matrix<double, 15, 15> F = Eigen::Matrix<double, 15, 15>::Identity();
  if (_perturbation == Perturbation::RIGHT) {
    F.block(0, 0, 9, 9) = ie3_adj(ie3_inv(U));
    F.block(0, 9, 9, 6) = -L;
  } else {
    F.block(0, 0, 9, 9) = ie3_adj(G);
    F.block(0, 9, 9, 6) = -Ad_se23(x_next) * L;
  }
  return F;
}

Eigen::Matrix<double, 15, 12> CoupledImuModel::noise_map(const Eigen::Matrix<double, 5, 5> &x_next, const Eigen::Matrix<double, 9, 6> &L,
                                                         double dt) const {
  Eigen::Matrix<double, 15, 12> L_full = Eigen::Matrix<double, 15, 12>::Zero();
  if (_perturbation == Perturbation::RIGHT) {
    L_full.block(0, 0, 9, 6) = L;
  } else {
    L_full.block(0, 0, 9, 6) = Ad_se23(x_next) * L;
  }
  L_full.block(9, 6, 6, 6) = dt * Eigen::Matrix<double, 6, 6>::Identity();
  return L_full;
}
