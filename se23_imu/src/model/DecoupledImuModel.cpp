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

#include "DecoupledImuModel.h"

#include <cmath>

#include "model/ImuProcessModel.h"
#include "utils/colors.h"
#include "utils/lie_ops.h"
#include "utils/print.h"

using namespace se23_imu;

DecoupledImuModel::DecoupledImuModel(const Eigen::VectorXd &gravity) {
  if (gravity.rows() != 3 || gravity.cols() != 1) {
    PRINT_ERROR(RED "DecoupledImuModel(): gravity must be a 3x1 vector (got %dx%d)\n" RESET, (int)gravity.rows(), (int)gravity.cols());
    std::exit(EXIT_FAILURE);
  }
  _g_a = gravity;
}

Eigen::Matrix<double, 15, 1> DecoupledImuModel::evaluate(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt,
                                                         Eigen::Matrix3d &C_k) const {
  ImuProcessModel::check_dt(dt, "DecoupledImuModel::evaluate()");
  Eigen::Matrix3d C = exp_so3(x.block(0, 0, 3, 1));
  Eigen::Vector3d v = x.block(3, 0, 3, 1);
  Eigen::Vector3d r = x.block(6, 0, 3, 1);
  Eigen::Vector3d acc_world = C * u.acc;

  Eigen::Matrix<double, 15, 1> x_next = x;
  x_next.block(6, 0, 3, 1) = r + dt * v + 0.5 * dt * dt * (_g_a + acc_world);
  x_next.block(3, 0, 3, 1) = v + dt * _g_a + dt * acc_world;
  C_k = C * exp_so3(dt * u.omega);
  x_next.block(0, 0, 3, 1) = log_so3(C_k);
  return x_next;
}

Eigen::Matrix<double, 15, 1> DecoupledImuModel::evaluate(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt) const {
  Eigen::Matrix3d C_k;
  return evaluate(x, u, dt, C_k);
}

VectorStateBatch DecoupledImuModel::evaluate(const VectorStateBatch &x, const InputBatch &u, double dt) const {
  if (x.empty() || x.size() != u.size()) {
    PRINT_ERROR(RED "DecoupledImuModel::evaluate(): batch size mismatch (%d states, %d inputs)\n" RESET, (int)x.size(), (int)u.size());
    std::exit(EXIT_FAILURE);
  }
  VectorStateBatch x_next;
  x_next.reserve(x.size());
  for (size_t i = 0; i < x.size(); i++) {
    x_next.push_back(evaluate(x.at(i), u.at(i), dt));
  }
  return x_next;
}

Eigen::Matrix<double, 15, 15> DecoupledImuModel::state_jacobian(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt) const {
  ImuProcessModel::check_dt(dt, "DecoupledImuModel::state_jacobian()");
  Eigen::Matrix3d C = exp_so3(x.block(0, 0, 3, 1));
  Eigen::Matrix3d acc_x = skew_x(-C * u.acc);
  Eigen::Vector3d phi = dt * u.omega;

  Eigen::Matrix<double, 15, 15> F = Eigen::Matrix<double, 15, 15>::Identity();
  F.block(6, 3, 3, 3) = dt * Eigen::Matrix3d::Identity();
  F.block(3, 0, 3, 3) = dt * acc_x;
  F.block(6, 0, 3, 3) = 0.5 * dt * dt * acc_x;
  F.block(0, 9, 3, 3) = C * exp_so3(phi) * dt * Jl_so3(-phi);
  F.block(3, 12, 3, 3) = dt * C;
  F.block(6, 12, 3, 3) = 0.5 * dt * dt * C;
  return F;
}

Eigen::Matrix<double, 15, 12> DecoupledImuModel::noise_jacobian(const Eigen::Matrix<double, 15, 1> &x, const ImuInput &u, double dt) const {
  ImuProcessModel::check_dt(dt, "DecoupledImuModel::noise_jacobian()");
  Eigen::Matrix3d C = exp_so3(x.block(0, 0, 3, 1));
  Eigen::Vector3d phi = dt * u.omega;

  Eigen::Matrix<double, 15, 12> B = Eigen::Matrix<double, 15, 12>::Zero();
  B.block(0, 0, 3, 3) = C * exp_so3(phi) * dt * Jr_so3(phi);
  B.block(3, 3, 3, 3) = dt * C;
  B.block(6, 3, 3, 3) = 0.5 * dt * dt * C;
  B.block(9, 6, 6, 6) = dt * Eigen::Matrix<double, 6, 6>::Identity();
  return B;
}

Eigen::Matrix<double, 15, 15> DecoupledImuModel::covariance(const Eigen::Matrix<double, 12, 12> &Q_c, const Eigen::Matrix<double, 15, 1> &x,
                                                            const ImuInput &u, double dt) const {
  Eigen::Matrix<double, 15, 12> B = noise_jacobian(x, u, dt);
  return B * (Q_c / dt) * B.transpose();
}
