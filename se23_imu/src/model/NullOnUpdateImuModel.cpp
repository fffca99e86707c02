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

#include "NullOnUpdateImuModel.h"

#include "utils/colors.h"
#include "utils/print.h"

using namespace se23_imu;

StateBatch NullOnUpdateImuModel::evaluate(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers) {
  check_dt(dt, "NullOnUpdateImuModel::evaluate()");
  check_batch(x.size(), u.size(), "NullOnUpdateImuModel::evaluate()");
  check_markers(x.size(), markers.size(), "NullOnUpdateImuModel::evaluate()");
  Eigen::Matrix<double, 5, 5> G = generate_g(dt, _g_a);
  StateBatch x_next;
  x_next.reserve(x.size());
  for (size_t i = 0; i < x.size(); i++) {
    Eigen::Matrix<double, 5, 5> U = generate_u(u.at(i), dt);
    null_increment(U, markers.at(i));

    // With zero velocity the body can not have been accelerated by gravity either
    if (markers.at(i).linear_rest) {
      x_next.push_back(x.at(i) * U);
    } else {
      x_next.push_back(G * x.at(i) * U);
    }
  }
  return x_next;
}

JacobianBatch NullOnUpdateImuModel::state_jacobian(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers) {
  check_markers(x.size(), markers.size(), "NullOnUpdateImuModel::state_jacobian()");
  JacobianBatch F = CoupledImuModel::state_jacobian(x, u, dt);
  for (size_t i = 0; i < F.size(); i++) {
    if (markers.at(i).angular_rest) {
      F.at(i).block(0, 0, 3, 15).setZero();
      F.at(i).block(0, 0, 3, 3).setIdentity();
    }
    if (markers.at(i).linear_rest) {
      F.at(i).block(3, 0, 6, 15).setZero();
      F.at(i).block(3, 3, 6, 6).setIdentity();
    }
  }
  return F;
}

NoiseJacobianBatch NullOnUpdateImuModel::input_jacobian(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers) {
  check_markers(x.size(), markers.size(), "NullOnUpdateImuModel::input_jacobian()");
  NoiseJacobianBatch L = CoupledImuModel::input_jacobian(x, u, dt);
  for (size_t i = 0; i < L.size(); i++) {
    if (markers.at(i).angular_rest) {
      L.at(i).block(0, 0, 3, 12).setZero();
    }
    if (markers.at(i).linear_rest) {
      L.at(i).block(3, 0, 6, 12).setZero();
    }
  }
  return L;
}

JacobianBatch NullOnUpdateImuModel::covariance(const StateBatch &x, const InputBatch &u, double dt, const MarkerBatch &markers) {
  NoiseJacobianBatch L = input_jacobian(x, u, dt, markers);
  Eigen::Matrix<double, 12, 12> Q_d = _Q_c / dt;
  JacobianBatch Q;
  Q.reserve(L.size());
  for (size_t i = 0; i < L.size(); i++) {
    Q.push_back(L.at(i) * Q_d * L.at(i).transpose());
  }
  return Q;
}

Eigen::Matrix<double, 5, 5> NullOnUpdateImuModel::evaluate(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt,
                                                           const ImuMarker &marker) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  MarkerBatch m_batch = {marker};
  return evaluate(x_batch, u_batch, dt, m_batch).at(0);
}

Eigen::Matrix<double, 15, 15> NullOnUpdateImuModel::state_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt,
                                                                   const ImuMarker &marker) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  MarkerBatch m_batch = {marker};
  return state_jacobian(x_batch, u_batch, dt, m_batch).at(0);
}

Eigen::Matrix<double, 15, 12> NullOnUpdateImuModel::input_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt,
                                                                   const ImuMarker &marker) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  MarkerBatch m_batch = {marker};
  return input_jacobian(x_batch, u_batch, dt, m_batch).at(0);
}

Eigen::Matrix<double, 15, 15> NullOnUpdateImuModel::covariance(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt,
                                                               const ImuMarker &marker) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  MarkerBatch m_batch = {marker};
  return covariance(x_batch, u_batch, dt, m_batch).at(0);
}

void NullOnUpdateImuModel::null_increment(Eigen::Matrix<double, 5, 5> &U, const ImuMarker &marker) {
  if (marker.angular_rest) {
    U.block(0, 0, 3, 3).setIdentity();
  }
  if (marker.linear_rest) {
    U.block(0, 3, 5, 2).setZero();
    U.block(3, 3, 2, 2).setIdentity();
  }
}

void NullOnUpdateImuModel::check_markers(size_t num_states, size_t num_markers, const std::string &caller) {
  if (num_states != num_markers) {
    PRINT_ERROR(RED "%s: need one marker per trajectory (%d states, %d markers)\n" RESET, caller.c_str(), (int)num_states,
                (int)num_markers);
    std::exit(EXIT_FAILURE);
  }
}
