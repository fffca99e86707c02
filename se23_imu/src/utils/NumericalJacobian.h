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

#ifndef SE23_IMU_NUMERICAL_JACOBIAN_H
#define SE23_IMU_NUMERICAL_JACOBIAN_H

#include <Eigen/Eigen>
#include <functional>

#include "model/Perturbation.h"
#include "utils/lie_ops.h"

namespace se23_imu {

/// A propagation function of the SE_2(3) state alone
typedef std::function<Eigen::Matrix<double, 5, 5>(const Eigen::Matrix<double, 5, 5> &)> StateFunction;

/// A propagation function of the 6 dof input [omega, acc] alone
typedef std::function<Eigen::Matrix<double, 5, 5>(const Eigen::Matrix<double, 6, 1> &)> InputFunction;

/**
 * @brief Error between two SE_2(3) states in a given convention
 *
 * Left is log(X * X_ref^-1) and right is log(X_ref^-1 * X).
 */
inline Eigen::Matrix<double, 9, 1> se23_error(const Eigen::Matrix<double, 5, 5> &X, const Eigen::Matrix<double, 5, 5> &X_ref,
                                              Perturbation::Type perturbation) {
  if (perturbation == Perturbation::LEFT)
    return log_se23(X * Inv_se23(X_ref));
  return log_se23(Inv_se23(X_ref) * X);
}

/**
 * @brief Central difference Jacobian of a state function
 *
 * Perturbs the input state as Exp(d) * x (left) or x * Exp(d) (right) and measures the output error in the same convention.
 *
 * @param f Function to differentiate
 * @param x Linearization point
 * @param perturbation Error-state convention
 * @param h Step size
 * @return 9x9 Jacobian
 */
inline Eigen::Matrix<double, 9, 9> numerical_state_jacobian(const StateFunction &f, const Eigen::Matrix<double, 5, 5> &x,
                                                            Perturbation::Type perturbation, double h = 1e-6) {
  Eigen::Matrix<double, 5, 5> f_x = f(x);
  Eigen::Matrix<double, 9, 9> J = Eigen::Matrix<double, 9, 9>::Zero();
  for (int j = 0; j < 9; j++) {
    Eigen::Matrix<double, 9, 1> d = Eigen::Matrix<double, 9, 1>::Zero();
    d(j) = h;
    Eigen::Matrix<double, 5, 5> x_plus, x_minus;
    if (perturbation == Perturbation::LEFT) {
      x_plus = exp_se23(d) * x;
      x_minus = exp_se23(-d) * x;
    } else {
      x_plus = x * exp_se23(d);
      x_minus = x * exp_se23(-d);
    }
    J.col(j) = (se23_error(f(x_plus), f_x, perturbation) - se23_error(f(x_minus), f_x, perturbation)) / (2.0 * h);
  }
  return J;
}

/**
 * @brief Central difference Jacobian of an input function
 * @param g Function to differentiate
 * @param u Linearization point [omega, acc]
 * @param perturbation Convention of the output error
 * @param h Step size
 * @return 9x6 Jacobian
 */
inline Eigen::Matrix<double, 9, 6> numerical_input_jacobian(const InputFunction &g, const Eigen::Matrix<double, 6, 1> &u,
                                                            Perturbation::Type perturbation, double h = 1e-6) {
  Eigen::Matrix<double, 5, 5> g_u = g(u);
  Eigen::Matrix<double, 9, 6> J = Eigen::Matrix<double, 9, 6>::Zero();
  for (int j = 0; j < 6; j++) {
    Eigen::Matrix<double, 6, 1> d = Eigen::Matrix<double, 6, 1>::Zero();
    d(j) = h;
    J.col(j) = (se23_error(g(u + d), g_u, perturbation) - se23_error(g(u - d), g_u, perturbation)) / (2.0 * h);
  }
  return J;
}

} // namespace se23_imu

#endif // SE23_IMU_NUMERICAL_JACOBIAN_H
