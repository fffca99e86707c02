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

#include <Eigen/Eigen>
#include <algorithm>
#include <string>
#include <vector>

#include "model/CoupledImuModel.h"
#include "model/DecoupledImuModel.h"
#include "model/ModelOptions.h"
#include "utils/colors.h"
#include "utils/lie_ops.h"
#include "utils/print.h"

using namespace se23_imu;

namespace {

int num_failed = 0;

void check_near(const std::string &name, const Eigen::MatrixXd &A, const Eigen::MatrixXd &B, double tol) {
  double err = (A - B).norm();
  if (!(err < tol)) {
    PRINT_ERROR(RED "[FAIL]: %s (error %.3e > %.1e)\n" RESET, name.c_str(), err, tol);
    Printer::printMatrix(Printer::PrintLevel::DEBUG, name + " difference", A - B);
    num_failed++;
  } else {
    PRINT_DEBUG("[PASS]: %s (error %.3e)\n", name.c_str(), err);
  }
}

/// Error of the navigation part, global attitude error and plain differences
Eigen::Matrix<double, 9, 1> nav_error(const Eigen::Matrix3d &C, const Eigen::Matrix<double, 15, 1> &x, const Eigen::Matrix3d &C_ref,
                                      const Eigen::Matrix<double, 15, 1> &x_ref) {
  Eigen::Matrix<double, 9, 1> err;
  err.block(0, 0, 3, 1) = log_so3(C * C_ref.transpose());
  err.block(3, 0, 6, 1) = x.block(3, 0, 6, 1) - x_ref.block(3, 0, 6, 1);
  return err;
}

} // namespace

int main(int argc, char **argv) {

  // Verbosity
  std::string verbosity = "INFO";
  if (argc > 1)
    verbosity = argv[1];
  Printer::setPrintLevel(verbosity);

  ModelOptions options;
  const DecoupledImuModel model(options.gravity);
  Eigen::Matrix<double, 15, 1> x0;
  x0 << 0.2, -0.3, 0.5, 1.0, -0.5, 0.2, 3.0, 1.0, -2.0, 1e-3, -2e-3, 5e-4, 0.05, -0.02, 0.01;
  std::vector<double> dts = {1.0 / 400.0, 1.0 / 100.0, 1.0 / 10.0};
  std::vector<double> omega_mags = {0.0, 1e-4, 0.5, 3.0};
  Eigen::Vector3d omega_dir = Eigen::Vector3d(0.3, -0.5, 0.8).normalized();
  Eigen::Vector3d acc(0.4, -1.2, 9.6);

  //===================================================================================
  // Jacobians against central differences
  //===================================================================================
  double h = 1e-6;
  for (double dt : dts) {
    for (double mag : omega_mags) {
      std::string tag = " (dt " + std::to_string(dt) + ", |w| " + std::to_string(mag) + ")";
      ImuInput u(mag * omega_dir, acc);
      Eigen::Matrix3d C_ref;
      Eigen::Matrix<double, 15, 1> x_ref = model.evaluate(x0, u, dt, C_ref);
      Eigen::Matrix<double, 9, 15> F_num = Eigen::Matrix<double, 9, 15>::Zero();
      for (int j = 0; j < 15; j++) {
        Eigen::Matrix<double, 9, 1> err[2];
        for (int s = 0; s < 2; s++) {
          double step = (s == 0) ? h : -h;
          Eigen::Matrix<double, 15, 1> x_p = x0;
          ImuInput u_p = u;
          if (j < 3) {
            Eigen::Vector3d d = Eigen::Vector3d::Zero();
            d(j) = step;
            x_p.block(0, 0, 3, 1) = log_so3(exp_so3(d) * exp_so3(x0.block(0, 0, 3, 1)));
          } else if (j < 9) {
            x_p(j) += step;
          } else if (j < 12) {
            // Bias error enters the corrected input with a plus sign
            u_p.omega(j - 9) += step;
          } else {
            u_p.acc(j - 12) += step;
          }
          Eigen::Matrix3d C_p;
          Eigen::Matrix<double, 15, 1> x_next = model.evaluate(x_p, u_p, dt, C_p);
          err[s] = nav_error(C_p, x_next, C_ref, x_ref);
        }
        F_num.col(j) = (err[0] - err[1]) / (2.0 * h);
      }
      Eigen::Matrix<double, 15, 15> F = model.state_jacobian(x0, u, dt);
      check_near("state Jacobian" + tag, F.block(0, 0, 9, 15), F_num, 1e-6 * std::max(1.0, F_num.norm()));
      check_near("bias rows" + tag, F.block(9, 0, 6, 15),
                 (Eigen::Matrix<double, 6, 15>() << Eigen::Matrix<double, 6, 9>::Zero(), Eigen::Matrix<double, 6, 6>::Identity()).finished(),
                 1e-15);

      // Noise enters where the biases do, and the walk scales with dt
      Eigen::Matrix<double, 15, 12> B = model.noise_jacobian(x0, u, dt);
      check_near("gyro noise" + tag, B.block(0, 0, 9, 3), F.block(0, 9, 9, 3), 1e-15);
      check_near("accel noise" + tag, B.block(0, 3, 9, 3), F.block(0, 12, 9, 3), 1e-15);
      check_near("bias walk noise" + tag, B.block(9, 6, 6, 6), dt * Eigen::Matrix<double, 6, 6>::Identity(), 1e-15);
      Eigen::Matrix<double, 15, 15> Q = model.covariance(options.Q_c(), x0, u, dt);
      check_near("covariance" + tag, Q, B * (options.Q_c() / dt) * B.transpose(), 1e-20);
      check_near("covariance symmetric" + tag, Q, Q.transpose(), 1e-20);
      check_near("biases pass through" + tag, x_ref.block(9, 0, 6, 1), x0.block(9, 0, 6, 1), 1e-15);
    }
  }

  //===================================================================================
  // Without rotation it agrees with the coupled model
  //===================================================================================
  {
    CoupledImuModel coupled(options);
    Eigen::Matrix3d C0 = exp_so3(x0.block(0, 0, 3, 1));
    Eigen::Matrix<double, 5, 5> X0 = se23_from_components(C0, x0.block(3, 0, 3, 1), x0.block(6, 0, 3, 1));
    for (double dt : dts) {
      std::string tag = " (dt " + std::to_string(dt) + ")";
      ImuInput u(Eigen::Vector3d::Zero(), acc);
      Eigen::Matrix3d C1;
      Eigen::Matrix<double, 15, 1> x1 = model.evaluate(x0, u, dt, C1);
      Eigen::Matrix<double, 5, 5> X1 = coupled.evaluate(X0, u, dt);
      check_near("attitude matches coupled" + tag, C1, X1.block(0, 0, 3, 3), 1e-14);
      check_near("velocity matches coupled" + tag, x1.block(3, 0, 3, 1), X1.block(0, 3, 3, 1), 1e-12);
      check_near("position matches coupled" + tag, x1.block(6, 0, 3, 1), X1.block(0, 4, 3, 1), 1e-12);
    }
  }

  //===================================================================================
  // The model carries nothing between calls
  //===================================================================================
  {
    ImuInput u(0.5 * omega_dir, acc);
    Eigen::Matrix<double, 15, 1> first = model.evaluate(x0, u, 0.01);
    Eigen::Matrix<double, 15, 1> other = x0;
    other.block(0, 0, 3, 1) << 1.0, 1.0, -1.0;
    model.evaluate(other, ImuInput(Eigen::Vector3d(3.0, 0.0, 0.0), Eigen::Vector3d::Zero()), 0.1);
    Eigen::Matrix<double, 15, 15> F_first = model.state_jacobian(x0, u, 0.01);
    model.state_jacobian(other, u, 0.1);
    check_near("evaluate is repeatable", model.evaluate(x0, u, 0.01), first, 1e-300);
    check_near("state_jacobian is repeatable", model.state_jacobian(x0, u, 0.01), F_first, 1e-300);

    VectorStateBatch xs = {x0, other};
    InputBatch us = {u, u};
    VectorStateBatch x_batch = model.evaluate(xs, us, 0.01);
    check_near("batch entry 0", x_batch.at(0), first, 1e-300);
    check_near("batch entry 1", x_batch.at(1), model.evaluate(other, u, 0.01), 1e-300);
  }

  if (num_failed > 0) {
    PRINT_ERROR(RED "test_decoupled_model: %d checks failed\n" RESET, num_failed);
    return EXIT_FAILURE;
  }
  PRINT_INFO(GREEN "test_decoupled_model: all checks passed\n" RESET);
  return EXIT_SUCCESS;
}
