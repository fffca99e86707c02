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
#include <cmath>
#include <string>
#include <vector>

#include "model/CoupledImuModel.h"
#include "model/ModelOptions.h"
#include "utils/NumericalJacobian.h"
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

void check_structure(const std::string &name, const Eigen::Matrix<double, 5, 5> &X) {
  Eigen::Matrix<double, 2, 5> bottom = Eigen::Matrix<double, 2, 5>::Zero();
  bottom(0, 3) = 1.0;
  bottom(1, 4) = 1.0;
  if (!is_valid_rotation(X.block(0, 0, 3, 3)) || (X.block(3, 0, 2, 5) - bottom).norm() > 1e-12) {
    PRINT_ERROR(RED "[FAIL]: %s is not an element of SE_2(3)\n" RESET, name.c_str());
    num_failed++;
  }
}

} // namespace

int main(int argc, char **argv) {

  // Verbosity
  std::string verbosity = "INFO";
  if (argc > 1)
    verbosity = argv[1];
  Printer::setPrintLevel(verbosity);

  // Common state and input direction
  Eigen::Matrix<double, 5, 5> x0 =
      se23_from_components(rot_z(0.3) * rot_y(-0.2), Eigen::Vector3d(1.0, -0.5, 0.2), Eigen::Vector3d(3.0, 1.0, -2.0));
  Eigen::Vector3d omega_dir = Eigen::Vector3d(0.3, -0.5, 0.8).normalized();
  Eigen::Vector3d acc(0.4, -1.2, 9.6);

  //===================================================================================
  // Body at rest, the accelerometer cancels gravity and nothing moves
  //===================================================================================
  {
    ModelOptions options;
    options.gravity = (Eigen::VectorXd(3) << 0.0, 0.0, -9.80665).finished();
    CoupledImuModel model(options);
    ImuInput u(Eigen::Vector3d::Zero(), Eigen::Vector3d(0.0, 0.0, 9.80665));
    Eigen::Matrix<double, 5, 5> x1 = model.evaluate(Eigen::Matrix<double, 5, 5>::Identity(), u, 0.01);
    check_near("stationary body stays at the identity", x1, Eigen::Matrix<double, 5, 5>::Identity(), 1e-12);
  }

  //===================================================================================
  // Closed form increment
  //===================================================================================
  std::vector<double> dts = {1.0 / 400.0, 1.0 / 100.0, 1.0 / 10.0};
  std::vector<double> omega_mags = {0.0, 1e-4, 0.5, 3.0};
  for (double dt : dts) {
    for (double mag : omega_mags) {
      std::string tag = " (dt " + std::to_string(dt) + ", |w| " + std::to_string(mag) + ")";
      ImuInput u(mag * omega_dir, acc);
      Eigen::Matrix<double, 5, 5> U = CoupledImuModel::generate_u(u, dt);
      check_near("U = T(dt) Exp(nu)" + tag, U, time_machine(dt) * exp_se23(CoupledImuModel::generate_nu(u, dt)), 1e-10);
      check_near("U U^-1 = I" + tag, U * CoupledImuModel::generate_u_inverse(u, dt), Eigen::Matrix<double, 5, 5>::Identity(), 1e-12);

      // Compare with a brute force integration of the constant input
      int num_int = 4000;
      double h = dt / num_int;
      Eigen::Matrix3d C = Eigen::Matrix3d::Identity();
      Eigen::Vector3d v = Eigen::Vector3d::Zero(), r = Eigen::Vector3d::Zero();
      for (int i = 0; i < num_int; i++) {
        Eigen::Matrix3d C_mid = C * exp_so3(0.5 * h * u.omega);
        r += h * v + 0.5 * h * h * C_mid * u.acc;
        v += h * C_mid * u.acc;
        C = C * exp_so3(h * u.omega);
      }
      check_near("U velocity vs integration" + tag, U.block(0, 3, 3, 1), v, 1e-7 * std::max(1.0, v.norm()));
      check_near("U position vs integration" + tag, U.block(0, 4, 3, 1), r, 1e-7 * std::max(1.0, r.norm()));
    }
  }

  //===================================================================================
  // Jacobians against central differences for both conventions
  //===================================================================================
  std::vector<Perturbation::Type> conventions = {Perturbation::LEFT, Perturbation::RIGHT};
  for (Perturbation::Type perturbation : conventions) {
    ModelOptions options;
    options.perturbation = perturbation;
    CoupledImuModel model(options);
    for (double dt : dts) {
      for (double mag : omega_mags) {
        std::string tag = " (" + Perturbation::as_string(perturbation) + ", dt " + std::to_string(dt) + ", |w| " + std::to_string(mag) + ")";
        ImuInput u(mag * omega_dir, acc);
        Eigen::Matrix<double, 5, 5> x1 = model.evaluate(x0, u, dt);
        check_structure("x1" + tag, x1);

        // State block
        StateFunction f = [&](const Eigen::Matrix<double, 5, 5> &x) { return model.evaluate(x, u, dt); };
        Eigen::Matrix<double, 15, 15> F = model.state_jacobian(x0, u, dt);
        Eigen::Matrix<double, 9, 9> F_num = numerical_state_jacobian(f, x0, perturbation);
        check_near("state Jacobian" + tag, F.block(0, 0, 9, 9), F_num, 1e-6 * std::max(1.0, F_num.norm()));

        // Input block, a positive bias error lowers the corrected input
        Eigen::Matrix<double, 6, 1> u_vec;
        u_vec << u.omega, u.acc;
        InputFunction g = [&](const Eigen::Matrix<double, 6, 1> &uu) {
          return model.evaluate(x0, ImuInput(uu.block(0, 0, 3, 1), uu.block(3, 0, 3, 1)), dt);
        };
        Eigen::Matrix<double, 9, 6> L_num = numerical_input_jacobian(g, u_vec, perturbation);
        double tol = 1e-6 * std::max(1.0, L_num.norm());
        check_near("bias Jacobian" + tag, F.block(0, 9, 9, 6), -L_num, tol);
        check_near("bias rows are identity" + tag, F.block(9, 0, 6, 15),
                   (Eigen::Matrix<double, 6, 15>() << Eigen::Matrix<double, 6, 9>::Zero(), Eigen::Matrix<double, 6, 6>::Identity()).finished(),
                   1e-15);

        // Noise map and discrete covariance
        Eigen::Matrix<double, 15, 12> L = model.input_jacobian(x0, u, dt);
        check_near("noise Jacobian" + tag, L.block(0, 0, 9, 6), L_num, tol);
        check_near("noise Jacobian bias walk" + tag, L.block(9, 6, 6, 6), dt * Eigen::Matrix<double, 6, 6>::Identity(), 1e-15);
        check_near("noise Jacobian cross terms" + tag, L.block(0, 6, 9, 6), Eigen::Matrix<double, 9, 6>::Zero(), 1e-15);
        Eigen::Matrix<double, 15, 15> Q = model.covariance(x0, u, dt);
        check_near("covariance" + tag, Q, L * (options.Q_c() / dt) * L.transpose(), 1e-12 * std::max(1.0, Q.norm()));
        check_near("covariance symmetric" + tag, Q, Q.transpose(), 1e-15);
        Eigen::SelfAdjointEigenSolver<Eigen::Matrix<double, 15, 15>> eig(0.5 * (Q + Q.transpose()));
        if (eig.eigenvalues().minCoeff() < -1e-12 * std::max(1.0, Q.norm())) {
          PRINT_ERROR(RED "[FAIL]: covariance is not positive semi-definite%s\n" RESET, tag.c_str());
          num_failed++;
        }

        // Input Jacobian of the increment alone
        Eigen::Matrix<double, 9, 6> L_pose_num = numerical_input_jacobian(
            [&](const Eigen::Matrix<double, 6, 1> &uu) -> Eigen::Matrix<double, 5, 5> {
              return time_machine(-dt) * CoupledImuModel::generate_u(ImuInput(uu.block(0, 0, 3, 1), uu.block(3, 0, 3, 1)), dt);
            },
            u_vec, Perturbation::RIGHT);
        check_near("increment input Jacobian" + tag, CoupledImuModel::input_jacobian_pose(u, dt), L_pose_num, tol);
      }
    }
  }

  //===================================================================================
  // Batches are the single trajectory model broadcast
  //===================================================================================
  {
    ModelOptions options;
    CoupledImuModel model(options);
    StateBatch xs = {x0, Eigen::Matrix<double, 5, 5>::Identity(),
                     se23_from_components(rot_x(1.2), Eigen::Vector3d(0, 3.0, 0), Eigen::Vector3d(-1.0, 0.0, 10.0))};
    InputBatch us = {ImuInput(0.5 * omega_dir, acc), ImuInput(Eigen::Vector3d::Zero(), Eigen::Vector3d(0, 0, 9.81)),
                     ImuInput(Eigen::Vector3d(2.0, -1.0, 0.1), Eigen::Vector3d(-3.0, 0.5, 1.0))};
    double dt = 0.005;
    StateBatch x1 = model.evaluate(xs, us, dt);
    JacobianBatch F = model.state_jacobian(xs, us, dt);
    NoiseJacobianBatch L = model.input_jacobian(xs, us, dt);
    JacobianBatch Q = model.covariance(xs, us, dt);
    if (x1.size() != 3 || F.size() != 3 || L.size() != 3 || Q.size() != 3) {
      PRINT_ERROR(RED "[FAIL]: batch outputs do not have one entry per trajectory\n" RESET);
      return EXIT_FAILURE;
    }
    for (size_t i = 0; i < xs.size(); i++) {
      std::string tag = " (trajectory " + std::to_string(i) + ")";
      check_near("batch evaluate" + tag, x1.at(i), model.evaluate(xs.at(i), us.at(i), dt), 1e-15);
      check_near("batch state_jacobian" + tag, F.at(i), model.state_jacobian(xs.at(i), us.at(i), dt), 1e-15);
      check_near("batch input_jacobian" + tag, L.at(i), model.input_jacobian(xs.at(i), us.at(i), dt), 1e-15);
      check_near("batch covariance" + tag, Q.at(i), model.covariance(xs.at(i), us.at(i), dt), 1e-15);
    }
  }

  if (num_failed > 0) {
    PRINT_ERROR(RED "test_coupled_model: %d checks failed\n" RESET, num_failed);
    return EXIT_FAILURE;
  }
  PRINT_INFO(GREEN "test_coupled_model: all checks passed\n" RESET);
  return EXIT_SUCCESS;
}
