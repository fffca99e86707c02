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
#include <random>
#include <string>
#include <vector>

#include "model/CoupledImuModel.h"
#include "model/ModelOptions.h"
#include "model/PreintegratedImuModel.h"
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

} // namespace

int main(int argc, char **argv) {

  // Verbosity
  std::string verbosity = "INFO";
  if (argc > 1)
    verbosity = argv[1];
  Printer::setPrintLevel(verbosity);

  // Random but repeatable inputs
  std::mt19937 gen(42);
  std::normal_distribution<double> w(0, 1);
  int num_steps = 60;
  double dt = 1.0 / 200.0;

  // Three trajectories starting from different states and covariances
  StateBatch x0 = {Eigen::Matrix<double, 5, 5>::Identity(),
                   se23_from_components(rot_z(0.3) * rot_y(-0.2), Eigen::Vector3d(1.0, -0.5, 0.2), Eigen::Vector3d(3.0, 1.0, -2.0)),
                   se23_from_components(rot_x(2.0), Eigen::Vector3d(0.0, 4.0, -1.0), Eigen::Vector3d(-10.0, 5.0, 2.0))};
  InitOptions init;
  JacobianBatch P0;
  for (size_t i = 0; i < x0.size(); i++) {
    Eigen::Matrix<double, 15, 15> A = Eigen::Matrix<double, 15, 15>::Zero();
    for (int r = 0; r < 15; r++)
      for (int c = 0; c < 15; c++)
        A(r, c) = 0.01 * w(gen);
    P0.push_back(init.P0() + A * A.transpose());
  }
  std::vector<InputBatch> inputs;
  for (int k = 0; k < num_steps; k++) {
    InputBatch u_k;
    for (size_t i = 0; i < x0.size(); i++) {
      Eigen::Vector3d omega(0.8 * w(gen), 0.8 * w(gen), 0.8 * w(gen));
      Eigen::Vector3d acc(w(gen), w(gen), 9.81 + w(gen));
      u_k.push_back(ImuInput(omega, acc));
    }
    inputs.push_back(u_k);
  }

  //===================================================================================
  // Preintegrated covariance equals recursive single step propagation
  //===================================================================================
  std::vector<Perturbation::Type> conventions = {Perturbation::LEFT, Perturbation::RIGHT};
  for (Perturbation::Type perturbation : conventions) {
    ModelOptions options;
    options.perturbation = perturbation;
    CoupledImuModel single(options);
    PreintegratedImuModel preint(options, x0.size());
    preint.reset_incremental_jacobians(P0);

    StateBatch x_single = x0, x_preint = x0;
    JacobianBatch P_single = P0;
    JacobianBatch Phi_single(x0.size(), Eigen::Matrix<double, 15, 15>::Identity());
    for (int k = 0; k < num_steps; k++) {
      JacobianBatch F = single.state_jacobian(x_single, inputs.at(k), dt);
      JacobianBatch Q = single.covariance(x_single, inputs.at(k), dt);
      for (size_t i = 0; i < x0.size(); i++) {
        P_single.at(i) = F.at(i) * P_single.at(i) * F.at(i).transpose() + Q.at(i);
        Phi_single.at(i) = F.at(i) * Phi_single.at(i);
      }
      x_single = single.evaluate(x_single, inputs.at(k), dt);
      x_preint = preint.evaluate(x_preint, inputs.at(k), dt);
    }

    JacobianBatch A_ij = preint.state_jacobian(x_preint, inputs.back(), dt);
    JacobianBatch P_preint = preint.propagated_covariance();
    for (size_t i = 0; i < x0.size(); i++) {
      std::string tag = " (" + Perturbation::as_string(perturbation) + ", trajectory " + std::to_string(i) + ")";
      check_near("state" + tag, x_preint.at(i), x_single.at(i), 1e-12 * std::max(1.0, x_single.at(i).norm()));
      check_near("A_ij is the product of the transitions" + tag, A_ij.at(i), Phi_single.at(i), 1e-9 * std::max(1.0, Phi_single.at(i).norm()));
      check_near("covariance" + tag, P_preint.at(i), P_single.at(i), 1e-9 * P_single.at(i).norm());
      check_near("stored P_j" + tag, preint.incremental(i).P_j, P_preint.at(i), 1e-15);
      check_near("covariance symmetric" + tag, P_preint.at(i), P_preint.at(i).transpose(), 1e-15);
    }
    for (size_t i = 0; i < x0.size(); i++) {
      if (preint.steps_since_reset(i) != num_steps) {
        PRINT_ERROR(RED "[FAIL]: trajectory %d expected %d steps since the reset, got %d\n" RESET, (int)i, num_steps,
                    preint.steps_since_reset(i));
        num_failed++;
      }
    }

    //===================================================================================
    // Resetting clears the chain, and doing it twice changes nothing
    //===================================================================================
    JacobianBatch P_reset = preint.propagated_covariance();
    preint.reset_incremental_jacobians(P_reset);
    preint.reset_incremental_jacobians(P_reset);
    JacobianBatch A_reset = preint.state_jacobian(x_preint, inputs.back(), dt);
    JacobianBatch Q_reset = preint.covariance();
    JacobianBatch L_reset = preint.input_jacobian();
    JacobianBatch P_after = preint.propagated_covariance();
    for (size_t i = 0; i < x0.size(); i++) {
      std::string tag = " (" + Perturbation::as_string(perturbation) + ", trajectory " + std::to_string(i) + ")";
      check_near("reset A_ij" + tag, A_reset.at(i), Eigen::Matrix<double, 15, 15>::Identity(), 1e-15);
      check_near("reset Q_ij" + tag, Q_reset.at(i), Eigen::Matrix<double, 15, 15>::Zero(), 1e-15);
      check_near("reset L_ij" + tag, L_reset.at(i), Eigen::Matrix<double, 15, 15>::Identity(), 1e-15);
      check_near("reset keeps P" + tag, P_after.at(i), P_reset.at(i), 1e-15);
      check_near("reset U_ij" + tag, preint.incremental(i).U_ij, Eigen::Matrix<double, 5, 5>::Identity(), 1e-15);
      check_near("reset G_ij" + tag, preint.incremental(i).G_ij, Eigen::Matrix<double, 5, 5>::Identity(), 1e-15);
    }
    for (size_t i = 0; i < x0.size(); i++) {
      if (preint.steps_since_reset(i) != 0) {
        PRINT_ERROR(RED "[FAIL]: steps of trajectory %d were not cleared by the reset\n" RESET, (int)i);
        num_failed++;
      }
    }

    //===================================================================================
    // After a reset only the new steps are carried, none of the stale ones
    //===================================================================================
    StateBatch x_restart = x_preint;
    JacobianBatch P_restart = P_reset;
    for (int k = 0; k < 10; k++) {
      JacobianBatch F = single.state_jacobian(x_restart, inputs.at(k), dt);
      JacobianBatch Q = single.covariance(x_restart, inputs.at(k), dt);
      for (size_t i = 0; i < x0.size(); i++) {
        P_restart.at(i) = F.at(i) * P_restart.at(i) * F.at(i).transpose() + Q.at(i);
      }
      x_restart = single.evaluate(x_restart, inputs.at(k), dt);
      x_preint = preint.evaluate(x_preint, inputs.at(k), dt);

      // The first step after a reset is exactly one single-step propagation
      if (k == 0) {
        JacobianBatch A_one = preint.state_jacobian(x_preint, inputs.at(k), dt);
        JacobianBatch P_one = preint.propagated_covariance();
        for (size_t i = 0; i < x0.size(); i++) {
          std::string tag = " (" + Perturbation::as_string(perturbation) + ", trajectory " + std::to_string(i) + ")";
          check_near("one step state" + tag, x_preint.at(i), x_restart.at(i), 1e-13 * std::max(1.0, x_restart.at(i).norm()));
          check_near("one step A_ij" + tag, A_one.at(i), F.at(i), 1e-12 * std::max(1.0, F.at(i).norm()));
          check_near("one step covariance" + tag, P_one.at(i), P_restart.at(i), 1e-12 * P_restart.at(i).norm());
          if (preint.steps_since_reset(i) != 1) {
            PRINT_ERROR(RED "[FAIL]: trajectory %d should have one step after the reset\n" RESET, (int)i);
            num_failed++;
          }
        }
      }
    }
    P_after = preint.propagated_covariance();
    for (size_t i = 0; i < x0.size(); i++) {
      std::string tag = " (" + Perturbation::as_string(perturbation) + ", trajectory " + std::to_string(i) + ")";
      check_near("restarted covariance" + tag, P_after.at(i), P_restart.at(i), 1e-9 * P_restart.at(i).norm());
    }
  }

  // The single trajectory reset goes to the first chain
  {
    ModelOptions options;
    PreintegratedImuModel preint(options);
    preint.reset_incremental_jacobians(P0.at(1));
    check_near("single trajectory reset", preint.incremental(0).P_i, P0.at(1), 1e-15);
    if (preint.num_trajectories() != 1) {
      PRINT_ERROR(RED "[FAIL]: default model should integrate one trajectory\n" RESET);
      num_failed++;
    }
  }

  if (num_failed > 0) {
    PRINT_ERROR(RED "test_preintegration: %d checks failed\n" RESET, num_failed);
    return EXIT_FAILURE;
  }
  PRINT_INFO(GREEN "test_preintegration: all checks passed\n" RESET);
  return EXIT_SUCCESS;
}
