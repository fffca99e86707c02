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

#include "ImuProcessModel.h"

#include <cmath>

#include "utils/colors.h"
#include "utils/print.h"

using namespace se23_imu;

ImuProcessModel::ImuProcessModel(const ModelOptions &options) {

  // The convention selects every Jacobian formula, so we can not guess it
  if (options.perturbation != Perturbation::LEFT && options.perturbation != Perturbation::RIGHT) {
    PRINT_ERROR(RED "ImuProcessModel(): perturbation must be either left or right (got %s)\n" RESET,
                Perturbation::as_string(options.perturbation).c_str());
    std::exit(EXIT_FAILURE);
  }
  if (options.gravity.rows() != 3 || options.gravity.cols() != 1) {
    PRINT_ERROR(RED "ImuProcessModel(): gravity must be a 3x1 vector (got %dx%d)\n" RESET, (int)options.gravity.rows(),
                (int)options.gravity.cols());
    std::exit(EXIT_FAILURE);
  }
  if (!options.gravity.allFinite()) {
    PRINT_ERROR(RED "ImuProcessModel(): gravity has non-finite entries\n" RESET);
    std::exit(EXIT_FAILURE);
  }
  _perturbation = options.perturbation;
  _g_a = options.gravity;
  _Q_c = options.Q_c();
}

Eigen::Matrix<double, 5, 5> ImuProcessModel::evaluate(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  return evaluate(x_batch, u_batch, dt).at(0);
}

Eigen::Matrix<double, 15, 15> ImuProcessModel::state_jacobian(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  return state_jacobian(x_batch, u_batch, dt).at(0);
}

Eigen::Matrix<double, 15, 15> ImuProcessModel::covariance(const Eigen::Matrix<double, 5, 5> &x, const ImuInput &u, double dt) {
  StateBatch x_batch = {x};
  InputBatch u_batch = {u};
  return covariance(x_batch, u_batch, dt).at(0);
}

bool ImuProcessModel::check_finite(const std::string &name, const Eigen::MatrixXd &mat) {
  if (mat.allFinite())
    return true;
  int count = 0;
  for (int r = 0; r < mat.rows(); r++) {
    for (int c = 0; c < mat.cols(); c++) {
      if (!std::isfinite(mat(r, c)))
        count++;
    }
  }
  PRINT_WARNING(YELLOW "%s has %d non-finite entries (of %d)!!\n" RESET, name.c_str(), count, (int)mat.size());
  Printer::printMatrix(Printer::PrintLevel::DEBUG, name, mat);
  return false;
}

void ImuProcessModel::check_dt(double dt, const std::string &caller) {
  if (!std::isfinite(dt) || dt <= 0.0) {
    PRINT_ERROR(RED "%s: time step must be positive (dt = %.9f)\n" RESET, caller.c_str(), dt);
    std::exit(EXIT_FAILURE);
  }
}

void ImuProcessModel::check_batch(size_t num_states, size_t num_inputs, const std::string &caller) {
  if (num_states == 0 || num_states != num_inputs) {
    PRINT_ERROR(RED "%s: batch size mismatch (%d states, %d inputs)\n" RESET, caller.c_str(), (int)num_states, (int)num_inputs);
    std::exit(EXIT_FAILURE);
  }
}
