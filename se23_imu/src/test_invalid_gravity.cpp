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
#include <string>

#include "model/ModelOptions.h"
#include "model/NullOnUpdateImuModel.h"
#include "utils/print.h"

using namespace se23_imu;

// Gravity has to be a 3 vector
int main(int argc, char **argv) {

  std::string verbosity = "INFO";
  Printer::setPrintLevel(verbosity);

  ModelOptions options;
  options.gravity = Eigen::VectorXd::Zero(2);
  options.gravity(1) = -9.81;
  NullOnUpdateImuModel model(options);

  // Should never get here
  PRINT_INFO("2d gravity was accepted (%.3f)\n", model.gravity().norm());
  return EXIT_SUCCESS;
}
