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
#include <boost/date_time/posix_time/posix_time.hpp>
#include <cmath>
#include <csignal>
#include <memory>
#include <string>

#include "sim/ImuSimulator.h"
#include "sim/SimulatorOptions.h"
#include "state/Propagator.h"
#include "state/PropagatorOptions.h"
#include "utils/NumericalJacobian.h"
#include "utils/colors.h"
#include "utils/opencv_yaml_parse.h"
#include "utils/print.h"
#include "utils/sensor_data.h"

using namespace se23_imu;

// Define the function to be called when ctrl-c (SIGINT) is sent to process
void signal_callback_handler(int signum) { std::exit(signum); }

// Main function
int main(int argc, char **argv) {

  // Ensure we have a path, if the user passes it then we should use it
  std::string config_path = "config/se23_imu.yaml";
  if (argc > 1) {
    config_path = argv[1];
  }

  // Load the config
  auto parser = std::make_shared<YamlParser>(config_path);

  // Verbosity
  std::string verbosity = "INFO";
  parser->parse_config("verbosity", verbosity);
  Printer::setPrintLevel(verbosity);

  // Create our propagator and simulator
  PropagatorOptions params;
  params.print(parser);
  SimulatorOptions sim_params;
  sim_params.print(parser);

  // Ensure we read in all parameters required
  if (!parser->successful()) {
    PRINT_ERROR(RED "unable to parse all parameters, please fix\n" RESET);
    std::exit(EXIT_FAILURE);
  }
  auto sim = std::make_shared<ImuSimulator>(params, sim_params);
  auto prop = std::make_shared<Propagator>(params);

  //===================================================================================
  //===================================================================================
  //===================================================================================

  // Initialize our filter with the groundtruth
  double time0 = sim->initial_timestamp();
  Eigen::Matrix<double, 5, 5> x_true;
  if (!sim->get_state(time0, x_true)) {
    PRINT_ERROR(RED "[SIM]: Could not initialize the filter to the first state\n" RESET);
    std::exit(EXIT_FAILURE);
  }
  prop->initialize(time0, x_true, sim_params.sim_bias_gyro_init, sim_params.sim_bias_acc_init, params.init.P0());

  // Statistics of the errors at each correction
  int num_updates = 0;
  Eigen::Matrix<double, 15, 1> sum_sq_error = Eigen::Matrix<double, 15, 1>::Zero();
  Eigen::Matrix<double, 15, 1> sum_3sigma = Eigen::Matrix<double, 15, 1>::Zero();
  Eigen::Matrix<double, 15, 1> num_within_3sigma = Eigen::Matrix<double, 15, 1>::Zero();
  double update_period = 1.0 / params.update_frequency;
  double next_update_time = time0 + update_period;

  // Step through the simulation
  signal(SIGINT, signal_callback_handler);
  auto rT1 = boost::posix_time::microsec_clock::local_time();
  ImuMarker marker_last;
  while (sim->ok()) {

    // IMU: get the next simulated IMU measurement if we have it
    ImuData message_imu;
    if (!sim->get_next_imu(message_imu.timestamp, message_imu.wm, message_imu.am))
      break;
    prop->feed_imu(message_imu, prop->timestamp());

    // Propagate over the interval of the previous reading, using its ground truth rest markers
    if (message_imu.timestamp > prop->timestamp()) {
      if (!prop->propagate(message_imu.timestamp, marker_last) && !prop->healthy()) {
        PRINT_ERROR(RED "[SIM]: covariance became invalid at %.3f\n" RESET, prop->timestamp());
        std::exit(EXIT_FAILURE);
      }
    }
    sim->get_marker(message_imu.timestamp, marker_last);

    // Stand in for a measurement update, record the error and correct to the truth
    if (prop->timestamp() + 1e-9 < next_update_time)
      continue;
    next_update_time += update_period;
    Eigen::Vector3d bg_true, ba_true;
    if (!sim->get_state(prop->timestamp(), x_true) || !sim->get_true_bias(prop->timestamp(), bg_true, ba_true)) {
      PRINT_WARNING(YELLOW "[SIM]: no groundtruth at %.3f, skipping this correction\n" RESET, prop->timestamp());
      continue;
    }
    Eigen::Matrix<double, 15, 1> error;
    error.block(0, 0, 9, 1) = se23_error(prop->state(), x_true, params.model.perturbation);
    error.block(9, 0, 3, 1) = prop->bias_gyro() - bg_true;
    error.block(12, 0, 3, 1) = prop->bias_acc() - ba_true;
    Eigen::Matrix<double, 15, 15> P = prop->covariance();
    for (int i = 0; i < 15; i++) {
      double sigma3 = 3.0 * std::sqrt(std::max(P(i, i), 0.0));
      sum_sq_error(i) += error(i) * error(i);
      sum_3sigma(i) += sigma3;
      num_within_3sigma(i) += (std::abs(error(i)) <= sigma3) ? 1.0 : 0.0;
    }
    num_updates++;
    PRINT_DEBUG("[SIM]: t = %.2f | ori err %.4f deg | pos err %.4f m | pos 3sig %.4f m\n", prop->timestamp(),
                180.0 / M_PI * error.block(0, 0, 3, 1).norm(), error.block(6, 0, 3, 1).norm(),
                3.0 * std::sqrt(P.block(6, 6, 3, 3).trace()));
    prop->reset_after_correction(x_true, bg_true, ba_true, P);
  }
  auto rT2 = boost::posix_time::microsec_clock::local_time();

  //===================================================================================
  //===================================================================================
  //===================================================================================

  // Final report
  if (num_updates < 1) {
    PRINT_ERROR(RED "[SIM]: no corrections were made, is the simulation long enough?\n" RESET);
    std::exit(EXIT_FAILURE);
  }
  Eigen::Matrix<double, 15, 1> rmse = (sum_sq_error / num_updates).cwiseSqrt();
  Eigen::Matrix<double, 15, 1> avg_3sigma = sum_3sigma / num_updates;
  Eigen::Matrix<double, 15, 1> pct_within = 100.0 * num_within_3sigma / num_updates;
  const char *names[5] = {"ori (deg)", "vel (m/s)", "pos (m)", "bg (rad/s)", "ba (m/s^2)"};
  double scale[5] = {180.0 / M_PI, 1.0, 1.0, 1.0, 1.0};
  PRINT_INFO(BOLDGREEN "[SIM]: %s propagation, %s perturbation, %d corrections\n" RESET, PropagatorOptions::as_string(params.method).c_str(),
             Perturbation::as_string(params.model.perturbation).c_str(), num_updates);
  for (int b = 0; b < 5; b++) {
    PRINT_INFO("  - %-11s rmse %.5f, %.5f, %.5f | avg 3sig %.5f, %.5f, %.5f | within 3sig %.1f, %.1f, %.1f %%\n", names[b],
               scale[b] * rmse(3 * b), scale[b] * rmse(3 * b + 1), scale[b] * rmse(3 * b + 2), scale[b] * avg_3sigma(3 * b),
               scale[b] * avg_3sigma(3 * b + 1), scale[b] * avg_3sigma(3 * b + 2), pct_within(3 * b), pct_within(3 * b + 1),
               pct_within(3 * b + 2));
  }
  PRINT_INFO("[TIME]: %.4f seconds total (%.3f ms per correction)\n", (rT2 - rT1).total_microseconds() * 1e-6,
             (rT2 - rT1).total_microseconds() * 1e-3 / num_updates);

  // Done!
  return EXIT_SUCCESS;
}
