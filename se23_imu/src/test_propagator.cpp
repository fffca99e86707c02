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

#include "sim/ImuSimulator.h"
#include "sim/SimulatorOptions.h"
#include "state/MotionClassifier.h"
#include "state/Propagator.h"
#include "state/PropagatorOptions.h"
#include "utils/colors.h"
#include "utils/print.h"

using namespace se23_imu;

namespace {

int num_failed = 0;

void check_near(const std::string &name, const Eigen::MatrixXd &A, const Eigen::MatrixXd &B, double tol) {
  double err = (A - B).norm();
  if (!(err < tol)) {
    PRINT_ERROR(RED "[FAIL]: %s (error %.3e > %.1e)\n" RESET, name.c_str(), err, tol);
    num_failed++;
  } else {
    PRINT_DEBUG("[PASS]: %s (error %.3e)\n", name.c_str(), err);
  }
}

void check_true(const std::string &name, bool value) {
  if (!value) {
    PRINT_ERROR(RED "[FAIL]: %s\n" RESET, name.c_str());
    num_failed++;
  }
}

ImuData make_reading(double timestamp) {
  ImuData data;
  data.timestamp = timestamp;
  data.wm = timestamp * Eigen::Vector3d(1.0, 2.0, 3.0);
  data.am = Eigen::Vector3d(0.0, 0.0, 9.81) + timestamp * Eigen::Vector3d(-1.0, 0.5, 0.0);
  return data;
}

} // namespace

int main(int argc, char **argv) {

  // Verbosity
  std::string verbosity = "INFO";
  if (argc > 1)
    verbosity = argv[1];
  Printer::setPrintLevel(verbosity);

  //===================================================================================
  // Reading selection splits at both ends of the interval
  //===================================================================================
  {
    std::vector<ImuData> buffer = {make_reading(0.0), make_reading(0.1), make_reading(0.2), make_reading(0.3)};
    std::vector<ImuData> selected = Propagator::select_imu_readings(buffer, 0.05, 0.25);
    std::vector<double> expected = {0.05, 0.1, 0.2, 0.25};
    check_true("selected 4 readings", selected.size() == expected.size());
    for (size_t i = 0; i < std::min(selected.size(), expected.size()); i++) {
      std::string tag = " " + std::to_string(i);
      check_near("selected time" + tag, Eigen::Matrix<double, 1, 1>::Constant(selected.at(i).timestamp),
                 Eigen::Matrix<double, 1, 1>::Constant(expected.at(i)), 1e-12);
      check_near("selected wm" + tag, selected.at(i).wm, make_reading(expected.at(i)).wm, 1e-12);
      check_near("selected am" + tag, selected.at(i).am, make_reading(expected.at(i)).am, 1e-12);
    }

    // Exactly on the readings
    selected = Propagator::select_imu_readings(buffer, 0.1, 0.2);
    check_true("aligned interval gives 2 readings", selected.size() == 2);

    // Past the end we stretch the last reading
    selected = Propagator::select_imu_readings(buffer, 0.2, 0.35, false);
    check_true("stretched interval ends at 0.35", !selected.empty() && std::abs(selected.back().timestamp - 0.35) < 1e-12);

    // Duplicate timestamps are removed
    std::vector<ImuData> duplicated = {make_reading(0.0), make_reading(0.1), make_reading(0.1), make_reading(0.2)};
    selected = Propagator::select_imu_readings(duplicated, 0.0, 0.2, false);
    bool increasing = true;
    for (size_t i = 0; i + 1 < selected.size(); i++)
      increasing = increasing && (selected.at(i + 1).timestamp > selected.at(i).timestamp);
    check_true("no zero dt readings", !selected.empty() && increasing);

    // Nothing to give
    check_true("empty buffer", Propagator::select_imu_readings(std::vector<ImuData>(), 0.0, 1.0, false).empty());

    // Interpolation
    ImuData mid = Propagator::interpolate_data(buffer.at(1), buffer.at(2), 0.125);
    check_near("interpolated wm", mid.wm, make_reading(0.125).wm, 1e-12);
  }

  //===================================================================================
  // Rest classification
  //===================================================================================
  {
    MotionClassifier classifier(0.005, 0.01);
    ImuMarker m = classifier.classify(Eigen::Vector3d(0.001, 0, 0), Eigen::Vector3d(0.02, 0, 0));
    check_true("classifier angular rest", m.angular_rest && !m.linear_rest);
    m = classifier.classify(Eigen::Vector3d(0.1, 0, 0), Eigen::Vector3d::Zero());
    check_true("classifier linear rest", !m.angular_rest && m.linear_rest);
  }

  //===================================================================================
  // With perfect readings the propagator reproduces the simulated truth
  //===================================================================================
  PropagatorOptions prop_options;
  prop_options.method = PropagatorOptions::SINGLE_STEP;
  prop_options.imu_frequency = 200.0;
  SimulatorOptions sim_options;
  sim_options.sim_duration = 6.0;
  sim_options.sim_rest_duration = 1.0;
  sim_options.sim_add_noise = false;
  sim_options.sim_bias_walk = false;
  {
    ImuSimulator sim(prop_options, sim_options);
    Propagator prop(prop_options);
    Eigen::Matrix<double, 5, 5> x_true;
    sim.get_state(sim.initial_timestamp(), x_true);
    prop.initialize(sim.initial_timestamp(), x_true, sim_options.sim_bias_gyro_init, sim_options.sim_bias_acc_init,
                    prop_options.init.P0());

    double max_error = 0.0;
    bool rested = false;
    double time_imu;
    Eigen::Vector3d wm, am;
    while (sim.get_next_imu(time_imu, wm, am)) {
      ImuData message;
      message.timestamp = time_imu;
      message.wm = wm;
      message.am = am;
      prop.feed_imu(message, prop.timestamp());
      if (time_imu <= prop.timestamp())
        continue;
      check_true("propagation succeeded", prop.propagate(time_imu));
      sim.get_state(time_imu, x_true);
      max_error = std::max(max_error, (prop.state() - x_true).norm());
      ImuMarker marker;
      if (sim.get_marker(time_imu, marker) && marker.linear_rest && time_imu > sim_options.sim_duration - sim_options.sim_rest_duration)
        rested = true;
    }
    check_near("final time", Eigen::Matrix<double, 1, 1>::Constant(prop.timestamp()),
               Eigen::Matrix<double, 1, 1>::Constant(sim_options.sim_duration - 1.0 / prop_options.imu_frequency), 1e-9);
    check_true("trajectory errors below 1e-8", max_error < 1e-8);
    check_true("body comes to rest at the end", rested);
    check_true("propagator is healthy", prop.healthy());
    PRINT_INFO("[TRUTH]: max state error %.3e over %.1f seconds\n", max_error, prop.timestamp());
  }

  //===================================================================================
  // Preintegrated and single step propagation give the same state and covariance
  //===================================================================================
  {
    sim_options.sim_add_noise = true;
    sim_options.sim_bias_walk = true;
    ImuSimulator sim(prop_options, sim_options);
    PropagatorOptions preint_options = prop_options;
    preint_options.method = PropagatorOptions::PREINTEGRATED;
    Propagator single(prop_options);
    Propagator preint(preint_options);

    Eigen::Matrix<double, 5, 5> x_true;
    sim.get_state(sim.initial_timestamp(), x_true);
    Eigen::Vector3d bg = Eigen::Vector3d::Zero(), ba = Eigen::Vector3d::Zero();
    single.initialize(sim.initial_timestamp(), x_true, bg, ba, prop_options.init.P0());
    preint.initialize(sim.initial_timestamp(), x_true, bg, ba, prop_options.init.P0());

    double time_imu;
    Eigen::Vector3d wm, am;
    std::vector<double> update_times = {0.5, 1.75, 2.0, 3.5, 4.6};
    while (sim.get_next_imu(time_imu, wm, am)) {
      ImuData message;
      message.timestamp = time_imu;
      message.wm = wm;
      message.am = am;
      single.feed_imu(message);
      preint.feed_imu(message);
    }
    for (double t : update_times) {
      std::string tag = " @ " + std::to_string(t);
      check_true("single step propagated" + tag, single.propagate(t));
      check_true("preintegrated propagated" + tag, preint.propagate(t));
      check_near("states agree" + tag, preint.state(), single.state(), 1e-9);
      check_near("covariances agree" + tag, preint.covariance(), single.covariance(), 1e-8 * single.covariance().norm());

      // Correct back to the truth and restart both
      Eigen::Matrix<double, 5, 5> x_corrected = single.state();
      Eigen::Matrix<double, 15, 15> P_corrected = 0.5 * single.covariance();
      single.reset_after_correction(x_corrected, bg, ba, P_corrected);
      preint.reset_after_correction(x_corrected, bg, ba, P_corrected);
    }
  }

  //===================================================================================
  // Null on update keeps the state and its uncertainty still at rest
  //===================================================================================
  {
    sim_options.sim_add_noise = false;
    sim_options.sim_bias_walk = false;
    ImuSimulator sim(prop_options, sim_options);
    PropagatorOptions null_options = prop_options;
    null_options.method = PropagatorOptions::NULL_ON_UPDATE;
    Propagator prop(null_options);
    Eigen::Matrix<double, 5, 5> x_true;
    sim.get_state(sim.initial_timestamp(), x_true);
    prop.initialize(sim.initial_timestamp(), x_true, sim_options.sim_bias_gyro_init, sim_options.sim_bias_acc_init,
                    null_options.init.P0());
    Eigen::Matrix<double, 15, 15> P_start = prop.covariance();

    double time_imu;
    Eigen::Vector3d wm, am;
    ImuMarker marker_last;
    while (sim.get_next_imu(time_imu, wm, am) && time_imu < 0.5 * sim_options.sim_rest_duration) {
      ImuData message;
      message.timestamp = time_imu;
      message.wm = wm;
      message.am = am;
      prop.feed_imu(message);
      if (time_imu > prop.timestamp()) {
        prop.propagate(time_imu, marker_last);
      }
      sim.get_marker(time_imu, marker_last);
    }
    check_true("rest markers at the start", marker_last.angular_rest && marker_last.linear_rest);
    sim.get_state(prop.timestamp(), x_true);
    check_near("null on update state at rest", prop.state(), x_true, 1e-12);
    check_near("null on update pose covariance at rest", prop.covariance().block(0, 0, 9, 9), P_start.block(0, 0, 9, 9),
               1e-12 * P_start.norm());
  }

  if (num_failed > 0) {
    PRINT_ERROR(RED "test_propagator: %d checks failed\n" RESET, num_failed);
    return EXIT_FAILURE;
  }
  PRINT_INFO(GREEN "test_propagator: all checks passed\n" RESET);
  return EXIT_SUCCESS;
}
