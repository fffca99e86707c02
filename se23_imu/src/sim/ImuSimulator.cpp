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

#include "ImuSimulator.h"

#include <algorithm>
#include <cmath>

#include "model/CoupledImuModel.h"
#include "utils/colors.h"
#include "utils/lie_ops.h"
#include "utils/print.h"

using namespace se23_imu;

ImuSimulator::ImuSimulator(const PropagatorOptions &prop, const SimulatorOptions &sim)
    : sim_params(sim), classifier(prop.zero_omega_epsilon, prop.zero_velocity_epsilon) {

  if (prop.model.gravity.rows() != 3 || prop.imu_frequency <= 0.0) {
    PRINT_ERROR(RED "ImuSimulator(): need a 3x1 gravity and a positive imu rate\n" RESET);
    std::exit(EXIT_FAILURE);
  }
  gravity = prop.model.gravity;
  sigma_w = prop.model.sigma_w;
  sigma_a = prop.model.sigma_a;
  sigma_wb = prop.model.sigma_wb;
  sigma_ab = prop.model.sigma_ab;
  freq_imu = prop.imu_frequency;

  // Our random number generator
  gen_meas_imu = std::mt19937(sim_params.sim_seed_measurements);
  true_bias_gyro = sim_params.sim_bias_gyro_init;
  true_bias_accel = sim_params.sim_bias_acc_init;

  // Start level with some yaw, away from the origin
  timestamp = 0.0;
  hist_time.push_back(timestamp);
  hist_state.push_back(se23_from_components(rot_z(0.4) * rot_x(0.05), Eigen::Vector3d::Zero(), Eigen::Vector3d(1.0, -2.0, 0.5)));

  PRINT_DEBUG("[SIM]: simulating %.2f seconds at %.1f hz (%d readings)\n", sim_params.sim_duration, freq_imu,
              (int)std::floor(sim_params.sim_duration * freq_imu));
}

bool ImuSimulator::get_next_imu(double &time_imu, Eigen::Vector3d &wm, Eigen::Vector3d &am) {

  // Stop once the next interval would go past the end of the simulation
  double dt = 1.0 / freq_imu;
  double time_next = (double)(num_readings + 1) / freq_imu;
  if (!is_running || time_next > sim_params.sim_duration + 1e-9) {
    is_running = false;
    return false;
  }
  time_imu = (double)num_readings / freq_imu;

  // Current true state
  const Eigen::Matrix<double, 5, 5> x_k = hist_state.at(hist_state.size() - 1);
  Eigen::Matrix3d C_k;
  Eigen::Vector3d v_k, r_k;
  se23_components(x_k, C_k, v_k, r_k);

  // True angular velocity and world acceleration over this interval
  // NOTE: in the rest segments we cancel any remaining velocity in a single step
  Eigen::Vector3d omega_inI = Eigen::Vector3d::Zero();
  Eigen::Vector3d accel_inG = -v_k / dt;
  double tau = time_imu - sim_params.sim_rest_duration;
  if (tau >= 0.0 && time_imu < sim_params.sim_duration - sim_params.sim_rest_duration) {
    motion_profile(tau, omega_inI, accel_inG);
  }
  // NOTE: the inverse Jacobian makes the velocity change over the step exactly accel_inG * dt
  Eigen::Vector3d accel_inI = Jl_inv_so3(dt * omega_inI) * C_k.transpose() * (accel_inG - gravity);

  // Move the true state forward with the exact increment
  ImuInput u_true(omega_inI, accel_inI);
  Eigen::Matrix<double, 5, 5> x_next = CoupledImuModel::generate_g(dt, gravity) * x_k * CoupledImuModel::generate_u(u_true, dt);
  Eigen::Matrix3d C_next;
  Eigen::Vector3d v_next, r_next;
  se23_components(x_next, C_next, v_next, r_next);
  Eigen::Vector3d v_max = (v_next.norm() > v_k.norm()) ? v_next : v_k;

  // Now add noise to these measurements
  std::normal_distribution<double> w(0, 1);
  wm = omega_inI + true_bias_gyro;
  am = accel_inI + true_bias_accel;
  if (sim_params.sim_add_noise) {
    for (int i = 0; i < 3; i++) {
      wm(i) += sigma_w / std::sqrt(dt) * w(gen_meas_imu);
      am(i) += sigma_a / std::sqrt(dt) * w(gen_meas_imu);
    }
  }

  // Append the history of this reading
  hist_true_bias_gyro.push_back(true_bias_gyro);
  hist_true_bias_accel.push_back(true_bias_accel);
  hist_marker.push_back(classifier.classify(omega_inI, v_max));
  hist_time.push_back(time_next);
  hist_state.push_back(x_next);

  // Move the biases forward in time
  if (sim_params.sim_bias_walk) {
    for (int i = 0; i < 3; i++) {
      true_bias_gyro(i) += sigma_wb * std::sqrt(dt) * w(gen_meas_imu);
      true_bias_accel(i) += sigma_ab * std::sqrt(dt) * w(gen_meas_imu);
    }
  }

  num_readings++;
  timestamp = time_imu;
  return true;
}

bool ImuSimulator::get_state(double desired_time, Eigen::Matrix<double, 5, 5> &x) const {
  int index = history_index(desired_time);
  if (index < 0 || index >= (int)hist_state.size())
    return false;
  x = hist_state.at(index);
  return true;
}

bool ImuSimulator::get_true_bias(double desired_time, Eigen::Vector3d &bg, Eigen::Vector3d &ba) const {
  int index = history_index(desired_time);
  if (index < 0 || index >= (int)hist_true_bias_gyro.size())
    return false;
  bg = hist_true_bias_gyro.at(index);
  ba = hist_true_bias_accel.at(index);
  return true;
}

bool ImuSimulator::get_marker(double desired_time, ImuMarker &marker) const {
  int index = history_index(desired_time);
  if (index < 0 || index >= (int)hist_marker.size())
    return false;
  marker = hist_marker.at(index);
  return true;
}

void ImuSimulator::motion_profile(double tau, Eigen::Vector3d &omega, Eigen::Vector3d &accel) const {

  // Smooth window so the motion starts and stops without jumps
  double T = sim_params.sim_duration - 2.0 * sim_params.sim_rest_duration;
  double window = std::pow(std::sin(M_PI * tau / T), 2);

  omega << 0.6 * std::sin(2.0 * M_PI * 0.3 * tau), 0.5 * std::cos(2.0 * M_PI * 0.2 * tau), 0.8 * std::sin(2.0 * M_PI * 0.1 * tau + 0.5);
  omega *= sim_params.sim_max_omega * window / std::max(1.0, omega.norm());

  // Full periods over the segment, so the velocity returns to (nearly) zero
  accel << std::sin(4.0 * M_PI * tau / T), 0.5 * std::sin(6.0 * M_PI * tau / T), 0.3 * std::sin(2.0 * M_PI * tau / T);
  accel *= sim_params.sim_max_accel;
}

int ImuSimulator::history_index(double desired_time) const {
  int index = (int)std::round((desired_time - hist_time.at(0)) * freq_imu);
  if (index < 0 || index >= (int)hist_time.size() || std::abs(hist_time.at(index) - desired_time) > 1e-9)
    return -1;
  return index;
}
