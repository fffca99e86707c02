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

#include "Propagator.h"

#include <cmath>

#include "model/CoupledImuModel.h"
#include "model/ImuProcessModel.h"
#include "model/NullOnUpdateImuModel.h"
#include "model/PreintegratedImuModel.h"
#include "utils/colors.h"
#include "utils/print.h"

using namespace se23_imu;

Propagator::Propagator(const PropagatorOptions &options) : _options(options) {
  _model_single = std::make_shared<CoupledImuModel>(_options.model);
  if (_options.method == PropagatorOptions::PREINTEGRATED) {
    _model_preint = std::make_shared<PreintegratedImuModel>(_options.model, 1);
  } else if (_options.method == PropagatorOptions::NULL_ON_UPDATE) {
    _model_null = std::make_shared<NullOnUpdateImuModel>(_options.model);
  }
}

Propagator::~Propagator() {}

void Propagator::initialize(double timestamp, const Eigen::Matrix<double, 5, 5> &x, const Eigen::Vector3d &bg, const Eigen::Vector3d &ba,
                            const Eigen::Matrix<double, 15, 15> &P) {
  _timestamp = timestamp;
  _initialized = true;
  reset_after_correction(x, bg, ba, P);
  PRINT_DEBUG("[PROP]: initialized at %.4f using the %s method\n", _timestamp, PropagatorOptions::as_string(_options.method).c_str());
}

bool Propagator::propagate(double timestamp, const ImuMarker &marker) {

  if (!_initialized) {
    PRINT_ERROR(RED "Propagator::propagate(): called before initialize()!!!!\n" RESET);
    std::exit(EXIT_FAILURE);
  }

  // If the difference between the current update time and state is zero
  // We should crash, as this means we would have two states at the same time!!!!
  if (_timestamp == timestamp) {
    PRINT_ERROR(RED "Propagator::propagate(): Propagation called again at same timestep at last update timestep!!!!\n" RESET);
    std::exit(EXIT_FAILURE);
  }

  // We should crash if we are trying to propagate backwards
  if (_timestamp > timestamp) {
    PRINT_ERROR(RED "Propagator::propagate(): Propagation called trying to propagate backwards in time!!!!\n" RESET);
    PRINT_ERROR(RED "Propagator::propagate(): desired propagation = %.4f\n" RESET, (timestamp - _timestamp));
    std::exit(EXIT_FAILURE);
  }

  // First lets construct an IMU vector of measurements we need
  std::vector<ImuData> prop_data;
  {
    std::lock_guard<std::mutex> lck(imu_data_mtx);
    prop_data = Propagator::select_imu_readings(imu_data, _timestamp, timestamp);
  }
  if (prop_data.size() < 2) {
    PRINT_WARNING(YELLOW "[PROP]: not enough readings to propagate from %.4f to %.4f, state is unchanged\n" RESET, _timestamp, timestamp);
    return false;
  }

  // Loop through all IMU messages, and use them to move the state forward in time
  // Each reading is held constant until the next one
  for (size_t i = 0; i < prop_data.size() - 1; i++) {
    double dt = prop_data.at(i + 1).timestamp - prop_data.at(i).timestamp;
    ImuInput u = correct(prop_data.at(i));
    if (_options.method == PropagatorOptions::SINGLE_STEP) {
      Eigen::Matrix<double, 15, 15> F = _model_single->state_jacobian(_x, u, dt);
      Eigen::Matrix<double, 15, 15> Qd = _model_single->covariance(_x, u, dt);
      _P = F * _P * F.transpose() + Qd;
      _P = 0.5 * (_P + _P.transpose());
      _x = _model_single->evaluate(_x, u, dt);
    } else if (_options.method == PropagatorOptions::NULL_ON_UPDATE) {
      Eigen::Matrix<double, 15, 15> F = _model_null->state_jacobian(_x, u, dt, marker);
      Eigen::Matrix<double, 15, 15> Qd = _model_null->covariance(_x, u, dt, marker);
      _P = F * _P * F.transpose() + Qd;
      _P = 0.5 * (_P + _P.transpose());
      _x = _model_null->evaluate(_x, u, dt, marker);
    } else {
      _x = _model_preint->evaluate(_x, u, dt);
    }
  }

  // The preintegrated model only needs the covariance once we have arrived
  if (_options.method == PropagatorOptions::PREINTEGRATED) {
    _P = _model_preint->propagated_covariance().at(0);
  }
  _timestamp = prop_data.at(prop_data.size() - 1).timestamp;

  if (!ImuProcessModel::check_finite("Propagator::propagate(): covariance", _P)) {
    _healthy = false;
    return false;
  }
  return true;
}

void Propagator::reset_after_correction(const Eigen::Matrix<double, 5, 5> &x, const Eigen::Vector3d &bg, const Eigen::Vector3d &ba,
                                        const Eigen::Matrix<double, 15, 15> &P) {
  _x = x;
  _bg = bg;
  _ba = ba;
  _P = 0.5 * (P + P.transpose());
  _healthy = ImuProcessModel::check_finite("Propagator::reset_after_correction(): covariance", _P);
  if (_model_preint != nullptr) {
    _model_preint->reset_incremental_jacobians(_P);
  }
}

ImuInput Propagator::correct(const ImuData &data) const { return ImuInput(data.wm - _bg, data.am - _ba); }

std::vector<ImuData> Propagator::select_imu_readings(const std::vector<ImuData> &imu_data, double time0, double time1, bool warn) {

  // Our vector imu readings
  std::vector<ImuData> prop_data;

  // Ensure we have some measurements in the first place!
  if (imu_data.empty()) {
    if (warn)
      PRINT_WARNING(YELLOW "Propagator::select_imu_readings(): No IMU measurements. Has feed_imu() been called?\n" RESET);
    return prop_data;
  }

  // Loop through and find all the needed measurements to propagate with
  for (size_t i = 0; i < imu_data.size() - 1; i++) {

    // Start of the interval, split the reading that straddles time0
    if (imu_data.at(i + 1).timestamp > time0 && imu_data.at(i).timestamp < time0) {
      prop_data.push_back(Propagator::interpolate_data(imu_data.at(i), imu_data.at(i + 1), time0));
      continue;
    }

    // Middle of the interval, take the whole reading
    if (imu_data.at(i).timestamp >= time0 && imu_data.at(i + 1).timestamp <= time1) {
      prop_data.push_back(imu_data.at(i));
      continue;
    }

    // End of the interval, split the next reading at time1 and stop
    if (imu_data.at(i + 1).timestamp > time1) {
      if (imu_data.at(i).timestamp > time1 && i == 0) {
        // All of our readings are after the requested interval
        break;
      } else if (imu_data.at(i).timestamp > time1) {
        prop_data.push_back(interpolate_data(imu_data.at(i - 1), imu_data.at(i), time1));
      } else {
        prop_data.push_back(imu_data.at(i));
      }
      if (prop_data.at(prop_data.size() - 1).timestamp != time1) {
        prop_data.push_back(interpolate_data(imu_data.at(i), imu_data.at(i + 1), time1));
      }
      break;
    }
  }

  // Check that we have at least one measurement to propagate with
  if (prop_data.empty()) {
    if (warn)
      PRINT_WARNING(YELLOW "Propagator::select_imu_readings(): No IMU measurements to propagate with between %.4f and %.4f!\n" RESET, time0,
                    time1);
    return prop_data;
  }

  // If the buffer ends before time1 we stretch the last reading over the remainder
  if (prop_data.at(prop_data.size() - 1).timestamp != time1) {
    if (warn)
      PRINT_DEBUG(YELLOW "Propagator::select_imu_readings(): Missing inertial measurements to propagate with (%f sec missing)!\n" RESET,
                  (time1 - imu_data.at(imu_data.size() - 1).timestamp));
    prop_data.push_back(interpolate_data(imu_data.at(imu_data.size() - 2), imu_data.at(imu_data.size() - 1), time1));
  }

  // Remove zero dt readings, these would make the discrete noise infinite
  for (size_t i = 0; i + 1 < prop_data.size(); i++) {
    if (std::abs(prop_data.at(i + 1).timestamp - prop_data.at(i).timestamp) < 1e-12) {
      if (warn)
        PRINT_WARNING(YELLOW "Propagator::select_imu_readings(): Zero DT between IMU reading %d and %d, removing it!\n" RESET, (int)i,
                      (int)(i + 1));
      prop_data.erase(prop_data.begin() + i);
      i--;
    }
  }

  // Check that we have at least two measurements to propagate with
  if (prop_data.size() < 2) {
    if (warn)
      PRINT_WARNING(YELLOW "Propagator::select_imu_readings(): Only %d readings to propagate with, need 2!\n" RESET, (int)prop_data.size());
    prop_data.clear();
  }
  return prop_data;
}
