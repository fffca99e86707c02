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

#ifndef SE23_IMU_PROPAGATOR_H
#define SE23_IMU_PROPAGATOR_H

#include <Eigen/Eigen>
#include <memory>
#include <mutex>
#include <vector>

#include "state/PropagatorOptions.h"
#include "utils/sensor_data.h"

namespace se23_imu {

class CoupledImuModel;
class PreintegratedImuModel;
class NullOnUpdateImuModel;

/**
 * @brief Performs the state and covariance propagation of a single trajectory.
 *
 * This class buffers the raw inertial readings and moves the SE_2(3) state, bias estimates and their covariance forward in time.
 * Readings are held constant over each interval (zero-order hold), with the current bias estimates removed before they reach the model.
 * Depending on @ref PropagatorOptions::method the covariance is either propagated every reading with the single step model,
 * or once at the requested time from the preintegrated incremental Jacobians.
 * The owning filter is expected to call reset_after_correction() after each of its updates.
 */
class Propagator {

public:
  /**
   * @brief Default constructor
   * @param options Propagation and process model options
   */
  explicit Propagator(const PropagatorOptions &options);

  ~Propagator();

  /**
   * @brief Sets the state the propagator starts from
   * @param timestamp Time of the state
   * @param x SE_2(3) navigation state
   * @param bg Gyroscope bias estimate
   * @param ba Accelerometer bias estimate
   * @param P Error-state covariance in the convention of the model
   */
  void initialize(double timestamp, const Eigen::Matrix<double, 5, 5> &x, const Eigen::Vector3d &bg, const Eigen::Vector3d &ba,
                  const Eigen::Matrix<double, 15, 15> &P);

  /**
   * @brief Stores incoming inertial readings
   * @param message Contains our timestamp and inertial information
   * @param oldest_time Time that we can discard measurements before
   */
  void feed_imu(const ImuData &message, double oldest_time = -1) {

    // Append it to our vector
    std::lock_guard<std::mutex> lck(imu_data_mtx);
    imu_data.emplace_back(message);

    // Clean old measurements
    clean_old_imu_measurements(oldest_time - 0.10);
  }

  /**
   * @brief This will remove any IMU measurements that are older then the given measurement time
   * @param oldest_time Time that we can discard measurements before (in IMU clock)
   */
  void clean_old_imu_measurements(double oldest_time) {
    if (oldest_time < 0)
      return;
    auto it0 = imu_data.begin();
    while (it0 != imu_data.end()) {
      if (it0->timestamp < oldest_time) {
        it0 = imu_data.erase(it0);
      } else {
        it0++;
      }
    }
  }

  /**
   * @brief Propagates the state and covariance to a new time
   *
   * Terminates if asked to propagate backwards or to the current time.
   * The marker is only used by the null on update model and applies to every reading in the interval.
   *
   * @param timestamp Time to propagate to
   * @param marker Rest classification over the interval
   * @return False if there were not enough readings or the covariance became non-finite
   */
  bool propagate(double timestamp, const ImuMarker &marker = ImuMarker());

  /**
   * @brief Overwrites the state after the owning filter has corrected it
   *
   * This is where the preintegrated model restarts its incremental Jacobians from the corrected covariance.
   */
  void reset_after_correction(const Eigen::Matrix<double, 5, 5> &x, const Eigen::Vector3d &bg, const Eigen::Vector3d &ba,
                              const Eigen::Matrix<double, 15, 15> &P);

  /**
   * @brief Helper function that given current imu data, will select imu readings between the two times.
   *
   * This will create measurements that we will integrate with, and an extra measurement at the end.
   * We use the @ref interpolate_data() function to "cut" the imu readings at the beginning and end of the integration.
   * Readings with zero time between them are removed.
   *
   * @param imu_data IMU data we will select measurements from
   * @param time0 Start timestamp
   * @param time1 End timestamp
   * @param warn If we should warn if we don't have enough IMU to propagate with
   * @return Vector of measurements (if we could compute them)
   */
  static std::vector<ImuData> select_imu_readings(const std::vector<ImuData> &imu_data, double time0, double time1, bool warn = true);

  /**
   * @brief Nice helper function that will linearly interpolate between two imu messages.
   *
   * @param imu_1 imu at begining of interpolation interval
   * @param imu_2 imu at end of interpolation interval
   * @param timestamp Timestamp being interpolated to
   */
  static ImuData interpolate_data(const ImuData &imu_1, const ImuData &imu_2, double timestamp) {
    double lambda = (timestamp - imu_1.timestamp) / (imu_2.timestamp - imu_1.timestamp);
    ImuData data;
    data.timestamp = timestamp;
    data.am = (1 - lambda) * imu_1.am + lambda * imu_2.am;
    data.wm = (1 - lambda) * imu_1.wm + lambda * imu_2.wm;
    return data;
  }

  /// Current SE_2(3) state
  const Eigen::Matrix<double, 5, 5> &state() const { return _x; }

  /// Current gyroscope bias estimate
  const Eigen::Vector3d &bias_gyro() const { return _bg; }

  /// Current accelerometer bias estimate
  const Eigen::Vector3d &bias_acc() const { return _ba; }

  /// Current error-state covariance
  const Eigen::Matrix<double, 15, 15> &covariance() const { return _P; }

  /// Time of the current state
  double timestamp() const { return _timestamp; }

  /// False once a non-finite covariance has been produced
  bool healthy() const { return _healthy; }

  /// Options we were created with
  const PropagatorOptions &options() const { return _options; }

protected:
  /// Removes the bias estimates from a raw reading
  ImuInput correct(const ImuData &data) const;

  /// Options
  PropagatorOptions _options;

  /// Single step model (also used for the state of the null on update method)
  std::shared_ptr<CoupledImuModel> _model_single;

  /// Preintegrated model, only created for that method
  std::shared_ptr<PreintegratedImuModel> _model_preint;

  /// Null on update model, only created for that method
  std::shared_ptr<NullOnUpdateImuModel> _model_null;

  /// Our history of IMU messages (time, angular, linear)
  std::vector<ImuData> imu_data;
  std::mutex imu_data_mtx;

  /// Navigation state
  Eigen::Matrix<double, 5, 5> _x = Eigen::Matrix<double, 5, 5>::Identity();

  /// Bias estimates
  Eigen::Vector3d _bg = Eigen::Vector3d::Zero();
  Eigen::Vector3d _ba = Eigen::Vector3d::Zero();

  /// Error-state covariance
  Eigen::Matrix<double, 15, 15> _P = Eigen::Matrix<double, 15, 15>::Zero();

  /// Time of the state
  double _timestamp = -1;

  /// If initialize() has been called
  bool _initialized = false;

  /// Health of the covariance
  bool _healthy = true;
};

} // namespace se23_imu

#endif // SE23_IMU_PROPAGATOR_H
