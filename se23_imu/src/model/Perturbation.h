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

#ifndef SE23_IMU_PERTURBATION_H
#define SE23_IMU_PERTURBATION_H

#include <string>

namespace se23_imu {

/**
 * @brief Error-state conventions the process models can be linearized in
 */
class Perturbation {

public:
  /**
   * @brief Which side the small error multiplies the true state on
   *
   * - LEFT : @f$\hat{\mathbf X} = \exp(\delta\boldsymbol\xi^\wedge)\mathbf X@f$, errors expressed in the world frame
   * - RIGHT : @f$\hat{\mathbf X} = \mathbf X\exp(\delta\boldsymbol\xi^\wedge)@f$, errors expressed in the body frame
   */
  enum Type { LEFT, RIGHT, UNKNOWN };

  /**
   * @brief Returns a string representation of this enum value.
   * @param perturbation Convention we want the name of
   * @return String version of the passed enum
   */
  static inline std::string as_string(Type perturbation) {
    if (perturbation == LEFT)
      return "left";
    if (perturbation == RIGHT)
      return "right";
    return "unknown";
  }

  /**
   * @brief Returns the enum value of a string (case sensitive, lower case as in the config)
   * @param perturbation String we want to find the enum of
   * @return Type, will be "unknown" if we coun't parse it
   */
  static inline Type from_string(const std::string &perturbation) {
    if (perturbation == "left")
      return LEFT;
    if (perturbation == "right")
      return RIGHT;
    return UNKNOWN;
  }

private:
  /**
   * All function in this class should be static.
   * Thus an instance of this class cannot be created.
   */
  Perturbation(){};
};

} // namespace se23_imu

#endif // SE23_IMU_PERTURBATION_H
