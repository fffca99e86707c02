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

#ifndef SE23_IMU_PRINT_H
#define SE23_IMU_PRINT_H

#include <Eigen/Eigen>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace se23_imu {

/**
 * @brief Printer for se23_imu that allows for various levels of printing to be done
 *
 * To set the global verbosity level one can do the following:
 * @code{.cpp}
 * se23_imu::Printer::setPrintLevel("WARNING");
 * se23_imu::Printer::setPrintLevel(se23_imu::Printer::PrintLevel::WARNING);
 * @endcode
 *
 * Warnings and errors go to stderr so that they are still visible when stdout is redirected to a results file.
 */
class Printer {
public:
  /**
   * @brief The different print levels possible
   *
   * - PrintLevel::ALL : All PRINT_XXXX will output to the console
   * - PrintLevel::DEBUG : "DEBUG", "INFO", "WARNING" and "ERROR" will be printed. "ALL" will be silenced
   * - PrintLevel::INFO : "INFO", "WARNING" and "ERROR" will be printed. "ALL" and "DEBUG" will be silenced
   * - PrintLevel::WARNING : "WARNING" and "ERROR" will be printed. "ALL", "DEBUG" and "INFO" will be silenced
   * - PrintLevel::ERROR : Only "ERROR" will be printed. All the rest are silenced
   * - PrintLevel::SILENT : All PRINT_XXXX will be silenced.
   */
  enum PrintLevel { ALL = 0, DEBUG = 1, INFO = 2, WARNING = 3, ERROR = 4, SILENT = 5 };

  /**
   * @brief Set the print level to use for all future printing.
   * @param level The debug level to use (ALL, DEBUG, INFO, WARNING, ERROR, SILENT)
   */
  static void setPrintLevel(const std::string &level);

  /**
   * @brief Set the print level to use for all future printing.
   * @param level The debug level to use
   */
  static void setPrintLevel(PrintLevel level);

  /// Gets the name of a print level
  static std::string as_string(PrintLevel level);

  /**
   * @brief The print function that prints to the console.
   * @param level the print level for this print call
   * @param location the location the print was made from
   * @param line the line the print was made from
   * @param format The printf format
   */
  static void debugPrint(PrintLevel level, const char location[], const char line[], const char *format, ...);

  /**
   * @brief Prints a named matrix row by row if the level is enabled.
   *
   * Used to dump Jacobians and covariances when a check on them fails.
   * Matrices larger than 15x15 only have their size and norm printed.
   *
   * @param level the print level for this print call
   * @param name label printed before the matrix
   * @param mat the matrix to print
   */
  static void printMatrix(PrintLevel level, const std::string &name, const Eigen::MatrixXd &mat);

  /// The current print level
  static PrintLevel current_print_level;

private:
  /// The max length for the file path.  This is to avoid very long file paths from cluttering the output
  static constexpr uint32_t MAX_FILE_PATH_LEGTH = 30;
};

} /* namespace se23_imu */

/*
 * Converts anything to a string
 */
#define SE23_IMU_STRINGIFY(x) #x
#define SE23_IMU_TOSTRING(x) SE23_IMU_STRINGIFY(x)

/*
 * The different Types of print levels
 */
#define PRINT_ALL(x...) se23_imu::Printer::debugPrint(se23_imu::Printer::PrintLevel::ALL, __FILE__, SE23_IMU_TOSTRING(__LINE__), x);
#define PRINT_DEBUG(x...) se23_imu::Printer::debugPrint(se23_imu::Printer::PrintLevel::DEBUG, __FILE__, SE23_IMU_TOSTRING(__LINE__), x);
#define PRINT_INFO(x...) se23_imu::Printer::debugPrint(se23_imu::Printer::PrintLevel::INFO, __FILE__, SE23_IMU_TOSTRING(__LINE__), x);
#define PRINT_WARNING(x...) se23_imu::Printer::debugPrint(se23_imu::Printer::PrintLevel::WARNING, __FILE__, SE23_IMU_TOSTRING(__LINE__), x);
#define PRINT_ERROR(x...) se23_imu::Printer::debugPrint(se23_imu::Printer::PrintLevel::ERROR, __FILE__, SE23_IMU_TOSTRING(__LINE__), x);

#endif /* SE23_IMU_PRINT_H */
