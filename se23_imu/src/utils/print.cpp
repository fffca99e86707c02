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

#include "print.h"

using namespace se23_imu;

// Need to define the static variable for everything to work
Printer::PrintLevel Printer::current_print_level = PrintLevel::INFO;

void Printer::setPrintLevel(const std::string &level) {
  for (int i = PrintLevel::ALL; i <= PrintLevel::SILENT; i++) {
    if (level == as_string(static_cast<PrintLevel>(i))) {
      setPrintLevel(static_cast<PrintLevel>(i));
      return;
    }
  }
  std::cerr << "Invalid print level requested: " << level << std::endl;
  std::cerr << "Valid levels are: ALL, DEBUG, INFO, WARNING, ERROR, SILENT" << std::endl;
  std::exit(EXIT_FAILURE);
}

void Printer::setPrintLevel(PrintLevel level) {
  if (level < PrintLevel::ALL || level > PrintLevel::SILENT) {
    std::cerr << "Invalid print level requested: " << level << std::endl;
    std::cerr << "Valid levels are: ALL, DEBUG, INFO, WARNING, ERROR, SILENT" << std::endl;
    std::exit(EXIT_FAILURE);
  }
  Printer::current_print_level = level;
  std::cout << "Setting printing level to: " << as_string(level) << std::endl;
}

std::string Printer::as_string(PrintLevel level) {
  switch (level) {
  case PrintLevel::ALL:
    return "ALL";
  case PrintLevel::DEBUG:
    return "DEBUG";
  case PrintLevel::INFO:
    return "INFO";
  case PrintLevel::WARNING:
    return "WARNING";
  case PrintLevel::ERROR:
    return "ERROR";
  case PrintLevel::SILENT:
    return "SILENT";
  default:
    return "UNKNOWN";
  }
}

void Printer::debugPrint(PrintLevel level, const char location[], const char line[], const char *format, ...) {
  // Only print for the current debug level
  if (static_cast<int>(level) < static_cast<int>(Printer::current_print_level)) {
    return;
  }
  FILE *stream = (level >= PrintLevel::WARNING) ? stderr : stdout;

  // Print the location info first for our debug output
  // Truncate the filename to the max size for the filepath
  if (static_cast<int>(Printer::current_print_level) <= static_cast<int>(Printer::PrintLevel::DEBUG)) {
    std::string path(location);
    std::string base_filename = path.substr(path.find_last_of("/\\") + 1);
    if (base_filename.size() > MAX_FILE_PATH_LEGTH) {
      base_filename = base_filename.substr(base_filename.size() - MAX_FILE_PATH_LEGTH, base_filename.size());
    }
    fprintf(stream, "%s:%s ", base_filename.c_str(), line);
  }

  // Print the rest of the args
  va_list args;
  va_start(args, format);
  vfprintf(stream, format, args);
  va_end(args);
}

void Printer::printMatrix(PrintLevel level, const std::string &name, const Eigen::MatrixXd &mat) {
  if (static_cast<int>(level) < static_cast<int>(Printer::current_print_level)) {
    return;
  }
  FILE *stream = (level >= PrintLevel::WARNING) ? stderr : stdout;
  fprintf(stream, "%s [%d x %d] (norm %.4e)\n", name.c_str(), (int)mat.rows(), (int)mat.cols(), mat.norm());
  if (mat.rows() > 15 || mat.cols() > 15) {
    return;
  }
  for (int r = 0; r < mat.rows(); r++) {
    for (int c = 0; c < mat.cols(); c++) {
      fprintf(stream, "% .3e ", mat(r, c));
    }
    fprintf(stream, "\n");
  }
}
