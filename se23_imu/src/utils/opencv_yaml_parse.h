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

#ifndef SE23_IMU_OPENCV_YAML_PARSER_H
#define SE23_IMU_OPENCV_YAML_PARSER_H

#include <Eigen/Eigen>
#include <boost/filesystem.hpp>
#include <memory>
#include <opencv2/core/core.hpp>
#include <string>
#include <typeinfo>
#include <vector>

#include "colors.h"
#include "print.h"

namespace se23_imu {

/**
 * @brief Helper class to do OpenCV yaml parsing of the estimator configuration.
 *
 * The logic is as follows:
 * - Given a path to the main config file we will load it into our cv::FileStorage object.
 * - From there the user can request for different parameters of different types from the config.
 * - Each request should already hold its default value, which is kept if the key is missing.
 *
 * NOTE: There are no "nested" yaml parameters. They are all under the "root" of the yaml file!!!
 */
class YamlParser {
public:
  /**
   * @brief Constructor that loads the configuration file
   * @param config_path Path to the YAML file we will parse
   * @param fail_if_not_found If we should terminate the program if we can't open the config file
   */
  explicit YamlParser(const std::string &config_path, bool fail_if_not_found = true) : config_path_(config_path) {

    // Check if file exists
    if (!boost::filesystem::exists(config_path)) {
      if (!fail_if_not_found) {
        PRINT_WARNING(YELLOW "config file %s not found, all parameters will keep their defaults\n" RESET, config_path.c_str());
        return;
      }
      PRINT_ERROR(RED "unable to open the configuration file!\n%s\n" RESET, config_path.c_str());
      std::exit(EXIT_FAILURE);
    }

    // Open the file, error if we can't
    config = std::make_shared<cv::FileStorage>(config_path, cv::FileStorage::READ);
    if (!config->isOpened()) {
      config = nullptr;
      if (!fail_if_not_found)
        return;
      PRINT_ERROR(RED "unable to open the configuration file!\n%s\n" RESET, config_path.c_str());
      std::exit(EXIT_FAILURE);
    }
  }

  /**
   * @brief Will get the folder this config file is in
   * @return Config folder
   */
  std::string get_config_folder() const { return config_path_.substr(0, config_path_.find_last_of('/')) + "/"; }

  /**
   * @brief Check to see if all parameters were read succesfully
   * @return True if we found all parameters
   */
  bool successful() const { return all_params_found_successfully; }

  /**
   * @brief Custom parser for the ESTIMATOR parameters.
   *
   * This will load the data from the main config file.
   * If it is unable it will give a warning to the user it couldn't be found.
   *
   * @tparam T Type of parameter we are looking for.
   * @param node_name Name of the node
   * @param node_result Resulting value (should already have default value in it)
   * @param required If this parameter is required by the user to set
   */
  template <class T> void parse_config(const std::string &node_name, T &node_result, bool required = true) {

    // Directly return if the config hasn't been opened
    if (config == nullptr)
      return;
    parse(config->root(), node_name, node_result, required);
  }

private:
  /// Path to the config file
  std::string config_path_;

  /// Our config file with the data in it
  std::shared_ptr<cv::FileStorage> config;

  /// Record if all parameters were found
  bool all_params_found_successfully = true;

  /**
   * @brief Given a YAML node object, this check to see if we have a valid key
   * @param file_node OpenCV file node we will get the data from
   * @param node_name Name of the node
   * @return True if we can get the data
   */
  static bool node_found(const cv::FileNode &file_node, const std::string &node_name) {
    for (const auto &item : file_node) {
      if (item.name() == node_name) {
        return true;
      }
    }
    return false;
  }

  /// Records a missing or unreadable node, only failing if it was required
  template <class T> void report_missing(const std::string &node_name, const T &node_result, bool required, const char *reason) {
    if (required) {
      PRINT_WARNING(YELLOW "the node %s of type [%s] %s...\n" RESET, node_name.c_str(), typeid(node_result).name(), reason);
      all_params_found_successfully = false;
    } else {
      PRINT_DEBUG("the node %s of type [%s] %s (not required)...\n", node_name.c_str(), typeid(node_result).name(), reason);
    }
  }

  /**
   * @brief This function will try to get the requested parameter from our config.
   *
   * If it is unable to find it, it will give a warning to the user it couldn't be found.
   *
   * @tparam T Type of parameter we are looking for.
   * @param file_node OpenCV file node we will get the data from
   * @param node_name Name of the node
   * @param node_result Resulting value (should already have default value in it)
   * @param required If this parameter is required by the user to set
   */
  template <class T> void parse(const cv::FileNode &file_node, const std::string &node_name, T &node_result, bool required = true) {
    if (!node_found(file_node, node_name)) {
      report_missing(node_name, node_result, required, "was not found");
      return;
    }
    try {
      file_node[node_name] >> node_result;
    } catch (const cv::Exception &) {
      report_missing(node_name, node_result, required, "could not be parsed");
    }
  }

  /**
   * @brief Custom parser for booleans (0,false,False,FALSE=>false and 1,true,True,TRUE=>true)
   * @param file_node OpenCV file node we will get the data from
   * @param node_name Name of the node
   * @param node_result Resulting value (should already have default value in it)
   * @param required If this parameter is required by the user to set
   */
  void parse(const cv::FileNode &file_node, const std::string &node_name, bool &node_result, bool required = true) {
    if (!node_found(file_node, node_name)) {
      report_missing(node_name, node_result, required, "was not found");
      return;
    }
    try {
      if (file_node[node_name].isInt()) {
        int value = (int)file_node[node_name];
        if (value == 0 || value == 1) {
          node_result = (value == 1);
          return;
        }
      }
      // NOTE: we select the first bit of text as there can be a comment afterwards
      std::string value;
      file_node[node_name] >> value;
      value = value.substr(0, value.find_first_of('#'));
      value = value.substr(0, value.find_first_of(' '));
      if (value == "1" || value == "true" || value == "True" || value == "TRUE") {
        node_result = true;
      } else if (value == "0" || value == "false" || value == "False" || value == "FALSE") {
        node_result = false;
      } else {
        PRINT_WARNING(YELLOW "the node %s has an invalid boolean type of [%s]\n" RESET, node_name.c_str(), value.c_str());
        all_params_found_successfully = false;
      }
    } catch (const cv::Exception &) {
      report_missing(node_name, node_result, required, "could not be parsed");
    }
  }

  /**
   * @brief Custom parser for 3x1 vectors written as a yaml list
   *
   * A list that is not exactly three long leaves the default untouched and marks the parse as failed.
   *
   * @param file_node OpenCV file node we will get the data from
   * @param node_name Name of the node
   * @param node_result Resulting value (should already have default value in it)
   * @param required If this parameter is required by the user to set
   */
  void parse(const cv::FileNode &file_node, const std::string &node_name, Eigen::Vector3d &node_result, bool required = true) {
    std::vector<double> values;
    parse(file_node, node_name, values, required);
    if (values.empty())
      return;
    if (values.size() != 3) {
      PRINT_WARNING(YELLOW "the node %s has %d entries but a 3 vector was expected\n" RESET, node_name.c_str(), (int)values.size());
      all_params_found_successfully = false;
      return;
    }
    node_result << values.at(0), values.at(1), values.at(2);
  }
};

} /* namespace se23_imu */

#endif /* SE23_IMU_OPENCV_YAML_PARSER_H */
