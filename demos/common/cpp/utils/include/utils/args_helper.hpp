/*
// Copyright (C) 2024 Intel Corporation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
*/

/**
 * @brief a header file with common samples functionality
 * @file args_helper.hpp
 */

#pragma once

#include <string>
#include <vector>

std::vector<std::string> split(const std::string& s, char delim);

std::vector<std::string> parseDevices(const std::string& device_string);

/**
* @brief Checks that a regular file exists and can be stat'ed
* @param path file to check
*/
bool fileExists(const std::string& path);

/**
* @brief Creates a directory and all missing parents, like `mkdir -p`
* @param path directory to create
* @throw std::runtime_error if a component cannot be created or is not a directory
*/
void makeDirectories(const std::string& path);

std::string toLower(std::string s);
