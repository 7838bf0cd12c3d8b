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
 * @file common.hpp
 */

#pragma once

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <openvino/openvino.hpp>

#include "utils/args_helper.hpp"
#include "utils/slog.hpp"

template <typename T>
T clamp(T value, T low, T high) {
    return value < low ? low : (value > high ? high : value);
}

inline slog::LogStream& operator<<(slog::LogStream& os, const ov::Version& version) {
    return os << "OpenVINO" << slog::endl
              << "\tversion: " << OPENVINO_VERSION_MAJOR << "." << OPENVINO_VERSION_MINOR << "."
              << OPENVINO_VERSION_PATCH << slog::endl
              << "\tbuild: " << version.buildNumber;
}

inline void showAvailableDevices() {
    ov::Core core;
    std::vector<std::string> devices = core.get_available_devices();

    std::cout << "Available devices:";
    for (const auto& device : devices) {
        std::cout << ' ' << device;
    }
    std::cout << std::endl;
}

inline void logCompiledModelInfo(const ov::CompiledModel& compiledModel,
                                 const std::string& modelName,
                                 const std::string& deviceName,
                                 const std::string& modelType = "") {
    slog::info << "The " << modelType << (modelType.empty() ? "" : " ") << "model " << modelName
               << " is loaded to " << deviceName << slog::endl;
    std::set<std::string> devices;
    for (const std::string& device : parseDevices(deviceName)) {
        devices.insert(device);
    }

    if (devices.find("AUTO") == devices.end()) {  // do not print info for AUTO device
        for (const auto& device : devices) {
            try {
                slog::info << "\tDevice: " << device << slog::endl;
                int32_t nstreams = compiledModel.get_property(ov::streams::num);
                slog::info << "\t\tNumber of streams: " << nstreams << slog::endl;
                if (device == "CPU") {
                    int32_t nthreads = compiledModel.get_property(ov::inference_num_threads);
                    slog::info << "\t\tNumber of threads: " << (nthreads == 0 ? "AUTO" : std::to_string(nthreads))
                               << slog::endl;
                }
            } catch (const ov::Exception& e) {
                slog::debug << "\t\tDevice properties are not available: " << e.what() << slog::endl;
            }
        }
    }
}

inline void logBasicModelInfo(const std::shared_ptr<ov::Model>& model) {
    slog::info << "Model name: " << model->get_friendly_name() << slog::endl;

    slog::info << "\tInputs: " << slog::endl;
    for (const ov::Output<ov::Node>& input : model->inputs()) {
        slog::info << "\t\t" << input.get_any_name() << ", " << input.get_element_type() << ", "
                   << input.get_partial_shape() << ", " << ov::layout::get_layout(input).to_string() << slog::endl;
    }

    slog::info << "\tOutputs: " << slog::endl;
    for (const ov::Output<ov::Node>& output : model->outputs()) {
        slog::info << "\t\t" << output.get_any_name() << ", " << output.get_element_type() << ", "
                   << output.get_partial_shape() << ", " << ov::layout::get_layout(output).to_string() << slog::endl;
    }
}
