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

#include "utils/config_factory.h"

#include <set>
#include <string>

#include "utils/args_helper.hpp"

std::set<std::string> ModelConfig::getDevices() {
    if (devices.empty()) {
        for (const std::string& device : parseDevices(deviceName)) {
            devices.insert(device);
        }
    }

    return devices;
}

ModelConfig ConfigFactory::getMinLatencyConfig(const std::string& flags_d) {
    auto config = getCommonConfig(flags_d);
    for (const auto& device : config.getDevices()) {
        if (device == "CPU" || device == "GPU") {
            config.compiledModelConfig.emplace(ov::streams::num.name(), 1);
        }
    }
    config.compiledModelConfig.emplace(ov::hint::performance_mode.name(), ov::hint::PerformanceMode::LATENCY);
    return config;
}

ModelConfig ConfigFactory::getCommonConfig(const std::string& flags_d) {
    ModelConfig config;
    if (!flags_d.empty()) {
        config.deviceName = flags_d;
    }
    return config;
}
