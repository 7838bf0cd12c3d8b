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

#pragma once
#include <set>
#include <string>

#include <openvino/openvino.hpp>

struct ModelConfig {
    std::string deviceName = "CPU";
    ov::AnyMap compiledModelConfig;

    std::set<std::string> getDevices();

protected:
    std::set<std::string> devices;
};

class ConfigFactory {
public:
    /// Single-stream configuration for one-shot, synchronous inference of a single image
    static ModelConfig getMinLatencyConfig(const std::string& flags_d);

protected:
    static ModelConfig getCommonConfig(const std::string& flags_d);
};
