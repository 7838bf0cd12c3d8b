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
#include <stdint.h>

#include <memory>

#include <openvino/openvino.hpp>

#include <models/results.h>

class ModelBase;
struct InputData;
struct ModelConfig;

/// Runs one inference at a time on a single infer request.
/// The pipeline is not reentrant: callers sharing it between threads must serialize calls to infer().
class SyncPipeline {
public:
    /// Loads model and performs required initialization
    /// @param modelInstance pointer to model object. Object it points to should not be destroyed manually after passing
    /// pointer to this function.
    /// @param config - fine tuning configuration for model
    /// @param core - reference to ov::Core instance to use.
    SyncPipeline(std::unique_ptr<ModelBase>&& modelInstance, const ModelConfig& config, ov::Core& core);
    virtual ~SyncPipeline();

    /// Preprocesses the input, runs inference and returns the postprocessed result of the model
    /// @param inputData - input data to be processed
    std::unique_ptr<ResultBase> infer(const InputData& inputData);

protected:
    std::unique_ptr<ModelBase> model;
    ov::CompiledModel compiledModel;
    ov::InferRequest request;
    int64_t inputFrameId = 0;
};
