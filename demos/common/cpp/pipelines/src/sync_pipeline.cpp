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

#include "pipelines/sync_pipeline.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <openvino/openvino.hpp>

#include <models/input_data.h>
#include <models/model_base.h>
#include <models/results.h>
#include <utils/config_factory.h>

SyncPipeline::SyncPipeline(std::unique_ptr<ModelBase>&& modelInstance, const ModelConfig& config, ov::Core& core)
    : model(std::move(modelInstance)) {
    if (!model) {
        throw std::logic_error("SyncPipeline requires a model");
    }
    compiledModel = model->compileModel(config, core);
    request = compiledModel.create_infer_request();
}

SyncPipeline::~SyncPipeline() {}

std::unique_ptr<ResultBase> SyncPipeline::infer(const InputData& inputData) {
    InferenceResult result;
    result.frameId = inputFrameId++;
    result.internalModelData = model->preprocess(inputData, request);

    request.infer();

    for (const auto& outName : model->getOutputsNames()) {
        result.outputsData.emplace(outName, request.get_tensor(outName));
    }

    return model->postprocess(result);
}
