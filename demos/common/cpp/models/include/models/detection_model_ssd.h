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
#include <stddef.h>

#include <memory>
#include <string>
#include <vector>

#include "models/detection_model.h"

namespace ov {
class InferRequest;
class Model;
}  // namespace ov
struct InferenceResult;
struct InputData;
struct InternalModelData;
struct ResultBase;

/// SSD-style detector with a single DetectionOutput tensor of shape [1, 1, N, 7].
/// Each row is [image_id, label, confidence, x_min, y_min, x_max, y_max] with normalized coordinates,
/// the list ends at the first row with negative image_id.
class ModelSSD : public DetectionModel {
public:
    ModelSSD(const std::string& modelFileName,
             float confidenceThreshold,
             const std::vector<std::string>& labels = std::vector<std::string>(),
             const std::string& layout = "");

    std::shared_ptr<InternalModelData> preprocess(const InputData& inputData, ov::InferRequest& request) override;
    std::unique_ptr<ResultBase> postprocess(InferenceResult& infResult) override;

protected:
    void prepareInputsOutputs(std::shared_ptr<ov::Model>& model) override;

    size_t objectSize = 0;
    size_t detectionsNumId = 0;
};
