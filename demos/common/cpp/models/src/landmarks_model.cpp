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

#include "models/landmarks_model.h"

#include <stdexcept>
#include <string>

#include <openvino/openvino.hpp>

#include "models/internal_model_data.h"
#include "models/results.h"

LandmarksModel::LandmarksModel(const std::string& modelFileName, const std::string& layout)
    : ImageModel(modelFileName, layout) {}

void LandmarksModel::prepareInputsOutputs(std::shared_ptr<ov::Model>& model) {
    // --------------------------- Prepare input  -----------------------------------------------------
    if (model->inputs().size() != 1) {
        throw std::logic_error("Landmarks model wrapper supports topologies with only 1 input");
    }
    ov::preprocess::PrePostProcessor ppp(model);
    prepareImageInput(ppp, model->input());

    // --------------------------- Prepare output  -----------------------------------------------------
    if (model->outputs().size() != 1) {
        throw std::logic_error("Landmarks model wrapper supports topologies with only 1 output");
    }
    const auto& output = model->output();
    outputsNames.push_back(output.get_any_name());

    size_t values = ov::shape_size(output.get_shape());
    if (values == 0 || values % 2 != 0) {
        throw std::logic_error("Landmarks output must contain (x, y) pairs, but has " + std::to_string(values) +
                               " values");
    }
    numberLandmarks = values / 2;

    ppp.output().tensor().set_element_type(ov::element::f32);
    model = ppp.build();
}

std::unique_ptr<ResultBase> LandmarksModel::postprocess(InferenceResult& infResult) {
    LandmarksResult* result = new LandmarksResult(infResult.frameId);
    auto retVal = std::unique_ptr<ResultBase>(result);

    const auto& internalData = infResult.internalModelData->asRef<InternalImageModelData>();
    const float* points = infResult.getFirstOutputTensor().data<float>();

    result->landmarks.reserve(numberLandmarks);
    for (size_t i = 0; i < numberLandmarks; ++i) {
        result->landmarks.emplace_back(points[2 * i] * internalData.inputImgWidth,
                                       points[2 * i + 1] * internalData.inputImgHeight);
    }

    return retVal;
}
