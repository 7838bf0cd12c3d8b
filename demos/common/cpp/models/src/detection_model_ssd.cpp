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

#include "models/detection_model_ssd.h"

#include <stdexcept>
#include <string>
#include <vector>

#include <openvino/openvino.hpp>

#include <utils/common.hpp>
#include <utils/ocv_common.hpp>

#include "models/internal_model_data.h"
#include "models/results.h"

struct InputData;

ModelSSD::ModelSSD(const std::string& modelFileName,
                   float confidenceThreshold,
                   const std::vector<std::string>& labels,
                   const std::string& layout)
    : DetectionModel(modelFileName, confidenceThreshold, labels, layout) {}

std::shared_ptr<InternalModelData> ModelSSD::preprocess(const InputData& inputData, ov::InferRequest& request) {
    if (inputsNames.size() > 1) {
        ov::Tensor imageInfoTensor = request.get_tensor(inputsNames[1]);
        const auto info = imageInfoTensor.data<float>();
        info[0] = static_cast<float>(netInputHeight);
        info[1] = static_cast<float>(netInputWidth);
        info[2] = 1;
    }

    return DetectionModel::preprocess(inputData, request);
}

std::unique_ptr<ResultBase> ModelSSD::postprocess(InferenceResult& infResult) {
    const ov::Tensor& detectionsTensor = infResult.getFirstOutputTensor();
    size_t detectionsNum = detectionsTensor.get_shape()[detectionsNumId];
    const float* detections = detectionsTensor.data<float>();

    DetectionResult* result = new DetectionResult(infResult.frameId);
    auto retVal = std::unique_ptr<ResultBase>(result);

    const auto& internalData = infResult.internalModelData->asRef<InternalImageModelData>();
    const float imgWidth = static_cast<float>(internalData.inputImgWidth);
    const float imgHeight = static_cast<float>(internalData.inputImgHeight);

    for (size_t i = 0; i < detectionsNum; i++) {
        const float* row = detections + i * objectSize;
        if (row[0] < 0) {
            break;
        }

        float confidence = row[2];
        if (confidence <= confidenceThreshold) {
            continue;
        }

        DetectedObject desc;
        desc.confidence = confidence;
        desc.labelID = static_cast<int>(row[1]);
        desc.label = getLabelName(desc.labelID);

        desc.x = clamp(row[3] * imgWidth, 0.f, imgWidth);
        desc.y = clamp(row[4] * imgHeight, 0.f, imgHeight);
        desc.width = clamp(row[5] * imgWidth, 0.f, imgWidth) - desc.x;
        desc.height = clamp(row[6] * imgHeight, 0.f, imgHeight) - desc.y;

        if (desc.width > 0 && desc.height > 0) {
            result->objects.push_back(desc);
        }
    }

    return retVal;
}

void ModelSSD::prepareInputsOutputs(std::shared_ptr<ov::Model>& model) {
    // --------------------------- Prepare input ------------------------------------------------------
    ov::preprocess::PrePostProcessor ppp(model);
    for (const auto& input : model->inputs()) {
        const ov::Shape& shape = input.get_shape();
        if (shape.size() == 4) {  // 1st input contains images
            prepareImageInput(ppp, input);
        } else if (shape.size() == 2) {  // 2nd input contains image info
            inputsNames.resize(2);
            inputsNames[1] = input.get_any_name();
            ppp.input(inputsNames[1]).tensor().set_element_type(ov::element::f32);
        } else {
            throw std::logic_error("Unsupported " + std::to_string(shape.size()) + "D input layer '" +
                                   input.get_any_name() + "'. Only 2D and 4D input layers are supported");
        }
    }

    // --------------------------- Prepare output  -----------------------------------------------------
    if (model->outputs().size() != 1) {
        throw std::logic_error("SSD model wrapper supports topologies with only 1 output");
    }
    const auto& output = model->output();
    outputsNames.push_back(output.get_any_name());

    const ov::Shape& shape = output.get_shape();
    const ov::Layout layout("NCHW");
    if (shape.size() != 4) {
        throw std::logic_error("SSD single output must have 4 dimensions, but had " + std::to_string(shape.size()));
    }
    detectionsNumId = ov::layout::height_idx(layout);
    objectSize = shape[ov::layout::width_idx(layout)];
    if (objectSize != 7) {
        throw std::logic_error("SSD single output must have 7 as a last dimension, but had " +
                               std::to_string(objectSize));
    }
    ppp.output().tensor().set_element_type(ov::element::f32).set_layout(layout);
    model = ppp.build();
}
