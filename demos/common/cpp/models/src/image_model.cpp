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

#include "models/image_model.h"

#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <openvino/openvino.hpp>

#include <utils/ocv_common.hpp>

#include "models/input_data.h"
#include "models/internal_model_data.h"

ImageModel::ImageModel(const std::string& modelFileName, const std::string& layout)
    : ModelBase(modelFileName, layout) {}

std::shared_ptr<InternalModelData> ImageModel::preprocess(const InputData& inputData, ov::InferRequest& request) {
    const auto& origImg = inputData.asRef<ImageInputData>().inputImage;
    if (origImg.empty()) {
        throw std::invalid_argument("Empty image passed to " + modelFileName);
    }
    auto img = inputTransform(origImg);

    /* Resize and copy data from the image to the input tensor */
    ov::Tensor frameTensor = request.get_tensor(inputsNames[0]);  // first input should be image
    resize2tensor(img, frameTensor);

    return std::make_shared<InternalImageModelData>(origImg.cols, origImg.rows);
}

void ImageModel::prepareImageInput(ov::preprocess::PrePostProcessor& ppp, const ov::Output<ov::Node>& input) {
    const std::string inputTensorName = input.get_any_name();
    const ov::Shape& shape = input.get_shape();
    const ov::Layout inputLayout = getInputLayout(input);
    if (shape.size() != 4 || shape[ov::layout::channels_idx(inputLayout)] != 3) {
        throw std::logic_error("3-channel 4-dimensional model's input is expected");
    }

    if (inputsNames.empty()) {
        inputsNames.push_back(inputTensorName);
    } else {
        inputsNames[0] = inputTensorName;
    }

    inputTransform.setPrecision(ppp, inputTensorName);
    ppp.input(inputTensorName).tensor().set_layout({"NHWC"});
    ppp.input(inputTensorName).model().set_layout(inputLayout);

    netInputWidth = shape[ov::layout::width_idx(inputLayout)];
    netInputHeight = shape[ov::layout::height_idx(inputLayout)];
}
