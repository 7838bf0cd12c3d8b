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

#include "models/segmentation_model.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <openvino/openvino.hpp>

#include "models/internal_model_data.h"
#include "models/results.h"

SegmentationModel::SegmentationModel(const std::string& modelFileName, int foregroundClass, const std::string& layout)
    : ImageModel(modelFileName, layout),
      foregroundClass(foregroundClass) {}

void SegmentationModel::prepareInputsOutputs(std::shared_ptr<ov::Model>& model) {
    // --------------------------- Prepare input  -----------------------------------------------------
    if (model->inputs().size() != 1) {
        throw std::logic_error("Segmentation model wrapper supports topologies with only 1 input");
    }
    ov::preprocess::PrePostProcessor ppp(model);
    prepareImageInput(ppp, model->input());

    // --------------------------- Prepare output  -----------------------------------------------------
    if (model->outputs().size() != 1) {
        throw std::logic_error("Segmentation model wrapper supports topologies with only 1 output");
    }
    const auto& output = model->output();
    outputsNames.push_back(output.get_any_name());

    const ov::Shape& outputShape = output.get_shape();
    ov::Layout outputLayout("");
    switch (outputShape.size()) {
        case 3:
            outputLayout = "CHW";
            outChannels = 1;
            break;
        case 4:
            outputLayout = getLayoutFromShape(outputShape);
            channelsLast = outputLayout == ov::Layout("NHWC");
            outChannels = static_cast<int>(outputShape[ov::layout::channels_idx(outputLayout)]);
            break;
        default:
            throw std::logic_error("Unexpected output tensor shape. Only 4D and 3D outputs are supported.");
    }
    outHeight = static_cast<int>(outputShape[ov::layout::height_idx(outputLayout)]);
    outWidth = static_cast<int>(outputShape[ov::layout::width_idx(outputLayout)]);

    if (foregroundClass >= outChannels && outChannels > 1) {
        throw std::logic_error("Foreground class " + std::to_string(foregroundClass) + " is out of " +
                               std::to_string(outChannels) + " output channels");
    }

    if (output.get_element_type().is_real()) {
        ppp.output().tensor().set_element_type(ov::element::f32);
    }
    model = ppp.build();
}

std::unique_ptr<ResultBase> SegmentationModel::postprocess(InferenceResult& infResult) {
    ImageResult* result = new ImageResult(infResult.frameId);
    auto retVal = std::unique_ptr<ResultBase>(result);
    const auto& inputImgSize = infResult.internalModelData->asRef<InternalImageModelData>();
    const auto& outTensor = infResult.getFirstOutputTensor();

    cv::Mat probabilities(outHeight, outWidth, CV_32FC1);
    const size_t planeSize = static_cast<size_t>(outHeight) * outWidth;

    if (outTensor.get_element_type() == ov::element::i32 || outTensor.get_element_type() == ov::element::i64) {
        // Class map: the pixel belongs to the subject or it doesn't
        const int fgClass = foregroundClass < 0 ? 1 : foregroundClass;
        const bool is64 = outTensor.get_element_type() == ov::element::i64;
        for (size_t i = 0; i < planeSize; ++i) {
            int64_t classId = is64 ? outTensor.data<int64_t>()[i] : outTensor.data<int32_t>()[i];
            reinterpret_cast<float*>(probabilities.data)[i] = classId == fgClass ? 1.0f : 0.0f;
        }
    } else if (outTensor.get_element_type() == ov::element::f32) {
        const float* data = outTensor.data<float>();
        const int fgChannel = foregroundClass < 0 ? outChannels - 1 : foregroundClass;
        const size_t chStride = channelsLast ? 1 : planeSize;
        const size_t pixStride = channelsLast ? static_cast<size_t>(outChannels) : 1;
        for (size_t i = 0; i < planeSize; ++i) {
            const float* pixel = data + i * pixStride;
            float prob;
            if (outChannels == 1) {
                prob = pixel[0];
            } else {
                float maxScore = pixel[0];
                for (int ch = 1; ch < outChannels; ++ch) {
                    maxScore = std::max(maxScore, pixel[ch * chStride]);
                }
                float sum = 0.0f;
                for (int ch = 0; ch < outChannels; ++ch) {
                    sum += std::exp(pixel[ch * chStride] - maxScore);
                }
                prob = std::exp(pixel[fgChannel * chStride] - maxScore) / sum;
            }
            reinterpret_cast<float*>(probabilities.data)[i] = std::min(1.0f, std::max(0.0f, prob));
        }
    } else {
        throw std::runtime_error("Unsupported segmentation output type " + outTensor.get_element_type().get_type_name());
    }

    cv::resize(probabilities,
               result->resultImage,
               cv::Size(inputImgSize.inputImgWidth, inputImgSize.inputImgHeight),
               0,
               0,
               cv::INTER_LINEAR);

    return retVal;
}
