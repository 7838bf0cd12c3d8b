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
 * @brief a header file with common samples functionality using OpenCV
 * @file ocv_common.hpp
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <openvino/openvino.hpp>

#include "utils/common.hpp"

static inline ov::Layout getLayoutFromShape(const ov::Shape& shape) {
    if (shape.size() == 2) {
        return "NC";
    } else if (shape.size() == 3) {
        return (shape[0] >= 1 && shape[0] <= 4) ? "CHW" : "HWC";
    } else if (shape.size() == 4) {
        return (shape[1] >= 1 && shape[1] <= 4) ? "NCHW" : "NHWC";
    } else {
        throw std::runtime_error("Unsupported " + std::to_string(shape.size()) + "D shape");
    }
}

/**
 * @brief Resizes an image into the memory of an NHWC tensor of batch 1.
 * The tensor element type must match the image depth: u8 for CV_8U, f32 for CV_32F.
 */
static inline void resize2tensor(const cv::Mat& mat, const ov::Tensor& tensor) {
    static const ov::Layout layout{"NHWC"};
    const ov::Shape& shape = tensor.get_shape();
    if (shape.size() != 4 || shape[ov::layout::batch_idx(layout)] != 1) {
        throw std::runtime_error("Only 4D tensors of batch 1 can be filled from an image");
    }
    const int channels = static_cast<int>(shape[ov::layout::channels_idx(layout)]);
    if (channels != mat.channels()) {
        throw std::runtime_error("The number of channels for model input: " + std::to_string(channels) +
                                 " and image: " + std::to_string(mat.channels()) + " - must match");
    }
    int type;
    if (tensor.get_element_type() == ov::element::u8 && mat.depth() == CV_8U) {
        type = CV_8UC(channels);
    } else if (tensor.get_element_type() == ov::element::f32 && mat.depth() == CV_32F) {
        type = CV_32FC(channels);
    } else {
        throw std::runtime_error("Image depth doesn't match tensor element type " +
                                 tensor.get_element_type().get_type_name());
    }
    cv::Size size{int(shape[ov::layout::width_idx(layout)]), int(shape[ov::layout::height_idx(layout)])};
    cv::Mat target{size, type, tensor.data()};
    if (mat.size() == size) {
        mat.copyTo(target);
    } else {
        cv::resize(mat, target, size);
    }
}

class InputTransform {
public:
    InputTransform() : reverseInputChannels(false), isTrivial(true) {}

    InputTransform(bool reverseInputChannels, const std::string& meanValues, const std::string& scaleValues) :
        reverseInputChannels(reverseInputChannels),
        isTrivial(!reverseInputChannels && meanValues.empty() && scaleValues.empty()),
        means(meanValues.empty() ? cv::Scalar(0.0, 0.0, 0.0) : string2Vec(meanValues)),
        stdScales(scaleValues.empty() ? cv::Scalar(1.0, 1.0, 1.0) : string2Vec(scaleValues)) {
    }

    cv::Scalar string2Vec(const std::string& string) {
        const auto& strValues = split(string, ' ');
        std::vector<float> values;
        try {
            for (auto& str : strValues)
                values.push_back(std::stof(str));
        }
        catch (const std::invalid_argument&) {
            throw std::runtime_error("Invalid parameter --mean_values or --scale_values is provided.");
        }
        if (values.size() != 3) {
            throw std::runtime_error("InputTransform expects 3 values per channel, but get \"" + string + "\".");
        }
        return cv::Scalar(values[0], values[1], values[2]);
    }

    void setPrecision(ov::preprocess::PrePostProcessor& ppp, const std::string& tensorName) {
        const auto precision = isTrivial ? ov::element::u8 : ov::element::f32;
        ppp.input(tensorName).tensor().set_element_type(precision);
    }

    cv::Mat operator()(const cv::Mat& inputs) {
        if (isTrivial) { return inputs; }
        cv::Mat result;
        inputs.convertTo(result, CV_32F);
        if (reverseInputChannels) {
            cv::cvtColor(result, result, cv::COLOR_BGR2RGB);
        }
        cv::subtract(result, means, result);
        cv::divide(result, stdScales, result);
        return result;
    }

private:
    bool reverseInputChannels;
    bool isTrivial;
    cv::Scalar means;
    cv::Scalar stdScales;
};
