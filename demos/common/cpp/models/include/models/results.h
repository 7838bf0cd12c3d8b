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

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <openvino/openvino.hpp>

#include "internal_model_data.h"

struct ResultBase {
    ResultBase(int64_t frameId = -1) : frameId(frameId) {}
    virtual ~ResultBase() {}

    int64_t frameId;

    bool IsEmpty() {
        return frameId < 0;
    }

    template <class T>
    T& asRef() {
        return dynamic_cast<T&>(*this);
    }

    template <class T>
    const T& asRef() const {
        return dynamic_cast<const T&>(*this);
    }
};

struct InferenceResult : public ResultBase {
    std::shared_ptr<InternalModelData> internalModelData;
    std::map<std::string, ov::Tensor> outputsData;

    /// Returns the first output tensor
    /// This function is a useful addition to direct access to outputs list as many models have only one output
    /// @returns first output tensor
    ov::Tensor getFirstOutputTensor() {
        if (outputsData.empty()) {
            throw std::out_of_range("Outputs map is empty.");
        }
        return outputsData.begin()->second;
    }

    /// Returns true if object contains no valid data
    /// @returns true if object contains no valid data
    bool IsEmpty() {
        return outputsData.empty();
    }
};

struct DetectedObject : public cv::Rect2f {
    unsigned int labelID;
    std::string label;
    float confidence;
};

struct DetectionResult : public ResultBase {
    DetectionResult(int64_t frameId = -1) : ResultBase(frameId) {}
    std::vector<DetectedObject> objects;
};

/// Landmark points in the pixel coordinates of the image passed to the model
struct LandmarksResult : public ResultBase {
    LandmarksResult(int64_t frameId = -1) : ResultBase(frameId) {}
    std::vector<cv::Point2f> landmarks;
};

/// Single-channel map at the resolution of the image passed to the model.
/// Segmentation models store a CV_32FC1 probability of the foreground class in [0, 1].
struct ImageResult : public ResultBase {
    ImageResult(int64_t frameId = -1) : ResultBase(frameId) {}
    cv::Mat resultImage;
};
