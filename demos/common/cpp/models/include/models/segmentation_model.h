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
#include <memory>
#include <string>

#include <openvino/openvino.hpp>

#include "models/image_model.h"

namespace ov {
class Model;
}  // namespace ov
struct InferenceResult;
struct ResultBase;

/// Foreground segmentation model producing an ImageResult with a CV_32FC1 probability map
/// of the foreground class at the resolution of the input image.
/// Supported outputs:
///  - one channel score map (NCHW or NHWC), taken as foreground probability,
///  - multi channel class scores, converted with softmax and sliced at the foreground class,
///  - integer class map ([1, H, W] or [1, 1, H, W]), giving 0 or 1 per pixel.
class SegmentationModel : public ImageModel {
public:
    /// Constructor
    /// @param modelFileName name of model to load
    /// @param foregroundClass - class index of the subject, -1 picks the last channel of a
    /// multi channel output (the person channel of background/person models)
    /// @param layout - model input layout
    SegmentationModel(const std::string& modelFileName, int foregroundClass = -1, const std::string& layout = "");

    std::unique_ptr<ResultBase> postprocess(InferenceResult& infResult) override;

protected:
    void prepareInputsOutputs(std::shared_ptr<ov::Model>& model) override;

    int foregroundClass;
    int outHeight = 0;
    int outWidth = 0;
    int outChannels = 0;
    bool channelsLast = false;
};
