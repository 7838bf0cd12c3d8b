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
#include <string>
#include <vector>

#include "models/image_model.h"

class DetectionModel : public ImageModel {
public:
    /// Constructor
    /// @param modelFileName name of model to load
    /// @param confidenceThreshold - threshold to eliminate low-confidence detections.
    /// Any detected object with confidence lower than this threshold will be ignored.
    /// @param labels - array of labels for every class. If this array is empty or contains less elements
    /// than actual classes number, default "Label #N" will be shown for missing items.
    /// @param layout - model input layout
    DetectionModel(const std::string& modelFileName,
                   float confidenceThreshold,
                   const std::vector<std::string>& labels,
                   const std::string& layout = "");

    float getConfidenceThreshold() const {
        return confidenceThreshold;
    }
    void setConfidenceThreshold(float threshold) {
        confidenceThreshold = threshold;
    }

protected:
    float confidenceThreshold;
    std::vector<std::string> labels;

    std::string getLabelName(int labelID) {
        return (size_t)labelID < labels.size() ? labels[labelID] : std::string("Label #") + std::to_string(labelID);
    }
};
