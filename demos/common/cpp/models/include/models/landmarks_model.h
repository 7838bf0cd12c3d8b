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

#include "models/image_model.h"

namespace ov {
class Model;
}  // namespace ov
struct InferenceResult;
struct ResultBase;

/// Regression landmarks model: one output holding normalized (x, y) pairs relative to the input image,
/// e.g. [1, 10, 1, 1] for landmarks-regression-retail-0009 or [1, 70] for facial-landmarks-35-adas-0002.
/// 5-point models start with the eye centers, 35-point models with two corners per eye.
class LandmarksModel : public ImageModel {
public:
    LandmarksModel(const std::string& modelFileName, const std::string& layout = "");

    std::unique_ptr<ResultBase> postprocess(InferenceResult& infResult) override;

    size_t getNumberLandmarks() const {
        return numberLandmarks;
    }

protected:
    void prepareInputsOutputs(std::shared_ptr<ov::Model>& model) override;

    size_t numberLandmarks = 0;
};
