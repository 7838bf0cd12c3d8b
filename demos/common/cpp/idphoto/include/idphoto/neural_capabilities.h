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
#include <vector>

#include <opencv2/core.hpp>
#include <openvino/openvino.hpp>

#include <pipelines/sync_pipeline.h>
#include <utils/config_factory.h>

#include "idphoto/face_locator.h"
#include "idphoto/segmentation_cascade.h"

class DetectionModel;
class LandmarksModel;

namespace idphoto {

/// SSD face detector with optional facial landmarks, both run by OpenVINO.
/// Landmarks are estimated on a square crop around the face enlarged by landmarksEnlarge.
class OpenVINOFaceDetector : public FaceDetector {
public:
    OpenVINOFaceDetector(ov::Core& core,
                         const ModelConfig& config,
                         const std::string& detectorModel,
                         const std::string& landmarksModelFile = "",
                         float threshold = 0.5f,
                         float relaxedThreshold = 0.3f,
                         float landmarksEnlarge = 1.2f);

    std::vector<FaceCandidate> detect(const cv::Mat& image, bool relaxed) override;

private:
    void addEyes(const cv::Mat& image, FaceCandidate& candidate);

    std::unique_ptr<SyncPipeline> detector;
    DetectionModel* detectionModel;
    std::unique_ptr<SyncPipeline> landmarks;
    LandmarksModel* landmarksModel;
    float threshold;
    float relaxedThreshold;
    float landmarksEnlarge;
};

/// Foreground probability by an OpenVINO segmentation model
class OpenVINOSegmenter : public ForegroundSegmenter {
public:
    /// @param foregroundClass class index of the subject, -1 for the last output channel
    /// @param reverseInputChannels feed RGB instead of BGR
    /// @param meanValues per channel means subtracted from the input, e.g. "127.5 127.5 127.5"
    /// @param scaleValues per channel divisors applied after the means
    OpenVINOSegmenter(ov::Core& core,
                      const ModelConfig& config,
                      const std::string& modelFile,
                      int foregroundClass = -1,
                      bool reverseInputChannels = false,
                      const std::string& meanValues = "",
                      const std::string& scaleValues = "");

    cv::Mat segment(const cv::Mat& image) override;

private:
    std::unique_ptr<SyncPipeline> pipeline;
};

}  // namespace idphoto
