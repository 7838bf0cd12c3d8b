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

#include "idphoto/neural_capabilities.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <models/detection_model_ssd.h>
#include <models/input_data.h>
#include <models/landmarks_model.h>
#include <models/results.h>
#include <models/segmentation_model.h>
#include <utils/slog.hpp>

namespace idphoto {

OpenVINOFaceDetector::OpenVINOFaceDetector(ov::Core& core,
                                           const ModelConfig& config,
                                           const std::string& detectorModel,
                                           const std::string& landmarksModelFile,
                                           float threshold,
                                           float relaxedThreshold,
                                           float landmarksEnlarge)
    : detectionModel(nullptr),
      landmarksModel(nullptr),
      threshold(threshold),
      relaxedThreshold(relaxedThreshold),
      landmarksEnlarge(landmarksEnlarge) {
    std::unique_ptr<ModelSSD> ssd(new ModelSSD(detectorModel, threshold, {"face"}));
    detectionModel = ssd.get();
    detector.reset(new SyncPipeline(std::move(ssd), config, core));

    if (!landmarksModelFile.empty()) {
        std::unique_ptr<LandmarksModel> lm(new LandmarksModel(landmarksModelFile));
        landmarksModel = lm.get();
        landmarks.reset(new SyncPipeline(std::move(lm), config, core));
        if (landmarksModel->getNumberLandmarks() < 2) {
            throw std::logic_error("Landmarks model must report at least both eyes");
        }
    }
}

std::vector<FaceCandidate> OpenVINOFaceDetector::detect(const cv::Mat& image, bool relaxed) {
    detectionModel->setConfidenceThreshold(relaxed ? relaxedThreshold : threshold);
    std::unique_ptr<ResultBase> result = detector->infer(ImageInputData(image));

    std::vector<FaceCandidate> candidates;
    for (const DetectedObject& object : result->asRef<DetectionResult>().objects) {
        FaceCandidate candidate;
        candidate.box = cv::Rect(cvRound(object.x), cvRound(object.y), cvRound(object.width), cvRound(object.height)) &
                        cv::Rect(0, 0, image.cols, image.rows);
        if (candidate.box.area() == 0) {
            continue;
        }
        if (landmarks) {
            addEyes(image, candidate);
        }
        slog::debug << "Face " << candidate.box << ", confidence " << object.confidence << slog::endl;
        candidates.push_back(candidate);
    }
    return candidates;
}

void OpenVINOFaceDetector::addEyes(const cv::Mat& image, FaceCandidate& candidate) {
    // Square, enlarged crop, the landmarks models are trained on such face images
    const cv::Rect& box = candidate.box;
    const int side = static_cast<int>(landmarksEnlarge * std::max(box.width, box.height));
    const cv::Point center(box.x + box.width / 2, box.y + box.height / 2);
    const cv::Rect crop = cv::Rect(center.x - side / 2, center.y - side / 2, side, side) &
                          cv::Rect(0, 0, image.cols, image.rows);
    if (crop.area() == 0) {
        return;
    }

    std::unique_ptr<ResultBase> result = landmarks->infer(ImageInputData(image(crop)));
    const std::vector<cv::Point2f>& points = result->asRef<LandmarksResult>().landmarks;
    const cv::Point2f offset(static_cast<float>(crop.x), static_cast<float>(crop.y));

    // 35-point models report two corners per eye, 5-point models the eye centers
    if (points.size() >= 35) {
        candidate.leftEye = (points[0] + points[1]) * 0.5f + offset;
        candidate.rightEye = (points[2] + points[3]) * 0.5f + offset;
    } else {
        candidate.leftEye = points[0] + offset;
        candidate.rightEye = points[1] + offset;
    }
    candidate.hasEyes = true;
}

OpenVINOSegmenter::OpenVINOSegmenter(ov::Core& core,
                                     const ModelConfig& config,
                                     const std::string& modelFile,
                                     int foregroundClass,
                                     bool reverseInputChannels,
                                     const std::string& meanValues,
                                     const std::string& scaleValues) {
    std::unique_ptr<SegmentationModel> model(new SegmentationModel(modelFile, foregroundClass));
    model->setInputsPreprocessing(reverseInputChannels, meanValues, scaleValues);
    pipeline.reset(new SyncPipeline(std::move(model), config, core));
}

cv::Mat OpenVINOSegmenter::segment(const cv::Mat& image) {
    std::unique_ptr<ResultBase> result = pipeline->infer(ImageInputData(image));
    return result->asRef<ImageResult>().resultImage;
}

}  // namespace idphoto
