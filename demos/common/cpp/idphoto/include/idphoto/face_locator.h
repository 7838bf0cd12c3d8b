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

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

namespace idphoto {

/// Face proposal of a detector. Eye points are set only by detectors that report landmarks.
struct FaceCandidate {
    cv::Rect box;
    bool hasEyes = false;
    cv::Point2f leftEye;
    cv::Point2f rightEye;
};

/// Face detection capability. The relaxed flag asks for a second, more permissive pass.
class FaceDetector {
public:
    virtual ~FaceDetector() {}
    virtual std::vector<FaceCandidate> detect(const cv::Mat& image, bool relaxed) = 0;
};

/// Haar cascade detector run on the grayscale image
class CascadeFaceDetector : public FaceDetector {
public:
    /// @param cascadeFile cascade XML, e.g. haarcascade_frontalface_default.xml
    /// @throw std::runtime_error if the cascade can't be loaded
    explicit CascadeFaceDetector(const std::string& cascadeFile);

    std::vector<FaceCandidate> detect(const cv::Mat& image, bool relaxed) override;

private:
    cv::CascadeClassifier cascade;
};

struct FaceLocation {
    cv::Rect box;
    cv::Point eye;
};

class FaceLocator {
public:
    explicit FaceLocator(FaceDetector& detector) : detector(detector) {}

    /// Finds the largest face and its eye anchor.
    /// The eye anchor is the midpoint of the eye landmarks when the detector reports them,
    /// otherwise (box.x + box.width / 2, box.y + box.height * 0.35).
    /// @throw NoFaceDetected if both the regular and the relaxed pass find nothing
    FaceLocation locate(const cv::Mat& image) const;

private:
    FaceDetector& detector;
};

}  // namespace idphoto
