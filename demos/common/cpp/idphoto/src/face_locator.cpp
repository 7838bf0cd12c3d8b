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

#include "idphoto/face_locator.h"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/imgproc.hpp>

#include <utils/slog.hpp>

#include "idphoto/errors.h"

namespace idphoto {

CascadeFaceDetector::CascadeFaceDetector(const std::string& cascadeFile) {
    if (!cascade.load(cascadeFile)) {
        throw std::runtime_error("Can't load the face cascade: " + cascadeFile);
    }
}

std::vector<FaceCandidate> CascadeFaceDetector::detect(const cv::Mat& image, bool relaxed) {
    cv::Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    }

    std::vector<cv::Rect> faces;
    if (relaxed) {
        cascade.detectMultiScale(gray, faces, 1.05, 2, 0, cv::Size(20, 20));
    } else {
        cascade.detectMultiScale(gray, faces, 1.01, 3, 0, cv::Size(30, 30));
    }

    std::vector<FaceCandidate> candidates(faces.size());
    for (size_t i = 0; i < faces.size(); ++i) {
        candidates[i].box = faces[i];
    }
    return candidates;
}

FaceLocation FaceLocator::locate(const cv::Mat& image) const {
    if (image.empty()) {
        throw std::invalid_argument("FaceLocator got an empty image");
    }
    const cv::Rect bounds(0, 0, image.cols, image.rows);

    std::vector<FaceCandidate> candidates;
    for (bool relaxed : {false, true}) {
        candidates = detector.detect(image, relaxed);
        // Keep boxes inside the image, a detector may report partially visible faces
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&bounds](FaceCandidate& candidate) {
                                            candidate.box &= bounds;
                                            return candidate.box.width < 1 || candidate.box.height < 1;
                                        }),
                         candidates.end());
        if (!candidates.empty()) {
            slog::debug << candidates.size() << " face(s) found by the " << (relaxed ? "relaxed" : "regular")
                        << " detection pass" << slog::endl;
            break;
        }
    }
    if (candidates.empty()) {
        throw NoFaceDetected();
    }

    // Largest area wins, the first one among equals
    const FaceCandidate* best = &candidates.front();
    for (const FaceCandidate& candidate : candidates) {
        if (candidate.box.area() > best->box.area()) {
            best = &candidate;
        }
    }

    FaceLocation location;
    location.box = best->box;
    if (best->hasEyes) {
        const cv::Point2f middle = (best->leftEye + best->rightEye) * 0.5f;
        location.eye = cv::Point(cvRound(middle.x), cvRound(middle.y));
    } else {
        location.eye = cv::Point(location.box.x + location.box.width / 2,
                                 location.box.y + static_cast<int>(location.box.height * 0.35));
    }
    return location;
}

}  // namespace idphoto
