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

#include <opencv2/core.hpp>

#include "idphoto/face_locator.h"
#include "idphoto/photo_spec.h"
#include "idphoto/segmentation_cascade.h"

namespace idphoto {

struct ProcessOptions {
    bool replaceBackground = false;
    SegmentationOptions segmentation;
};

struct ProcessedPhoto {
    FaceLocation face;
    cv::Mat photo;
};

/// Locates the face, optionally replaces the background and crops the photo to a spec.
/// Every call is independent apart from the segmenter handle, which is built on first use.
class IdPhotoProcessor {
public:
    IdPhotoProcessor(FaceDetector& detector, SegmenterHandle* segmenter = nullptr)
        : locator(detector), segmenter(segmenter) {}

    /// @throw NoFaceDetected
    ProcessedPhoto process(const cv::Mat& image, const PhotoSpec& spec, int dpi,
                           const ProcessOptions& options = ProcessOptions()) const;

private:
    FaceLocator locator;
    SegmenterHandle* segmenter;
};

}  // namespace idphoto
