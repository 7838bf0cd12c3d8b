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

#include <opencv2/core.hpp>

#include "idphoto/photo_spec.h"

namespace idphoto {

/// Placement of the scaled source image on the output canvas
struct CropGeometry {
    cv::Size outputSize;
    double scale = 0.0;     ///< head_height_ratio * outH / max(faceBox.height, 1)
    cv::Point scaledEye;    ///< round(eye * scale)
    int targetEyeY = 0;     ///< round(outH * (1 - eye_line_from_bottom_ratio))
    int left = 0;           ///< crop origin in the scaled image, may be negative
    int top = 0;
};

CropGeometry computeCropGeometry(const cv::Rect& faceBox, const cv::Point& eye, const PhotoSpec& spec, int dpi);

/// Cuts roi out of image. Parts of roi outside the image are filled with padColor.
cv::Mat cropWithPadding(const cv::Mat& image, const cv::Rect& roi, const cv::Scalar& padColor);

/// Scales the photo uniformly so the face box height matches the head height ratio,
/// then cuts the output canvas with the eyes on the eye line and horizontally centered.
/// The result is exactly outputSize(spec, dpi). When enlarging, only the output canvas is rendered,
/// so memory doesn't grow with the scale.
/// @param padBgr fill color of areas outside the source, the photo spec background color when null
cv::Mat cropToSpec(const cv::Mat& image,
                   const cv::Rect& faceBox,
                   const cv::Point& eye,
                   const PhotoSpec& spec,
                   int dpi,
                   const cv::Scalar* padBgr = nullptr);

}  // namespace idphoto
