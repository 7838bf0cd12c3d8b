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


#include "idphoto/crop_engine.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <opencv2/imgproc.hpp>

#include <utils/slog.hpp>

namespace idphoto {

CropGeometry computeCropGeometry(const cv::Rect& faceBox, const cv::Point& eye, const PhotoSpec& spec, int dpi) {
    if (dpi <= 0) {
        throw std::invalid_argument("DPI must be positive, got " + std::to_string(dpi));
    }
    CropGeometry geometry;
    geometry.outputSize = outputSize(spec, dpi);
    if (geometry.outputSize.width < 1 || geometry.outputSize.height < 1) {
        throw std::invalid_argument("Photo spec '" + spec.name + "' gives an empty output at " +
                                    std::to_string(dpi) + " DPI");
    }
    const int outW = geometry.outputSize.width;
    const int outH = geometry.outputSize.height;

    geometry.scale = spec.headHeightRatio * outH / std::max(faceBox.height, 1);
    geometry.scaledEye = cv::Point(cvRound(eye.x * geometry.scale), cvRound(eye.y * geometry.scale));
    geometry.targetEyeY = cvRound(outH * (1.0 - spec.eyeLineFromBottomRatio));
    geometry.left = cvRound(geometry.scaledEye.x - outW / 2.0);
    geometry.top = geometry.scaledEye.y - geometry.targetEyeY;
    return geometry;
}

cv::Mat cropWithPadding(const cv::Mat& image, const cv::Rect& roi, const cv::Scalar& padColor) {
    const int padLeft = std::max(0, -roi.x);
    const int padTop = std::max(0, -roi.y);
    const int padRight = std::max(0, roi.x + roi.width - image.cols);
    const int padBottom = std::max(0, roi.y + roi.height - image.rows);

    if (padLeft == 0 && padTop == 0 && padRight == 0 && padBottom == 0) {
        return image(roi).clone();
    }

    // Pad only as far as the roi reaches so that a roi far away from the image stays cheap
    const cv::Rect inside = roi & cv::Rect(0, 0, image.cols, image.rows);
    cv::Mat result(roi.size(), image.type(), padColor);
    if (inside.area() > 0) {
        image(inside).copyTo(result(cv::Rect(inside.x - roi.x, inside.y - roi.y, inside.width, inside.height)));
    }
    return result;
}

cv::Mat cropToSpec(const cv::Mat& image,
                   const cv::Rect& faceBox,
                   const cv::Point& eye,
                   const PhotoSpec& spec,
                   int dpi,
                   const cv::Scalar* padBgr) {
    if (image.empty()) {
        throw std::invalid_argument("cropToSpec got an empty image");
    }
    const CropGeometry geometry = computeCropGeometry(faceBox, eye, spec, dpi);
    const cv::Rect canvas(geometry.left, geometry.top, geometry.outputSize.width, geometry.outputSize.height);
    const cv::Scalar padColor = padBgr ? *padBgr : spec.backgroundBgr();

    slog::debug << "Crop scale " << geometry.scale << ", scaled eye " << geometry.scaledEye << ", canvas " << canvas
                << slog::endl;

    const double s = geometry.scale;
    if (s < 1.0) {
        // The scaled image is smaller than the source, area interpolation avoids aliasing
        const cv::Size scaledSize(std::max(1, cvRound(image.cols * s)), std::max(1, cvRound(image.rows * s)));
        cv::Mat scaled;
        cv::resize(image, scaled, scaledSize, 0, 0, cv::INTER_AREA);
        return cropWithPadding(scaled, canvas, padColor);
    }

    // Enlarging renders only the canvas: output (x, y) is the scaled pixel (x + left, y + top),
    // with the pixel center convention of cv::resize
    const cv::Matx23d transform(s, 0.0, 0.5 * s - 0.5 - canvas.x,
                                0.0, s, 0.5 * s - 0.5 - canvas.y);
    cv::Mat cropped;
    cv::warpAffine(image, cropped, transform, canvas.size(), cv::INTER_CUBIC, cv::BORDER_CONSTANT, padColor);
    return cropped;
}

}  // namespace idphoto
