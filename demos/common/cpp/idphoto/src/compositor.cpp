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

#include "idphoto/compositor.h"

#include <stdexcept>
#include <string>

#include <opencv2/imgproc.hpp>

#include <utils/slog.hpp>

namespace idphoto {

Compositor::Compositor(const SegmentationOptions& options, SegmenterHandle* segmenter)
    : options(options),
      segmenter(segmenter) {
    this->options.preferWhiteKey = true;
}

cv::Mat Compositor::replace(const cv::Mat& image, const cv::Scalar& backgroundBgr, const cv::Rect& faceBox) const {
    SegmentationCascade cascade(options, segmenter);
    std::string strategy;
    cv::Mat mask = cascade.mask(image, faceBox, &strategy);
    slog::info << "Background mask built by " << (strategy.empty() ? "no strategy" : strategy) << slog::endl;
    return replace(image, mask, backgroundBgr, faceBox);
}

cv::Mat Compositor::replace(const cv::Mat& image,
                            const cv::Mat& mask,
                            const cv::Scalar& backgroundBgr,
                            const cv::Rect& faceBox) const {
    if (image.empty() || image.type() != CV_8UC3) {
        throw std::invalid_argument("Compositor expects a non-empty 8-bit 3-channel image");
    }
    if (mask.size() != image.size() || mask.type() != CV_8UC1) {
        throw std::invalid_argument("Compositor expects an 8-bit single channel mask of the image size");
    }

    cv::Mat foreground = mask.clone();
    if (foregroundFraction(foreground) >= 0.98) {
        cv::Mat whiteKey;
        if (WhiteKeyStrategy(options.bgTolerance).tryMask(image, faceBox, whiteKey)) {
            slog::debug << "Mask covers the whole photo, using the white key instead" << slog::endl;
            foreground = whiteKey;
        }
    }

    const cv::Rect face = faceBox & cv::Rect(0, 0, image.cols, image.rows);
    if (face.area() > 0) {
        const cv::Point center(face.x + face.width / 2, face.y + face.height / 2);
        const cv::Size axes(static_cast<int>(face.width * options.faceProtect),
                            static_cast<int>(face.height * (options.faceProtect + 0.15)));
        cv::ellipse(foreground, center, axes, 0, 0, 360, cv::Scalar(255), cv::FILLED);
    }

    cv::erode(foreground, foreground, cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3)));
    cv::Mat alpha;
    cv::GaussianBlur(foreground, alpha, cv::Size(11, 11), 0);
    alpha.convertTo(alpha, CV_32F, 1.0 / 255.0);

    cv::Mat result(image.size(), CV_8UC3);
    const float bg[] = {static_cast<float>(backgroundBgr[0]),
                        static_cast<float>(backgroundBgr[1]),
                        static_cast<float>(backgroundBgr[2])};
    for (int y = 0; y < image.rows; ++y) {
        const cv::Vec3b* src = image.ptr<cv::Vec3b>(y);
        const float* a = alpha.ptr<float>(y);
        cv::Vec3b* dst = result.ptr<cv::Vec3b>(y);
        for (int x = 0; x < image.cols; ++x) {
            for (int c = 0; c < 3; ++c) {
                dst[x][c] = cv::saturate_cast<uchar>(src[x][c] * a[x] + bg[c] * (1.0f - a[x]));
            }
        }
    }
    return result;
}

}  // namespace idphoto
