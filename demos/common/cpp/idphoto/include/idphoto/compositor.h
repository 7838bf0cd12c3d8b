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

#include "idphoto/segmentation_cascade.h"

namespace idphoto {

/// Replaces the background of a photo with a solid color using a feathered foreground mask.
class Compositor {
public:
    explicit Compositor(const SegmentationOptions& options = SegmentationOptions(),
                        SegmenterHandle* segmenter = nullptr);

    /// Builds the mask with the segmentation cascade, keying white backgrounds first, and composites.
    /// @param backgroundBgr replacement color in the channel order of the image
    /// @param faceBox protected face region, empty when unknown
    cv::Mat replace(const cv::Mat& image, const cv::Scalar& backgroundBgr, const cv::Rect& faceBox = cv::Rect()) const;

    /// Composites with a given 0/255 mask. A mask covering 98% of the image or more is replaced
    /// by the white key mask when the border allows one.
    cv::Mat replace(const cv::Mat& image,
                    const cv::Mat& mask,
                    const cv::Scalar& backgroundBgr,
                    const cv::Rect& faceBox) const;

private:
    SegmentationOptions options;
    SegmenterHandle* segmenter;
};

}  // namespace idphoto
