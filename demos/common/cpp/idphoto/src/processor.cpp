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

#include "idphoto/processor.h"

#include <opencv2/core.hpp>

#include <utils/slog.hpp>

#include "idphoto/compositor.h"
#include "idphoto/crop_engine.h"

namespace idphoto {

ProcessedPhoto IdPhotoProcessor::process(const cv::Mat& image,
                                         const PhotoSpec& spec,
                                         int dpi,
                                         const ProcessOptions& options) const {
    ProcessedPhoto result;
    result.face = locator.locate(image);
    slog::info << "Face " << result.face.box << ", eye anchor " << result.face.eye << slog::endl;

    cv::Mat source = image;
    const cv::Scalar background = spec.backgroundBgr();
    if (options.replaceBackground) {
        source = Compositor(options.segmentation, segmenter).replace(image, background, result.face.box);
    }

    result.photo = cropToSpec(source, result.face.box, result.face.eye, spec, dpi, &background);
    slog::info << "Photo for " << spec.name << ": " << result.photo.cols << "x" << result.photo.rows << " at "
               << dpi << " DPI" << slog::endl;
    return result;
}

}  // namespace idphoto
