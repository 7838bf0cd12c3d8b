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


#ifndef IDPHOTO_TEST_PRECOMP_HPP
#define IDPHOTO_TEST_PRECOMP_HPP

#include <gtest/gtest.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "idphoto/compositor.h"
#include "idphoto/crop_engine.h"
#include "idphoto/errors.h"
#include "idphoto/face_locator.h"
#include "idphoto/photo_spec.h"
#include "idphoto/processor.h"
#include "idphoto/segmentation_cascade.h"
#include "idphoto/sheet_packer.h"

namespace idphoto_test {

// 200x200 light gray photo with a centered 100x100 colored square
inline cv::Mat squareOnBackground(const cv::Scalar& background = cv::Scalar(250, 250, 250),
                                  const cv::Scalar& square = cv::Scalar(30, 60, 200)) {
    cv::Mat image(200, 200, CV_8UC3, background);
    image(cv::Rect(50, 50, 100, 100)).setTo(square);
    return image;
}

inline int countMismatches(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat diff;
    cv::compare(a, b, diff, cv::CMP_NE);
    return cv::countNonZero(diff.reshape(1));
}

}  // namespace idphoto_test

#endif
