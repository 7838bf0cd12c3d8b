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


#include "test_precomp.hpp"

#include <vector>

namespace idphoto_test { namespace {

using namespace idphoto;

class FixedFaceDetector : public FaceDetector {
public:
    explicit FixedFaceDetector(const std::vector<cv::Rect>& faces) : faces(faces) {}
    std::vector<FaceCandidate> detect(const cv::Mat&, bool) override {
        std::vector<FaceCandidate> candidates(faces.size());
        for (size_t i = 0; i < faces.size(); ++i) {
            candidates[i].box = faces[i];
        }
        return candidates;
    }

private:
    std::vector<cv::Rect> faces;
};

PhotoSpec blueSpec() {
    PhotoSpec spec;
    spec.name = "blue";
    spec.widthIn = 1.0;
    spec.heightIn = 1.5;
    spec.headHeightRatio = 0.5;
    spec.eyeLineFromBottomRatio = 0.6;
    spec.backgroundRgb = cv::Vec3b(0, 0, 255);
    return spec;
}

TEST(IdPhotoProcessor, cropsAroundFace)
{
    FixedFaceDetector detector({cv::Rect(50, 50, 100, 100)});
    const ProcessedPhoto processed = IdPhotoProcessor(detector).process(squareOnBackground(), blueSpec(), 200);

    ASSERT_EQ(processed.face.box, cv::Rect(50, 50, 100, 100));
    ASSERT_EQ(processed.face.eye, cv::Point(100, 85));
    ASSERT_EQ(processed.photo.size(), cv::Size(200, 300));
    // eye at (150, 128) after scaling by 1.5, the canvas starts at (50, 8)
    ASSERT_EQ(processed.photo.at<cv::Vec3b>(0, 0), cv::Vec3b(250, 250, 250));
}

TEST(IdPhotoProcessor, replacesBackground)
{
    FixedFaceDetector detector({cv::Rect(50, 50, 100, 100)});
    ProcessOptions options;
    options.replaceBackground = true;

    const ProcessedPhoto processed =
        IdPhotoProcessor(detector).process(squareOnBackground(), blueSpec(), 200, options);

    ASSERT_EQ(processed.photo.size(), cv::Size(200, 300));
    ASSERT_EQ(processed.photo.at<cv::Vec3b>(2, 2), cv::Vec3b(255, 0, 0));
    ASSERT_EQ(processed.photo.at<cv::Vec3b>(150, 100), cv::Vec3b(30, 60, 200));
}

TEST(IdPhotoProcessor, noFace)
{
    FixedFaceDetector detector({});
    ASSERT_THROW(IdPhotoProcessor(detector).process(squareOnBackground(), blueSpec(), 300), NoFaceDetected);
}

}}  // namespace idphoto_test
