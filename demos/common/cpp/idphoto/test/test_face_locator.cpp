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

#include <stdexcept>
#include <string>
#include <vector>

namespace idphoto_test { namespace {

using namespace idphoto;

class ScriptedDetector : public FaceDetector {
public:
    std::vector<FaceCandidate> detect(const cv::Mat&, bool relaxed) override {
        ++(relaxed ? relaxedCalls : regularCalls);
        return relaxed ? relaxedFaces : regularFaces;
    }

    std::vector<FaceCandidate> regularFaces;
    std::vector<FaceCandidate> relaxedFaces;
    int regularCalls = 0;
    int relaxedCalls = 0;
};

FaceCandidate box(int x, int y, int width, int height) {
    FaceCandidate candidate;
    candidate.box = cv::Rect(x, y, width, height);
    return candidate;
}

const cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(128));

TEST(FaceLocator, largestFaceWins)
{
    ScriptedDetector detector;
    detector.regularFaces = {box(10, 10, 20, 20), box(50, 50, 40, 40), box(0, 0, 30, 30)};

    const FaceLocation location = FaceLocator(detector).locate(image);

    ASSERT_EQ(location.box, cv::Rect(50, 50, 40, 40));
    ASSERT_EQ(detector.relaxedCalls, 0);
}

TEST(FaceLocator, firstAmongEqualAreas)
{
    ScriptedDetector detector;
    detector.regularFaces = {box(10, 10, 20, 40), box(50, 10, 40, 20)};

    ASSERT_EQ(FaceLocator(detector).locate(image).box, cv::Rect(10, 10, 20, 40));
}

TEST(FaceLocator, estimatedEye)
{
    ScriptedDetector detector;
    detector.regularFaces = {box(30, 30, 50, 50)};

    ASSERT_EQ(FaceLocator(detector).locate(image).eye, cv::Point(55, 47));
}

TEST(FaceLocator, eyeLandmarksMidpoint)
{
    ScriptedDetector detector;
    FaceCandidate face = box(50, 50, 40, 40);
    face.hasEyes = true;
    face.leftEye = cv::Point2f(60.4f, 70.2f);
    face.rightEye = cv::Point2f(80.2f, 70.6f);
    detector.regularFaces = {face};

    ASSERT_EQ(FaceLocator(detector).locate(image).eye, cv::Point(70, 70));
}

TEST(FaceLocator, relaxedPass)
{
    ScriptedDetector detector;
    detector.relaxedFaces = {box(20, 20, 25, 25)};

    const FaceLocation location = FaceLocator(detector).locate(image);

    ASSERT_EQ(location.box, cv::Rect(20, 20, 25, 25));
    ASSERT_EQ(detector.regularCalls, 1);
    ASSERT_EQ(detector.relaxedCalls, 1);
}

TEST(FaceLocator, clipsBoxesToImage)
{
    ScriptedDetector detector;
    detector.regularFaces = {box(200, 200, 50, 50)};
    detector.relaxedFaces = {box(-10, -10, 30, 30)};

    ASSERT_EQ(FaceLocator(detector).locate(image).box, cv::Rect(0, 0, 20, 20));
}

TEST(FaceLocator, noFace)
{
    ScriptedDetector detector;

    try {
        FaceLocator(detector).locate(image);
        FAIL() << "NoFaceDetected expected";
    } catch (const NoFaceDetected& e) {
        ASSERT_EQ(std::string(e.what()), "No face detected. Please use a clearer, front-facing photo.");
    }
    ASSERT_EQ(detector.regularCalls, 1);
    ASSERT_EQ(detector.relaxedCalls, 1);
}

TEST(FaceLocator, rejectsEmptyImage)
{
    ScriptedDetector detector;
    ASSERT_THROW(FaceLocator(detector).locate(cv::Mat()), std::invalid_argument);
}

}}  // namespace idphoto_test
