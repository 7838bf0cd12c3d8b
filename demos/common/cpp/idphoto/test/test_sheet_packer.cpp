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

namespace idphoto_test { namespace {

using namespace idphoto;

cv::Mat randomPhoto(int width, int height) {
    cv::Mat photo(height, width, CV_8UC3);
    cv::randu(photo, cv::Scalar::all(0), cv::Scalar::all(256));
    return photo;
}

LayoutSpec layout(double width, double height) {
    LayoutSpec spec;
    spec.widthIn = width;
    spec.heightIn = height;
    return spec;
}

SheetOptions tightOptions(int copies) {
    SheetOptions options;
    options.marginIn = 0.0;
    options.spacingIn = 0.0;
    options.copies = copies;
    return options;
}

TEST(SheetPacker, fitGrid)
{
    GridFit fit = fitGrid(cv::Size(380, 580), cv::Size(80, 60), 10);
    ASSERT_EQ(fit.cols, 4);
    ASSERT_EQ(fit.rows, 8);
    ASSERT_EQ(fit.total(), 32);

    fit = fitGrid(cv::Size(100, 100), cv::Size(300, 300), 10);
    ASSERT_EQ(fit.cols, 1);
    ASSERT_EQ(fit.rows, 1);
}

TEST(SheetPacker, keepsOrientationOnTie)
{
    // 4x2 upright and 2x4 turned
    const PackResult result = packSheet(randomPhoto(100, 200), layout(4, 4), 100, tightOptions(6));

    ASSERT_FALSE(result.rotated);
    ASSERT_EQ(result.cols, 4);
    ASSERT_EQ(result.rows, 2);
    ASSERT_EQ(result.placed, 6);
}

TEST(SheetPacker, rotatesWhenMoreFit)
{
    const cv::Mat photo = randomPhoto(200, 300);
    SheetOptions options = tightOptions(6);
    options.drawGuides = false;

    // 3x1 upright and 2x2 turned
    const PackResult result = packSheet(photo, layout(6, 4), 100, options);

    ASSERT_TRUE(result.rotated);
    ASSERT_EQ(result.cols, 2);
    ASSERT_EQ(result.rows, 2);
    ASSERT_EQ(result.placed, 4);

    cv::Mat turned;
    cv::rotate(photo, turned, cv::ROTATE_90_COUNTERCLOCKWISE);
    ASSERT_EQ(countMismatches(result.sheet(cv::Rect(0, 0, 300, 200)), turned), 0);
    ASSERT_EQ(countMismatches(result.sheet(cv::Rect(300, 200, 300, 200)), turned), 0);
}

TEST(SheetPacker, placedCount)
{
    const cv::Mat photo = randomPhoto(100, 200);

    SheetOptions options = tightOptions(3);
    ASSERT_EQ(packSheet(photo, layout(4, 4), 100, options).placed, 3);

    options.copies = 20;
    ASSERT_EQ(packSheet(photo, layout(4, 4), 100, options).placed, 8);

    options.copies = 1;
    options.copyMode = CopyMode::MAXIMIZE;
    ASSERT_EQ(packSheet(photo, layout(4, 4), 100, options).placed, 8);
}

TEST(SheetPacker, unplacedCellsStayWhite)
{
    SheetOptions options = tightOptions(3);
    options.drawGuides = false;
    const PackResult result = packSheet(randomPhoto(100, 200), layout(4, 4), 100, options);

    const cv::Mat lastCell = result.sheet(cv::Rect(300, 200, 100, 200));
    ASSERT_EQ(countMismatches(lastCell, cv::Mat(lastCell.size(), CV_8UC3, cv::Scalar::all(255))), 0);
}

TEST(SheetPacker, singleCopyRoundTrip)
{
    const cv::Mat photo = randomPhoto(600, 600);
    SheetOptions options = tightOptions(1);
    options.drawGuides = false;

    const PackResult result = packSheet(photo, layout(2, 2), 300, options);

    ASSERT_EQ(result.placed, 1);
    ASSERT_EQ(result.sheet.size(), photo.size());
    ASSERT_EQ(cv::norm(result.sheet, photo, cv::NORM_INF), 0.0);
}

TEST(SheetPacker, guidesStayOutsidePhotos)
{
    const cv::Mat photo = randomPhoto(80, 60);
    SheetOptions options;
    options.marginIn = 0.1;
    options.spacingIn = 0.1;
    options.copies = 6;

    const PackResult result = packSheet(photo, layout(4, 6), 100, options);

    ASSERT_FALSE(result.rotated);
    ASSERT_EQ(result.cols, 4);
    ASSERT_EQ(result.rows, 8);
    ASSERT_EQ(result.placed, 6);

    // 350x550 grid centered in the 380x580 area inside the 10 px margins
    for (int i = 0; i < result.placed; ++i) {
        const cv::Rect cell(25 + (i % 4) * 90, 25 + (i / 4) * 70, 80, 60);
        ASSERT_EQ(countMismatches(result.sheet(cell), photo), 0) << "copy " << i;
    }

    ASSERT_EQ(result.sheet.at<cv::Vec3b>(50, 24), cv::Vec3b(210, 210, 210));
    ASSERT_EQ(result.sheet.at<cv::Vec3b>(24, 24), cv::Vec3b(180, 180, 180));
    ASSERT_EQ(result.sheet.at<cv::Vec3b>(300, 110), cv::Vec3b(200, 200, 200));
    ASSERT_EQ(result.sheet.at<cv::Vec3b>(2, 2), cv::Vec3b(255, 255, 255));
}

TEST(SheetPacker, oversizedPhotoIsClipped)
{
    const cv::Mat photo = randomPhoto(500, 500);
    const PackResult result = packSheet(photo, layout(4, 4), 100, tightOptions(4));

    ASSERT_EQ(result.cols, 1);
    ASSERT_EQ(result.rows, 1);
    ASSERT_EQ(result.placed, 1);
    ASSERT_EQ(result.sheet.size(), cv::Size(400, 400));
    ASSERT_EQ(countMismatches(result.sheet, photo(cv::Rect(50, 50, 400, 400))), 0);
}

TEST(SheetPacker, rejectsBadInput)
{
    ASSERT_THROW(packSheet(cv::Mat(), layout(4, 6), 300), std::invalid_argument);
    ASSERT_THROW(packSheet(randomPhoto(10, 10), layout(4, 6), 0), std::invalid_argument);
}

TEST(SheetPacker, negativeCopyCount)
{
    const cv::Mat photo = randomPhoto(100, 200);
    SheetOptions options = tightOptions(-5);
    ASSERT_THROW(packSheet(photo, layout(4, 4), 100, options), std::invalid_argument);

    options.copies = 0;
    ASSERT_EQ(packSheet(photo, layout(4, 4), 100, options).placed, 0);

    // the count is unused when the grid is filled
    options.copies = -5;
    options.copyMode = CopyMode::MAXIMIZE;
    ASSERT_EQ(packSheet(photo, layout(4, 4), 100, options).placed, 8);
}

}}  // namespace idphoto_test
