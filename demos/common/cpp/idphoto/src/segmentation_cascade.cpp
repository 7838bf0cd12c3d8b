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

#include "idphoto/segmentation_cascade.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <utils/slog.hpp>

namespace idphoto {
namespace {

constexpr int MEDIAN_KERNEL = 5;

cv::Mat colorDistance(const cv::Mat& image, const cv::Scalar& color) {
    cv::Mat distance(image.size(), CV_32FC1);
    const float c0 = static_cast<float>(color[0]);
    const float c1 = static_cast<float>(color[1]);
    const float c2 = static_cast<float>(color[2]);
    for (int y = 0; y < image.rows; ++y) {
        const cv::Vec3b* src = image.ptr<cv::Vec3b>(y);
        float* dst = distance.ptr<float>(y);
        for (int x = 0; x < image.cols; ++x) {
            const float d0 = src[x][0] - c0;
            const float d1 = src[x][1] - c1;
            const float d2 = src[x][2] - c2;
            dst[x] = std::sqrt(d0 * d0 + d1 * d1 + d2 * d2);
        }
    }
    return distance;
}

// 255 where the color distance to the border mean is at or above the threshold
cv::Mat keyOut(const cv::Mat& image, const cv::Scalar& color, double threshold) {
    cv::Mat foreground;
    cv::compare(colorDistance(image, color), threshold, foreground, cv::CMP_GE);
    cv::medianBlur(foreground, foreground, MEDIAN_KERNEL);
    return foreground;
}

bool hasFace(const cv::Rect& faceBox) {
    return faceBox.width > 0 && faceBox.height > 0;
}

void checkImage(const cv::Mat& image) {
    if (image.empty() || image.type() != CV_8UC3) {
        throw std::invalid_argument("Segmentation expects a non-empty 8-bit 3-channel image");
    }
}

}  // namespace

BorderStats borderStats(const cv::Mat& image, int band) {
    const int rows = std::min(band, image.rows);
    const int cols = std::min(band, image.cols);
    const cv::Rect regions[] = {cv::Rect(0, 0, image.cols, rows),
                                cv::Rect(0, image.rows - rows, image.cols, rows),
                                cv::Rect(0, 0, cols, image.rows),
                                cv::Rect(image.cols - cols, 0, cols, image.rows)};

    // Corners belong to two bands and are counted twice
    cv::Vec3d sum(0, 0, 0), sumSq(0, 0, 0);
    double count = 0;
    for (const cv::Rect& region : regions) {
        for (int y = region.y; y < region.y + region.height; ++y) {
            const cv::Vec3b* row = image.ptr<cv::Vec3b>(y);
            for (int x = region.x; x < region.x + region.width; ++x) {
                for (int c = 0; c < 3; ++c) {
                    sum[c] += row[x][c];
                    sumSq[c] += static_cast<double>(row[x][c]) * row[x][c];
                }
            }
        }
        count += region.area();
    }

    BorderStats stats;
    for (int c = 0; c < 3; ++c) {
        const double mean = count > 0 ? sum[c] / count : 0.0;
        const double variance = count > 0 ? sumSq[c] / count - mean * mean : 0.0;
        stats.mean[c] = mean;
        stats.stddev[c] = std::sqrt(std::max(0.0, variance));
    }
    return stats;
}

double foregroundFraction(const cv::Mat& mask) {
    if (mask.empty()) {
        return 0.0;
    }
    return static_cast<double>(cv::countNonZero(mask)) / mask.total();
}

cv::Rect expandFaceBox(const cv::Rect& faceBox, const cv::Size& imageSize, double expandX, double expandY) {
    const int padX = static_cast<int>(faceBox.width * expandX);
    const int padY = static_cast<int>(faceBox.height * expandY);
    const int x0 = std::max(0, faceBox.x - padX);
    const int y0 = std::max(0, faceBox.y - padY);
    const int x1 = std::min(imageSize.width - 1, faceBox.x + faceBox.width + padX);
    const int y1 = std::min(imageSize.height - 1, faceBox.y + faceBox.height + padY);
    return cv::Rect(x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0));
}

ForegroundSegmenter* SegmenterHandle::get() {
    if (!segmenter && factory && !failed) {
        try {
            segmenter = factory();
        } catch (const std::exception& e) {
            slog::warn << "Segmentation model is unavailable: " << e.what() << slog::endl;
        }
        failed = !segmenter;
    }
    return segmenter.get();
}

void SegmenterHandle::reset() {
    segmenter.reset();
    failed = false;
}

bool BorderColorKeyStrategy::tryMask(const cv::Mat& image, const cv::Rect&, cv::Mat& mask) {
    const BorderStats stats = borderStats(image);
    const double meanStd = stats.meanStd();
    if (meanStd > 45.0) {
        return false;
    }

    cv::Mat candidates;
    const double threshold = std::max(10.0, tolerance) + 1.5 * meanStd;
    cv::compare(colorDistance(image, stats.mean), threshold, candidates, cv::CMP_LT);

    cv::Mat labels;
    const int labelsNum = cv::connectedComponents(candidates, labels, 8, CV_32S);
    if (labelsNum <= 1) {
        return false;
    }

    std::vector<uchar> touchesBorder(labelsNum, 0);
    const int lastRow = labels.rows - 1;
    const int lastCol = labels.cols - 1;
    for (int x = 0; x <= lastCol; ++x) {
        touchesBorder[labels.at<int>(0, x)] = 1;
        touchesBorder[labels.at<int>(lastRow, x)] = 1;
    }
    for (int y = 0; y <= lastRow; ++y) {
        touchesBorder[labels.at<int>(y, 0)] = 1;
        touchesBorder[labels.at<int>(y, lastCol)] = 1;
    }
    touchesBorder[0] = 0;  // label 0 is the non-candidate area
    if (std::find(touchesBorder.begin(), touchesBorder.end(), 1) == touchesBorder.end()) {
        return false;
    }

    mask.create(image.size(), CV_8UC1);
    for (int y = 0; y < labels.rows; ++y) {
        const int* label = labels.ptr<int>(y);
        uchar* dst = mask.ptr<uchar>(y);
        for (int x = 0; x < labels.cols; ++x) {
            dst[x] = touchesBorder[label[x]] ? 0 : 255;
        }
    }
    cv::medianBlur(mask, mask, MEDIAN_KERNEL);
    return true;
}

bool WhiteKeyStrategy::tryMask(const cv::Mat& image, const cv::Rect&, cv::Mat& mask) {
    const BorderStats stats = borderStats(image);
    const double minBrightness = 180.0 - std::max(0.0, tolerance - 25.0);
    if (stats.meanBrightness() < minBrightness || stats.meanStd() > 40.0) {
        return false;
    }
    mask = keyOut(image, stats.mean, std::max(10.0, tolerance));
    return true;
}

bool WhiteHeuristicStrategy::tryMask(const cv::Mat& image, const cv::Rect&, cv::Mat& mask) {
    cv::Mat hsv;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
    const int valueThreshold = static_cast<int>(std::max(180.0, 255.0 - tolerance * 1.5));
    const int saturationThreshold = static_cast<int>(std::min(60.0, std::max(20.0, tolerance)));

    mask.create(image.size(), CV_8UC1);
    for (int y = 0; y < hsv.rows; ++y) {
        const cv::Vec3b* src = hsv.ptr<cv::Vec3b>(y);
        uchar* dst = mask.ptr<uchar>(y);
        for (int x = 0; x < hsv.cols; ++x) {
            const bool background = src[x][2] > valueThreshold && src[x][1] < saturationThreshold;
            dst[x] = background ? 0 : 255;
        }
    }
    cv::medianBlur(mask, mask, MEDIAN_KERNEL);
    return true;
}

bool NeuralStrategy::tryMask(const cv::Mat& image, const cv::Rect&, cv::Mat& mask) {
    ForegroundSegmenter* model = segmenter.get();
    if (!model) {
        return false;
    }

    cv::Mat probabilities = model->segment(image);
    if (probabilities.empty()) {
        return false;
    }
    if (probabilities.type() != CV_32FC1) {
        probabilities.convertTo(probabilities, CV_32F);
    }
    if (probabilities.size() != image.size()) {
        cv::resize(probabilities, probabilities, image.size(), 0, 0, cv::INTER_LINEAR);
    }

    cv::Mat smoothed, candidate;
    cv::GaussianBlur(probabilities, smoothed, cv::Size(7, 7), 0);
    cv::compare(smoothed, threshold, candidate, cv::CMP_GT);
    cv::medianBlur(candidate, candidate, MEDIAN_KERNEL);

    const double fraction = foregroundFraction(candidate);
    if (fraction <= 0.02 || fraction >= 0.98) {
        slog::debug << "Neural mask rejected, foreground fraction " << fraction << slog::endl;
        return false;
    }
    mask = candidate;
    return true;
}

bool GraphCutStrategy::tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) {
    if (!hasFace(faceBox)) {
        return false;
    }
    const cv::Rect expanded = expandFaceBox(faceBox, image.size(), expandX, expandY);
    const int cx0 = std::max(0, faceBox.x + static_cast<int>(faceBox.width * 0.2));
    const int cy0 = std::max(0, faceBox.y + static_cast<int>(faceBox.height * 0.2));
    const int cx1 = std::min(image.cols - 1, faceBox.x + static_cast<int>(faceBox.width * 0.8));
    const int cy1 = std::min(image.rows - 1, faceBox.y + static_cast<int>(faceBox.height * 0.8));
    const cv::Rect core(cx0, cy0, std::max(0, cx1 - cx0), std::max(0, cy1 - cy0));

    cv::Mat trimap(image.size(), CV_8UC1, cv::Scalar(cv::GC_BGD));
    trimap(expanded).setTo(cv::GC_PR_FGD);
    trimap(core).setTo(cv::GC_FGD);

    cv::Mat bgdModel, fgdModel;
    cv::grabCut(image, trimap, cv::Rect(), bgdModel, fgdModel, 5, cv::GC_INIT_WITH_MASK);

    // GC_FGD and GC_PR_FGD are the odd labels
    cv::Mat foreground;
    cv::bitwise_and(trimap, cv::Scalar(1), foreground);
    foreground *= 255;
    cv::medianBlur(foreground, foreground, MEDIAN_KERNEL);

    if (core.area() > 0 && cv::mean(foreground(core))[0] < 128.0) {
        slog::debug << "Graph cut solution is inverted, flipping it" << slog::endl;
        cv::bitwise_not(foreground, foreground);
    }

    foreground(expanded).setTo(255);
    cv::dilate(foreground, foreground, cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(7, 7)));
    mask = foreground;
    return true;
}

bool BoundingBoxStrategy::tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) {
    if (!hasFace(faceBox)) {
        return false;
    }
    const cv::Rect expanded =
        expandFaceBox(faceBox, image.size(), std::max(0.1, expandX), std::max(0.2, expandY));
    mask = cv::Mat::zeros(image.size(), CV_8UC1);
    mask(expanded).setTo(255);
    return true;
}

bool SkinColorStrategy::tryMask(const cv::Mat& image, const cv::Rect&, cv::Mat& mask) {
    cv::Mat hsv, skin;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
    cv::inRange(hsv, cv::Scalar(0, 20, 70), cv::Scalar(20, 255, 255), skin);

    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(5, 5));
    cv::dilate(skin, skin, kernel, cv::Point(-1, -1), 2);
    cv::erode(skin, skin, kernel, cv::Point(-1, -1), 1);

    cv::compare(skin, 128, mask, cv::CMP_GT);
    return true;
}

SegmentationCascade::SegmentationCascade(const SegmentationOptions& options, SegmenterHandle* segmenter) {
    strategies.push_back(std::unique_ptr<MaskStrategy>(new BorderColorKeyStrategy(options.bgTolerance)));
    strategies.push_back(std::unique_ptr<MaskStrategy>(new WhiteKeyStrategy(options.bgTolerance)));
    if (options.preferWhiteKey) {
        strategies.push_back(std::unique_ptr<MaskStrategy>(new WhiteHeuristicStrategy(options.bgTolerance)));
    }
    if (segmenter) {
        strategies.push_back(std::unique_ptr<MaskStrategy>(new NeuralStrategy(*segmenter, options.threshold)));
    }
    strategies.push_back(std::unique_ptr<MaskStrategy>(new GraphCutStrategy(options.bboxExpandX, options.bboxExpandY)));
    strategies.push_back(std::unique_ptr<MaskStrategy>(new BoundingBoxStrategy(options.bboxExpandX, options.bboxExpandY)));
    strategies.push_back(std::unique_ptr<MaskStrategy>(new SkinColorStrategy()));
}

SegmentationCascade::SegmentationCascade(std::vector<std::unique_ptr<MaskStrategy>>&& strategies)
    : strategies(std::move(strategies)) {}

cv::Mat SegmentationCascade::mask(const cv::Mat& image, const cv::Rect& faceBox, std::string* strategyName) const {
    checkImage(image);
    const cv::Rect face = faceBox & cv::Rect(0, 0, image.cols, image.rows);

    for (const auto& strategy : strategies) {
        cv::Mat result;
        bool succeeded = false;
        try {
            succeeded = strategy->tryMask(image, face, result);
        } catch (const std::exception& e) {
            slog::warn << "Mask strategy '" << strategy->name() << "' failed: " << e.what() << slog::endl;
            continue;
        }
        if (succeeded && result.size() == image.size() && result.type() == CV_8UC1) {
            slog::debug << "Foreground mask by " << strategy->name() << ", foreground fraction "
                        << foregroundFraction(result) << slog::endl;
            if (strategyName) {
                *strategyName = strategy->name();
            }
            return result;
        }
    }

    slog::warn << "No mask strategy succeeded, the whole image is treated as background" << slog::endl;
    if (strategyName) {
        strategyName->clear();
    }
    return cv::Mat::zeros(image.size(), CV_8UC1);
}

}  // namespace idphoto
