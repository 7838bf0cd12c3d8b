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

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace idphoto {

struct SegmentationOptions {
    double threshold = 0.5;    ///< probability cutoff of the neural mask
    double bboxExpandX = 0.4;  ///< face box padding, fraction of the box width per side
    double bboxExpandY = 0.6;  ///< face box padding, fraction of the box height per side
    double bgTolerance = 25.0; ///< color distance tolerance of the keying strategies
    double faceProtect = 0.4;  ///< semi-axes of the protected face ellipse, fraction of the box size
    bool preferWhiteKey = false;
};

/// Mean and standard deviation per channel of a band along the four image edges
struct BorderStats {
    cv::Scalar mean;
    cv::Scalar stddev;

    double meanStd() const {
        return (stddev[0] + stddev[1] + stddev[2]) / 3.0;
    }
    double meanBrightness() const {
        return (mean[0] + mean[1] + mean[2]) / 3.0;
    }
};

BorderStats borderStats(const cv::Mat& image, int band = 5);

/// Fraction of non-zero pixels of a mask
double foregroundFraction(const cv::Mat& mask);

/// Face box padded by int(w * expandX) and int(h * expandY) on each side and clipped to the image,
/// with the right and bottom edges kept one pixel inside it
cv::Rect expandFaceBox(const cv::Rect& faceBox, const cv::Size& imageSize, double expandX, double expandY);

/// Opaque foreground segmentation capability.
/// segment() returns a CV_32FC1 foreground probability map with the size of the image.
class ForegroundSegmenter {
public:
    virtual ~ForegroundSegmenter() {}
    virtual cv::Mat segment(const cv::Mat& image) = 0;
};

/// Owner of a segmenter constructed on first use and reused afterwards.
/// Not reentrant: use one handle per worker or serialize the calls.
class SegmenterHandle {
public:
    typedef std::function<std::unique_ptr<ForegroundSegmenter>()> Factory;

    SegmenterHandle() {}
    explicit SegmenterHandle(Factory factory) : factory(factory) {}

    /// Builds the segmenter on the first call.
    /// @returns nullptr when there is no factory or the construction failed; a failure isn't retried until reset()
    ForegroundSegmenter* get();

    /// Destroys the segmenter, the next get() builds a new one
    void reset();

    bool isConstructed() const {
        return static_cast<bool>(segmenter);
    }

private:
    Factory factory;
    std::unique_ptr<ForegroundSegmenter> segmenter;
    bool failed = false;
};

/// One way of building a foreground mask.
/// faceBox is empty when no face is known.
/// On success mask is a CV_8UC1 image of the source size with values 0 or 255.
class MaskStrategy {
public:
    virtual ~MaskStrategy() {}
    virtual const char* name() const = 0;
    virtual bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) = 0;
};

/// Keys out the border color, keeping only candidate regions connected to the image edges
class BorderColorKeyStrategy : public MaskStrategy {
public:
    explicit BorderColorKeyStrategy(double tolerance) : tolerance(tolerance) {}
    const char* name() const override { return "border color key"; }
    bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) override;

private:
    double tolerance;
};

/// Keys out a bright uniform border color everywhere in the image
class WhiteKeyStrategy : public MaskStrategy {
public:
    explicit WhiteKeyStrategy(double tolerance) : tolerance(tolerance) {}
    const char* name() const override { return "white key"; }
    bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) override;

private:
    double tolerance;
};

/// Bright and weakly saturated pixels are background. Always succeeds.
class WhiteHeuristicStrategy : public MaskStrategy {
public:
    explicit WhiteHeuristicStrategy(double tolerance) : tolerance(tolerance) {}
    const char* name() const override { return "white heuristic"; }
    bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) override;

private:
    double tolerance;
};

/// Thresholded probability map of a ForegroundSegmenter.
/// Masks with a foreground fraction outside (0.02, 0.98) are rejected.
class NeuralStrategy : public MaskStrategy {
public:
    NeuralStrategy(SegmenterHandle& segmenter, double threshold) : segmenter(segmenter), threshold(threshold) {}
    const char* name() const override { return "neural segmentation"; }
    bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) override;

private:
    SegmenterHandle& segmenter;
    double threshold;
};

/// GrabCut seeded with a trimap around the face box
class GraphCutStrategy : public MaskStrategy {
public:
    GraphCutStrategy(double expandX, double expandY) : expandX(expandX), expandY(expandY) {}
    const char* name() const override { return "graph cut"; }
    bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) override;

private:
    double expandX;
    double expandY;
};

/// The padded face box itself
class BoundingBoxStrategy : public MaskStrategy {
public:
    BoundingBoxStrategy(double expandX, double expandY) : expandX(expandX), expandY(expandY) {}
    const char* name() const override { return "face box"; }
    bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) override;

private:
    double expandX;
    double expandY;
};

/// Skin hue range, closed by a dilation and an erosion. Always succeeds.
class SkinColorStrategy : public MaskStrategy {
public:
    const char* name() const override { return "skin color"; }
    bool tryMask(const cv::Mat& image, const cv::Rect& faceBox, cv::Mat& mask) override;
};

/// Ordered list of strategies, the first one that succeeds produces the mask.
class SegmentationCascade {
public:
    /// Standard order: border key, white key, white heuristic (only with preferWhiteKey),
    /// neural (only with a segmenter handle), graph cut, face box, skin color
    explicit SegmentationCascade(const SegmentationOptions& options = SegmentationOptions(),
                                 SegmenterHandle* segmenter = nullptr);
    explicit SegmentationCascade(std::vector<std::unique_ptr<MaskStrategy>>&& strategies);

    /// Never throws on a strategy failure: failing strategies are logged and skipped.
    /// @param strategyName if not null, receives the name of the strategy that produced the mask
    cv::Mat mask(const cv::Mat& image, const cv::Rect& faceBox = cv::Rect(), std::string* strategyName = nullptr) const;

private:
    std::vector<std::unique_ptr<MaskStrategy>> strategies;
};

}  // namespace idphoto
