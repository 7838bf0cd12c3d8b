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

#include <opencv2/core.hpp>

#include "idphoto/photo_spec.h"

namespace idphoto {

enum class CopyMode {
    FIXED,    ///< place min(copies, cols * rows) photos
    MAXIMIZE  ///< fill every cell of the grid
};

struct SheetOptions {
    double marginIn = 0.25;
    double spacingIn = 0.05;
    int copies = 6;
    bool drawGuides = true;
    CopyMode copyMode = CopyMode::FIXED;
};

struct PackResult {
    cv::Mat sheet;
    int cols = 0;
    int rows = 0;
    bool rotated = false;
    int placed = 0;
};

/// Grid of cells that fit into the available area, at least 1x1
struct GridFit {
    int cols = 0;
    int rows = 0;

    int total() const {
        return cols * rows;
    }
};

GridFit fitGrid(const cv::Size& available, const cv::Size& cell, int spacing);

/// Tiles copies of a photo on a white sheet of the layout size.
/// The photo is turned by 90 degrees only when that fits strictly more copies.
/// The grid is centered in the area inside the margins and filled row by row.
/// Cut guides are drawn outside the photos only: an outline around each photo,
/// lines through the gaps between cells and corner ticks.
/// Throws std::invalid_argument on an empty photo, a non-positive DPI or a negative FIXED copy count.
PackResult packSheet(const cv::Mat& photo, const LayoutSpec& layout, int dpi, const SheetOptions& options = SheetOptions());

}  // namespace idphoto
