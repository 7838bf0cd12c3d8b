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

#include "idphoto/sheet_packer.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <opencv2/imgproc.hpp>

#include <utils/slog.hpp>

namespace idphoto {
namespace {

const cv::Scalar SHEET_COLOR(255, 255, 255);
const cv::Scalar GUIDE_COLOR(200, 200, 200);
const cv::Scalar OUTLINE_COLOR(210, 210, 210);
const cv::Scalar CORNER_COLOR(180, 180, 180);
constexpr int CORNER_SIZE = 5;

int floorDiv(int a, int b) {
    int q = a / b;
    return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

// L-shaped tick on the outline ring of a photo corner, the arms run along the photo edges
void drawCornerTick(cv::Mat& sheet, const cv::Point& corner, int dx, int dy) {
    cv::line(sheet, corner, corner + cv::Point(dx * CORNER_SIZE, 0), CORNER_COLOR, 1);
    cv::line(sheet, corner, corner + cv::Point(0, dy * CORNER_SIZE), CORNER_COLOR, 1);
}

}  // namespace

GridFit fitGrid(const cv::Size& available, const cv::Size& cell, int spacing) {
    GridFit fit;
    fit.cols = std::max(1, floorDiv(available.width + spacing, cell.width + spacing));
    fit.rows = std::max(1, floorDiv(available.height + spacing, cell.height + spacing));
    return fit;
}

PackResult packSheet(const cv::Mat& photo, const LayoutSpec& layout, int dpi, const SheetOptions& options) {
    if (photo.empty()) {
        throw std::invalid_argument("packSheet got an empty photo");
    }
    if (dpi <= 0) {
        throw std::invalid_argument("DPI must be positive, got " + std::to_string(dpi));
    }
    if (options.copyMode == CopyMode::FIXED && options.copies < 0) {
        throw std::invalid_argument("Copy count can't be negative, got " + std::to_string(options.copies));
    }
    const int sheetW = cvRound(layout.widthIn * dpi);
    const int sheetH = cvRound(layout.heightIn * dpi);
    if (sheetW < 1 || sheetH < 1) {
        throw std::invalid_argument("Sheet layout is empty at " + std::to_string(dpi) + " DPI");
    }
    const int margin = std::max(0, cvRound(options.marginIn * dpi));
    const int spacing = std::max(0, cvRound(options.spacingIn * dpi));
    const cv::Size available(sheetW - 2 * margin, sheetH - 2 * margin);

    const GridFit original = fitGrid(available, photo.size(), spacing);
    const GridFit turned = fitGrid(available, cv::Size(photo.rows, photo.cols), spacing);

    PackResult result;
    result.rotated = turned.total() > original.total();
    cv::Mat cell;
    if (result.rotated) {
        cv::rotate(photo, cell, cv::ROTATE_90_COUNTERCLOCKWISE);
    } else {
        cell = photo;
    }
    const GridFit& grid = result.rotated ? turned : original;
    result.cols = grid.cols;
    result.rows = grid.rows;

    const int cellW = cell.cols;
    const int cellH = cell.rows;
    const int gridW = grid.cols * cellW + (grid.cols - 1) * spacing;
    const int gridH = grid.rows * cellH + (grid.rows - 1) * spacing;
    const int left = margin + floorDiv(available.width - gridW, 2);
    const int top = margin + floorDiv(available.height - gridH, 2);

    const int capacity = grid.total();
    const int wanted = options.copyMode == CopyMode::MAXIMIZE ? capacity : options.copies;
    result.placed = std::min(wanted, capacity);

    result.sheet = cv::Mat(sheetH, sheetW, CV_8UC3, SHEET_COLOR);
    cv::Mat& sheet = result.sheet;

    // Guides go first, the photos pasted afterwards cover whatever reaches into them
    if (options.drawGuides) {
        for (int col = 1; col < grid.cols; ++col) {
            const int x = left + col * (cellW + spacing) - spacing / 2;
            cv::line(sheet, cv::Point(x, top), cv::Point(x, top + gridH), GUIDE_COLOR, 1);
        }
        for (int row = 1; row < grid.rows; ++row) {
            const int y = top + row * (cellH + spacing) - spacing / 2;
            cv::line(sheet, cv::Point(left, y), cv::Point(left + gridW, y), GUIDE_COLOR, 1);
        }
        for (int i = 0; i < result.placed; ++i) {
            const int x = left + (i % grid.cols) * (cellW + spacing);
            const int y = top + (i / grid.cols) * (cellH + spacing);
            const cv::Point tl(x - 1, y - 1);
            const cv::Point br(x + cellW, y + cellH);
            cv::rectangle(sheet, tl, br, OUTLINE_COLOR, 1);
            drawCornerTick(sheet, tl, 1, 1);
            drawCornerTick(sheet, cv::Point(br.x, tl.y), -1, 1);
            drawCornerTick(sheet, cv::Point(tl.x, br.y), 1, -1);
            drawCornerTick(sheet, br, -1, -1);
        }
    }

    const cv::Rect sheetRect(0, 0, sheetW, sheetH);
    for (int i = 0; i < result.placed; ++i) {
        const cv::Rect target(left + (i % grid.cols) * (cellW + spacing),
                              top + (i / grid.cols) * (cellH + spacing),
                              cellW,
                              cellH);
        const cv::Rect visible = target & sheetRect;
        if (visible.area() == 0) {
            continue;
        }
        cell(visible - target.tl()).copyTo(sheet(visible));
    }

    slog::info << "Sheet " << sheetW << "x" << sheetH << ": " << grid.cols << "x" << grid.rows << " grid"
               << (result.rotated ? " of rotated photos" : "") << ", " << result.placed << " placed" << slog::endl;
    return result;
}

}  // namespace idphoto
