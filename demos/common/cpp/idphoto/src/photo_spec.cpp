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

#include "idphoto/photo_spec.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <utils/args_helper.hpp>
#include <utils/slog.hpp>

#include "idphoto/errors.h"

namespace idphoto {
namespace {

constexpr double MM_PER_INCH = 25.4;

bool isNumber(const cv::FileNode& node) {
    return node.isInt() || node.isReal();
}

double readNumber(const cv::FileNode& spec, const std::string& key, const std::string& field) {
    const cv::FileNode node = spec[field];
    if (!isNumber(node)) {
        throw std::runtime_error("Spec '" + key + "' has no numeric field '" + field + "'");
    }
    return static_cast<double>(node);
}

// Inches win over millimeters when both are given
double readLength(const cv::FileNode& spec, const std::string& key, const std::string& dimension) {
    const cv::FileNode inches = spec["photo_" + dimension + "_in"];
    if (isNumber(inches)) {
        return static_cast<double>(inches);
    }
    const cv::FileNode millimeters = spec["photo_" + dimension + "_mm"];
    if (isNumber(millimeters)) {
        return static_cast<double>(millimeters) / MM_PER_INCH;
    }
    throw std::runtime_error("Spec '" + key + "' needs photo_" + dimension + "_in or photo_" + dimension + "_mm");
}

double readRatio(const cv::FileNode& spec, const std::string& key, const std::string& field) {
    double value = readNumber(spec, key, field);
    if (value <= 0.0 || value >= 1.0) {
        throw std::runtime_error("Spec '" + key + "': " + field + " must be in (0, 1), got " + std::to_string(value));
    }
    return value;
}

cv::Vec3b readColor(const cv::FileNode& spec, const std::string& key) {
    const cv::FileNode node = spec["background_rgb"];
    if (!node.isSeq() || node.size() != 3) {
        throw std::runtime_error("Spec '" + key + "': background_rgb must be a list of 3 integers");
    }
    cv::Vec3b color;
    int channel = 0;
    for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it, ++channel) {
        if (!isNumber(*it)) {
            throw std::runtime_error("Spec '" + key + "': background_rgb must be a list of 3 integers");
        }
        color[channel] = cv::saturate_cast<uchar>(static_cast<int>(*it));
    }
    return color;
}

}  // namespace

cv::Size outputSize(const PhotoSpec& spec, int dpi) {
    return cv::Size(cvRound(spec.widthIn * dpi), cvRound(spec.heightIn * dpi));
}

LayoutSpec parseLayout(const std::string& value) {
    const std::string lowered = toLower(value);
    const std::vector<std::string> sides = split(lowered, 'x');
    if (std::count(lowered.begin(), lowered.end(), 'x') != 1 || sides.size() != 2 || sides[0].empty() ||
        sides[1].empty()) {
        throw std::invalid_argument("layout must be like 4x6 or 6x6");
    }
    LayoutSpec layout;
    try {
        size_t widthEnd = 0, heightEnd = 0;
        layout.widthIn = std::stod(sides[0], &widthEnd);
        layout.heightIn = std::stod(sides[1], &heightEnd);
        if (widthEnd != sides[0].size() || heightEnd != sides[1].size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error&) {
        // std::stod reports both invalid_argument and out_of_range
        throw std::invalid_argument("layout must be like 4x6 or 6x6");
    }
    if (layout.widthIn <= 0.0 || layout.heightIn <= 0.0) {
        throw std::invalid_argument("layout must be like 4x6 or 6x6");
    }
    return layout;
}

SpecCatalog SpecCatalog::load(const std::string& path) {
    cv::FileStorage fs(path, cv::FileStorage::READ | cv::FileStorage::FORMAT_JSON);
    if (!fs.isOpened()) {
        throw std::runtime_error("Can't open the specs file: " + path);
    }
    return read(fs, path);
}

SpecCatalog SpecCatalog::parse(const std::string& json) {
    cv::FileStorage fs(json, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
    if (!fs.isOpened()) {
        throw std::runtime_error("Can't parse the specs document");
    }
    return read(fs, "<memory>");
}

SpecCatalog SpecCatalog::read(cv::FileStorage& fs, const std::string& source) {
    const cv::FileNode root = fs.root();
    if (!root.isMap()) {
        throw std::runtime_error("Specs document " + source + " must be a JSON object");
    }

    SpecCatalog catalog;
    for (cv::FileNodeIterator it = root.begin(); it != root.end(); ++it) {
        const cv::FileNode node = *it;
        const std::string key = node.name();
        if (!node.isMap()) {
            throw std::runtime_error("Spec '" + key + "' must be a JSON object");
        }

        PhotoSpec spec;
        const cv::FileNode name = node["name"];
        spec.name = name.isString() ? static_cast<std::string>(name) : key;
        spec.widthIn = readLength(node, key, "width");
        spec.heightIn = readLength(node, key, "height");
        if (spec.widthIn <= 0.0 || spec.heightIn <= 0.0) {
            throw std::runtime_error("Spec '" + key + "' must have a positive photo size");
        }
        spec.headHeightRatio = readRatio(node, key, "head_height_ratio");
        spec.eyeLineFromBottomRatio = readRatio(node, key, "eye_line_from_bottom_ratio");
        spec.backgroundRgb = readColor(node, key);

        catalog.add(key, spec);
    }

    slog::info << "Loaded " << catalog.size() << " photo specs from " << source << slog::endl;
    return catalog;
}

void SpecCatalog::add(const std::string& key, const PhotoSpec& spec) {
    auto it = std::find_if(entries.begin(), entries.end(), [&key](const std::pair<std::string, PhotoSpec>& entry) {
        return entry.first == key;
    });
    if (it != entries.end()) {
        it->second = spec;
    } else {
        entries.emplace_back(key, spec);
    }
}

const PhotoSpec& SpecCatalog::at(const std::string& key) const {
    for (const auto& entry : entries) {
        if (entry.first == key) {
            return entry.second;
        }
    }
    throw UnknownSpecKey(key, keys());
}

bool SpecCatalog::contains(const std::string& key) const {
    for (const auto& entry : entries) {
        if (entry.first == key) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> SpecCatalog::keys() const {
    std::vector<std::string> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace idphoto
