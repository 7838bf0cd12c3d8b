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

const char CATALOG[] = R"({
    "US": {
        "name": "United States",
        "photo_width_in": 2,
        "photo_height_in": 2,
        "head_height_ratio": 0.6,
        "eye_line_from_bottom_ratio": 0.625,
        "background_rgb": [255, 255, 255]
    },
    "UK": {
        "name": "United Kingdom",
        "photo_width_mm": 35,
        "photo_height_mm": 45,
        "head_height_ratio": 0.7,
        "eye_line_from_bottom_ratio": 0.6,
        "background_rgb": [10, 20, 30]
    },
    "XX": {
        "photo_width_in": 1.5,
        "photo_width_mm": 100,
        "photo_height_in": 2,
        "head_height_ratio": 0.5,
        "eye_line_from_bottom_ratio": 0.5,
        "background_rgb": [0, 0, 0]
    }
})";

TEST(SpecCatalog, readsInchesAndMillimeters)
{
    const SpecCatalog catalog = SpecCatalog::parse(CATALOG);
    ASSERT_EQ(catalog.size(), 3u);

    const PhotoSpec& us = catalog.at("US");
    ASSERT_EQ(us.name, "United States");
    ASSERT_DOUBLE_EQ(us.widthIn, 2.0);
    ASSERT_DOUBLE_EQ(us.eyeLineFromBottomRatio, 0.625);

    const PhotoSpec& uk = catalog.at("UK");
    ASSERT_NEAR(uk.widthIn, 35 / 25.4, 1e-12);
    ASSERT_NEAR(uk.heightIn, 45 / 25.4, 1e-12);
    ASSERT_EQ(outputSize(uk, 300), cv::Size(413, 531));
    ASSERT_DOUBLE_EQ(uk.headHeightRatio, 0.7);
}

TEST(SpecCatalog, inchesWinOverMillimeters)
{
    const PhotoSpec& spec = SpecCatalog::parse(CATALOG).at("XX");
    ASSERT_DOUBLE_EQ(spec.widthIn, 1.5);
    ASSERT_EQ(spec.name, "XX");
}

TEST(SpecCatalog, backgroundChannelOrder)
{
    const PhotoSpec& uk = SpecCatalog::parse(CATALOG).at("UK");
    ASSERT_EQ(uk.backgroundRgb, cv::Vec3b(10, 20, 30));
    ASSERT_EQ(uk.backgroundBgr(), cv::Scalar(30, 20, 10));
}

TEST(SpecCatalog, unknownKey)
{
    const SpecCatalog catalog = SpecCatalog::parse(CATALOG);
    ASSERT_FALSE(catalog.contains("FR"));
    ASSERT_EQ(catalog.keys(), std::vector<std::string>({"US", "UK", "XX"}));

    try {
        catalog.at("FR");
        FAIL() << "UnknownSpecKey expected";
    } catch (const UnknownSpecKey& e) {
        ASSERT_EQ(e.key(), "FR");
        ASSERT_EQ(std::string(e.what()), "Unknown country 'FR'. Available: US, UK, XX");
    }
}

TEST(SpecCatalog, rejectsInvalidSpecs)
{
    ASSERT_THROW(SpecCatalog::parse(R"({"A": {"photo_width_in": 2, "head_height_ratio": 0.5,
        "eye_line_from_bottom_ratio": 0.5, "background_rgb": [0, 0, 0]}})"),
                 std::runtime_error);
    ASSERT_THROW(SpecCatalog::parse(R"({"A": {"photo_width_in": 2, "photo_height_in": 2, "head_height_ratio": 1.5,
        "eye_line_from_bottom_ratio": 0.5, "background_rgb": [0, 0, 0]}})"),
                 std::runtime_error);
    ASSERT_THROW(SpecCatalog::parse(R"({"A": {"photo_width_in": 2, "photo_height_in": 2, "head_height_ratio": 0.5,
        "eye_line_from_bottom_ratio": 0.5, "background_rgb": [0, 0]}})"),
                 std::runtime_error);
}

TEST(SpecCatalog, addReplacesExisting)
{
    SpecCatalog catalog;
    PhotoSpec spec;
    spec.name = "first";
    catalog.add("A", spec);
    spec.name = "second";
    catalog.add("A", spec);

    ASSERT_EQ(catalog.size(), 1u);
    ASSERT_EQ(catalog.at("A").name, "second");
}

TEST(ParseLayout, validLayouts)
{
    LayoutSpec layout = parseLayout("4x6");
    ASSERT_DOUBLE_EQ(layout.widthIn, 4.0);
    ASSERT_DOUBLE_EQ(layout.heightIn, 6.0);

    layout = parseLayout("8.5X11");
    ASSERT_DOUBLE_EQ(layout.widthIn, 8.5);
    ASSERT_DOUBLE_EQ(layout.heightIn, 11.0);
}

TEST(ParseLayout, invalidLayouts)
{
    for (const char* value : {"", "4", "4x", "x6", "4x6x", "4x6x8", "ax6", "4xb", "0x6", "-4x6", "4 x6"}) {
        ASSERT_THROW(parseLayout(value), std::invalid_argument) << value;
    }
}

}}  // namespace idphoto_test
