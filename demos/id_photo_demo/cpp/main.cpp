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


#include <stdint.h>

#include <climits>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <openvino/openvino.hpp>

#include <idphoto/errors.h>
#include <idphoto/face_locator.h>
#include <idphoto/neural_capabilities.h>
#include <idphoto/photo_spec.h>
#include <idphoto/processor.h>
#include <idphoto/segmentation_cascade.h>
#include <idphoto/sheet_packer.h>
#include <utils/args_helper.hpp>
#include <utils/common.hpp>
#include <utils/config_factory.h>
#include <utils/slog.hpp>

static const char help_message[] = "Print a usage message.";
static const char input_message[] = "Required. Path to the source photo.";
static const char specs_message[] = "Optional. Path to the JSON catalog of photo specs.";
static const char country_message[] = "Required. Key of the photo spec in the catalog, e.g. US.";
static const char dpi_message[] = "Optional. Print resolution in dots per inch.";
static const char replace_bg_message[] = "Optional. Replace the background with the color of the photo spec.";
static const char layout_message[] = "Optional. Print sheet size in inches, e.g. 4x6 or 6x6.";
static const char copies_message[] = "Optional. Number of photos on the print sheet.";
static const char max_copies_message[] = "Optional. Fill every cell of the print sheet, -copies is ignored.";
static const char margin_message[] = "Optional. Sheet margin in inches.";
static const char spacing_message[] = "Optional. Spacing between photos on the sheet in inches.";
static const char no_guides_message[] = "Optional. Don't draw cut guides on the sheet.";
static const char output_message[] = "Optional. Output directory, created if missing.";
static const char cascade_message[] =
    "Optional. Path to a Haar cascade XML file for face detection. Used when -m_fd is not set.";
static const char face_model_message[] = "Optional. Path to an .xml file with a trained SSD face detection model.";
static const char landmarks_model_message[] =
    "Optional. Path to an .xml file with a trained facial landmarks model. Requires -m_fd.";
static const char segmentation_model_message[] =
    "Optional. Path to an .xml file with a trained person segmentation model.";
static const char target_device_message[] =
    "Optional. Specify the target device to infer on (the list of available devices is shown below). "
    "Default value is CPU. Use \"-d HETERO:<comma-separated_devices_list>\" format to specify HETERO plugin.";
static const char threshold_message[] = "Optional. Probability threshold of the segmentation mask.";
static const char bg_tolerance_message[] = "Optional. Color tolerance of background keying.";
static const char face_protect_message[] =
    "Optional. Size of the face region always kept in the foreground, fraction of the face box.";
static const char expand_x_message[] = "Optional. Horizontal padding of the face box, fraction of its width.";
static const char expand_y_message[] = "Optional. Vertical padding of the face box, fraction of its height.";
static const char seg_class_message[] =
    "Optional. Foreground class of the segmentation model, -1 for the last output channel.";
static const char reverse_input_channels_message[] = "Optional. Switch the input channels order from BGR to RGB.";
static const char mean_values_message[] =
    "Optional. Normalize input by subtracting the mean values per channel. Example: \"255.0 255.0 255.0\"";
static const char scale_values_message[] = "Optional. Divide input by scale values per channel. Division is applied "
                                           "after mean values subtraction. Example: \"255.0 255.0 255.0\"";
static const char verbose_message[] = "Optional. Print debug messages.";

DEFINE_bool(h, false, help_message);
DEFINE_string(i, "", input_message);
DEFINE_string(specs, "specs.json", specs_message);
DEFINE_string(country, "", country_message);
DEFINE_uint32(dpi, 300, dpi_message);
DEFINE_bool(replace_bg, false, replace_bg_message);
DEFINE_string(layout, "4x6", layout_message);
DEFINE_uint32(copies, 6, copies_message);
DEFINE_bool(max_copies, false, max_copies_message);
DEFINE_double(margin, 0.1, margin_message);
DEFINE_double(spacing, 0.1, spacing_message);
DEFINE_bool(no_guides, false, no_guides_message);
DEFINE_string(o, "output", output_message);
DEFINE_string(fd, "haarcascade_frontalface_default.xml", cascade_message);
DEFINE_string(m_fd, "", face_model_message);
DEFINE_string(m_lm, "", landmarks_model_message);
DEFINE_string(m_seg, "", segmentation_model_message);
DEFINE_string(d, "CPU", target_device_message);
DEFINE_double(t, 0.5, threshold_message);
DEFINE_double(bg_tolerance, 25.0, bg_tolerance_message);
DEFINE_double(face_protect, 0.4, face_protect_message);
DEFINE_double(expand_x, 0.4, expand_x_message);
DEFINE_double(expand_y, 0.6, expand_y_message);
DEFINE_int32(seg_class, -1, seg_class_message);
DEFINE_bool(reverse_input_channels, false, reverse_input_channels_message);
DEFINE_string(mean_values, "", mean_values_message);
DEFINE_string(scale_values, "", scale_values_message);
DEFINE_bool(v, false, verbose_message);

/**
 * \brief This function shows a help message
 */
static void showUsage() {
    std::cout << std::endl;
    std::cout << "id_photo_demo [OPTION]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << std::endl;
    std::cout << "    -h                        " << help_message << std::endl;
    std::cout << "    -i \"<path>\"               " << input_message << std::endl;
    std::cout << "    -specs \"<path>\"           " << specs_message << std::endl;
    std::cout << "    -country \"<key>\"          " << country_message << std::endl;
    std::cout << "    -dpi \"<integer>\"          " << dpi_message << std::endl;
    std::cout << "    -replace_bg               " << replace_bg_message << std::endl;
    std::cout << "    -layout \"<WxH>\"           " << layout_message << std::endl;
    std::cout << "    -copies \"<integer>\"       " << copies_message << std::endl;
    std::cout << "    -max_copies               " << max_copies_message << std::endl;
    std::cout << "    -margin \"<inches>\"        " << margin_message << std::endl;
    std::cout << "    -spacing \"<inches>\"       " << spacing_message << std::endl;
    std::cout << "    -no_guides                " << no_guides_message << std::endl;
    std::cout << "    -o \"<path>\"               " << output_message << std::endl;
    std::cout << "    -fd \"<path>\"              " << cascade_message << std::endl;
    std::cout << "    -m_fd \"<path>\"            " << face_model_message << std::endl;
    std::cout << "    -m_lm \"<path>\"            " << landmarks_model_message << std::endl;
    std::cout << "    -m_seg \"<path>\"           " << segmentation_model_message << std::endl;
    std::cout << "    -d \"<device>\"             " << target_device_message << std::endl;
    std::cout << "    -t \"<double>\"             " << threshold_message << std::endl;
    std::cout << "    -bg_tolerance \"<double>\"  " << bg_tolerance_message << std::endl;
    std::cout << "    -face_protect \"<double>\"  " << face_protect_message << std::endl;
    std::cout << "    -expand_x \"<double>\"      " << expand_x_message << std::endl;
    std::cout << "    -expand_y \"<double>\"      " << expand_y_message << std::endl;
    std::cout << "    -seg_class \"<integer>\"    " << seg_class_message << std::endl;
    std::cout << "    -reverse_input_channels   " << reverse_input_channels_message << std::endl;
    std::cout << "    -mean_values              " << mean_values_message << std::endl;
    std::cout << "    -scale_values             " << scale_values_message << std::endl;
    std::cout << "    -v                        " << verbose_message << std::endl;
}

bool ParseAndCheckCommandLine(int argc, char* argv[]) {
    // ---------------------------Parsing and validation of input args--------------------------------------
    gflags::ParseCommandLineNonHelpFlags(&argc, &argv, true);
    if (FLAGS_h) {
        showUsage();
        showAvailableDevices();
        return false;
    }

    if (FLAGS_i.empty()) {
        throw std::logic_error("Parameter -i is not set");
    }
    if (FLAGS_country.empty()) {
        throw std::logic_error("Parameter -country is not set");
    }
    if (FLAGS_dpi == 0) {
        throw std::logic_error("Parameter -dpi must be positive");
    }
    if (FLAGS_dpi > static_cast<uint32_t>(INT_MAX)) {
        throw std::logic_error("Parameter -dpi is too large");
    }
    if (!FLAGS_max_copies && FLAGS_copies == 0) {
        throw std::logic_error("Parameter -copies must be positive");
    }
    if (FLAGS_copies > static_cast<uint32_t>(INT_MAX)) {
        throw std::logic_error("Parameter -copies is too large");
    }
    if (FLAGS_margin < 0 || FLAGS_spacing < 0) {
        throw std::logic_error("Parameters -margin and -spacing can't be negative");
    }
    if (FLAGS_t <= 0 || FLAGS_t >= 1) {
        throw std::logic_error("Parameter -t must be in (0, 1)");
    }
    if (!FLAGS_m_lm.empty() && FLAGS_m_fd.empty()) {
        throw std::logic_error("Parameter -m_lm requires -m_fd");
    }
    if (FLAGS_m_fd.empty() && !fileExists(FLAGS_fd)) {
        throw std::logic_error("Face cascade " + FLAGS_fd + " doesn't exist, set -fd or -m_fd");
    }
    return true;
}

static std::string joinPath(const std::string& dir, const std::string& file) {
    if (dir.empty() || dir[dir.size() - 1] == '/') {
        return dir + file;
    }
    return dir + '/' + file;
}

static void writeJpeg(const std::string& path, const cv::Mat& image) {
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, 95};
    if (!cv::imwrite(path, image, params)) {
        throw std::runtime_error("Can't write " + path);
    }
    slog::info << "Saved " << path << slog::endl;
}

int main(int argc, char* argv[]) {
    try {
        // ------------------------------ Parsing and validation of input args ---------------------------------
        if (!ParseAndCheckCommandLine(argc, argv)) {
            return 0;
        }
        slog::enableDebug(FLAGS_v);

        const idphoto::SpecCatalog catalog = idphoto::SpecCatalog::load(FLAGS_specs);
        const idphoto::PhotoSpec& spec = catalog.at(FLAGS_country);
        const std::string country = toLower(FLAGS_country);
        const idphoto::LayoutSpec layout = idphoto::parseLayout(FLAGS_layout);

        //------------------------------- Preparing Input ------------------------------------------------------
        cv::Mat image = cv::imread(FLAGS_i, cv::IMREAD_COLOR);
        if (image.empty()) {
            throw idphoto::UnreadableImage(FLAGS_i);
        }
        slog::info << "Input " << FLAGS_i << ": " << image.cols << "x" << image.rows << slog::endl;

        //------------------------------ Loading capabilities -------------------------------------------------
        ov::Core core;
        const ModelConfig config = ConfigFactory::getMinLatencyConfig(FLAGS_d);
        if (!FLAGS_m_fd.empty() || !FLAGS_m_seg.empty()) {
            slog::info << ov::get_openvino_version() << slog::endl;
        }

        std::unique_ptr<idphoto::FaceDetector> detector;
        if (!FLAGS_m_fd.empty()) {
            detector.reset(new idphoto::OpenVINOFaceDetector(core, config, FLAGS_m_fd, FLAGS_m_lm));
        } else {
            detector.reset(new idphoto::CascadeFaceDetector(FLAGS_fd));
        }

        idphoto::SegmenterHandle segmenter;
        if (!FLAGS_m_seg.empty()) {
            segmenter = idphoto::SegmenterHandle([&core, &config]() {
                return std::unique_ptr<idphoto::ForegroundSegmenter>(
                    new idphoto::OpenVINOSegmenter(core,
                                                   config,
                                                   FLAGS_m_seg,
                                                   FLAGS_seg_class,
                                                   FLAGS_reverse_input_channels,
                                                   FLAGS_mean_values,
                                                   FLAGS_scale_values));
            });
        }

        //------------------------------ Processing -----------------------------------------------------------
        idphoto::ProcessOptions options;
        options.replaceBackground = FLAGS_replace_bg;
        options.segmentation.threshold = FLAGS_t;
        options.segmentation.bgTolerance = FLAGS_bg_tolerance;
        options.segmentation.faceProtect = FLAGS_face_protect;
        options.segmentation.bboxExpandX = FLAGS_expand_x;
        options.segmentation.bboxExpandY = FLAGS_expand_y;

        idphoto::IdPhotoProcessor processor(*detector, FLAGS_m_seg.empty() ? nullptr : &segmenter);
        const idphoto::ProcessedPhoto processed = processor.process(image, spec, static_cast<int>(FLAGS_dpi), options);

        idphoto::SheetOptions sheetOptions;
        sheetOptions.marginIn = FLAGS_margin;
        sheetOptions.spacingIn = FLAGS_spacing;
        sheetOptions.copies = static_cast<int>(FLAGS_copies);
        sheetOptions.drawGuides = !FLAGS_no_guides;
        sheetOptions.copyMode = FLAGS_max_copies ? idphoto::CopyMode::MAXIMIZE : idphoto::CopyMode::FIXED;
        const idphoto::PackResult packed = idphoto::packSheet(processed.photo, layout, static_cast<int>(FLAGS_dpi), sheetOptions);

        //------------------------------ Saving results -------------------------------------------------------
        makeDirectories(FLAGS_o);
        writeJpeg(joinPath(FLAGS_o, country + "_photo.jpg"), processed.photo);
        writeJpeg(joinPath(FLAGS_o,
                           country + "_sheet_" + std::to_string(static_cast<int>(layout.widthIn)) + "x" +
                               std::to_string(static_cast<int>(layout.heightIn)) + ".jpg"),
                  packed.sheet);
        slog::info << packed.placed << " copies on a " << packed.cols << "x" << packed.rows << " grid"
                   << (packed.rotated ? ", rotated" : "") << slog::endl;
    } catch (const std::exception& error) {
        slog::err << error.what() << slog::endl;
        return 1;
    }

    return 0;
}
