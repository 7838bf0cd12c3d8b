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

#include <stdexcept>
#include <string>
#include <vector>

namespace idphoto {

/// No face was found, not even by the relaxed detection pass. Nothing can be cropped without an anchor.
class NoFaceDetected : public std::runtime_error {
public:
    NoFaceDetected() : std::runtime_error("No face detected. Please use a clearer, front-facing photo.") {}
};

class UnknownSpecKey : public std::runtime_error {
public:
    UnknownSpecKey(const std::string& key, const std::vector<std::string>& available);

    const std::string& key() const {
        return missingKey;
    }

private:
    std::string missingKey;
};

/// Input bytes could not be decoded into an image. Raised by callers before the core is invoked.
class UnreadableImage : public std::runtime_error {
public:
    explicit UnreadableImage(const std::string& path) : std::runtime_error("Could not read input image: " + path) {}
};

}  // namespace idphoto
