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

#include "idphoto/errors.h"

#include <string>
#include <vector>

namespace idphoto {
namespace {

std::string describe(const std::string& key, const std::vector<std::string>& available) {
    std::string message = "Unknown country '" + key + "'. Available: ";
    for (size_t i = 0; i < available.size(); ++i) {
        message += (i == 0 ? "" : ", ") + available[i];
    }
    return message;
}

}  // namespace

UnknownSpecKey::UnknownSpecKey(const std::string& key, const std::vector<std::string>& available)
    : std::runtime_error(describe(key, available)),
      missingKey(key) {}

}  // namespace idphoto
