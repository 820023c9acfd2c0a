// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "rostering/scenarios/proto_overrides.h"

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace rostering {

absl::Status MergeTextOverrides(const std::string& text,
                                google::protobuf::Message* message) {
  if (text.empty()) return absl::OkStatus();
  std::unique_ptr<google::protobuf::Message> merged(message->New());
  merged->CopyFrom(*message);
  if (!google::protobuf::TextFormat::MergeFromString(text, merged.get())) {
    return absl::InvalidArgumentError(
        absl::StrCat("cannot parse '", text, "' as a ",
                     message->GetDescriptor()->full_name()));
  }
  message->GetReflection()->Swap(message, merged.get());
  return absl::OkStatus();
}

}  // namespace rostering
