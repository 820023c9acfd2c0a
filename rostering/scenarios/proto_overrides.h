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

#ifndef ROSTERING_SCENARIOS_PROTO_OVERRIDES_H_
#define ROSTERING_SCENARIOS_PROTO_OVERRIDES_H_

#include <string>

#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace rostering {

// Merges a text format message, e.g. "num_entities: 4 max_work_subperiods: 6",
// on top of the current content of `message`. Fields absent from `text` keep
// their value. Returns InvalidArgument if the text does not parse, in which
// case `message` is left unchanged.
absl::Status MergeTextOverrides(const std::string& text,
                                google::protobuf::Message* message);

}  // namespace rostering

#endif  // ROSTERING_SCENARIOS_PROTO_OVERRIDES_H_
