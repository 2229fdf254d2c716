// Copyright 2019 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PAYBILL_UTIL_TEXT_PROCESSING_H_
#define PAYBILL_UTIL_TEXT_PROCESSING_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace paybill {

// Replaces every run of whitespace with a single space and removes leading and
// trailing whitespace.
//
// eg. "  Dr.  Ramesh\t Patel " -> "Dr. Ramesh Patel"
std::string CollapseWhitespace(absl::string_view input);
void CollapseWhitespaceInPlace(std::string* input);

// Returns true if 'token' is a plain, optionally negative, decimal number such
// as "1200", "-15" or "42.50".
bool IsNumberToken(absl::string_view token);

// Returns all the number-like substrings of 'text' in order of appearance.
// Thousand separators are not recognized: "1,200" yields {1, 200}.
std::vector<double> ExtractNumbers(absl::string_view text);

}  // namespace paybill

#endif  // PAYBILL_UTIL_TEXT_PROCESSING_H_
