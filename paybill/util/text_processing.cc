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

#include "paybill/util/text_processing.h"

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "paybill/util/strings.h"
#include "re2/re2.h"

namespace paybill {

void CollapseWhitespaceInPlace(std::string* input) {
  static const LazyRE2 whitespace = {R"(\s+)"};
  RE2::GlobalReplace(input, *whitespace, " ");
  absl::StripAsciiWhitespace(input);
}

std::string CollapseWhitespace(absl::string_view input) {
  std::string output(input);
  CollapseWhitespaceInPlace(&output);
  return output;
}

bool IsNumberToken(absl::string_view token) {
  static const LazyRE2 number = {R"(-?\d+\.?\d*)"};
  return RE2::FullMatch(ToStringPiece(token), *number);
}

std::vector<double> ExtractNumbers(absl::string_view text) {
  static const LazyRE2 number = {R"((-?\d+\.?\d*))"};
  std::vector<double> numbers;
  re2::StringPiece remainder = ToStringPiece(text);
  re2::StringPiece piece;
  while (RE2::FindAndConsume(&remainder, *number, &piece)) {
    absl::string_view number_text = ToStringView(piece);
    // "12." is a valid match but not a valid number for SimpleAtod.
    absl::ConsumeSuffix(&number_text, ".");
    double value = 0.0;
    CHECK(absl::SimpleAtod(number_text, &value))
        << "Not a number: " << number_text;
    numbers.push_back(value);
  }
  return numbers;
}

}  // namespace paybill
