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


#ifndef PAYBILL_UTIL_STRINGS_H_
#define PAYBILL_UTIL_STRINGS_H_

#include "absl/strings/string_view.h"
#include "re2/stringpiece.h"

namespace paybill {

// Converts a string-like data type to absl::string_view.
template <typename StringType>
absl::string_view ToStringView(const StringType& text) {
  return absl::string_view(text.data(), text.size());
}

// Converts a string-like data type to re2::StringPiece.
template <typename StringType>
re2::StringPiece ToStringPiece(const StringType& text) {
  return {text.data(), text.size()};
}

}  // namespace paybill

#endif  // PAYBILL_UTIL_STRINGS_H_
