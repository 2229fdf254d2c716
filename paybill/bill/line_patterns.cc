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

#include "paybill/bill/line_patterns.h"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "paybill/util/strings.h"
#include "re2/re2.h"

namespace paybill {

bool IsContactLine(absl::string_view text) {
  static const LazyRE2 kContactRegex = {"(?i)phone|mobile"};
  return RE2::PartialMatch(ToStringPiece(text), *kContactRegex);
}

bool IsNamePrefixLine(absl::string_view text) {
  static const LazyRE2 kNamePrefixRegex = {
      R"((?i)^(Mr\.|Mrs\.|Miss\.|Ms\.|Dr\.|Shri\.|Smt\.))"};
  return RE2::PartialMatch(ToStringPiece(absl::StripAsciiWhitespace(text)),
                           *kNamePrefixRegex);
}

bool StartsWithSerialAndIdentifier(absl::string_view text) {
  static const LazyRE2 kPrefixRegex = {R"(^\d+\s+\d{8})"};
  return RE2::PartialMatch(ToStringPiece(text), *kPrefixRegex);
}

bool IsAnchorLine(absl::string_view text) {
  static const LazyRE2 kAnchorRegex = {R"(^\d+\s+\d{8}\s)"};
  return RE2::PartialMatch(ToStringPiece(text), *kAnchorRegex);
}

bool ParseAnchorPrefix(absl::string_view text, int* serial_number,
                       std::string* employee_id) {
  static const LazyRE2 kAnchorRegex = {R"(^(\d+)\s+(\d{8})\s)"};
  re2::StringPiece serial_text;
  std::string identifier;
  if (!RE2::PartialMatch(ToStringPiece(text), *kAnchorRegex, &serial_text,
                         &identifier)) {
    return false;
  }
  int serial = 0;
  if (!absl::SimpleAtoi(ToStringView(serial_text), &serial)) return false;
  if (serial_number != nullptr) *serial_number = serial;
  if (employee_id != nullptr) *employee_id = std::move(identifier);
  return true;
}

bool IsTotalLine(absl::string_view text) {
  static const LazyRE2 kTotalRegex = {R"((?i)^total\b)"};
  return RE2::PartialMatch(ToStringPiece(absl::StripAsciiWhitespace(text)),
                           *kTotalRegex);
}

bool IsNoiseLine(absl::string_view text) {
  static const LazyRE2 kPortalRegex = {R"((?i)karmyogi|gujarat\.gov)"};
  static const LazyRE2 kCertificationRegex = {
      R"((?i)hereby certify|rupees\s*(\(|:)|superintendent|cardex\s*no|)"
      R"(date\s*:)"};
  static const LazyRE2 kBillMetadataRegex = {
      R"((?i)PAYBILL|INNER SHEET|D\.D\.O|Name\s+of\s+(Office|D\.D\.O|Ministry)|)"
      R"(Phone\s*no|Taluka|E-Mail|Address|Department|Major\s+Head|TAN\s+No|)"
      R"(Bill\s+No|Cardex\s+No)"};
  static const LazyRE2 kHospitalRegex = {R"((?i)^ESIS\s+General\s+Hospital)"};

  const absl::string_view trimmed = absl::StripAsciiWhitespace(text);
  if (trimmed.empty()) return true;
  if (IsTotalLine(trimmed)) return true;
  const re2::StringPiece piece = ToStringPiece(trimmed);
  return RE2::PartialMatch(piece, *kPortalRegex) ||
         RE2::PartialMatch(piece, *kCertificationRegex) ||
         RE2::PartialMatch(piece, *kBillMetadataRegex) ||
         RE2::PartialMatch(piece, *kHospitalRegex);
}

}  // namespace paybill
