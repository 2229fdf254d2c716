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

#include "paybill/bill/document_classifier.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "glog/logging.h"
#include "paybill/util/strings.h"
#include "re2/re2.h"

namespace paybill {

absl::StatusOr<DocumentMeta> ClassifyDocument(absl::string_view document_text) {
  static const LazyRE2 kMonthRegex = {
      R"((?i)Month\s+of\s*:\s*([A-Za-z]+-\d{4}))"};
  static const LazyRE2 kBillNumberRegex = {R"((?i)Bill\s+No\.\s*:\s*(\S+))"};
  // The office name ends at "Bill No" or at the end of its line, whichever
  // comes first.
  static const LazyRE2 kOfficeRegex = {
      R"((?im)Name\s+of\s+Office\s*:\s*(.+?)(?:\s*Bill\s+No|$))"};

  DocumentMeta meta;
  const std::string lowercase_text = absl::AsciiStrToLower(document_text);
  if (absl::StrContains(lowercase_text, "earning side")) {
    meta.set_kind(EARNING_SIDE);
  } else if (absl::StrContains(lowercase_text, "deduction side")) {
    meta.set_kind(DEDUCTION_SIDE);
  } else {
    return absl::InvalidArgumentError(
        "Cannot detect the document kind: neither \"Earning Side\" nor "
        "\"Deduction Side\" found");
  }

  const re2::StringPiece text = ToStringPiece(document_text);
  std::string value;
  if (RE2::PartialMatch(text, *kMonthRegex, &value)) {
    meta.set_month(value);
  }
  if (RE2::PartialMatch(text, *kBillNumberRegex, &value)) {
    meta.set_bill_number(value);
  }
  if (RE2::PartialMatch(text, *kOfficeRegex, &value)) {
    absl::StripAsciiWhitespace(&value);
    if (!value.empty()) meta.set_office(value);
  }
  VLOG(1) << "Classified document: " << meta.ShortDebugString();
  return meta;
}

}  // namespace paybill
