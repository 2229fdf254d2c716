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

#include "paybill/bill/month_label.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"

namespace paybill {

namespace {

constexpr absl::string_view kMonthNames[] = {
    "january", "february", "march",     "april",   "may",      "june",
    "july",    "august",   "september", "october", "november", "december"};

}  // namespace

int GetMonthNumber(absl::string_view month_name) {
  const std::string lowercase = absl::AsciiStrToLower(month_name);
  for (int i = 0; i < 12; ++i) {
    if (kMonthNames[i] == lowercase) return i + 1;
  }
  return 0;
}

absl::StatusOr<std::string> MonthLabelToDate(absl::string_view month_label) {
  const std::vector<absl::string_view> parts =
      absl::StrSplit(month_label, '-');
  int year = 0;
  if (parts.size() != 2 || parts[1].size() != 4 ||
      !absl::SimpleAtoi(parts[1], &year)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Not a month label: '", month_label, "'"));
  }
  const int month = GetMonthNumber(parts[0]);
  if (month == 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown month name in '", month_label, "'"));
  }
  return absl::StrFormat("%04d-%02d-01", year, month);
}

}  // namespace paybill
