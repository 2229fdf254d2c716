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


// Utilities for the month labels printed on payroll bills, e.g.
// "January-2026".

#ifndef PAYBILL_BILL_MONTH_LABEL_H_
#define PAYBILL_BILL_MONTH_LABEL_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace paybill {

// Returns the 1-based number of the given English month name, or 0 when the
// name is not a month. The comparison is case-insensitive.
int GetMonthNumber(absl::string_view month_name);

// Converts a month label of the form "<Month name>-<year>" into the ISO date
// of the first day of that month, e.g. "January-2026" -> "2026-01-01".
absl::StatusOr<std::string> MonthLabelToDate(absl::string_view month_label);

}  // namespace paybill

#endif  // PAYBILL_BILL_MONTH_LABEL_H_
