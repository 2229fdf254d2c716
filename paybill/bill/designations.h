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


// The job titles printed on payroll bills.

#ifndef PAYBILL_BILL_DESIGNATIONS_H_
#define PAYBILL_BILL_DESIGNATIONS_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace paybill {

// Returns the known designations, longest first. Designations of the same
// length keep their relative order.
const std::vector<std::string>& GetDesignations();

// A designation found in a line of text. The string views point into the text
// passed to FindDesignation.
struct DesignationMatch {
  // The designation as it is printed in the text.
  absl::string_view designation;
  // The text before the designation.
  absl::string_view before;
};

// Finds the longest known designation contained in 'text'. The search is
// case-insensitive. Returns an empty optional if the text contains no known
// designation.
absl::optional<DesignationMatch> FindDesignation(absl::string_view text);

}  // namespace paybill

#endif  // PAYBILL_BILL_DESIGNATIONS_H_
