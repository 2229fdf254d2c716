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


// Mapping of the column labels of a payroll bill to canonical field keys.
//
// The canonical keys are the stable names under which the amounts are stored
// downstream, e.g. "basic", "da", "incomeTax" or "netPay".

#ifndef PAYBILL_BILL_FIELD_NORMALIZER_H_
#define PAYBILL_BILL_FIELD_NORMALIZER_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "paybill/proto/payroll.pb.h"

namespace paybill {

// Canonical keys with a special meaning for the merger and the validator.
extern const char kGrossKey[];
extern const char kSloKey[];
extern const char kTotalDeductionsKey[];
extern const char kNetPayKey[];

// Returns the canonical field keys of the given category in the priority order
// of the normalization table.
std::vector<std::string> GetCanonicalFieldKeys(FieldCategory category);

// Derives a key from a label that matches none of the known patterns: the
// parenthesized parts are removed and the remaining words are joined in
// lower camel case, e.g. "Extra Duty (0150) allow" -> "extraDutyAllow".
// Returns "unknown" when no word remains.
std::string DeriveFieldKey(absl::string_view label);

// Maps a column label to its canonical key and category. The patterns of the
// normalization table are tried in order, and the first match wins. Labels
// that match no pattern get a derived key and FIELD_CATEGORY_UNKNOWN.
HeaderMapping NormalizeColumnLabel(absl::string_view label);

// Normalizes all columns of 'schema', in column order.
std::vector<HeaderMapping> NormalizeColumnSchema(const ColumnSchema& schema);

// Labels the values of 'employee' with the canonical keys of 'headers'. The
// values are assigned positionally; a column without a value gets 0. Values
// beyond the last column are kept only in 'raw_values'.
NormalizedRecord NormalizeEmployee(const ParsedEmployee& employee,
                                   const std::vector<HeaderMapping>& headers);

}  // namespace paybill

#endif  // PAYBILL_BILL_FIELD_NORMALIZER_H_
