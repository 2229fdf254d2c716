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


// Parsing of the employee blocks produced by the row segmenter.

#ifndef PAYBILL_BILL_BLOCK_PARSER_H_
#define PAYBILL_BILL_BLOCK_PARSER_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "paybill/bill/row_segmenter.h"
#include "paybill/proto/payroll.pb.h"

namespace paybill {

// Returns true if the whole (whitespace-trimmed) line is a pay scale, e.g.
// "PB-3 (15600-39100)/6600" or "37400-67000/8700".
bool IsPayScaleLine(absl::string_view text);

// Removes pay scale fragments from a line that also contains other text, e.g.
// "Patel 9300-34800/4200" -> "Patel".
std::string RemovePayScaleFragments(absl::string_view text);

// Extracts the name, the designation and the numeric values of one employee.
//
// The lines of the block other than the anchor line contribute to the name
// and the designation; pay scales are ignored. On the anchor line, the text
// between the identifier and the first numeric value is part of the name and
// may contain the designation. On earning-side documents, the numeric values
// start after the "No"/"Yes" flag followed by a single capital letter when the
// anchor line has one.
//
// Returns an InvalidArgument error when the anchor line has no numeric values.
absl::StatusOr<ParsedEmployee> ParseEmployeeBlock(const EmployeeBlock& block,
                                                  DocumentKind kind);

}  // namespace paybill

#endif  // PAYBILL_BILL_BLOCK_PARSER_H_
