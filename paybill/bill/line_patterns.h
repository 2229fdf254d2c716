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


// Predicates over the text of reconstructed lines of a payroll bill. They are
// shared by the schema detector and the row segmenter.

#ifndef PAYBILL_BILL_LINE_PATTERNS_H_
#define PAYBILL_BILL_LINE_PATTERNS_H_

#include <string>

#include "absl/strings/string_view.h"

namespace paybill {

// Returns true if the line contains the phone/mobile contact details that
// precede the column headers on the first page.
bool IsContactLine(absl::string_view text);

// Returns true if the (whitespace-trimmed) line starts with an honorific such
// as "Mr." or "Dr.", i.e. the first line of an employee name.
bool IsNamePrefixLine(absl::string_view text);

// Returns true if the line starts with a serial number followed by an 8-digit
// employee identifier. IsAnchorLine additionally requires a whitespace
// character after the identifier.
bool StartsWithSerialAndIdentifier(absl::string_view text);
bool IsAnchorLine(absl::string_view text);

// Parses the serial number and the employee identifier of an anchor line.
// Returns false if the line is not an anchor line or if the serial number
// does not fit in an int.
bool ParseAnchorPrefix(absl::string_view text, int* serial_number,
                       std::string* employee_id);

// Returns true if the (whitespace-trimmed) line starts with the word "total".
bool IsTotalLine(absl::string_view text);

// Returns true if the line carries no employee data: empty lines, portal
// footers, the total row, certification text and bill metadata.
bool IsNoiseLine(absl::string_view text);

}  // namespace paybill

#endif  // PAYBILL_BILL_LINE_PATTERNS_H_
