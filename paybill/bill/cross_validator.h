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


// Arithmetic and structural checks of the merged payroll.

#ifndef PAYBILL_BILL_CROSS_VALIDATOR_H_
#define PAYBILL_BILL_CROSS_VALIDATOR_H_

#include <string>
#include <vector>

#include "absl/flags/declare.h"
#include "paybill/proto/payroll.pb.h"

ABSL_DECLARE_FLAG(double, paybill_amount_tolerance);

namespace paybill {

// Checks one payroll record, and appends the problems found to 'errors' and
// 'warnings':
//  * a warning when the sum of the earning fields (without "gross" and "slo")
//    differs from a positive gross amount,
//  * an error when gross - total deductions differs from the net pay, if all
//    three are positive,
//  * an error when the employee identifier is not exactly 8 digits.
// Amounts are equal when they differ by at most 'tolerance'.
void ValidatePayrollRecord(const PayrollRecord& record, double tolerance,
                           std::vector<std::string>* errors,
                           std::vector<std::string>* warnings);

// Compares the total row of a document to the sums of its columns over the
// records of the document, and appends a warning to 'warnings' for each column
// whose total does not match. Documents without a total row, or whose total
// row does not have one value per column, are not checked.
void CheckColumnTotals(const DocumentResult& document, double tolerance,
                       std::vector<std::string>* warnings);

// Validates the merged payroll and the documents it was built from, and
// computes the summary of the payroll. Uses --paybill_amount_tolerance.
ValidationResult ValidatePayroll(const std::vector<PayrollRecord>& records,
                                 const std::vector<DocumentResult>& documents);

}  // namespace paybill

#endif  // PAYBILL_BILL_CROSS_VALIDATOR_H_
