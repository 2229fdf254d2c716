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


// Consolidation of the records of several documents by employee identifier.

#ifndef PAYBILL_BILL_RECORD_MERGER_H_
#define PAYBILL_BILL_RECORD_MERGER_H_

#include <vector>

#include "paybill/proto/payroll.pb.h"

namespace paybill {

// Combines the record sets of several documents of the same kind. A record
// whose employee identifier was already seen is merged into the first record
// with that identifier: the longer name and the longer designation win, and
// the fields are united, the values of later records taking precedence. The
// records keep the order in which their identifiers were first seen.
std::vector<NormalizedRecord> CombineRecordSets(
    const std::vector<std::vector<NormalizedRecord>>& record_sets);

// Merges the combined earning-side and deduction-side records into one payroll
// record per employee identifier, sorted by identifier.
//
// The earning fields are copied as they are, and the "gross" field, when
// present, also gives the gross amount of the record. The deduction fields are
// copied except "totalDed" and "netPay", which give the total deductions and
// the net pay of the record.
std::vector<PayrollRecord> MergePayroll(
    const std::vector<NormalizedRecord>& earning_records,
    const std::vector<NormalizedRecord>& deduction_records);

}  // namespace paybill

#endif  // PAYBILL_BILL_RECORD_MERGER_H_
