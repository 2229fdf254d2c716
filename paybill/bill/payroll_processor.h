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


// The batch driver of the payroll extraction: parses a set of earning-side
// and deduction-side bills of one pay period and merges them into one
// validated payroll.

#ifndef PAYBILL_BILL_PAYROLL_PROCESSOR_H_
#define PAYBILL_BILL_PAYROLL_PROCESSOR_H_

#include <functional>
#include <vector>

#include "absl/status/statusor.h"
#include "paybill/bill/document_parser.h"
#include "paybill/proto/payroll.pb.h"
#include "paybill/proto/pdf/pdf_document.pb.h"

namespace paybill {

struct PayrollProcessorOptions {
  // Receives the progress of the processing. May be empty.
  ProgressCallback progress;

  // Checked before each document; the processing stops at the first document
  // for which it returns true. May be empty.
  std::function<bool()> is_cancelled;
};

// Processes a batch of documents. A document that can't be parsed is reported
// in the batch metadata and in the validation errors, and the other documents
// are processed normally. Returns an error only when no document could be
// processed: when 'documents' is empty, when all documents failed, or when the
// processing was cancelled before the first document.
absl::StatusOr<PayrollBatch> ProcessPayroll(
    const std::vector<pdf::PdfDocument>& documents,
    const PayrollProcessorOptions& options);

}  // namespace paybill

#endif  // PAYBILL_BILL_PAYROLL_PROCESSOR_H_
