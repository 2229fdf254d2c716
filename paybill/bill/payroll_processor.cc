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

#include "paybill/bill/payroll_processor.h"

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "glog/logging.h"
#include "paybill/bill/cross_validator.h"
#include "paybill/bill/month_label.h"
#include "paybill/bill/record_merger.h"

namespace paybill {

namespace {

void Report(const PayrollProcessorOptions& options, absl::string_view phase,
            absl::string_view detail) {
  if (options.progress) options.progress(phase, detail);
}

// Copies the metadata of 'meta' that is not in 'metadata' yet.
void UpdateBatchMetadata(const DocumentMeta& meta, BatchMetadata* metadata) {
  if (!metadata->has_month() && meta.has_month()) {
    metadata->set_month(meta.month());
  }
  if (!metadata->has_bill_number() && meta.has_bill_number()) {
    metadata->set_bill_number(meta.bill_number());
  }
  if (!metadata->has_office() && meta.has_office()) {
    metadata->set_office(meta.office());
  }
}

}  // namespace

absl::StatusOr<PayrollBatch> ProcessPayroll(
    const std::vector<pdf::PdfDocument>& documents,
    const PayrollProcessorOptions& options) {
  if (documents.empty()) {
    return absl::InvalidArgumentError("No document to process");
  }

  PayrollBatch batch;
  BatchMetadata* const metadata = batch.mutable_metadata();
  std::vector<DocumentResult> results;
  std::vector<std::vector<NormalizedRecord>> earning_record_sets;
  std::vector<std::vector<NormalizedRecord>> deduction_record_sets;
  std::vector<std::string> document_errors;
  bool cancelled = false;
  for (const pdf::PdfDocument& document : documents) {
    if (options.is_cancelled && options.is_cancelled()) {
      LOG(WARNING) << "Processing cancelled before " << document.source_name();
      cancelled = true;
      break;
    }
    LOG(INFO) << "Processing " << document.source_name();
    DocumentSummary* const summary = metadata->add_documents();
    summary->set_source_name(document.source_name());

    absl::StatusOr<DocumentResult> result =
        ParseDocument(document, options.progress);
    if (!result.ok()) {
      LOG(WARNING) << "Failed to parse " << document.source_name() << ": "
                   << result.status();
      summary->set_error(std::string(result.status().message()));
      document_errors.push_back(absl::StrCat("Failed to parse ",
                                             document.source_name(), ": ",
                                             result.status().message()));
      Report(options, kErrorPhase, document_errors.back());
      continue;
    }

    const DocumentMeta& meta = result->meta();
    summary->set_kind(meta.kind());
    if (meta.has_month()) summary->set_month(meta.month());
    if (meta.has_bill_number()) summary->set_bill_number(meta.bill_number());
    summary->set_record_count(result->records_size());
    UpdateBatchMetadata(meta, metadata);

    std::vector<NormalizedRecord> records(result->records().begin(),
                                          result->records().end());
    if (meta.kind() == EARNING_SIDE) {
      earning_record_sets.push_back(std::move(records));
    } else {
      deduction_record_sets.push_back(std::move(records));
    }
    results.push_back(*std::move(result));
  }

  if (results.empty()) {
    if (cancelled) {
      return absl::CancelledError(
          "The processing was cancelled before any document was processed");
    }
    return absl::FailedPreconditionError(absl::StrCat(
        "None of the ", documents.size(), " documents could be processed"));
  }

  Report(options, kMergingPhase, "Merging the records by employee identifier");
  const std::vector<PayrollRecord> payroll =
      MergePayroll(CombineRecordSets(earning_record_sets),
                   CombineRecordSets(deduction_record_sets));

  Report(options, kValidationPhase, "Cross-validating the payroll");
  ValidationResult* const validation = batch.mutable_validation();
  *validation = ValidatePayroll(payroll, results);
  for (std::string& error : document_errors) {
    validation->add_errors(std::move(error));
  }
  for (const DocumentResult& result : results) {
    for (const std::string& diagnostic : result.diagnostics()) {
      validation->add_warnings(
          absl::StrCat(result.source_name(), ": ", diagnostic));
    }
  }
  validation->set_is_valid(validation->errors_size() == 0);

  for (const PayrollRecord& record : payroll) *batch.add_payroll() = record;
  metadata->set_processed_at(
      absl::FormatTime(absl::RFC3339_sec, absl::Now(), absl::UTCTimeZone()));
  if (metadata->has_month()) {
    const absl::StatusOr<std::string> month_date =
        MonthLabelToDate(metadata->month());
    if (month_date.ok()) {
      metadata->set_month_date(*month_date);
    } else {
      LOG(WARNING) << month_date.status();
    }
  }
  metadata->set_total_employees(batch.payroll_size());

  const std::string summary_text =
      absl::StrCat("Processed ", batch.payroll_size(), " employees");
  LOG(INFO) << summary_text;
  Report(options, kCompletePhase, summary_text);
  return batch;
}

}  // namespace paybill
