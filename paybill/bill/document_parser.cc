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

#include "paybill/bill/document_parser.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "paybill/bill/block_parser.h"
#include "paybill/bill/document_classifier.h"
#include "paybill/bill/field_normalizer.h"
#include "paybill/bill/row_segmenter.h"
#include "paybill/bill/schema_detector.h"
#include "paybill/util/pdf/line_reconstructor.h"
#include "paybill/util/status_util.h"

namespace paybill {

const char kExtractionPhase[] = "extraction";
const char kClassificationPhase[] = "classification";
const char kSchemaDetectionPhase[] = "schema-detection";
const char kSegmentationPhase[] = "segmentation";
const char kParsingPhase[] = "parsing";
const char kMergingPhase[] = "merging";
const char kValidationPhase[] = "validation";
const char kCompletePhase[] = "complete";
const char kErrorPhase[] = "error";

namespace {

void Report(const ProgressCallback& progress, absl::string_view phase,
            absl::string_view detail) {
  if (progress) progress(phase, detail);
}

}  // namespace

absl::StatusOr<DocumentResult> ParseDocument(const pdf::PdfDocument& document,
                                             const ProgressCallback& progress) {
  const std::string& source_name = document.source_name();
  DocumentResult result;
  result.set_source_name(source_name);

  Report(progress, kExtractionPhase,
         absl::StrCat("Reconstructing the lines of ", source_name));
  pdf::PdfDocument with_lines = document;
  pdf::ReconstructLines(&with_lines);

  Report(progress, kClassificationPhase,
         absl::StrCat("Detecting the kind of ", source_name));
  const absl::StatusOr<DocumentMeta> meta =
      ClassifyDocument(pdf::GetDocumentText(with_lines));
  if (!meta.ok()) {
    return AnnotateStatus(meta.status(), absl::StrCat("in ", source_name));
  }
  *result.mutable_meta() = *meta;
  const DocumentKind kind = meta->kind();

  Report(progress, kSchemaDetectionPhase,
         absl::StrCat("Detecting the columns (", DocumentKind_Name(kind),
                      ") of ", source_name));
  if (with_lines.pages_size() > 0) {
    *result.mutable_schema() = DetectColumnSchema(with_lines.pages(0), kind);
  }
  if (!result.schema().is_valid()) {
    LOG(WARNING) << source_name
                 << ": no column header found, the values stay unlabeled";
  }
  const std::vector<HeaderMapping> headers =
      NormalizeColumnSchema(result.schema());
  for (const HeaderMapping& header : headers) *result.add_headers() = header;

  Report(progress, kSegmentationPhase,
         absl::StrCat("Segmenting the employee rows of ", source_name));
  RowSegmentation segmentation = SegmentRows(with_lines);
  if (segmentation.total_row.has_value()) {
    *result.mutable_total_row() = *segmentation.total_row;
  }
  for (std::string& diagnostic : segmentation.diagnostics) {
    result.add_diagnostics(std::move(diagnostic));
  }

  Report(progress, kParsingPhase,
         absl::StrCat("Parsing ", segmentation.blocks.size(),
                      " employee blocks from ", source_name));
  for (const EmployeeBlock& block : segmentation.blocks) {
    const absl::StatusOr<ParsedEmployee> employee =
        ParseEmployeeBlock(block, kind);
    if (!employee.ok()) {
      LOG(WARNING) << source_name << ": dropped block: " << employee.status();
      result.add_diagnostics(std::string(employee.status().message()));
      continue;
    }
    *result.add_records() = NormalizeEmployee(*employee, headers);
  }
  LOG(INFO) << source_name << ": " << DocumentKind_Name(kind) << ", "
            << result.schema().columns_size() << " columns, "
            << result.records_size() << " records";
  return result;
}

}  // namespace paybill
