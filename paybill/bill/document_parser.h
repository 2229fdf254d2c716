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


// Parsing of a single payroll bill document, from the positioned text tokens
// to the normalized employee records.

#ifndef PAYBILL_BILL_DOCUMENT_PARSER_H_
#define PAYBILL_BILL_DOCUMENT_PARSER_H_

#include <functional>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "paybill/proto/payroll.pb.h"
#include "paybill/proto/pdf/pdf_document.pb.h"

namespace paybill {

// Receives the name of a processing phase and a human-readable detail, e.g.
// ("parsing", "Parsing 12 employee blocks from earning.pdf").
using ProgressCallback =
    std::function<void(absl::string_view phase, absl::string_view detail)>;

// Names of the processing phases reported to the progress callback.
extern const char kExtractionPhase[];
extern const char kClassificationPhase[];
extern const char kSchemaDetectionPhase[];
extern const char kSegmentationPhase[];
extern const char kParsingPhase[];
extern const char kMergingPhase[];
extern const char kValidationPhase[];
extern const char kCompletePhase[];
extern const char kErrorPhase[];

// Parses one document: reconstructs its lines, classifies it, detects its
// column schema from the first page, segments it into employee blocks and
// parses and normalizes every block. Blocks that can't be parsed are dropped
// and reported in the diagnostics of the result. Returns an error when the
// kind of the document can't be detected. 'progress' may be empty.
absl::StatusOr<DocumentResult> ParseDocument(const pdf::PdfDocument& document,
                                             const ProgressCallback& progress);

}  // namespace paybill

#endif  // PAYBILL_BILL_DOCUMENT_PARSER_H_
