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


// Detection of the kind of a payroll bill document and of the bill metadata
// printed in its heading.

#ifndef PAYBILL_BILL_DOCUMENT_CLASSIFIER_H_
#define PAYBILL_BILL_DOCUMENT_CLASSIFIER_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "paybill/proto/payroll.pb.h"

namespace paybill {

// Classifies a document from its full text (the newline-separated text of all
// its lines). The document is an earning-side document when the text contains
// "earning side", and a deduction-side document when it contains "deduction
// side"; both checks are case-insensitive and the earning side wins when both
// are present. Returns an InvalidArgument error when neither marker is found.
//
// The month, the bill number and the name of the office are extracted on a
// best-effort basis, and they are left unset when they are not found.
absl::StatusOr<DocumentMeta> ClassifyDocument(absl::string_view document_text);

}  // namespace paybill

#endif  // PAYBILL_BILL_DOCUMENT_CLASSIFIER_H_
