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


// Detection of the column schema of a payroll bill from the column headers
// printed on its first page.
//
// Payroll bills print their column headers between the contact details of the
// office and the first employee. The header text varies from one bill to
// another (e.g. "DA" vs. "DA (0103)"), so every expected column has its own
// detector that looks for a keyword or a field code in the pool of header
// tokens. The columns that were found are then sorted by their horizontal
// position, which gives the order of the numeric values of each data row.

#ifndef PAYBILL_BILL_SCHEMA_DETECTOR_H_
#define PAYBILL_BILL_SCHEMA_DETECTOR_H_

#include <functional>
#include <string>
#include <vector>

#include "absl/flags/declare.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "paybill/proto/payroll.pb.h"
#include "paybill/proto/pdf/pdf_document.pb.h"
#include "re2/re2.h"

ABSL_DECLARE_FLAG(double, paybill_non_private_practice_fallback_x);

namespace paybill {

// A non-blank token of the header zone.
struct HeaderToken {
  std::string text;
  float x = 0.0f;
};

// The tokens of the header zone, in reading order.
class HeaderTokenPool {
 public:
  HeaderTokenPool() = default;
  explicit HeaderTokenPool(std::vector<HeaderToken> tokens);

  // Returns the first token whose text contains a match of 'regex', or
  // nullptr if there is no such token.
  const HeaderToken* Find(const RE2& regex) const;

  // Returns true if the space-separated text of all tokens contains a match of
  // 'regex'.
  bool TextContains(const RE2& regex) const;

  const std::vector<HeaderToken>& tokens() const { return tokens_; }
  const std::string& raw_text() const { return raw_text_; }
  bool empty() const { return tokens_.empty(); }

 private:
  std::vector<HeaderToken> tokens_;
  std::string raw_text_;
};

// Resolves the horizontal position of one column from the header tokens.
// Returns an empty optional when the column is not present in the bill.
using ColumnDetectorFunction =
    std::function<absl::optional<float>(const HeaderTokenPool&)>;

struct ColumnDetector {
  // The label of the column in the schema, e.g. "DA (0103)".
  std::string label;
  ColumnDetectorFunction detect;
};

// Returns the catalogue of the columns expected in a document of the given
// kind, in catalogue order. Returns an empty catalogue for an unspecified
// kind.
const std::vector<ColumnDetector>& GetColumnDetectors(DocumentKind kind);

// Collects the header tokens of the first page of a document. The header zone
// starts after the first contact line; other contact lines are skipped. It
// ends at the first line that starts like a data row or with an honorific.
// The positions of the tokens are rounded to the nearest integer. Returns an
// empty pool when the page has no contact line.
HeaderTokenPool GetHeaderTokenPool(const pdf::PdfPage& first_page);

// Detects the column schema of a document of the given kind from its first
// page. The page must have been processed by ReconstructLines. The schema is
// invalid and has no columns when the header zone is empty.
ColumnSchema DetectColumnSchema(const pdf::PdfPage& first_page,
                                DocumentKind kind);

// Same as above, for an already collected token pool.
ColumnSchema DetectColumnSchema(const HeaderTokenPool& pool,
                                DocumentKind kind);

}  // namespace paybill

#endif  // PAYBILL_BILL_SCHEMA_DETECTOR_H_
