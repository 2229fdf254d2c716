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


// Segmentation of the lines of a payroll bill into per-employee blocks.
//
// Each employee has exactly one anchor line: the line that starts with the
// serial number and the employee identifier, and that carries the numeric
// values. The name of the employee usually starts on a line above the anchor
// line (with an honorific such as "Dr.") and may continue below it, and the
// pay scale is printed on separate lines around it. A block collects all these
// lines and leaves out the boilerplate of the bill.

#ifndef PAYBILL_BILL_ROW_SEGMENTER_H_
#define PAYBILL_BILL_ROW_SEGMENTER_H_

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "paybill/proto/payroll.pb.h"
#include "paybill/proto/pdf/pdf_document.pb.h"

namespace paybill {

// The lines of one employee. The pointers point into the PdfDocument passed to
// SegmentRows; the block must not outlive it.
struct EmployeeBlock {
  int serial_number = 0;
  std::string employee_id;
  // The lines of the block in reading order, the anchor line included.
  std::vector<const pdf::PdfTextLine*> lines;
  const pdf::PdfTextLine* anchor = nullptr;
  int page_number = 0;
};

struct RowSegmentation {
  std::vector<EmployeeBlock> blocks;
  // The last line of the document that starts with "total", if any.
  absl::optional<TotalRow> total_row;
  // Anchor lines that were dropped and why.
  std::vector<std::string> diagnostics;
};

// Segments the lines of 'document' into employee blocks. The document must
// have been processed by ReconstructLines. Blocks never span two pages, and
// the blocks of two consecutive employees never share a line.
RowSegmentation SegmentRows(const pdf::PdfDocument& document);

}  // namespace paybill

#endif  // PAYBILL_BILL_ROW_SEGMENTER_H_
