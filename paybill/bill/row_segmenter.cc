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

#include "paybill/bill/row_segmenter.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "paybill/bill/line_patterns.h"
#include "paybill/util/text_processing.h"

namespace paybill {

using ::paybill::pdf::PdfDocument;
using ::paybill::pdf::PdfPage;
using ::paybill::pdf::PdfTextLine;

namespace {

using Lines = google::protobuf::RepeatedPtrField<PdfTextLine>;

// Returns the index of the line where the employees of the page start: the
// first line that starts with an honorific or that is an anchor line.
int GetHeaderEnd(const Lines& lines) {
  for (int i = 0; i < lines.size(); ++i) {
    const std::string& text = lines.Get(i).text();
    if (IsNamePrefixLine(text) || IsAnchorLine(text)) return i;
  }
  return 0;
}

// Returns the index of the first line of the block of the employee whose
// anchor line is at 'anchor_index'. The lines in [region_start, anchor_index)
// are searched for the first line starting with an honorific. The first
// employee of a page also starts at the first line that is not noise.
int GetBlockStart(const Lines& lines, int region_start, int anchor_index,
                  bool first_on_page) {
  for (int i = region_start; i < anchor_index; ++i) {
    const std::string& text = lines.Get(i).text();
    if (IsNoiseLine(text)) continue;
    if (first_on_page || IsNamePrefixLine(text)) return i;
  }
  return anchor_index;
}

void SegmentPage(const PdfPage& page, RowSegmentation* segmentation) {
  const Lines& lines = page.lines();
  std::vector<int> anchor_indices;
  for (int i = 0; i < lines.size(); ++i) {
    const PdfTextLine& line = lines.Get(i);
    if (IsAnchorLine(line.text())) anchor_indices.push_back(i);
    if (IsTotalLine(line.text())) {
      TotalRow total_row;
      total_row.set_raw_text(line.text());
      total_row.set_page_number(page.number());
      for (const double value : ExtractNumbers(line.text())) {
        total_row.add_values(value);
      }
      segmentation->total_row = std::move(total_row);
    }
  }
  if (anchor_indices.empty()) return;

  const int header_end = GetHeaderEnd(lines);
  const int num_anchors = anchor_indices.size();
  for (int d = 0; d < num_anchors; ++d) {
    const int anchor_index = anchor_indices[d];
    const PdfTextLine& anchor = lines.Get(anchor_index);

    EmployeeBlock block;
    if (!ParseAnchorPrefix(anchor.text(), &block.serial_number,
                           &block.employee_id)) {
      const std::string diagnostic =
          absl::StrCat("Page ", page.number(),
                       ": could not parse the serial number and identifier of '",
                       anchor.text(), "'");
      LOG(WARNING) << diagnostic;
      segmentation->diagnostics.push_back(diagnostic);
      continue;
    }
    block.anchor = &anchor;
    block.page_number = page.number();

    const int region_start = d == 0 ? header_end : anchor_indices[d - 1] + 1;
    const int block_start =
        GetBlockStart(lines, region_start, anchor_index, d == 0);
    for (int i = block_start; i < anchor_index; ++i) {
      if (!IsNoiseLine(lines.Get(i).text())) {
        block.lines.push_back(&lines.Get(i));
      }
    }
    block.lines.push_back(&anchor);

    // Name continuations printed below the anchor line.
    const int next_boundary =
        d + 1 < num_anchors ? anchor_indices[d + 1] : lines.size();
    for (int i = anchor_index + 1; i < next_boundary; ++i) {
      const std::string& text = lines.Get(i).text();
      if (IsTotalLine(text)) break;
      if (IsNoiseLine(text)) continue;
      if (IsNamePrefixLine(text)) break;
      block.lines.push_back(&lines.Get(i));
    }
    VLOG(1) << "Employee " << block.employee_id << " on page "
            << block.page_number << ": " << block.lines.size() << " lines";
    segmentation->blocks.push_back(std::move(block));
  }
}

}  // namespace

RowSegmentation SegmentRows(const PdfDocument& document) {
  RowSegmentation segmentation;
  for (const PdfPage& page : document.pages()) {
    SegmentPage(page, &segmentation);
  }
  return segmentation;
}

}  // namespace paybill
