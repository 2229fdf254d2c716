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

#include "paybill/util/pdf/line_reconstructor.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>

#include "absl/strings/ascii.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"

namespace paybill {
namespace pdf {

namespace {

typedef std::vector<const PdfTextToken*> Tokens;

// Buckets sorted from the top of the page to the bottom.
typedef std::map<int, Tokens, std::greater<int>> TokensByBucket;

void FillLine(int bucket, const PdfPage& page, Tokens tokens,
              PdfTextLine* line) {
  std::stable_sort(tokens.begin(), tokens.end(),
                   [](const PdfTextToken* a, const PdfTextToken* b) {
                     return a->x() < b->x();
                   });
  line->set_y(bucket);
  line->set_page_number(page.number());
  std::vector<absl::string_view> pieces;
  pieces.reserve(tokens.size());
  for (const PdfTextToken* token : tokens) {
    *line->add_tokens() = *token;
    const absl::string_view text = absl::StripAsciiWhitespace(token->text());
    if (!text.empty()) pieces.push_back(text);
  }
  line->set_text(absl::StrJoin(pieces, " "));
}

}  // namespace

int GetLineBucket(const PdfTextToken& token) {
  return static_cast<int>(std::floor(token.y() + 0.5f));
}

void ReconstructLines(PdfPage* page) {
  CHECK(page != nullptr);
  TokensByBucket buckets;
  for (const PdfTextToken& token : page->tokens()) {
    buckets[GetLineBucket(token)].push_back(&token);
  }

  auto* const lines = page->mutable_lines();
  lines->Clear();
  for (auto& bucket_tokens : buckets) {
    FillLine(bucket_tokens.first, *page, std::move(bucket_tokens.second),
             lines->Add());
  }
  VLOG(1) << "Page " << page->number() << ": " << page->tokens_size()
          << " tokens in " << lines->size() << " lines";
}

void ReconstructLines(PdfDocument* document) {
  CHECK(document != nullptr);
  int page_index = 0;
  for (PdfPage& page : *document->mutable_pages()) {
    ++page_index;
    if (page.number() == 0) page.set_number(page_index);
    ReconstructLines(&page);
  }
}

std::vector<const PdfTextLine*> GetDocumentLines(const PdfDocument& document) {
  std::vector<const PdfTextLine*> lines;
  for (const PdfPage& page : document.pages()) {
    for (const PdfTextLine& line : page.lines()) lines.push_back(&line);
  }
  return lines;
}

std::string GetDocumentText(const PdfDocument& document) {
  std::vector<absl::string_view> texts;
  for (const PdfTextLine* line : GetDocumentLines(document)) {
    texts.push_back(line->text());
  }
  return absl::StrJoin(texts, "\n");
}

}  // namespace pdf
}  // namespace paybill
