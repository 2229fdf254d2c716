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

#ifndef PAYBILL_UTIL_PDF_LINE_RECONSTRUCTOR_H_
#define PAYBILL_UTIL_PDF_LINE_RECONSTRUCTOR_H_

#include <string>
#include <vector>

#include "paybill/proto/pdf/pdf_document.pb.h"

namespace paybill {
namespace pdf {

// Returns the vertical bucket of a token: its y coordinate rounded to the
// nearest integer, halves rounding up.
int GetLineBucket(const PdfTextToken& token);

// 'page' is passed in filled with 'tokens'. The function groups the tokens
// sharing the same vertical bucket into PdfTextLines and stores them in
// 'lines', top of the page first. Tokens of a line are sorted left to right.
//
// Every input token ends up in exactly one line, including whitespace-only
// tokens; those do not contribute to the text of the line. A page without
// tokens has no lines.
void ReconstructLines(PdfPage* page);

// Runs ReconstructLines on every page of the document. Pages without a number
// are numbered after their position in the document, starting at 1.
void ReconstructLines(PdfDocument* document);

// Returns the lines of all pages in reading order.
std::vector<const PdfTextLine*> GetDocumentLines(const PdfDocument& document);

// Returns the text of all lines of the document, one line per row.
std::string GetDocumentText(const PdfDocument& document);

}  // namespace pdf
}  // namespace paybill

#endif  // PAYBILL_UTIL_PDF_LINE_RECONSTRUCTOR_H_
