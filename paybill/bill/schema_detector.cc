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

#include "paybill/bill/schema_detector.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "paybill/bill/line_patterns.h"
#include "paybill/util/strings.h"

ABSL_FLAG(double, paybill_non_private_practice_fallback_x, 500.0,
          "The horizontal position used for the non-private practice allowance "
          "column when the header text mentions it but no header token can be "
          "attributed to it.");

namespace paybill {

using ::paybill::pdf::PdfPage;
using ::paybill::pdf::PdfTextLine;
using ::paybill::pdf::PdfTextToken;

namespace {

// The regular expressions below are owned by the detector tables, which live
// until the end of the program.
const RE2* NewCaseInsensitiveRegex(absl::string_view pattern) {
  return new RE2(absl::StrCat("(?i)", pattern));
}

const RE2* NewLiteralRegex(absl::string_view literal) {
  return new RE2(RE2::QuoteMeta(ToStringPiece(literal)));
}

absl::optional<float> FindX(const HeaderTokenPool& pool, const RE2& regex) {
  const HeaderToken* const token = pool.Find(regex);
  if (token == nullptr) return absl::nullopt;
  return token->x;
}

// Returns the position of the first token matching the first regexp from
// 'regexes' that matches any token.
ColumnDetectorFunction FirstMatchDetector(std::vector<const RE2*> regexes) {
  return [regexes](const HeaderTokenPool& pool) -> absl::optional<float> {
    for (const RE2* const regex : regexes) {
      const absl::optional<float> x = FindX(pool, *regex);
      if (x.has_value()) return x;
    }
    return absl::nullopt;
  };
}

// Detects a column by a case-insensitive keyword or, when no token contains
// the keyword, by its field code.
ColumnDetectorFunction KeywordDetector(absl::string_view keyword,
                                       absl::string_view code = "") {
  std::vector<const RE2*> regexes = {NewCaseInsensitiveRegex(keyword)};
  if (!code.empty()) regexes.push_back(NewLiteralRegex(code));
  return FirstMatchDetector(std::move(regexes));
}

// Detects a column that is only printed in some bills. The column is present
// iff the header text matches 'presence'; it is then positioned at the first
// token containing 'keyword' or the field code.
ColumnDetectorFunction ConditionalDetector(absl::string_view presence,
                                           absl::string_view keyword,
                                           absl::string_view code) {
  const RE2* const presence_regex = NewCaseInsensitiveRegex(presence);
  const ColumnDetectorFunction position = KeywordDetector(keyword, code);
  return [presence_regex,
          position](const HeaderTokenPool& pool) -> absl::optional<float> {
    if (!pool.TextContains(*presence_regex)) return absl::nullopt;
    return position(pool);
  };
}

// "Special" and "Additional" are often printed as two separate tokens.
ColumnDetectorFunction SpecialAdditionalPayDetector() {
  const RE2* const special = NewCaseInsensitiveRegex("^Special$");
  const RE2* const additional = NewCaseInsensitiveRegex("^Additional$");
  const ColumnDetectorFunction fallback = KeywordDetector("Special");
  return [special, additional,
          fallback](const HeaderTokenPool& pool) -> absl::optional<float> {
    const absl::optional<float> special_x = FindX(pool, *special);
    const absl::optional<float> additional_x = FindX(pool, *additional);
    if (special_x.has_value() && additional_x.has_value()) {
      return std::min(*special_x, *additional_x);
    }
    return fallback(pool);
  };
}

// The non-private practice allowance header is frequently broken into pieces
// that can't be attributed to a single token. When the header text mentions
// the allowance but neither a matching token nor its code can be found, the
// column is placed at a fixed position.
ColumnDetectorFunction NonPrivatePracticeDetector() {
  const ColumnDetectorFunction by_token = FirstMatchDetector(
      {NewCaseInsensitiveRegex(R"(^Non\s*Private$)"),
       NewCaseInsensitiveRegex("Practice")});
  const RE2* const presence = NewCaseInsensitiveRegex(
      R"(Non\s*Private|Practice\s*Allow|\(0128\))");
  const RE2* const code = NewLiteralRegex("0128");
  return [by_token, presence,
          code](const HeaderTokenPool& pool) -> absl::optional<float> {
    const absl::optional<float> token_x = by_token(pool);
    if (token_x.has_value()) return token_x;
    if (!pool.TextContains(*presence)) return absl::nullopt;
    const absl::optional<float> code_x = FindX(pool, *code);
    if (code_x.has_value()) return code_x;
    return static_cast<float>(
        absl::GetFlag(FLAGS_paybill_non_private_practice_fallback_x));
  };
}

std::vector<ColumnDetector>* NewEarningDetectors() {
  return new std::vector<ColumnDetector>({
      {"Basic Pay", KeywordDetector("Basic")},
      {"DA (0103)", KeywordDetector("DA", "0103")},
      {"HRA (0110)", KeywordDetector("HRA", "0110")},
      {"CLA (0111)", KeywordDetector("CLA", "0111")},
      {"Med Allow", KeywordDetector("Med", "0107")},
      {"Trans Allow", KeywordDetector("Trans", "0113")},
      {"Special Additional Pay", SpecialAdditionalPayDetector()},
      {"Non Private Practice Allow", NonPrivatePracticeDetector()},
      {"Washing Allow", KeywordDetector("Washing", "0132")},
      {"Nursing Allow", KeywordDetector("Nursing", "0129")},
      {"Uniform Allow", KeywordDetector("Uniform", "0131")},
      {"Book Allow", KeywordDetector("Book", "0104")},
      {"ESIS Allow", KeywordDetector("ESIS", "0127")},
      {"Recovery of Pay",
       FirstMatchDetector({NewCaseInsensitiveRegex("^Recovery$"),
                           NewCaseInsensitiveRegex("Recovery")})},
      {"Gross Amt", KeywordDetector("Gross")},
      {"SLO", KeywordDetector("^SLO$")},
  });
}

std::vector<ColumnDetector>* NewDeductionDetectors() {
  return new std::vector<ColumnDetector>({
      {"Income Tax", KeywordDetector("Income", "9510")},
      {"Prof Tax", KeywordDetector("Prof", "9570")},
      {"R&B", KeywordDetector("R&B", "9550")},
      {"GPF Reg Class 4", KeywordDetector("Class", "9531")},
      {"GPF Reg", ConditionalDetector(R"(GPF\s*Reg|9670)", "GPF", "9670")},
      {"NPS Reg", KeywordDetector("NPS", "9534")},
      {"Govt Fund", ConditionalDetector(R"(Govt\s*Fund|9581)", "Fund", "9581")},
      {"Govt Saving",
       ConditionalDetector(R"(Govt\s*Saving|9582)", "Saving", "9582")},
      {"Total Ded", KeywordDetector(R"(Total\s*Ded)")},
      {"Net Pay", KeywordDetector(R"(Net\s*Pay)")},
  });
}

}  // namespace

HeaderTokenPool::HeaderTokenPool(std::vector<HeaderToken> tokens)
    : tokens_(std::move(tokens)),
      raw_text_(absl::StrJoin(tokens_, " ",
                              [](std::string* out, const HeaderToken& token) {
                                out->append(token.text);
                              })) {}

const HeaderToken* HeaderTokenPool::Find(const RE2& regex) const {
  for (const HeaderToken& token : tokens_) {
    if (RE2::PartialMatch(token.text, regex)) return &token;
  }
  return nullptr;
}

bool HeaderTokenPool::TextContains(const RE2& regex) const {
  return RE2::PartialMatch(raw_text_, regex);
}

const std::vector<ColumnDetector>& GetColumnDetectors(DocumentKind kind) {
  static const std::vector<ColumnDetector>* const kEarningDetectors =
      NewEarningDetectors();
  static const std::vector<ColumnDetector>* const kDeductionDetectors =
      NewDeductionDetectors();
  static const std::vector<ColumnDetector>* const kNoDetectors =
      new std::vector<ColumnDetector>();
  switch (kind) {
    case EARNING_SIDE:
      return *kEarningDetectors;
    case DEDUCTION_SIDE:
      return *kDeductionDetectors;
    default:
      return *kNoDetectors;
  }
}

HeaderTokenPool GetHeaderTokenPool(const PdfPage& first_page) {
  std::vector<HeaderToken> tokens;
  bool in_header_zone = false;
  for (const PdfTextLine& line : first_page.lines()) {
    if (IsContactLine(line.text())) {
      in_header_zone = true;
      continue;
    }
    if (!in_header_zone) continue;
    if (StartsWithSerialAndIdentifier(line.text()) ||
        IsNamePrefixLine(line.text())) {
      break;
    }
    for (const PdfTextToken& token : line.tokens()) {
      const absl::string_view text = absl::StripAsciiWhitespace(token.text());
      if (text.empty()) continue;
      // Positions are compared at the integer precision of the printed layout;
      // halves round up.
      tokens.push_back({std::string(text), std::floor(token.x() + 0.5f)});
    }
  }
  return HeaderTokenPool(std::move(tokens));
}

ColumnSchema DetectColumnSchema(const HeaderTokenPool& pool,
                                DocumentKind kind) {
  ColumnSchema schema;
  schema.set_raw_header_text(pool.raw_text());
  if (pool.empty()) {
    schema.set_is_valid(false);
    return schema;
  }

  std::vector<ColumnSchema::Column> columns;
  for (const ColumnDetector& detector : GetColumnDetectors(kind)) {
    const absl::optional<float> x = detector.detect(pool);
    if (!x.has_value()) {
      VLOG(1) << "Column not found: " << detector.label;
      continue;
    }
    VLOG(1) << "Column '" << detector.label << "' at x = " << *x;
    ColumnSchema::Column column;
    column.set_label(detector.label);
    column.set_x(*x);
    columns.push_back(std::move(column));
  }
  std::stable_sort(
      columns.begin(), columns.end(),
      [](const ColumnSchema::Column& a, const ColumnSchema::Column& b) {
        return a.x() < b.x();
      });
  for (ColumnSchema::Column& column : columns) {
    *schema.add_columns() = std::move(column);
  }
  schema.set_is_valid(schema.columns_size() > 0);
  return schema;
}

ColumnSchema DetectColumnSchema(const PdfPage& first_page, DocumentKind kind) {
  return DetectColumnSchema(GetHeaderTokenPool(first_page), kind);
}

}  // namespace paybill
