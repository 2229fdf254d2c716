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

#include "paybill/bill/block_parser.h"

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/types/optional.h"
#include "glog/logging.h"
#include "paybill/bill/designations.h"
#include "paybill/util/strings.h"
#include "paybill/util/text_processing.h"
#include "re2/re2.h"

namespace paybill {

using ::paybill::pdf::PdfTextLine;

namespace {

// Returns the index of the first numeric value on the anchor line of an
// earning-side document, i.e. the index after the "No"/"Yes" flag and the
// letter that follows it. Returns -1 when there is no such flag.
int FindEarningFlagBoundary(const std::vector<absl::string_view>& tokens,
                            int* text_end) {
  static const LazyRE2 kFlagLetterRegex = {"[A-Z]"};
  const int num_tokens = tokens.size();
  for (int i = 0; i + 1 < num_tokens; ++i) {
    if ((tokens[i] == "No" || tokens[i] == "Yes") &&
        RE2::FullMatch(ToStringPiece(tokens[i + 1]), *kFlagLetterRegex)) {
      *text_end = i;
      return i + 2;
    }
  }
  return -1;
}

// Returns the index of the first numeric token. A number that follows the
// word "class" is part of a designation such as "Class 4", not a value.
int FindFirstNumber(const std::vector<absl::string_view>& tokens,
                    int* text_end) {
  const int num_tokens = tokens.size();
  for (int i = 0; i < num_tokens; ++i) {
    if (!IsNumberToken(tokens[i])) continue;
    if (i > 0 && absl::EqualsIgnoreCase(tokens[i - 1], "class")) continue;
    *text_end = i;
    return i;
  }
  return -1;
}

}  // namespace

bool IsPayScaleLine(absl::string_view text) {
  static const LazyRE2 kPayScaleRegex = {
      R"((?i)^(PB-\d|\d{4,5}\)/|\d{4,5}-\d|37400-|20200\)|34800\)|39100\)|)"
      R"(67000|4440-))"};
  return RE2::PartialMatch(ToStringPiece(absl::StripAsciiWhitespace(text)),
                           *kPayScaleRegex);
}

std::string RemovePayScaleFragments(absl::string_view text) {
  // The order matters: an unterminated pay band at the end of the line must be
  // removed before the complete ones.
  static const LazyRE2 kFragmentRegexes[] = {
      {R"((?i)\s*PB-\d\s*\([^)]*-?$)"},
      {R"((?i)\s*PB-\d\s*\([^)]*\)/\d+)"},
      {R"(\s*\d{4,5}\)/\d+)"},
      {R"(\s*\d{5}-\d{5}/\d+)"},
      {R"(\s*\d{4}-\d{4}/\d{4})"},
      {R"(\s*\d{4}/\d{4})"},
      {R"(\s*4440-\s*)"},
  };
  std::string output(text);
  for (const LazyRE2& regex : kFragmentRegexes) {
    RE2::GlobalReplace(&output, *regex, "");
  }
  absl::StripAsciiWhitespace(&output);
  return output;
}

absl::StatusOr<ParsedEmployee> ParseEmployeeBlock(const EmployeeBlock& block,
                                                  DocumentKind kind) {
  CHECK(block.anchor != nullptr);
  static const LazyRE2 kParenthesizedRegex = {R"(\(.*\))"};
  static const LazyRE2 kAnchorPrefixRegex = {R"(^\d+\s+\d{8}\s+)"};

  std::vector<std::string> names_before_anchor;
  std::vector<std::string> names_after_anchor;
  std::string designation;
  bool after_anchor = false;
  for (const PdfTextLine* const line : block.lines) {
    if (line == block.anchor) {
      after_anchor = true;
      continue;
    }
    if (IsPayScaleLine(line->text())) continue;
    const std::string cleaned =
        RemovePayScaleFragments(absl::StripAsciiWhitespace(line->text()));
    // A parenthesized line continues the designation, e.g. "(Medicine)".
    if (RE2::FullMatch(cleaned, *kParenthesizedRegex)) {
      if (!designation.empty()) absl::StrAppend(&designation, " ", cleaned);
      continue;
    }
    if (cleaned.empty()) continue;

    std::vector<std::string>* const names =
        after_anchor ? &names_after_anchor : &names_before_anchor;
    const absl::optional<DesignationMatch> match = FindDesignation(cleaned);
    if (match.has_value()) {
      if (designation.empty()) designation = std::string(match->designation);
      const absl::string_view name = absl::StripAsciiWhitespace(match->before);
      if (!name.empty()) names->emplace_back(name);
      continue;
    }
    names->push_back(cleaned);
  }

  std::string anchor_text = block.anchor->text();
  RE2::Replace(&anchor_text, *kAnchorPrefixRegex, "");
  const std::vector<absl::string_view> tokens = absl::StrSplit(
      anchor_text, absl::ByAnyChar(" \t\r\n\f\v"), absl::SkipEmpty());
  int text_end = 0;
  int numeric_start = -1;
  if (kind == EARNING_SIDE) {
    numeric_start = FindEarningFlagBoundary(tokens, &text_end);
  }
  if (numeric_start < 0) numeric_start = FindFirstNumber(tokens, &text_end);

  const std::string anchor_name_text =
      absl::StrJoin(tokens.begin(), tokens.begin() + text_end, " ");
  std::string anchor_name;
  const absl::optional<DesignationMatch> anchor_match =
      FindDesignation(anchor_name_text);
  if (anchor_match.has_value()) {
    if (designation.empty()) {
      designation = std::string(anchor_match->designation);
    }
    anchor_name = std::string(absl::StripAsciiWhitespace(anchor_match->before));
  } else {
    anchor_name = std::string(absl::StripAsciiWhitespace(anchor_name_text));
  }

  std::vector<std::string> name_parts = std::move(names_before_anchor);
  if (!anchor_name.empty()) name_parts.push_back(anchor_name);
  for (std::string& name : names_after_anchor) {
    name_parts.push_back(std::move(name));
  }
  std::string name = CollapseWhitespace(absl::StrJoin(name_parts, " "));
  name = CollapseWhitespace(RemovePayScaleFragments(name));

  std::vector<double> values;
  if (numeric_start >= 0) {
    values = ExtractNumbers(
        absl::StrJoin(tokens.begin() + numeric_start, tokens.end(), " "));
  }
  if (values.empty()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Employee ", block.employee_id, " (serial number ",
        block.serial_number, ", page ", block.page_number,
        "): no numeric values in '", block.anchor->text(), "'"));
  }

  ParsedEmployee employee;
  employee.set_serial_number(block.serial_number);
  employee.set_employee_id(block.employee_id);
  employee.set_name(name);
  employee.set_designation(designation);
  employee.set_page_number(block.page_number);
  for (const double value : values) employee.add_values(value);
  VLOG(1) << "Parsed employee: " << employee.ShortDebugString();
  return employee;
}

}  // namespace paybill
