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

#include "paybill/bill/field_normalizer.h"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "paybill/util/strings.h"
#include "re2/re2.h"

namespace paybill {

const char kGrossKey[] = "gross";
const char kSloKey[] = "slo";
const char kTotalDeductionsKey[] = "totalDed";
const char kNetPayKey[] = "netPay";

namespace {

struct FieldPattern {
  const RE2* regex;
  std::string key;
  FieldCategory category;
};

// The more specific patterns must come before the generic ones, e.g. "GPF Reg
// Class 4" before "GPF Reg".
std::vector<FieldPattern>* NewFieldPatterns() {
  const auto pattern = [](absl::string_view regex, std::string key,
                          FieldCategory category) {
    return FieldPattern{new RE2(absl::StrCat("(?i)", regex)), std::move(key),
                        category};
  };
  return new std::vector<FieldPattern>({
      pattern(R"(basic\s*pay)", "basic", EARNING),
      pattern(R"(\bda\b)", "da", EARNING),
      pattern(R"(\bhra\b)", "hra", EARNING),
      pattern(R"(\bcla\b)", "cla", EARNING),
      pattern(R"(med\s*allow)", "medAllow", EARNING),
      pattern(R"(trans\s*allow)", "transAllow", EARNING),
      pattern(R"(special\s*additional\s*pay)", "specialPay", EARNING),
      pattern(R"(non\s*private\s*practice\s*allow)", "nppAllow", EARNING),
      pattern(R"(washing\s*allow)", "washingAllow", EARNING),
      pattern(R"(nursing\s*allow)", "nursingAllow", EARNING),
      pattern(R"(uniform\s*allow)", "uniformAllow", EARNING),
      pattern(R"(book\s*allow)", "bookAllow", EARNING),
      pattern(R"(esis\s*allow)", "esisAllow", EARNING),
      pattern(R"(recovery\s*of\s*pay)", "recoveryOfPay", EARNING),
      pattern(R"(gross\s*amt)", kGrossKey, EARNING),
      pattern(R"(\bslo\b)", kSloKey, EARNING),
      pattern(R"(income\s*tax)", "incomeTax", DEDUCTION),
      pattern(R"(prof\s*tax)", "profTax", DEDUCTION),
      pattern(R"(r\s*&\s*b)", "rnb", DEDUCTION),
      pattern(R"(gpf\s*reg\s*class\s*4)", "gpfClass4", DEDUCTION),
      pattern(R"(gpf\s*reg\b)", "gpfReg", DEDUCTION),
      pattern(R"(nps\s*reg)", "npsReg", DEDUCTION),
      pattern(R"(govt?\s*fund)", "govtFund", DEDUCTION),
      pattern(R"(govt?\s*saving)", "govtSaving", DEDUCTION),
      pattern(R"(total\s*ded)", kTotalDeductionsKey, DEDUCTION),
      pattern(R"(net\s*pay)", kNetPayKey, DEDUCTION),
  });
}

const std::vector<FieldPattern>& GetFieldPatterns() {
  static const std::vector<FieldPattern>* const kFieldPatterns =
      NewFieldPatterns();
  return *kFieldPatterns;
}

}  // namespace

std::vector<std::string> GetCanonicalFieldKeys(FieldCategory category) {
  std::vector<std::string> keys;
  for (const FieldPattern& field_pattern : GetFieldPatterns()) {
    if (field_pattern.category == category) keys.push_back(field_pattern.key);
  }
  return keys;
}

std::string DeriveFieldKey(absl::string_view label) {
  static const LazyRE2 kParenthesizedRegex = {R"(\([^)]*\))"};
  std::string stripped(label);
  RE2::GlobalReplace(&stripped, *kParenthesizedRegex, "");
  const std::vector<absl::string_view> words = absl::StrSplit(
      stripped, absl::ByAnyChar(" \t\r\n\f\v"), absl::SkipEmpty());
  std::string key;
  for (const absl::string_view word : words) {
    if (key.empty()) {
      key = absl::AsciiStrToLower(word);
      continue;
    }
    key.push_back(absl::ascii_toupper(word.front()));
    key.append(absl::AsciiStrToLower(word.substr(1)));
  }
  return key.empty() ? "unknown" : key;
}

HeaderMapping NormalizeColumnLabel(absl::string_view label) {
  HeaderMapping mapping;
  mapping.set_raw_label(std::string(label));
  for (const FieldPattern& field_pattern : GetFieldPatterns()) {
    if (RE2::PartialMatch(ToStringPiece(label), *field_pattern.regex)) {
      mapping.set_canonical_key(field_pattern.key);
      mapping.set_category(field_pattern.category);
      return mapping;
    }
  }
  mapping.set_canonical_key(DeriveFieldKey(label));
  mapping.set_category(FIELD_CATEGORY_UNKNOWN);
  return mapping;
}

std::vector<HeaderMapping> NormalizeColumnSchema(const ColumnSchema& schema) {
  std::vector<HeaderMapping> headers;
  headers.reserve(schema.columns_size());
  for (const ColumnSchema::Column& column : schema.columns()) {
    headers.push_back(NormalizeColumnLabel(column.label()));
  }
  return headers;
}

NormalizedRecord NormalizeEmployee(const ParsedEmployee& employee,
                                   const std::vector<HeaderMapping>& headers) {
  NormalizedRecord record;
  record.set_employee_id(employee.employee_id());
  record.set_name(employee.name());
  record.set_designation(employee.designation());
  *record.mutable_raw_values() = employee.values();
  auto& fields = *record.mutable_fields();
  auto& categories = *record.mutable_categories();
  const int num_headers = headers.size();
  for (int i = 0; i < num_headers; ++i) {
    const HeaderMapping& header = headers[i];
    fields[header.canonical_key()] =
        i < employee.values_size() ? employee.values(i) : 0.0;
    categories[header.canonical_key()] = header.category();
  }
  return record;
}

}  // namespace paybill
