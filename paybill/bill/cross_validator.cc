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

#include "paybill/bill/cross_validator.h"

#include <cmath>
#include <set>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"
#include "paybill/bill/field_normalizer.h"
#include "re2/re2.h"

ABSL_FLAG(double, paybill_amount_tolerance, 1.0,
          "The largest absolute difference between two amounts that are "
          "considered equal by the payroll validation.");

namespace paybill {

namespace {

bool AmountsDiffer(double a, double b, double tolerance) {
  return std::abs(a - b) > tolerance;
}

}  // namespace

void ValidatePayrollRecord(const PayrollRecord& record, double tolerance,
                           std::vector<std::string>* errors,
                           std::vector<std::string>* warnings) {
  CHECK(errors != nullptr);
  CHECK(warnings != nullptr);
  static const LazyRE2 kEmployeeIdRegex = {R"(\d{8})"};

  if (record.gross() > 0 && !record.earning().empty()) {
    double earning_sum = 0.0;
    for (const auto& field : record.earning()) {
      if (field.first == kGrossKey || field.first == kSloKey) continue;
      earning_sum += field.second;
    }
    if (AmountsDiffer(earning_sum, record.gross(), tolerance)) {
      warnings->push_back(
          absl::StrFormat("Employee %s: Earning sum (%.2f) != Gross (%.2f)",
                          record.employee_id(), earning_sum, record.gross()));
    }
  }

  if (record.gross() > 0 && record.total_deductions() > 0 &&
      record.net_pay() > 0) {
    const double computed_net_pay = record.gross() - record.total_deductions();
    if (AmountsDiffer(computed_net_pay, record.net_pay(), tolerance)) {
      errors->push_back(absl::StrFormat(
          "Employee %s: Gross - Total deductions (%.2f) != Net pay (%.2f)",
          record.employee_id(), computed_net_pay, record.net_pay()));
    }
  }

  if (!RE2::FullMatch(record.employee_id(), *kEmployeeIdRegex)) {
    errors->push_back(absl::StrFormat("Invalid employee identifier: \"%s\"",
                                      record.employee_id()));
  }
}

void CheckColumnTotals(const DocumentResult& document, double tolerance,
                       std::vector<std::string>* warnings) {
  CHECK(warnings != nullptr);
  if (!document.has_total_row()) return;
  const TotalRow& total_row = document.total_row();
  const int num_columns = document.headers_size();
  if (num_columns == 0 || total_row.values_size() != num_columns) {
    VLOG(1) << document.source_name()
            << ": the total row does not match the columns";
    return;
  }
  for (int i = 0; i < num_columns; ++i) {
    const HeaderMapping& header = document.headers(i);
    double column_sum = 0.0;
    for (const NormalizedRecord& record : document.records()) {
      const auto it = record.fields().find(header.canonical_key());
      if (it != record.fields().end()) column_sum += it->second;
    }
    if (AmountsDiffer(total_row.values(i), column_sum, tolerance)) {
      warnings->push_back(absl::StrFormat(
          "%s: Total of column '%s' (%.2f) != Sum of the employees (%.2f)",
          document.source_name(), header.raw_label(), total_row.values(i),
          column_sum));
    }
  }
}

ValidationResult ValidatePayroll(const std::vector<PayrollRecord>& records,
                                 const std::vector<DocumentResult>& documents) {
  const double tolerance = absl::GetFlag(FLAGS_paybill_amount_tolerance);
  ValidationResult result;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  int valid_records = 0;
  for (const PayrollRecord& record : records) {
    const size_t num_errors = errors.size();
    ValidatePayrollRecord(record, tolerance, &errors, &warnings);
    if (errors.size() == num_errors) ++valid_records;
  }
  for (const DocumentResult& document : documents) {
    CheckColumnTotals(document, tolerance, &warnings);
  }

  ValidationResult::Summary* const summary = result.mutable_summary();
  std::set<std::string> earning_keys;
  std::set<std::string> deduction_keys;
  for (const PayrollRecord& record : records) {
    summary->set_total_gross(summary->total_gross() + record.gross());
    summary->set_total_deductions(summary->total_deductions() +
                                  record.total_deductions());
    summary->set_total_net_pay(summary->total_net_pay() + record.net_pay());
    for (const auto& field : record.earning()) earning_keys.insert(field.first);
    for (const auto& field : record.deduction()) {
      deduction_keys.insert(field.first);
    }
  }
  summary->set_total_employees(records.size());
  for (const std::string& key : earning_keys) {
    summary->add_earning_fields_found(key);
  }
  for (const std::string& key : deduction_keys) {
    summary->add_deduction_fields_found(key);
  }

  result.set_is_valid(errors.empty());
  result.set_total_records(records.size());
  result.set_valid_records(valid_records);
  for (std::string& error : errors) result.add_errors(std::move(error));
  for (std::string& warning : warnings) result.add_warnings(std::move(warning));
  LOG(INFO) << "Validated " << records.size() << " records: "
            << valid_records << " valid, " << result.errors_size()
            << " errors, " << result.warnings_size() << " warnings";
  return result;
}

}  // namespace paybill
