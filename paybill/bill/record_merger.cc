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

#include "paybill/bill/record_merger.h"

#include <map>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "glog/logging.h"
#include "paybill/bill/field_normalizer.h"

namespace paybill {

namespace {

// Keeps the longer of the two names, and the longer non-empty designation.
template <typename Record>
void MergeIdentity(const NormalizedRecord& record, Record* entry) {
  if (record.name().size() > entry->name().size()) {
    entry->set_name(record.name());
  }
  if (!record.designation().empty() &&
      record.designation().size() > entry->designation().size()) {
    entry->set_designation(record.designation());
  }
}

PayrollRecord* GetOrCreateEntry(const NormalizedRecord& record,
                                std::map<std::string, PayrollRecord>* payroll) {
  auto insertion = payroll->emplace(record.employee_id(), PayrollRecord());
  PayrollRecord* const entry = &insertion.first->second;
  if (insertion.second) {
    entry->set_employee_id(record.employee_id());
    entry->set_name(record.name());
    entry->set_designation(record.designation());
  }
  return entry;
}

}  // namespace

std::vector<NormalizedRecord> CombineRecordSets(
    const std::vector<std::vector<NormalizedRecord>>& record_sets) {
  std::vector<NormalizedRecord> combined;
  absl::flat_hash_map<std::string, int> index_by_employee_id;
  for (const std::vector<NormalizedRecord>& records : record_sets) {
    for (const NormalizedRecord& record : records) {
      const auto insertion =
          index_by_employee_id.emplace(record.employee_id(), combined.size());
      if (insertion.second) {
        combined.push_back(record);
        continue;
      }
      VLOG(1) << "Combining duplicate records of " << record.employee_id();
      NormalizedRecord& existing = combined[insertion.first->second];
      MergeIdentity(record, &existing);
      for (const auto& field : record.fields()) {
        (*existing.mutable_fields())[field.first] = field.second;
      }
      for (const auto& category : record.categories()) {
        (*existing.mutable_categories())[category.first] = category.second;
      }
    }
  }
  return combined;
}

std::vector<PayrollRecord> MergePayroll(
    const std::vector<NormalizedRecord>& earning_records,
    const std::vector<NormalizedRecord>& deduction_records) {
  std::map<std::string, PayrollRecord> payroll;
  for (const NormalizedRecord& record : earning_records) {
    PayrollRecord* const entry = GetOrCreateEntry(record, &payroll);
    MergeIdentity(record, entry);
    for (const auto& field : record.fields()) {
      (*entry->mutable_earning())[field.first] = field.second;
      if (field.first == kGrossKey) entry->set_gross(field.second);
    }
  }
  for (const NormalizedRecord& record : deduction_records) {
    PayrollRecord* const entry = GetOrCreateEntry(record, &payroll);
    MergeIdentity(record, entry);
    for (const auto& field : record.fields()) {
      if (field.first == kTotalDeductionsKey) {
        entry->set_total_deductions(field.second);
      } else if (field.first == kNetPayKey) {
        entry->set_net_pay(field.second);
      } else {
        (*entry->mutable_deduction())[field.first] = field.second;
      }
    }
  }

  std::vector<PayrollRecord> records;
  records.reserve(payroll.size());
  for (auto& employee_id_and_record : payroll) {
    records.push_back(std::move(employee_id_and_record.second));
  }
  return records;
}

}  // namespace paybill
