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

#include "paybill/bill/payroll_processor.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "paybill/testing/bill_builder.h"
#include "paybill/testing/test_util.h"
#include "paybill/util/proto_util.h"

namespace paybill {
namespace {

using ::paybill::testing::BillBuilder;
using ::paybill::testing::EqualsProto;
using ::paybill::testing::MakeDeductionBill;
using ::paybill::testing::MakeEarningBill;
using ::paybill::testing::Partially;
using ::paybill::testing::StatusIs;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

pdf::PdfDocument MakeLetter() {
  return BillBuilder("letter.pdf")
      .AddTextLine("Dear Sir,")
      .AddTextLine("Please find the bills attached.")
      .Build();
}

TEST(ProcessPayrollTest, EarningAndDeductionBills) {
  const absl::StatusOr<PayrollBatch> batch =
      ProcessPayroll({MakeEarningBill(), MakeDeductionBill()}, {});
  ASSERT_OK(batch.status());
  EXPECT_THAT(*batch, Partially(EqualsProto(R"pb(
                payroll {
                  employee_id: "00098765"
                  name: "Mr. Suresh Shah"
                  designation: "Junior Clerk"
                  earning { key: "basic" value: 20000 }
                  earning { key: "da" value: 2000 }
                  earning { key: "gross" value: 23000 }
                  earning { key: "hra" value: 1000 }
                  deduction { key: "incomeTax" value: 0 }
                  deduction { key: "profTax" value: 200 }
                  gross: 23000
                  total_deductions: 200
                  net_pay: 22800
                }
                payroll {
                  employee_id: "00125678"
                  name: "Dr. Ramesh Kumar Patel"
                  designation: "Specialist"
                  earning { key: "basic" value: 50000 }
                  earning { key: "da" value: 5000 }
                  earning { key: "gross" value: 58000 }
                  earning { key: "hra" value: 3000 }
                  deduction { key: "incomeTax" value: 4800 }
                  deduction { key: "profTax" value: 200 }
                  gross: 58000
                  total_deductions: 5000
                  net_pay: 53000
                }
                validation {
                  is_valid: true
                  total_records: 2
                  valid_records: 2
                  summary {
                    total_employees: 2
                    total_gross: 81000
                    total_deductions: 5200
                    total_net_pay: 75800
                    earning_fields_found: [ "basic", "da", "gross", "hra" ]
                    deduction_fields_found: [ "incomeTax", "profTax" ]
                  }
                }
                metadata {
                  month: "January-2026"
                  bill_number: "EB/12"
                  office: "ESIS General Hospital"
                  month_date: "2026-01-01"
                  documents {
                    source_name: "earning.pdf"
                    kind: EARNING_SIDE
                    month: "January-2026"
                    bill_number: "EB/12"
                    record_count: 2
                  }
                  documents {
                    source_name: "deduction.pdf"
                    kind: DEDUCTION_SIDE
                    month: "January-2026"
                    bill_number: "EB/12"
                    record_count: 2
                  }
                  total_employees: 2
                }
              )pb")));
  EXPECT_THAT(batch->validation().errors(), IsEmpty());
  EXPECT_THAT(batch->validation().warnings(), IsEmpty());
  EXPECT_THAT(batch->metadata().processed_at(), Not(IsEmpty()));
}

TEST(ProcessPayrollTest, PayrollDoesNotDependOnDocumentOrder) {
  const absl::StatusOr<PayrollBatch> first =
      ProcessPayroll({MakeEarningBill(), MakeDeductionBill()}, {});
  const absl::StatusOr<PayrollBatch> second =
      ProcessPayroll({MakeDeductionBill(), MakeEarningBill()}, {});
  ASSERT_OK(first.status());
  ASSERT_OK(second.status());
  ASSERT_EQ(first->payroll_size(), second->payroll_size());
  for (int i = 0; i < first->payroll_size(); ++i) {
    EXPECT_THAT(first->payroll(i), EqualsProto(second->payroll(i)));
  }
  EXPECT_THAT(first->validation(), EqualsProto(second->validation()));
}

TEST(ProcessPayrollTest, RepeatedRunsGiveIdenticalRecordBytes) {
  const absl::StatusOr<PayrollBatch> first =
      ProcessPayroll({MakeEarningBill(), MakeDeductionBill()}, {});
  const absl::StatusOr<PayrollBatch> second =
      ProcessPayroll({MakeEarningBill(), MakeDeductionBill()}, {});
  ASSERT_OK(first.status());
  ASSERT_OK(second.status());
  ASSERT_EQ(first->payroll_size(), second->payroll_size());
  for (int i = 0; i < first->payroll_size(); ++i) {
    EXPECT_EQ(SerializeToStringDeterministically(first->payroll(i)),
              SerializeToStringDeterministically(second->payroll(i)))
        << "record " << first->payroll(i).employee_id();
  }
}

TEST(ProcessPayrollTest, ReportsProgress) {
  std::vector<std::string> phases;
  PayrollProcessorOptions options;
  options.progress = [&phases](absl::string_view phase,
                               absl::string_view detail) {
    phases.emplace_back(phase);
  };
  ASSERT_OK(ProcessPayroll({MakeEarningBill()}, options).status());
  EXPECT_THAT(phases,
              ElementsAre(kExtractionPhase, kClassificationPhase,
                          kSchemaDetectionPhase, kSegmentationPhase,
                          kParsingPhase, kMergingPhase, kValidationPhase,
                          kCompletePhase));
}

TEST(ProcessPayrollTest, FailedDocumentIsIsolated) {
  std::vector<std::string> phases;
  PayrollProcessorOptions options;
  options.progress = [&phases](absl::string_view phase,
                               absl::string_view detail) {
    phases.emplace_back(phase);
  };
  const absl::StatusOr<PayrollBatch> batch = ProcessPayroll(
      {MakeEarningBill(), MakeLetter(), MakeDeductionBill()}, options);
  ASSERT_OK(batch.status());
  EXPECT_EQ(batch->payroll_size(), 2);
  ASSERT_EQ(batch->metadata().documents_size(), 3);
  EXPECT_THAT(batch->metadata().documents(1), Partially(EqualsProto(R"pb(
                source_name: "letter.pdf"
                kind: DOCUMENT_KIND_UNSPECIFIED
                record_count: 0
              )pb")));
  EXPECT_THAT(batch->metadata().documents(1).error(),
              HasSubstr("Earning Side"));
  EXPECT_THAT(batch->metadata().documents(0).error(), IsEmpty());
  EXPECT_THAT(batch->validation().errors(),
              ElementsAre(HasSubstr("letter.pdf")));
  EXPECT_FALSE(batch->validation().is_valid());
  EXPECT_THAT(phases, Contains(kErrorPhase));
  EXPECT_EQ(phases.back(), kCompletePhase);
}

TEST(ProcessPayrollTest, AllDocumentsFail) {
  EXPECT_THAT(ProcessPayroll({MakeLetter(), MakeLetter()}, {}),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST(ProcessPayrollTest, NoDocument) {
  EXPECT_THAT(ProcessPayroll({}, {}),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(ProcessPayrollTest, CancelledBeforeFirstDocument) {
  PayrollProcessorOptions options;
  options.is_cancelled = [] { return true; };
  EXPECT_THAT(ProcessPayroll({MakeEarningBill(), MakeDeductionBill()}, options),
              StatusIs(absl::StatusCode::kCancelled));
}

TEST(ProcessPayrollTest, CancelledAfterFirstDocument) {
  int num_checks = 0;
  PayrollProcessorOptions options;
  options.is_cancelled = [&num_checks] { return num_checks++ > 0; };
  const absl::StatusOr<PayrollBatch> batch =
      ProcessPayroll({MakeEarningBill(), MakeDeductionBill()}, options);
  ASSERT_OK(batch.status());
  ASSERT_EQ(batch->metadata().documents_size(), 1);
  EXPECT_EQ(batch->metadata().documents(0).source_name(), "earning.pdf");
  ASSERT_EQ(batch->payroll_size(), 2);
  EXPECT_THAT(batch->payroll(0).deduction(), IsEmpty());
  EXPECT_EQ(batch->payroll(0).gross(), 23000);
}

TEST(ProcessPayrollTest, DiagnosticsBecomeWarnings) {
  const pdf::PdfDocument document = BillBuilder("dropped.pdf")
                                        .AddTextLine("Deduction Side")
                                        .AddTextLine("Phone : 1234")
                                        .AddLine({{200, "Income Tax"}})
                                        .AddTextLine("Mr. Anil")
                                        .AddTextLine("1 00011111 Joshi Peon")
                                        .AddTextLine("Mr. Mehul")
                                        .AddTextLine("2 00022222 Mehta 300")
                                        .Build();
  const absl::StatusOr<PayrollBatch> batch = ProcessPayroll({document}, {});
  ASSERT_OK(batch.status());
  EXPECT_TRUE(batch->validation().is_valid());
  EXPECT_THAT(batch->validation().warnings(),
              ElementsAre(AllOf(HasSubstr("dropped.pdf"),
                                HasSubstr("00011111"))));
  EXPECT_FALSE(batch->metadata().has_month());
  EXPECT_FALSE(batch->metadata().has_month_date());
}

}  // namespace
}  // namespace paybill
