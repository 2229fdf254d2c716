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


// This program extracts the payroll of a set of pay bills, given as PdfDocument
// protos, and writes it as a PayrollBatch proto.
// Usage:
// parse_paybill \
//   --paybill_input_files=/path/to/earning.pdf.pb,/path/to/deduction.pdf.pb \
//   --paybill_output_file=/path/to/payroll.pbtxt

#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "paybill/base/init_main.h"
#include "paybill/bill/payroll_processor.h"
#include "paybill/proto/payroll.pb.h"
#include "paybill/proto/pdf/pdf_document.pb.h"
#include "paybill/util/proto_util.h"
#include "paybill/util/status_util.h"

ABSL_FLAG(std::vector<std::string>, paybill_input_files,
          std::vector<std::string>(),
          "A comma-separated list of PdfDocument protos, in text or binary "
          "format, to process as one batch.");
ABSL_FLAG(std::string, paybill_output_file, "",
          "Where to write the PayrollBatch. It is written in the text format "
          "when the extension is .pbtxt or .textproto, and in the binary "
          "format otherwise.");
ABSL_FLAG(bool, paybill_fail_on_validation_errors, false,
          "Exit with a non-zero status when the payroll does not validate.");

namespace paybill {
namespace {

int Main() {
  const std::vector<std::string> input_files =
      absl::GetFlag(FLAGS_paybill_input_files);
  const std::string output_file = absl::GetFlag(FLAGS_paybill_output_file);
  CHECK(!input_files.empty()) << "missing --paybill_input_files";
  CHECK(!output_file.empty()) << "missing --paybill_output_file";

  std::vector<pdf::PdfDocument> documents;
  for (const std::string& input_file : input_files) {
    pdf::PdfDocument document;
    CHECK_OK(ReadProto(input_file, &document));
    if (document.source_name().empty()) document.set_source_name(input_file);
    documents.push_back(std::move(document));
  }

  PayrollProcessorOptions options;
  options.progress = [](absl::string_view phase, absl::string_view detail) {
    VLOG(1) << phase << ": " << detail;
  };
  const absl::StatusOr<PayrollBatch> batch =
      ProcessPayroll(documents, options);
  if (!batch.ok()) {
    LOG(ERROR) << batch.status();
    return 1;
  }
  for (const std::string& error : batch->validation().errors()) {
    LOG(WARNING) << error;
  }
  CHECK_OK(WriteProto(output_file, *batch));
  LOG(INFO) << "Wrote " << batch->payroll_size() << " payroll records to "
            << output_file;

  if (absl::GetFlag(FLAGS_paybill_fail_on_validation_errors) &&
      !batch->validation().is_valid()) {
    return 2;
  }
  return 0;
}

}  // namespace
}  // namespace paybill

int main(int argc, char** argv) {
  paybill::InitMain(argc, argv);
  return ::paybill::Main();
}
