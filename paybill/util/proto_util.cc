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

#include "paybill/util/proto_util.h"

#include <cstdio>
#include <memory>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/io/coded_stream.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/io/zero_copy_stream_impl_lite.h"
#include "google/protobuf/text_format.h"

namespace paybill {
namespace {

struct FileCloser {
  void operator()(FILE* file) {
    if (file != nullptr) fclose(file);
  }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

absl::StatusOr<FilePtr> OpenFile(const std::string& filename,
                                 const char* mode) {
  if (filename.empty()) {
    return absl::InvalidArgumentError("filename must not be empty");
  }
  FilePtr file(fopen(filename.c_str(), mode));
  if (file == nullptr) {
    return absl::FailedPreconditionError(
        absl::StrCat("Could not open '", filename, "'"));
  }
  return file;
}

bool IsTextFormatFile(absl::string_view filename) {
  return absl::EndsWith(filename, ".pbtxt") ||
         absl::EndsWith(filename, ".textproto");
}

}  // namespace

absl::Status ReadTextProto(const std::string& filename,
                           google::protobuf::Message* message) {
  auto input_file = OpenFile(filename, "rb");
  if (!input_file.ok()) return input_file.status();
  google::protobuf::io::FileInputStream input_stream(
      fileno(input_file->get()));
  if (!google::protobuf::TextFormat::Parse(&input_stream, message)) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Could not parse text format protobuf from file '", filename, "'"));
  }
  return absl::OkStatus();
}

absl::Status ReadBinaryProto(const std::string& filename,
                             google::protobuf::Message* message) {
  auto input_file = OpenFile(filename, "rb");
  if (!input_file.ok()) return input_file.status();
  if (!message->ParseFromFileDescriptor(fileno(input_file->get()))) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Could not parse binary format protobuf from file '", filename, "'"));
  }
  return absl::OkStatus();
}

absl::Status ReadProto(const std::string& filename,
                       google::protobuf::Message* message) {
  if (IsTextFormatFile(filename)) return ReadTextProto(filename, message);
  return ReadBinaryProto(filename, message);
}

void ParseProtoFromStringOrDie(absl::string_view text,
                               google::protobuf::Message* message) {
  google::protobuf::io::ArrayInputStream input_stream(text.data(),
                                                      text.size());
  CHECK(google::protobuf::TextFormat::Parse(&input_stream, message));
}

absl::Status WriteTextProto(const std::string& filename,
                            const google::protobuf::Message& message) {
  auto output_file = OpenFile(filename, "wb");
  if (!output_file.ok()) return output_file.status();
  google::protobuf::io::FileOutputStream output_stream(
      fileno(output_file->get()));
  if (!google::protobuf::TextFormat::Print(message, &output_stream) ||
      !output_stream.Flush()) {
    return absl::InternalError(
        absl::StrCat("Could not write '", filename, "'"));
  }
  return absl::OkStatus();
}

absl::Status WriteBinaryProto(const std::string& filename,
                              const google::protobuf::Message& message) {
  auto output_file = OpenFile(filename, "wb");
  if (!output_file.ok()) return output_file.status();
  const std::string bytes = SerializeToStringDeterministically(message);
  if (fwrite(bytes.data(), 1, bytes.size(), output_file->get()) !=
      bytes.size()) {
    return absl::InternalError(
        absl::StrCat("Could not write '", filename, "'"));
  }
  return absl::OkStatus();
}

absl::Status WriteProto(const std::string& filename,
                        const google::protobuf::Message& message) {
  if (IsTextFormatFile(filename)) return WriteTextProto(filename, message);
  return WriteBinaryProto(filename, message);
}

std::string SerializeToStringDeterministically(
    const google::protobuf::Message& message) {
  std::string bytes;
  {
    google::protobuf::io::StringOutputStream string_stream(&bytes);
    google::protobuf::io::CodedOutputStream coded_stream(&string_stream);
    coded_stream.SetSerializationDeterministic(true);
    CHECK(message.SerializeToCodedStream(&coded_stream));
  }
  return bytes;
}

}  // namespace paybill
