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

#ifndef PAYBILL_UTIL_PROTO_UTIL_H_
#define PAYBILL_UTIL_PROTO_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace paybill {

absl::Status ReadTextProto(const std::string& filename,
                           ::google::protobuf::Message* message);

template <typename Proto>
absl::StatusOr<Proto> ReadTextProto(const std::string& filename) {
  Proto proto;
  const absl::Status read_status = ReadTextProto(filename, &proto);
  if (!read_status.ok()) return read_status;
  return proto;
}

absl::Status ReadBinaryProto(const std::string& filename,
                             ::google::protobuf::Message* message);

template <typename Proto>
absl::StatusOr<Proto> ReadBinaryProto(const std::string& filename) {
  Proto proto;
  const absl::Status read_status = ReadBinaryProto(filename, &proto);
  if (!read_status.ok()) return read_status;
  return proto;
}

// Reads 'filename' in the text format when its extension is ".pbtxt" or
// ".textproto", and in the binary format otherwise.
absl::Status ReadProto(const std::string& filename,
                       ::google::protobuf::Message* message);

template <typename Proto>
absl::StatusOr<Proto> ReadProto(const std::string& filename) {
  Proto proto;
  const absl::Status read_status = ReadProto(filename, &proto);
  if (!read_status.ok()) return read_status;
  return proto;
}

void ParseProtoFromStringOrDie(absl::string_view text,
                               ::google::protobuf::Message* message);

template <typename Proto>
Proto ParseProtoFromStringOrDie(absl::string_view text) {
  Proto proto;
  ParseProtoFromStringOrDie(text, &proto);
  return proto;
}

absl::Status WriteTextProto(const std::string& filename,
                            const google::protobuf::Message& message);

// Writes 'message' in the binary format, serialized deterministically.
absl::Status WriteBinaryProto(const std::string& filename,
                              const google::protobuf::Message& message);

// Writes 'filename' in the text format when its extension is ".pbtxt" or
// ".textproto", and in the binary format otherwise.
absl::Status WriteProto(const std::string& filename,
                        const google::protobuf::Message& message);

// Returns the binary serialization of 'message' with the map entries in a
// stable order, so that equal messages give equal bytes.
std::string SerializeToStringDeterministically(
    const google::protobuf::Message& message);

}  // namespace paybill

#endif  // PAYBILL_UTIL_PROTO_UTIL_H_
