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

// Contains implementations of:
//
// * EqualsProto, a gMock matcher that takes a ::google::protobuf::Messsage or
//   its equivalent in text format and matches it against actual protocol
//   buffers using a message differencer.
//
//   Usage:
//   PayrollRecord record = CreateRecord();
//   EXPECT_THAT(record, EqualsProto("employee_id: '00125678'"));
//
// * Partially, an extension to EqualsProto that only compares the fields that
//   are set in the expected proto.
//
//   Usage:
//   EXPECT_THAT(record, Partially(EqualsProto("gross: 50000")));
//
// * IsOk, a gMock matcher that matches OK absl::Status or absl::StatusOr.
//
// * StatusIs, a gMock matcher that matches an absl::Status or absl::StatusOr
//   error code, and optionally its error message.
//
//   Usage:
//   EXPECT_THAT(ParseDocument(document),
//               StatusIs(absl::StatusCode::kInvalidArgument,
//                        HasSubstr("Earning Side")));
//
// * IsOkAndHolds, a gMock matcher that matches an absl::StatusOr<T> value whose
//   status is OK and whose inner value matches a given matcher.

#ifndef PAYBILL_TESTING_TEST_UTIL_H_
#define PAYBILL_TESTING_TEST_UTIL_H_

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "glog/logging.h"
#include "gmock/gmock.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/message_differencer.h"

namespace paybill {
namespace testing {

namespace internal {

template <typename ProtoType>
bool MatchProto(const ProtoType& actual_proto,
                const std::string& expected_proto_str,
                ::google::protobuf::util::MessageDifferencer::Scope scope,
                ::testing::MatchResultListener* listener) {
  using ::google::protobuf::TextFormat;
  using ::google::protobuf::util::MessageDifferencer;
  ProtoType expected_proto;
  if (!TextFormat::ParseFromString(expected_proto_str, &expected_proto)) {
    *listener << "could not parse proto: <" << expected_proto_str << ">";
    return false;
  }

  MessageDifferencer differencer;
  std::string differences;
  differencer.ReportDifferencesToString(&differences);
  differencer.set_scope(scope);
  if (!differencer.Compare(expected_proto, actual_proto)) {
    *listener << "the protos are different:\n" << differences;
    return false;
  }

  return true;
}

}  // namespace internal

// A gMock matcher that takes a proto in the text format and compares protos
// against this text representation. Used to implement EqualsProto(str).
class EqualsProtoMatcher {
 public:
  explicit EqualsProtoMatcher(std::string expected_proto_str)
      : expected_proto_str_(std::move(expected_proto_str)) {}

  template <typename ProtoType>
  bool MatchAndExplain(const ProtoType& actual_proto,
                       ::testing::MatchResultListener* listener) const {
    return internal::MatchProto(actual_proto, expected_proto_str_, scope_,
                                listener);
  }

  void DescribeTo(std::ostream* os) const {
    *os << "equals to proto:\n" << expected_proto_str_;
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "is not equal to proto:\n" << expected_proto_str_;
  }

  void SetComparePartially() {
    scope_ = ::google::protobuf::util::MessageDifferencer::PARTIAL;
  }

 private:
  const std::string expected_proto_str_;
  ::google::protobuf::util::MessageDifferencer::Scope scope_ =
      ::google::protobuf::util::MessageDifferencer::FULL;
};

// Creates a polymorphic proto matcher based on the given proto in text format.
inline ::testing::PolymorphicMatcher<EqualsProtoMatcher> EqualsProto(
    std::string expected_proto_str) {
  return ::testing::MakePolymorphicMatcher(
      EqualsProtoMatcher(std::move(expected_proto_str)));
}

// Creates a polymorphic proto matcher based on the given proto.
inline ::testing::PolymorphicMatcher<EqualsProtoMatcher> EqualsProto(
    const google::protobuf::Message& expected_proto) {
  std::string expected_proto_str;
  using ::google::protobuf::TextFormat;
  CHECK(TextFormat::PrintToString(expected_proto, &expected_proto_str));
  return ::testing::MakePolymorphicMatcher(
      EqualsProtoMatcher(std::move(expected_proto_str)));
}

template <typename InnerProtoMatcher>
InnerProtoMatcher Partially(InnerProtoMatcher matcher) {
  matcher.mutable_impl().SetComparePartially();
  return matcher;
}

// Implements IsOk() as a polymorphic matcher.
MATCHER(IsOk, "") { return arg.ok(); }

#ifndef ASSERT_OK
#define ASSERT_OK(status_expr) \
  ASSERT_THAT(status_expr, ::paybill::testing::IsOk())
#endif  // ASSERT_OK

#ifndef EXPECT_OK
#define EXPECT_OK(status_expr) \
  EXPECT_THAT(status_expr, ::paybill::testing::IsOk())
#endif  // EXPECT_OK

namespace internal {

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& GetStatus(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace internal

// Implements StatusIs() as a polymorphic matcher.
MATCHER_P(StatusIs, expected_error_code, "") {
  return internal::GetStatus(arg).code() == expected_error_code;
}

// Implements StatusIs() as a polymorphic matcher.
MATCHER_P2(StatusIs, expected_error_code, expected_message, "") {
  const absl::Status& status = internal::GetStatus(arg);
  const ::testing::Matcher<const std::string&> message_matcher =
      expected_message;
  return status.code() == expected_error_code &&
         message_matcher.MatchAndExplain(std::string(status.message()),
                                         result_listener);
}

namespace internal {

// Monomorphic implementation of a matcher for a StatusOr.
template <typename StatusOrType>
class IsOkAndHoldsMatcherImpl
    : public ::testing::MatcherInterface<StatusOrType> {
 public:
  using ValueType = typename std::remove_reference<decltype(
      *std::declval<StatusOrType>())>::type;

  template <typename InnerMatcher>
  explicit IsOkAndHoldsMatcherImpl(InnerMatcher&& inner_matcher)
      : inner_matcher_(::testing::SafeMatcherCast<const ValueType&>(
            std::forward<InnerMatcher>(inner_matcher))) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "is OK and has a value that ";
    inner_matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const override {
    *os << "isn't OK or has a value that ";
    inner_matcher_.DescribeNegationTo(os);
  }

  bool MatchAndExplain(
      StatusOrType actual_value,
      ::testing::MatchResultListener* listener) const override {
    if (!actual_value.ok()) {
      *listener << "which has status " << actual_value.status();
      return false;
    }
    return inner_matcher_.MatchAndExplain(*actual_value, listener);
  }

 private:
  const ::testing::Matcher<const ValueType&> inner_matcher_;
};

// Implements IsOkAndHolds() as a polymorphic matcher.
template <typename InnerMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(InnerMatcher inner_matcher)
      : inner_matcher_(std::move(inner_matcher)) {}

  // StatusOrType can be either StatusOr<T> or a reference to StatusOr<T>.
  template <typename StatusOrType>
  operator ::testing::Matcher<StatusOrType>() const {  // NOLINT
    return ::testing::MakeMatcher(
        new IsOkAndHoldsMatcherImpl<StatusOrType>(inner_matcher_));
  }

 private:
  const InnerMatcher inner_matcher_;
};

}  // namespace internal

// Returns a gMock matcher that matches a StatusOr<> whose status is
// OK and whose value matches the inner matcher.
template <typename InnerMatcher>
internal::IsOkAndHoldsMatcher<typename std::decay<InnerMatcher>::type>
IsOkAndHolds(InnerMatcher&& inner_matcher) {
  return internal::IsOkAndHoldsMatcher<typename std::decay<InnerMatcher>::type>(
      std::forward<InnerMatcher>(inner_matcher));
}

}  // namespace testing
}  // namespace paybill

#endif  // PAYBILL_TESTING_TEST_UTIL_H_
