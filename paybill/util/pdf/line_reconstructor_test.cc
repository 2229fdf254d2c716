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

#include "paybill/util/pdf/line_reconstructor.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "paybill/testing/test_util.h"
#include "paybill/util/proto_util.h"

namespace paybill {
namespace pdf {
namespace {

using ::paybill::testing::EqualsProto;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAreArray;

std::vector<std::string> GetTokenStrings(
    const google::protobuf::RepeatedPtrField<PdfTextToken>& tokens) {
  std::vector<std::string> output;
  for (const PdfTextToken& token : tokens) {
    output.push_back(token.ShortDebugString());
  }
  return output;
}

TEST(ReconstructLinesTest, NoToken) {
  PdfPage page;
  ReconstructLines(&page);
  EXPECT_THAT(page.lines(), IsEmpty());
}

TEST(ReconstructLinesTest, OneToken) {
  PdfPage page = ParseProtoFromStringOrDie<PdfPage>(R"pb(
    number: 3
    tokens { text: " Basic " x: 200 y: 540.2 width: 24 }
  )pb");
  ReconstructLines(&page);
  ASSERT_EQ(page.lines_size(), 1);
  EXPECT_THAT(page.lines(0), EqualsProto(R"pb(
                y: 540
                tokens { text: " Basic " x: 200 y: 540.2 width: 24 }
                text: "Basic"
                page_number: 3
              )pb"));
}

TEST(ReconstructLinesTest, GroupsByRoundedY) {
  PdfPage page = ParseProtoFromStringOrDie<PdfPage>(R"pb(
    number: 1
    tokens { text: "00125678" x: 40 y: 499.6 width: 30 }
    tokens { text: "Phone No : 12345" x: 10 y: 700 width: 80 }
    tokens { text: "50000" x: 300 y: 500.4 width: 20 }
    tokens { text: "1" x: 10 y: 500 width: 5 }
  )pb");
  ReconstructLines(&page);
  ASSERT_EQ(page.lines_size(), 2);
  EXPECT_EQ(page.lines(0).y(), 700);
  EXPECT_EQ(page.lines(0).text(), "Phone No : 12345");
  EXPECT_EQ(page.lines(1).y(), 500);
  EXPECT_EQ(page.lines(1).text(), "1 00125678 50000");
}

TEST(ReconstructLinesTest, HalvesRoundUp) {
  PdfTextToken token;
  token.set_y(99.5f);
  EXPECT_EQ(GetLineBucket(token), 100);
  token.set_y(99.49f);
  EXPECT_EQ(GetLineBucket(token), 99);
  token.set_y(-0.5f);
  EXPECT_EQ(GetLineBucket(token), 0);
}

TEST(ReconstructLinesTest, PreservesTheTokenMultiset) {
  PdfPage page = ParseProtoFromStringOrDie<PdfPage>(R"pb(
    number: 1
    tokens { text: "Net Pay" x: 460 y: 610 width: 30 }
    tokens { text: "Total Ded" x: 400 y: 610 width: 35 }
    tokens { text: "   " x: 380 y: 610 width: 5 }
    tokens { text: "Total Ded" x: 400 y: 610 width: 35 }
    tokens { text: "Income" x: 200 y: 611.2 width: 30 }
    tokens { text: "9510" x: 200 y: 598 width: 20 }
  )pb");
  const std::vector<std::string> input_tokens = GetTokenStrings(page.tokens());

  ReconstructLines(&page);
  google::protobuf::RepeatedPtrField<PdfTextToken> flattened;
  for (const PdfTextLine& line : page.lines()) {
    for (const PdfTextToken& token : line.tokens()) *flattened.Add() = token;
  }
  EXPECT_THAT(GetTokenStrings(flattened),
              UnorderedElementsAreArray(input_tokens));
  ASSERT_EQ(page.lines_size(), 3);
  EXPECT_EQ(page.lines(1).text(), "Total Ded Total Ded Net Pay");
}

TEST(ReconstructLinesTest, DocumentLinesSpanPages) {
  PdfDocument document = ParseProtoFromStringOrDie<PdfDocument>(R"pb(
    pages {
      tokens { text: "Deduction Side" x: 10 y: 800 width: 50 }
      tokens { text: "Month of : January-2026" x: 10 y: 780 width: 90 }
    }
    pages {}
    pages { tokens { text: "Total 1200" x: 10 y: 90 width: 50 } }
  )pb");
  ReconstructLines(&document);
  EXPECT_EQ(document.pages(0).number(), 1);
  EXPECT_EQ(document.pages(1).number(), 2);
  EXPECT_EQ(document.pages(2).number(), 3);
  EXPECT_THAT(document.pages(1).lines(), IsEmpty());

  std::vector<std::string> texts;
  std::vector<int> page_numbers;
  for (const PdfTextLine* line : GetDocumentLines(document)) {
    texts.push_back(line->text());
    page_numbers.push_back(line->page_number());
  }
  EXPECT_THAT(texts, ElementsAre("Deduction Side", "Month of : January-2026",
                                 "Total 1200"));
  EXPECT_THAT(page_numbers, ElementsAre(1, 1, 3));
  EXPECT_EQ(GetDocumentText(document),
            "Deduction Side\nMonth of : January-2026\nTotal 1200");
}

}  // namespace
}  // namespace pdf
}  // namespace paybill
