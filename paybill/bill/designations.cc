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

#include "paybill/bill/designations.h"

#include <algorithm>

#include "absl/strings/ascii.h"

namespace paybill {

namespace {

std::vector<std::string>* NewDesignations() {
  auto* const designations = new std::vector<std::string>({
      "Specialist",
      "Insurance Medical Officer",
      "Administrative Officer",
      "Junior Clerk",
      "Senior Clerk",
      "Junior Pharmacist",
      "Senior Pharmacist",
      "Matron",
      "Laboratory Technician",
      "Physiotherapist",
      "Head Nurse",
      "Staff Nurse",
      "Superintendent",
      "Peon",
      "Sweeper",
      "Watchman",
      "Driver",
      "Class-IV",
      "Class-III",
  });
  std::stable_sort(designations->begin(), designations->end(),
                   [](const std::string& a, const std::string& b) {
                     return a.size() > b.size();
                   });
  return designations;
}

}  // namespace

const std::vector<std::string>& GetDesignations() {
  static const std::vector<std::string>* const kDesignations =
      NewDesignations();
  return *kDesignations;
}

absl::optional<DesignationMatch> FindDesignation(absl::string_view text) {
  // ASCII lower-casing keeps the byte offsets of the original text.
  const std::string lowercase_text = absl::AsciiStrToLower(text);
  for (const std::string& designation : GetDesignations()) {
    const size_t position =
        lowercase_text.find(absl::AsciiStrToLower(designation));
    if (position == std::string::npos) continue;
    DesignationMatch match;
    match.designation = text.substr(position, designation.size());
    match.before = text.substr(0, position);
    return match;
  }
  return absl::nullopt;
}

}  // namespace paybill
