#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tgw {

using Record = nlohmann::json;
using FieldList = std::vector<std::string>;

// Returns a copy of `record` reduced to the allowed keys that are present.
// Allowed keys missing from the record are left out, not filled with null.
// Non-object input yields an empty object.
Record project(const Record& record, const FieldList& allowed);

// Applies project() to every element of an array.
nlohmann::json projectAll(const nlohmann::json& records, const FieldList& allowed);

// Allow-lists for outbound records.
namespace fields {
extern const FieldList kProjectSummary;
extern const FieldList kProjectDetail;
extern const FieldList kEpicSummary;
extern const FieldList kEpic;
extern const FieldList kStorySummary;
extern const FieldList kStory;
extern const FieldList kTask;
extern const FieldList kIssue;
extern const FieldList kStatus;
extern const FieldList kUser;
extern const FieldList kMilestone;
} // namespace fields

} // namespace tgw
