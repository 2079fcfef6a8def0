#include "FieldProjector.hpp"

namespace tgw {

Record project(const Record& record, const FieldList& allowed) {
  Record out = Record::object();
  if (!record.is_object()) return out;
  for (const auto& key : allowed) {
    auto it = record.find(key);
    if (it != record.end()) out[key] = *it;
  }
  return out;
}

nlohmann::json projectAll(const nlohmann::json& records, const FieldList& allowed) {
  nlohmann::json out = nlohmann::json::array();
  if (!records.is_array()) return out;
  for (const auto& r : records) out.push_back(project(r, allowed));
  return out;
}

namespace fields {

const FieldList kProjectSummary = {"id", "name", "slug", "description", "is_private"};

const FieldList kProjectDetail = {
  "id", "name", "slug", "description", "is_private", "owner", "members",
  "created_date", "modified_date", "total_milestones", "total_story_points",
  "is_backlog_activated", "is_kanban_activated", "is_epics_activated",
  "is_issues_activated", "tags"
};

const FieldList kEpicSummary = {"id", "ref", "subject", "created_date", "modified_date", "status"};

const FieldList kEpic = {
  "id", "ref", "subject", "project", "status", "description", "assigned_to",
  "tags", "color", "created_date", "modified_date", "version"
};

const FieldList kStorySummary = {
  "id", "ref", "subject", "description", "project", "epic", "epics", "tags",
  "status", "status_extra_info", "assigned_to", "created_date", "modified_date",
  "version"
};

const FieldList kStory = {
  "id", "ref", "subject", "project", "status", "description", "assigned_to",
  "tags", "milestone", "created_date", "modified_date", "version"
};

const FieldList kTask = {
  "id", "ref", "subject", "project", "user_story", "status", "description",
  "assigned_to", "tags", "due_date", "created_date", "modified_date", "version"
};

const FieldList kIssue = {
  "id", "ref", "subject", "project", "status", "priority", "severity",
  "issue_type", "description", "assigned_to", "tags", "created_date",
  "modified_date", "version"
};

const FieldList kStatus = {"id", "name", "slug", "is_closed", "order"};

const FieldList kUser = {"id", "full_name", "username", "email"};

const FieldList kMilestone = {
  "id", "name", "slug", "estimated_start", "estimated_finish", "closed", "project"
};

} // namespace fields

} // namespace tgw
