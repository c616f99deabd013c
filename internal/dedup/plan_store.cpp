#include "internal/dedup/plan_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "roster/dedup/v1/plan.pb.h"

namespace roster::dedup {
namespace {

namespace fs = std::filesystem;

std::int32_t Narrow(std::int64_t value, const char* field) {
  if (value < std::numeric_limits<std::int32_t>::min() || value > std::numeric_limits<std::int32_t>::max()) {
    throw util::PlanFormatError(std::string(field) + " out of plan range: " + std::to_string(value));
  }
  return static_cast<std::int32_t>(value);
}

void ToProto(const PersonRef& ref, v1::PersonRef* out) {
  out->set_id(Narrow(ref.id, "person id"));
  out->set_name(ref.name);
}

PersonRef FromProto(const v1::PersonRef& ref) {
  return PersonRef{ref.id(), ref.name()};
}

v1::DeduplicationPlan ToProto(const DeduplicationPlan& plan) {
  v1::DeduplicationPlan out;
  *out.mutable_created_at() = util::ToProto(plan.created_at);
  out.set_person_count_before(Narrow(plan.person_count_before, "personCountBefore"));

  auto* summary = out.mutable_summary();
  summary->set_total_actions(Narrow(static_cast<std::int64_t>(plan.TotalActions()), "totalActions"));
  for (const auto& [pass, entry] : plan.by_pass) {
    auto& pb = (*summary->mutable_by_pass())[std::to_string(pass)];
    pb.set_count(Narrow(entry.count, "byPass count"));
    pb.set_type(entry.type);
    pb.set_label(entry.label);
  }

  for (const auto& action : plan.actions) {
    auto* a = out.add_actions();
    a->set_id(Narrow(action.id, "action id"));
    a->set_pass(action.pass);
    a->set_type(std::string(roster::model::ToString(action.type)));
    a->set_reason(action.reason);
    for (const auto& t : action.targets) ToProto(t, a->add_targets());
    if (action.canonical) ToProto(*action.canonical, a->mutable_canonical());
    for (const auto& d : action.duplicates) ToProto(d, a->add_duplicates());
    a->set_evidence(action.evidence);
    a->set_status(std::string(roster::model::ToString(action.status)));
  }
  return out;
}

DeduplicationAction FromProto(const v1::DeduplicationAction& a) {
  const auto where = "action " + std::to_string(a.id());

  DeduplicationAction action;
  action.id = a.id();

  if (!a.has_pass() || a.pass() < 0 || a.pass() >= kPassCount) {
    throw util::PlanFormatError(where + ": missing or invalid pass");
  }
  action.pass = a.pass();

  auto type = roster::model::ActionTypeFromString(a.type());
  if (!type) throw util::PlanFormatError(where + ": unknown type '" + a.type() + "'");
  action.type = *type;

  auto status = roster::model::ActionStatusFromString(a.status());
  if (!status) throw util::PlanFormatError(where + ": unknown status '" + a.status() + "'");
  action.status = *status;

  action.reason   = a.reason();
  action.evidence = a.evidence();
  for (const auto& t : a.targets()) action.targets.push_back(FromProto(t));
  if (a.has_canonical()) action.canonical = FromProto(a.canonical());
  for (const auto& d : a.duplicates()) action.duplicates.push_back(FromProto(d));
  return action;
}

DeduplicationPlan FromProto(const v1::DeduplicationPlan& in) {
  DeduplicationPlan plan;
  plan.created_at          = util::FromProto(in.created_at());
  plan.person_count_before = in.person_count_before();

  for (const auto& [key, entry] : in.summary().by_pass()) {
    int pass = 0;
    try {
      pass = std::stoi(key);
    } catch (const std::exception&) {
      throw util::PlanFormatError("summary.byPass: key '" + key + "' is not a pass number");
    }
    plan.by_pass[pass] = PassSummary{entry.count(), entry.type(), entry.label()};
  }

  plan.actions.reserve(static_cast<std::size_t>(in.actions_size()));
  for (const auto& a : in.actions()) plan.actions.push_back(FromProto(a));
  return plan;
}

} // namespace

PlanStore::PlanStore(std::string path) : path_(std::move(path)) {
}

bool PlanStore::Exists() const {
  return fs::exists(path_);
}

std::string PlanStore::ToJson(const DeduplicationPlan& plan) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(ToProto(plan), &json, options);
  if (!status.ok()) {
    throw util::PlanFormatError("failed to serialize plan: " + std::string(status.message()));
  }
  return json;
}

DeduplicationPlan PlanStore::FromJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  v1::DeduplicationPlan pb;
  auto status = google::protobuf::util::JsonStringToMessage(json, &pb, options);
  if (!status.ok()) {
    throw util::PlanFormatError("invalid plan: " + std::string(status.message()));
  }
  return FromProto(pb);
}

DeduplicationPlan PlanStore::Load() const {
  if (!Exists()) {
    throw util::NotFound("plan file not found: " + path_ + " (run dry-run first to generate a plan)");
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw util::PlanFormatError("cannot open plan file: " + path_);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return FromJson(buffer.str());
}

void PlanStore::Save(const DeduplicationPlan& plan) const {
  const auto json   = ToJson(plan);
  const auto target = fs::path(path_);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path());
  }

  auto temp = target;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write plan file: " + temp.string());
    }
    out << json;
    out.flush();
    if (!out) {
      throw std::runtime_error("short write to plan file: " + temp.string());
    }
  }
  fs::rename(temp, target);
}

} // namespace roster::dedup
