#include <lineidx/json_codec.hpp>
#include <lineidx/progress_store.hpp>
#include <lineidx/util.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lineidx {

const char *to_string(JobStatus s) {
  switch (s) {
  case JobStatus::InProgress:
    return "in_progress";
  case JobStatus::Completed:
    return "completed";
  }
  return "in_progress";
}

std::optional<JobStatus> parse_job_status(std::string_view s) {
  if (s == "in_progress")
    return JobStatus::InProgress;
  if (s == "completed")
    return JobStatus::Completed;
  return std::nullopt;
}

static Json::Value job_to_json(const JobCursor &j) {
  Json::Value v(Json::objectValue);
  v["position"] = Json::UInt64(j.position);
  v["file_size"] = Json::UInt64(j.file_size);
  v["file_mtime"] = j.file_mtime;
  v["status"] = to_string(j.status);
  v["created_at"] = j.created_at;
  v["last_checkpoint_at"] = j.last_checkpoint_at;
  v["completed_at"] =
      j.completed_at ? Json::Value(*j.completed_at) : Json::Value();
  return v;
}

static std::optional<JobCursor> job_from_json(const std::string &id,
                                              const Json::Value &v) {
  if (!v.isObject())
    return std::nullopt;
  const auto &pos = v["position"];
  const auto &size = v["file_size"];
  const auto &mtime = v["file_mtime"];
  const auto &status = v["status"];
  const auto &created = v["created_at"];
  const auto &last = v["last_checkpoint_at"];
  if (!pos.isUInt64() || !size.isUInt64() || !mtime.isNumeric() ||
      !status.isString() || !created.isString() || !last.isString())
    return std::nullopt;
  auto st = parse_job_status(status.asString());
  if (!st)
    return std::nullopt;

  JobCursor j;
  j.job_id = id;
  j.position = pos.asUInt64();
  j.file_size = size.asUInt64();
  j.file_mtime = mtime.asDouble();
  j.status = *st;
  j.created_at = created.asString();
  j.last_checkpoint_at = last.asString();

  // completed_at может отсутствовать или быть null
  const auto &done = v["completed_at"];
  if (done.isString())
    j.completed_at = done.asString();
  else if (!done.isNull())
    return std::nullopt;
  return j;
}

void ProgressStore::save(const fs::path &p, const JobMap &jobs) {
  Json::Value doc(Json::objectValue);
  doc["format_version"] = kProgressFormatVersion;
  Json::Value js(Json::objectValue);
  for (const auto &[id, job] : jobs)
    js[id] = job_to_json(job);
  doc["jobs"] = js;
  write_file_atomic(p, write_json_compact(doc));
}

std::optional<JobMap> ProgressStore::load(const fs::path &p) {
  auto text = read_file(p);
  if (!text)
    return std::nullopt;

  auto doc = try_parse_json(*text);
  if (!doc || !doc->isObject()) {
    spdlog::debug("progress {}: ignored (not a JSON object)", p.string());
    return std::nullopt;
  }
  const auto &ver = (*doc)["format_version"];
  if (!ver.isString() || ver.asString() != kProgressFormatVersion) {
    spdlog::debug("progress {}: ignored (format_version mismatch)",
                  p.string());
    return std::nullopt;
  }

  JobMap out;
  const auto &js = (*doc)["jobs"];
  if (js.isNull())
    return out;
  if (!js.isObject()) {
    spdlog::debug("progress {}: ignored (jobs is not an object)", p.string());
    return std::nullopt;
  }
  for (const auto &id : js.getMemberNames()) {
    auto job = job_from_json(id, js[id]);
    if (!job) {
      spdlog::debug("progress {}: ignored (bad job '{}')", p.string(), id);
      return std::nullopt;
    }
    out.emplace(id, std::move(*job));
  }
  return out;
}

void ProgressStore::update_one(const fs::path &p, const JobCursor &job) {
  auto jobs = load(p).value_or(JobMap{});
  jobs[job.job_id] = job;
  save(p, jobs);
}

bool ProgressStore::delete_one(const fs::path &p, const std::string &job_id) {
  auto jobs = load(p);
  if (!jobs || jobs->erase(job_id) == 0)
    return false;
  save(p, *jobs);
  return true;
}

} // namespace lineidx
