#include <sqljudge/job.h>

void to_json(nlohmann::json& j, const Job& job) {
  j = nlohmann::json{
    {"job_id", job.job_id},
    {"submission_id", job.submission_id},
    {"problem_id", job.problem_id},
    {"dataset", job.dataset},
    {"time_limit_us", job.time_limit},
    {"memory_limit_kib", job.memory_limit},
    {"max_rows", job.max_rows},
    {"enqueued_at", job.enqueued_at},
  };
}

void from_json(const nlohmann::json& j, Job& job) {
  j.at("job_id").get_to(job.job_id);
  j.at("submission_id").get_to(job.submission_id);
  j.at("problem_id").get_to(job.problem_id);
  j.at("dataset").get_to(job.dataset);
  j.at("time_limit_us").get_to(job.time_limit);
  j.at("memory_limit_kib").get_to(job.memory_limit);
  job.max_rows = j.value("max_rows", (int64_t)0);
  job.enqueued_at = j.value("enqueued_at", (int64_t)0);
}

std::string Job::Serialize() const {
  return nlohmann::json(*this).dump();
}

Job Job::Deserialize(const std::string& str) {
  return nlohmann::json::parse(str).get<Job>();
}
