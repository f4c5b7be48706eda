#ifndef INCLUDE_SQLJUDGE_INTAKE_H_
#define INCLUDE_SQLJUDGE_INTAKE_H_

#include <string>

#include <nlohmann/json.hpp>

#include "error.h"
#include "liveness.h"
#include "dispatcher.h"

// Transport-independent request handlers; the HTTP layer only moves bytes.
struct IntakeResponse {
  int status;
  nlohmann::json body;
};

int HttpStatusFor(ErrorCode);

// body: {"userId": int, "problemId": int, "sqlText": string}
IntakeResponse HandleSubmit(Dispatcher&, const std::string& body);
// 202 with {"status": "pending" | "running"} until the result exists
IntakeResponse HandleResult(Dispatcher&, const std::string& submission_id);
// body: {"problemId": int, "sqlText": string}; nothing is stored
IntakeResponse HandleTestQuery(Dispatcher&, const std::string& body);
IntakeResponse HandleHealth(Dispatcher&, const LivenessMonitor&);

#endif  // INCLUDE_SQLJUDGE_INTAKE_H_
