#include "server_io.h"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <sqljudge/intake.h>

std::string kListenHost = "127.0.0.1";
int kListenPort = 8080;

namespace {

void Reply(httplib::Response& res, const IntakeResponse& resp) {
  res.status = resp.status;
  res.set_content(resp.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

} // namespace

bool ServerWorkLoop(Dispatcher& dispatcher, const LivenessMonitor& liveness) {
  httplib::Server svr;
  svr.Post("/submissions", [&](const httplib::Request& req, httplib::Response& res) {
    Reply(res, HandleSubmit(dispatcher, req.body));
  });
  svr.Post("/test-query", [&](const httplib::Request& req, httplib::Response& res) {
    Reply(res, HandleTestQuery(dispatcher, req.body));
  });
  svr.Get(R"(/results/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    Reply(res, HandleResult(dispatcher, req.matches[1]));
  });
  svr.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    Reply(res, HandleHealth(dispatcher, liveness));
  });
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("HTTP {} {} -> {}", req.method, req.path, res.status);
  });
  spdlog::info("Intake listening: host={} port={}", kListenHost, kListenPort);
  if (!svr.listen(kListenHost.c_str(), kListenPort)) {
    spdlog::error("Failed to listen: host={} port={}", kListenHost, kListenPort);
    return false;
  }
  return true;
}
