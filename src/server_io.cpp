#include "server_io.h"

#include <mutex>
#include <algorithm>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <execbox/wire.h>

std::string kListenHost = "0.0.0.0";
int kListenPort = 8000;
size_t kServerThreads = 16;

namespace {

std::mutex server_mtx;
httplib::Server* server = nullptr;
bool stop_requested = false;

void Reply(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(DumpJSON(body), "application/json");
}

void SetupRoutes(httplib::Server& svr, ExecutionService& service) {
  using namespace httplib;

  svr.Options(R"(.*)", [](const Request&, Response& res) {
    res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
    res.status = 204;
  });

  svr.Get("/health", [&service](const Request&, Response& res) {
    Reply(res, 200, HealthJSON(service.SessionCount()));
  });

  svr.Post("/session", [&service](const Request&, Response& res) {
    auto session = service.CreateSession();
    Reply(res, 201, SessionCreatedJSON(*session));
  });

  svr.Delete(R"(/session/([^/]+))", [&service](const Request& req, Response& res) {
    std::string id = req.matches[1];
    service.DestroySession(id);
    Reply(res, 200, SessionDeletedJSON(id));
  });

  svr.Get("/sessions", [&service](const Request&, Response& res) {
    Reply(res, 200, SessionListJSON(service.ListSessions()));
  });

  svr.Post("/execute", [&service](const Request& req, Response& res) {
    std::string error;
    auto exec_req = DecodeExecuteRequest(req.body, error);
    if (!exec_req) {
      spdlog::info("Rejected malformed execute request from {}: {}", req.remote_addr, error);
      Reply(res, 400, ErrorJSON(error));
      return;
    }
    ExecutionEnvelope env = service.Execute(*exec_req);
    Reply(res, EnvelopeStatus(env), EnvelopeJSON(env, exec_req->session_id));
  });

  svr.set_exception_handler([](const Request& req, Response& res, std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (std::exception& e) {
      spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, e.what());
    } catch (...) {
      spdlog::error("Unknown exception on {} {}", req.method, req.path);
    }
    Reply(res, 500, ErrorJSON("Internal Service Error"));
  });

  svr.set_logger([](const Request& req, const Response& res) {
    spdlog::debug("{} {} {} -> {}", req.remote_addr, req.method, req.path, res.status);
  });
}

} // namespace

bool ServerWorkLoop(ExecutionService& service) {
  httplib::Server svr;
  size_t threads = std::max<size_t>(kServerThreads, 1);
  svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  svr.set_default_headers({{"Access-Control-Allow-Origin", "*"}});
  SetupRoutes(svr, service);
  if (!svr.bind_to_port(kListenHost, kListenPort)) {
    spdlog::error("Failed to listen on {}:{}", kListenHost, kListenPort);
    return false;
  }
  {
    std::lock_guard lck(server_mtx);
    if (stop_requested) return true;
    server = &svr;
  }
  spdlog::warn("Listening on {}:{} with {} worker threads", kListenHost, kListenPort, threads);
  bool ret = svr.listen_after_bind();
  {
    std::lock_guard lck(server_mtx);
    server = nullptr;
  }
  spdlog::info("Server stopped");
  return ret;
}

void StopServer() {
  std::lock_guard lck(server_mtx);
  stop_requested = true;
  if (server) server->stop();
}
