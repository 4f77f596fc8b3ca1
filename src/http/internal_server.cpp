#include "http/internal_server.hpp"

#include <chrono>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "http/api_handlers.hpp"
#include "util/log.hpp"
#include "util/time.hpp"
#include "util/uuid.hpp"

namespace verirag
{
    namespace
    {

        constexpr std::string_view kJson = "application/json";

        void write_response(httplib::Response &res, const ApiResponse &response)
        {
            res.status = response.status;
            res.set_content(response.body.dump(), std::string{kJson});
        }

        void log_request(const std::string &action, const std::string &trace_id, long long latency_ms, int status)
        {
            std::ostringstream oss;
            oss << action << " trace_id=" << trace_id << " status=" << status << " latency_ms=" << latency_ms;
            log::info(oss.str());
        }

        // Runs one endpoint, turning every exception into an error response.
        // Each failure is logged once here with its full cause.
        void dispatch(const char *action, httplib::Response &res, const std::function<ApiResponse()> &handler)
        {
            const auto trace_id = uuid::generate();
            const auto start = std::chrono::steady_clock::now();
            try
            {
                write_response(res, handler());
            }
            catch (const std::exception &ex)
            {
                const auto response = error_response(ex);
                write_response(res, response);
                log::error(std::string{action} + " trace_id=" + trace_id + " failed: " + ex.what());
            }
            log_request(action, trace_id, time::elapsed_ms(start), res.status);
        }

    } // namespace

    int run_http_server(RagService &rag, const std::string &host, int port)
    {
        ApiHandlers handlers(rag);
        httplib::Server server;

        server.Post("/internal/ask", [&](const httplib::Request &req, httplib::Response &res)
                    { dispatch("ask_http", res, [&]
                               { return handlers.ask(req.body); }); });

        server.Post("/internal/documents", [&](const httplib::Request &req, httplib::Response &res)
                    { dispatch("ingest_http", res, [&]
                               { return handlers.ingest(req.body); }); });

        server.Delete(R"(/internal/documents/([^/]+))", [&](const httplib::Request &req, httplib::Response &res)
                      { dispatch("soft_delete_http", res, [&]
                                 { return handlers.soft_delete(req.matches[1].str()); }); });

        server.Post(R"(/internal/documents/([^/]+)/restore)", [&](const httplib::Request &req, httplib::Response &res)
                    { dispatch("restore_http", res, [&]
                               { return handlers.restore(req.matches[1].str()); }); });

        server.set_error_handler([](const httplib::Request &, httplib::Response &res)
                                 {
            if (!res.body.empty()) {
                return;
            }
            nlohmann::json body;
            body["error"] = {{"code", res.status == 404 ? "NOT_FOUND" : "INTERNAL_ERROR"},
                             {"message", res.status == 404 ? "no such endpoint" : "internal server error"}};
            res.set_content(body.dump(), std::string{kJson}); });

        log::info("http server listening on " + host + ":" + std::to_string(port));
        if (!server.listen(host.c_str(), port))
        {
            log::error("http server failed to start on " + host + ":" + std::to_string(port));
            return 2;
        }
        return 0;
    }

} // namespace verirag
