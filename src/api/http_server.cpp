#include "api/http_server.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include "api/invocation_endpoints.h"
#include "api/protocol_adapter.h"
#include "utils/request_id.h"

namespace hostgate {

namespace {
bool accepts_gzip(const httplib::Request& req) {
    if (!req.has_header("Accept-Encoding")) return false;
    auto enc = req.get_header_value("Accept-Encoding");
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

std::string gzip_compress(const std::string& input) {
    if (input.empty()) return {};

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.reserve(input.size() / 2);
    char buffer[16384];

    int ret = Z_OK;
    while (ret == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(sizeof(buffer));
        ret = deflate(&zs, zs.avail_in ? Z_NO_FLUSH : Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return {};
        }
        output.append(buffer, sizeof(buffer) - zs.avail_out);
    }

    deflateEnd(&zs);
    return output;
}
}  // namespace

HttpServer::HttpServer(std::string bind_address, int port, InvocationEndpoints& endpoints)
    : bind_address_(std::move(bind_address)), port_(port), endpoints_(endpoints) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
    if (running_) return;

    if (thread_count_ > 0) {
        const size_t threads = static_cast<size_t>(thread_count_);
        server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    }

    // Request ID: echo the caller's, or mint one
    server_.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        res.set_header("X-Request-Id", resolve_request_id(req.get_header_value("X-Request-Id")));
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Streamed responses have no body here and are never compressed
    server_.set_post_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!accepts_gzip(req)) return;
        if (res.body.empty()) return;
        if (res.has_header("Content-Encoding")) return;

        auto compressed = gzip_compress(res.body);
        if (compressed.empty()) return;

        const auto content_type = res.get_header_value("Content-Type");
        res.set_content(compressed,
                        content_type.empty() ? "application/octet-stream" : content_type);
        res.set_header("Content-Encoding", "gzip");
        res.set_header("Vary", "Accept-Encoding");
    });

    if (logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            logger_(req, res);
        });
    }

    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        nlohmann::json body = {
            {"error", res.status == 404 ? "not_found" : "http_error"},
            {"status", res.status},
            {"path", req.path}
        };
        res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
        }
        spdlog::error("[{}] unhandled error on {} {}: {}", res.get_header_value("X-Request-Id"),
                      req.method, req.path, what);
        res.status = 500;
        res.set_content(ProtocolAdapter::internalErrorBody(), "application/json");
    });

    endpoints_.registerRoutes(server_);

    if (!server_.bind_to_port(bind_address_.c_str(), port_)) {
        throw std::runtime_error("failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }

    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::info("Listening on {}:{}", bind_address_, port_);
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace hostgate
