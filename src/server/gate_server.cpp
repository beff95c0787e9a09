#include "server/gate_server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>
#include <variant>

// ---------------------------------------------------------------------------
// GateServer: 구현
//
// handle_connection() 흐름:
//   1. 요청 읽기 (body_limit = max_prompt_bytes, 초과 시 413)
//   2. 라우팅
//      POST /api/generate → 본문 JSON 검증 → workers_ 에서 gate_->handle()
//      GET  /health, GET /stats → 즉시 응답
//   3. 응답 쓰기 후 close
// ---------------------------------------------------------------------------

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;
using json      = nlohmann::json;

namespace {

using Request  = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// -----------------------------------------------------------------------
// HTTP 응답 빌더 헬퍼
// -----------------------------------------------------------------------
Response json_response(http::status status, const json& body) {
    Response res{status, 11};
    res.set(http::field::server, "promptgate");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

Response error_response(http::status status, std::string_view error, std::string_view detail) {
    return json_response(status, json{
        {"status", "error"},
        {"error",  std::string(error)},
        {"detail", std::string(detail)},
    });
}

json stats_to_json(const StatsSnapshot& snap) {
    const auto captured_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        snap.captured_at.time_since_epoch()).count();
    return json{
        {"total_requests",     snap.total_requests},
        {"in_flight",          snap.in_flight},
        {"blocked_requests",   snap.blocked_requests},
        {"forwarded_requests", snap.forwarded_requests},
        {"backend_failures",   snap.backend_failures},
        {"rps",                snap.rps},
        {"block_rate",         snap.block_rate},
        {"captured_at_ms",     captured_ms},
    };
}

// -----------------------------------------------------------------------
// outcome_response
//   RequestOutcome → HTTP 응답.
//   BLOCKED 403, SUCCESS 200, BackendUnreachable 503,
//   BackendError / MalformedResponse 502
// -----------------------------------------------------------------------
Response outcome_response(const RequestOutcome& outcome, const std::string& model) {
    const auto& classification = outcome.decision.classification;

    switch (outcome.kind) {
        case OutcomeKind::kBlocked: {
            json direct = json::array();
            for (const auto& m : classification.direct_matches) {
                direct.push_back(json{{"kind", to_string(m.kind)}, {"signature", m.text}});
            }
            return json_response(http::status::forbidden, json{
                {"status",           "blocked"},
                {"request_id",       outcome.request_id},
                {"reason",           outcome.decision.reason},
                {"direct_matches",   std::move(direct)},
                {"indirect_matches", classification.indirect_matches},
            });
        }
        case OutcomeKind::kSuccess: {
            const auto* text = outcome.response_text();
            return json_response(http::status::ok, json{
                {"model",      model},
                {"response",   text != nullptr ? *text : std::string{}},
                {"done",       true},
                {"request_id", outcome.request_id},
            });
        }
        case OutcomeKind::kBackendUnreachable: {
            const auto* u = std::get_if<BackendUnreachable>(&*outcome.forward);
            return error_response(http::status::service_unavailable, to_string(outcome.kind),
                                  u != nullptr ? u->detail : std::string{});
        }
        case OutcomeKind::kBackendError: {
            const auto* e = std::get_if<BackendError>(&*outcome.forward);
            return json_response(http::status::bad_gateway, json{
                {"status",         "error"},
                {"error",          to_string(outcome.kind)},
                {"backend_status", e != nullptr ? e->status : 0U},
                {"detail",         e != nullptr ? truncate_for_log(e->body) : std::string{}},
            });
        }
        case OutcomeKind::kMalformedResponse:
        default: {
            const auto* m = std::get_if<MalformedResponse>(&*outcome.forward);
            return error_response(http::status::bad_gateway, "MalformedResponse",
                                  m != nullptr ? truncate_for_log(m->body) : std::string{});
        }
    }
}

// 쿼리 문자열을 제외한 경로
std::string request_path(const Request& req) {
    const auto target = req.target();
    std::string path(target.data(), target.size());
    if (const auto pos = path.find('?'); pos != std::string::npos) {
        path.resize(pos);
    }
    return path;
}

}  // namespace

// ---------------------------------------------------------------------------
// GateServer 생성자
// ---------------------------------------------------------------------------
GateServer::GateServer(GateServerConfig                config,
                       std::shared_ptr<PromptGate>     gate,
                       std::shared_ptr<StatsCollector> stats,
                       boost::asio::io_context&        io_context)
    : config_{std::move(config)}
    , gate_{std::move(gate)}
    , stats_{std::move(stats)}
    , io_context_{io_context}
    , acceptor_{io_context}
    , workers_{config_.worker_threads}
{
    const auto endpoint = tcp::endpoint{
        asio::ip::make_address(config_.listen_address),
        config_.listen_port
    };

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    local_port_ = acceptor_.local_endpoint().port();
}

GateServer::~GateServer() {
    workers_.join();
}

// ---------------------------------------------------------------------------
// GateServer::run
// ---------------------------------------------------------------------------
auto GateServer::run() -> asio::awaitable<void>
{
    spdlog::info("gate_server: listening on {}:{} (workers={})",
                 config_.listen_address, local_port_, config_.worker_threads);

    while (!stopping_) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(
            asio::redirect_error(asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == asio::error::operation_aborted) {
                spdlog::info("gate_server: acceptor closed");
                break;
            }
            if (!stopping_) {
                spdlog::warn("gate_server: accept error: {}", ec.message());
            }
            continue;
        }

        if (stopping_) {
            boost::system::error_code close_ec;
            socket.close(close_ec);
            continue;
        }

        ++active_connections_;
        const std::uint64_t request_id = next_request_id_++;

        asio::co_spawn(
            io_context_,
            handle_connection(std::move(socket), request_id),
            [this, request_id](std::exception_ptr eptr) {
                if (eptr) {
                    try { std::rethrow_exception(eptr); }
                    catch (const std::exception& e) {
                        spdlog::error("gate_server: request {} exception: {}", request_id, e.what());
                    }
                }
                on_connection_closed();
            }
        );
    }
}

// ---------------------------------------------------------------------------
// GateServer::handle_connection
// ---------------------------------------------------------------------------
auto GateServer::handle_connection(tcp::socket socket, std::uint64_t request_id)
    -> asio::awaitable<void>
{
    boost::system::error_code ec;

    std::string client_ip{"unknown"};
    if (const auto remote = socket.remote_endpoint(ec); !ec) {
        client_ip = remote.address().to_string();
    }

    beast::tcp_stream                  stream{std::move(socket)};
    beast::flat_buffer                 buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(config_.max_prompt_bytes);

    stream.expires_after(config_.io_timeout);
    co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));

    Response response;

    if (ec == http::error::body_limit) {
        response = error_response(http::status::payload_too_large, "PayloadTooLarge",
                                  "request body exceeds " + std::to_string(config_.max_prompt_bytes)
                                      + " bytes");
    } else if (ec) {
        spdlog::debug("gate_server: read error from {}: {}", client_ip, ec.message());
        co_return;
    } else {
        const Request&    req  = parser.get();
        const std::string path = request_path(req);

        if (path == "/api/generate" && req.method() == http::verb::post) {
            const auto body = json::parse(req.body(), nullptr, false);
            const auto it   = body.is_object() ? body.find("prompt") : body.end();

            if (body.is_discarded() || !body.is_object() || it == body.end() || !it->is_string()) {
                response = error_response(http::status::bad_request, "BadRequest",
                                          "body must be a JSON object with a string 'prompt'");
            } else {
                const auto prompt   = it->get<std::string>();
                const auto deadline = std::chrono::steady_clock::now() + config_.request_budget;
                RequestContext context{request_id, client_ip, std::chrono::system_clock::now()};

                try {
                    // 블로킹 파이프라인은 워커 풀에서 실행
                    const auto outcome = co_await asio::co_spawn(
                        workers_,
                        [this, &prompt, &context, deadline]() -> asio::awaitable<RequestOutcome> {
                            co_return gate_->handle(prompt, deadline, context);
                        },
                        asio::use_awaitable
                    );
                    response = outcome_response(outcome, gate_->model());
                } catch (const std::exception& e) {
                    spdlog::error("gate_server: request {} failed: {}", request_id, e.what());
                    response = error_response(http::status::internal_server_error, "Internal",
                                              e.what());
                }
            }
        } else if (path == "/health" && req.method() == http::verb::get) {
            response = json_response(http::status::ok, json{
                {"status",     "ok"},
                {"signatures", gate_->signatures().total()},
                {"model",      gate_->model()},
            });
        } else if (path == "/stats" && req.method() == http::verb::get) {
            response = json_response(http::status::ok,
                                     stats_ ? stats_to_json(stats_->snapshot()) : json::object());
        } else {
            response = json_response(http::status::not_found, json{{"status", "not found"}});
        }
    }

    stream.expires_after(config_.io_timeout);
    co_await http::async_write(stream, response, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("gate_server: write error to {}: {}", client_ip, ec.message());
    }

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream.socket().close(ec);
}

// ---------------------------------------------------------------------------
// GateServer::stop
//   1. stopping_ = true
//   2. acceptor close (run() 루프 종료)
//   3. 진행 중인 연결이 없으면 즉시 io_context 중단
// ---------------------------------------------------------------------------
void GateServer::stop()
{
    asio::post(io_context_, [this]() {
        if (stopping_) {
            return;
        }
        stopping_ = true;

        spdlog::info("gate_server: stopping: active connections: {}", active_connections_);

        boost::system::error_code ec;
        acceptor_.close(ec);

        if (active_connections_ == 0) {
            io_context_.stop();
        }
    });
}

void GateServer::on_connection_closed()
{
    if (active_connections_ > 0) {
        --active_connections_;
    }
    if (stopping_ && active_connections_ == 0) {
        spdlog::info("gate_server: all connections closed, stopping io_context");
        io_context_.stop();
    }
}
