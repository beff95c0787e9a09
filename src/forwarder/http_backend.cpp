// ---------------------------------------------------------------------------
// http_backend.cpp
//
// Boost.Beast 기반 HTTP/1.1 클라이언트로 생성 백엔드를 호출한다.
//
// [연결 정책]
// - keep-alive 없음. 요청마다 resolve → connect → write → read → close.
// - 네트워크 단계 오류(resolve/connect/write/read/타임아웃)는 모두
//   BackendUnreachable 로 수렴한다. HTTP 상태 코드 오류만 BackendError.
//
// [격리 원칙]
// - 백엔드 실패는 프로세스를 종료시키지 않는다. 모든 예외는 이 파일 안에서
//   ForwardOutcome 으로 변환된다.
// ---------------------------------------------------------------------------

#include "forwarder/http_backend.hpp"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

namespace {

using ExchangeResult = std::expected<HttpExchange, std::string>;

// ---------------------------------------------------------------------------
// exchange
//   요청 하나를 보내고 응답 하나를 읽는 코루틴.
//   timeout 은 각 네트워크 단계의 tcp_stream 만료 시간이다.
// ---------------------------------------------------------------------------
auto exchange(BackendEndpoint                  endpoint,
              http::request<http::string_body> request,
              std::chrono::steady_clock::duration timeout)
    -> asio::awaitable<ExchangeResult>
{
    auto executor = co_await asio::this_coro::executor;

    tcp::resolver     resolver{executor};
    beast::tcp_stream stream{executor};
    boost::system::error_code ec;

    const auto results = co_await resolver.async_resolve(
        endpoint.host,
        std::to_string(endpoint.port),
        asio::redirect_error(asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(fmt::format("resolve {} failed: {}", endpoint.host, ec.message()));
    }

    stream.expires_after(timeout);
    co_await stream.async_connect(results, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(fmt::format("connect {}:{} failed: {}",
                                              endpoint.host, endpoint.port, ec.message()));
    }

    stream.expires_after(timeout);
    co_await http::async_write(stream, request, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(fmt::format("write failed: {}", ec.message()));
    }

    beast::flat_buffer                 buffer;
    http::response<http::string_body>  response;
    stream.expires_after(timeout);
    co_await http::async_read(stream, buffer, response, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(fmt::format("read failed: {}", ec.message()));
    }

    // 정상 종료 시 shutdown 오류는 무시한다 (응답은 이미 수신됨)
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    co_return HttpExchange{response.result_int(), std::move(response.body())};
}

// ---------------------------------------------------------------------------
// run_exchange
//   exchange 코루틴을 전용 io_context 에서 실행하고 deadline 까지만 기다린다.
// ---------------------------------------------------------------------------
ExchangeResult run_exchange(const BackendEndpoint&                endpoint,
                            http::request<http::string_body>      request,
                            std::chrono::steady_clock::duration   timeout,
                            std::chrono::steady_clock::time_point deadline)
{
    std::optional<ExchangeResult> result;
    asio::io_context ioc;

    asio::co_spawn(
        ioc,
        exchange(endpoint, std::move(request), timeout),
        [&result](std::exception_ptr eptr, ExchangeResult value) {
            if (eptr) {
                result.emplace(std::unexpect, describe_exchange_failure(eptr));
                return;
            }
            result.emplace(std::move(value));
        }
    );

    ioc.run_until(deadline);

    if (!result) {
        return std::unexpected(std::string("timed out waiting for backend"));
    }
    return std::move(*result);
}

http::request<http::string_body> make_request(http::verb              method,
                                              const BackendEndpoint&  endpoint,
                                              std::string_view        target)
{
    http::request<http::string_body> req{method, std::string(target), 11};
    req.set(http::field::host, endpoint.host_header());
    req.set(http::field::user_agent, "promptgate");
    req.keep_alive(false);
    return req;
}

}  // namespace

// ---------------------------------------------------------------------------
// 순수 헬퍼
// ---------------------------------------------------------------------------
std::string describe_exchange_failure(std::exception_ptr eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return fmt::format("exchange error: {}", e.what());
    } catch (...) {
        return "unknown exchange error";
    }
}

std::string build_generate_body(std::string_view model, std::string_view prompt) {
    const nlohmann::json body = {
        {"model",  std::string(model)},
        {"prompt", std::string(prompt)},
        {"stream", false},
    };
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ForwardOutcome interpret_generate_response(const HttpExchange& exchange) {
    if (exchange.status < 200 || exchange.status >= 300) {
        return BackendError{exchange.status, exchange.body};
    }

    const auto parsed = nlohmann::json::parse(exchange.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return MalformedResponse{exchange.body};
    }

    const auto it = parsed.find("response");
    if (it == parsed.end() || !it->is_string()) {
        return MalformedResponse{exchange.body};
    }

    return ForwardSuccess{it->get<std::string>()};
}

// ---------------------------------------------------------------------------
// HttpBackend 구현
// ---------------------------------------------------------------------------
HttpBackend::HttpBackend(BackendConfig config)
    : config_{std::move(config)}
    , endpoint_{parse_backend_url(config_.url)}
{
    if (!endpoint_) {
        spdlog::error("http_backend: {}", endpoint_.error());
    }
}

std::expected<void, std::string>
HttpBackend::probe(std::chrono::steady_clock::time_point deadline) const {
    if (!endpoint_) {
        return std::unexpected(endpoint_.error());
    }

    const auto probe_deadline = std::min(deadline, std::chrono::steady_clock::now() + config_.probe_timeout);

    auto result = run_exchange(
        *endpoint_,
        make_request(http::verb::get, *endpoint_, "/"),
        config_.probe_timeout,
        probe_deadline
    );
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    // 상태 코드와 무관하게 응답이 오면 살아 있는 것으로 본다.
    return {};
}

ForwardOutcome HttpBackend::generate(std::string_view                      prompt,
                                     std::chrono::steady_clock::time_point deadline) {
    if (!endpoint_) {
        return BackendUnreachable{endpoint_.error()};
    }

    if (std::chrono::steady_clock::now() >= deadline) {
        return BackendUnreachable{"deadline exceeded before contacting backend"};
    }

    // 1. 프로브
    if (auto alive = probe(deadline); !alive) {
        spdlog::warn("http_backend: backend {}:{} unreachable: {}",
                     endpoint_->host, endpoint_->port, alive.error());
        return BackendUnreachable{fmt::format("probe failed: {}", alive.error())};
    }

    // 2. 생성 요청
    auto request = make_request(http::verb::post, *endpoint_, endpoint_->target);
    request.set(http::field::content_type, "application/json");
    request.body() = build_generate_body(config_.model, prompt);
    request.prepare_payload();

    const auto request_deadline =
        std::min(deadline, std::chrono::steady_clock::now() + config_.request_timeout);

    auto result = run_exchange(*endpoint_, std::move(request), config_.request_timeout, request_deadline);
    if (!result) {
        spdlog::warn("http_backend: generate request failed: {}", result.error());
        return BackendUnreachable{fmt::format("generate request failed: {}", result.error())};
    }

    // 3~5. 응답 해석
    return interpret_generate_response(*result);
}
