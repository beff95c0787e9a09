#pragma once

// ---------------------------------------------------------------------------
// stub_http_server.hpp
//
// 테스트 전용 HTTP 스텁 서버 (생성 백엔드 대역).
//
// [테스트 패턴]
// - 127.0.0.1:0 에 바인딩하여 OS 가 포트를 할당한다 (테스트 간 충돌 없음).
// - 전용 io_context 를 백그라운드 스레드에서 구동한다.
// - 받은 요청(method/target/body)을 모두 기록하여 테스트가 검사할 수 있게 한다.
// - 응답은 생성자에 주입한 핸들러가 결정한다. delay 가 있으면 그만큼 늦게 응답.
// ---------------------------------------------------------------------------

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace stub {

struct RecordedRequest {
    std::string method;
    std::string target;
    std::string body;
};

struct StubResponse {
    unsigned                  status{200};
    std::string               body{};
    std::chrono::milliseconds delay{0};
};

// Ollama 와 같은 기본 동작: GET 은 "Ollama is running", POST 는 응답 생성
inline StubResponse ollama_like(const RecordedRequest& req) {
    if (req.method == "GET") {
        return StubResponse{200, "Ollama is running"};
    }
    return StubResponse{200, R"({"model":"llama3","response":"Paris","done":true})"};
}

class StubHttpServer {
public:
    using Handler = std::function<StubResponse(const RecordedRequest&)>;

    explicit StubHttpServer(Handler handler = ollama_like)
        : handler_{std::move(handler)}
        , acceptor_{ioc_, boost::asio::ip::tcp::endpoint{
                              boost::asio::ip::make_address("127.0.0.1"), 0}}
    {
        port_ = acceptor_.local_endpoint().port();
        boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);
        thread_ = std::thread([this]() { ioc_.run(); });
    }

    ~StubHttpServer() {
        ioc_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    StubHttpServer(const StubHttpServer&)            = delete;
    StubHttpServer& operator=(const StubHttpServer&) = delete;

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::string url(const std::string& path = "/api/generate") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t count(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& r : requests_) {
            if (r.method == method) {
                ++n;
            }
        }
        return n;
    }

private:
    boost::asio::awaitable<void> accept_loop() {
        for (;;) {
            boost::system::error_code ec;
            auto socket = co_await acceptor_.async_accept(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                co_return;
            }
            boost::asio::co_spawn(ioc_, serve(std::move(socket)), boost::asio::detached);
        }
    }

    boost::asio::awaitable<void> serve(boost::asio::ip::tcp::socket socket) {
        namespace http = boost::beast::http;

        boost::beast::tcp_stream           stream{std::move(socket)};
        boost::beast::flat_buffer          buffer;
        http::request<http::string_body>   req;
        boost::system::error_code          ec;

        co_await http::async_read(stream, buffer, req,
                                  boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return;
        }

        const auto method = req.method_string();
        const auto target = req.target();
        RecordedRequest recorded{
            std::string(method.data(), method.size()),
            std::string(target.data(), target.size()),
            req.body(),
        };
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(recorded);
        }

        const StubResponse reply = handler_(recorded);

        if (reply.delay.count() > 0) {
            boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};
            timer.expires_after(reply.delay);
            co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }

        http::response<http::string_body> res{static_cast<http::status>(reply.status), req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = reply.body;
        res.prepare_payload();

        co_await http::async_write(stream, res,
                                   boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }

    Handler                        handler_;
    boost::asio::io_context        ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::uint16_t                  port_{0};
    std::thread                    thread_;

    mutable std::mutex             mutex_;
    std::vector<RecordedRequest>   requests_;
};

// 바인딩 후 바로 닫은 포트. 연결 시 connection refused.
inline std::uint16_t unused_port() {
    boost::asio::io_context        ioc;
    boost::asio::ip::tcp::acceptor acceptor{
        ioc, boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    const auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

}  // namespace stub
