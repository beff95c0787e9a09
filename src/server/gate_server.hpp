#pragma once

// ---------------------------------------------------------------------------
// gate_server.hpp
//
// promptgate HTTP 프론트. 백엔드와 같은 와이어 포맷(POST /api/generate)을
// 받아 PromptGate 로 처리하고 결과를 JSON 으로 돌려준다.
//
//   POST /api/generate → 200 / 400 / 403 / 413 / 502 / 503
//   GET  /health       → 200 {"status":"ok","signatures":N,"model":...}
//   GET  /stats        → 200 StatsSnapshot JSON
//   기타               → 404
//
// [스레드 모델]
// - accept 루프와 HTTP 입출력은 io_context 위의 코루틴에서 실행된다.
// - PromptGate::handle() 은 블로킹 호출(백엔드 HTTP)이므로 thread_pool 로
//   넘겨 실행하고 완료를 co_await 한다.
// - 연결당 요청 하나. 응답 후 소켓 close (keep-alive 없음).
// ---------------------------------------------------------------------------

#include "gate/prompt_gate.hpp"
#include "stats/stats_collector.hpp"

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// GateServerConfig
//   listen_address  : 바인딩 IP (예: "127.0.0.1")
//   listen_port     : 리슨 포트 (0 이면 OS 가 할당, local_port() 로 확인)
//   worker_threads  : PromptGate::handle() 실행 스레드 수
//   max_prompt_bytes: 요청 본문 최대 크기. 초과 시 413.
//   request_budget  : 요청당 백엔드 deadline (수신 시각 기준)
//   io_timeout      : 클라이언트 요청 읽기/응답 쓰기 타임아웃
// ---------------------------------------------------------------------------
struct GateServerConfig {
    std::string                         listen_address{"127.0.0.1"};
    std::uint16_t                       listen_port{8088};
    std::uint32_t                       worker_threads{4};
    std::uint32_t                       max_prompt_bytes{1024 * 1024};
    std::chrono::steady_clock::duration request_budget{std::chrono::seconds{61}};
    std::chrono::steady_clock::duration io_timeout{std::chrono::seconds{30}};
};

// ---------------------------------------------------------------------------
// GateServer
//
//   사용 예:
//     GateServer server(config, gate, stats, io_ctx);
//     co_spawn(io_ctx, server.run(), ...);
//     io_ctx.run();
//
//   Graceful Shutdown:
//     stop() 호출 시 새 연결을 거부하고, 진행 중인 연결이 모두 끝나면
//     io_context 를 중단한다.
// ---------------------------------------------------------------------------
class GateServer {
public:
    // 생성자에서 acceptor 를 열고 bind/listen 한다.
    // 실패 시 boost::system::system_error 를 던진다.
    GateServer(GateServerConfig                config,
               std::shared_ptr<PromptGate>     gate,
               std::shared_ptr<StatsCollector> stats,
               boost::asio::io_context&        io_context);

    ~GateServer();

    GateServer(const GateServer&)            = delete;
    GateServer& operator=(const GateServer&) = delete;
    GateServer(GateServer&&)                 = delete;
    GateServer& operator=(GateServer&&)      = delete;

    // run: accept 루프 코루틴. acceptor 가 닫히면 반환한다.
    boost::asio::awaitable<void> run();

    // stop: 다른 스레드에서 호출해도 안전 (io_context 로 post).
    void stop();

    [[nodiscard]] std::uint16_t local_port() const noexcept { return local_port_; }

private:
    GateServerConfig                config_;
    std::shared_ptr<PromptGate>     gate_;
    std::shared_ptr<StatsCollector> stats_;
    boost::asio::io_context&        io_context_;
    boost::asio::ip::tcp::acceptor  acceptor_;
    boost::asio::thread_pool        workers_;
    std::uint16_t                   local_port_{0};

    // io_context 스레드에서만 접근
    bool                            stopping_{false};
    std::uint64_t                   active_connections_{0};
    std::uint64_t                   next_request_id_{1};

    boost::asio::awaitable<void> handle_connection(boost::asio::ip::tcp::socket socket,
                                                   std::uint64_t                request_id);
    void on_connection_closed();
};
