#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request_start / on_blocked / on_forwarded / on_backend_failure:
//   요청 처리 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   조회 경로(GET /stats)에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 요청 처리 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   rps       : 수집기 생성 이후 평균 초당 요청 수
//   block_rate: blocked_requests / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_requests{0};
    std::uint64_t                              in_flight{0};
    std::uint64_t                              blocked_requests{0};
    std::uint64_t                              forwarded_requests{0};
    std::uint64_t                              backend_failures{0};
    double                                     rps{0.0};
    double                                     block_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
//   요청 처리 이벤트를 집계하고 StatsSnapshot 을 제공한다.
//   요청 하나는 on_request_start 1회 + 종료 이벤트 1회를 발생시킨다.
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : total_requests_{0}
        , in_flight_{0}
        , blocked_requests_{0}
        , forwarded_requests_{0}
        , backend_failures_{0}
        , started_at_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_request_start
    //   프롬프트 처리 시작 시 호출.
    void on_request_start() noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        in_flight_.fetch_add(1, std::memory_order_relaxed);
    }

    // on_blocked
    //   정책에 의해 차단되어 처리가 끝났을 때 호출.
    void on_blocked() noexcept {
        blocked_requests_.fetch_add(1, std::memory_order_relaxed);
        finish();
    }

    // on_forwarded
    //   백엔드가 생성 텍스트를 반환했을 때 호출.
    void on_forwarded() noexcept {
        forwarded_requests_.fetch_add(1, std::memory_order_relaxed);
        finish();
    }

    // on_backend_failure
    //   허용되었으나 백엔드 호출이 실패했을 때 호출
    //   (BackendUnreachable / BackendError / MalformedResponse).
    void on_backend_failure() noexcept {
        backend_failures_.fetch_add(1, std::memory_order_relaxed);
        finish();
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다 (조회 경로).
    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now        = std::chrono::system_clock::now();
        const auto total      = total_requests_.load(std::memory_order_relaxed);
        const auto in_flight  = in_flight_.load(std::memory_order_relaxed);
        const auto blocked    = blocked_requests_.load(std::memory_order_relaxed);
        const auto forwarded  = forwarded_requests_.load(std::memory_order_relaxed);
        const auto failures   = backend_failures_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - started_at_).count();

        double rps = 0.0;
        if (elapsed_sec > 0.0) {
            rps = static_cast<double>(total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_requests     = total,
            .in_flight          = in_flight,
            .blocked_requests   = blocked,
            .forwarded_requests = forwarded,
            .backend_failures   = failures,
            .rps                = rps,
            .block_rate         = block_rate,
            .captured_at        = now,
        };
    }

private:
    void finish() noexcept {
        const std::uint64_t current = in_flight_.load(std::memory_order_relaxed);
        if (current > 0) {
            in_flight_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    std::atomic<std::uint64_t>                 total_requests_;
    std::atomic<std::uint64_t>                 in_flight_;
    std::atomic<std::uint64_t>                 blocked_requests_;
    std::atomic<std::uint64_t>                 forwarded_requests_;
    std::atomic<std::uint64_t>                 backend_failures_;
    const std::chrono::system_clock::time_point started_at_;
};
