// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector 단위 테스트.
//
// [테스트 범위]
// - 초기 상태 검증 (all-zero)
// - on_request_start: total_requests / in_flight 증가
// - on_blocked / on_forwarded / on_backend_failure: 종료 카운터 증가, in_flight 감소
// - in_flight 언더플로우 방지
// - snapshot(): block_rate 계산, total == 0 시 0.0
// - ConcurrentAccess: 멀티스레드 동시성 (data race 미발생 확인)
//
// [알려진 한계]
// - rps 는 생성 이후 누적 평균이므로 절대값은 테스트 실행 시간에 따라 달라진다.
//   양수 여부만 검증한다.
// ---------------------------------------------------------------------------

#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// InitialState_AllZero
// ---------------------------------------------------------------------------
TEST(StatsCollector, InitialState_AllZero) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_requests,     0u) << "total_requests must be 0 at init";
    EXPECT_EQ(snap.in_flight,          0u) << "in_flight must be 0 at init";
    EXPECT_EQ(snap.blocked_requests,   0u) << "blocked_requests must be 0 at init";
    EXPECT_EQ(snap.forwarded_requests, 0u) << "forwarded_requests must be 0 at init";
    EXPECT_EQ(snap.backend_failures,   0u) << "backend_failures must be 0 at init";
    EXPECT_NEAR(snap.block_rate,       0.0, 1e-9) << "block_rate must be 0.0 at init";
}

// ---------------------------------------------------------------------------
// OnRequestStart_IncrementsTotalAndInFlight
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnRequestStart_IncrementsTotalAndInFlight) {
    StatsCollector stats;

    stats.on_request_start();
    stats.on_request_start();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_requests, 2u);
    EXPECT_EQ(snap.in_flight,      2u);
}

// ---------------------------------------------------------------------------
// Completion events
//   각 종료 이벤트는 자기 카운터만 올리고 in_flight 를 내린다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, CompletionEvents_CountSeparately) {
    StatsCollector stats;

    for (int i = 0; i < 3; ++i) {
        stats.on_request_start();
    }
    stats.on_blocked();
    stats.on_forwarded();
    stats.on_backend_failure();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_requests,     3u);
    EXPECT_EQ(snap.in_flight,          0u);
    EXPECT_EQ(snap.blocked_requests,   1u);
    EXPECT_EQ(snap.forwarded_requests, 1u);
    EXPECT_EQ(snap.backend_failures,   1u);
}

// ---------------------------------------------------------------------------
// InFlight_NoUnderflow
//   [엣지 케이스] 시작 없이 종료 이벤트가 와도 in_flight 는 0 을 유지한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, InFlight_NoUnderflow) {
    StatsCollector stats;

    stats.on_forwarded();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.in_flight, 0u) << "in_flight must not underflow below 0";
    EXPECT_EQ(snap.forwarded_requests, 1u);
}

// ---------------------------------------------------------------------------
// Snapshot_BlockRate
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_BlockRate) {
    StatsCollector stats;

    for (int i = 0; i < 4; ++i) {
        stats.on_request_start();
    }
    stats.on_blocked();
    stats.on_forwarded();
    stats.on_forwarded();
    stats.on_forwarded();

    const auto snap = stats.snapshot();
    EXPECT_NEAR(snap.block_rate, 0.25, 1e-9) << "1 blocked out of 4 should be 0.25";
}

// ---------------------------------------------------------------------------
// Snapshot_RpsPositive / CapturedAt
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_RpsPositive) {
    StatsCollector stats;

    stats.on_request_start();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    const auto snap = stats.snapshot();
    EXPECT_GT(snap.rps, 0.0);
}

TEST(StatsCollector, Snapshot_CapturedAtIsRecent) {
    StatsCollector stats;

    const auto before = std::chrono::system_clock::now();
    const auto snap   = stats.snapshot();
    const auto after  = std::chrono::system_clock::now();

    EXPECT_GE(snap.captured_at, before);
    EXPECT_LE(snap.captured_at, after);
}

// ---------------------------------------------------------------------------
// ConcurrentAccess
//   여러 스레드가 동시에 요청 이벤트를 보내도 카운터 합계가 정확해야 한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentAccess) {
    StatsCollector stats;

    constexpr int kThreads       = 8;
    constexpr int kRequestsEach  = 1000;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&stats, t]() {
            for (int i = 0; i < kRequestsEach; ++i) {
                stats.on_request_start();
                if ((i + t) % 2 == 0) {
                    stats.on_blocked();
                } else {
                    stats.on_forwarded();
                }
                // 조회 경로와 갱신 경로 동시 실행
                (void)stats.snapshot();
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_requests, static_cast<std::uint64_t>(kThreads * kRequestsEach));
    EXPECT_EQ(snap.blocked_requests + snap.forwarded_requests,
              static_cast<std::uint64_t>(kThreads * kRequestsEach));
    EXPECT_EQ(snap.in_flight, 0u);
}
