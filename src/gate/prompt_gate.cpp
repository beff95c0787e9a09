// ---------------------------------------------------------------------------
// prompt_gate.cpp
//
// 요청 처리 오케스트레이터 구현.
//
// handle() 흐름:
//   1. request_id 발급 (context 에 없으면)
//   2. detector_.detect()     : 실패하지 않음
//   3. policy_engine_.decide(): 실패하지 않음
//   4. BLOCK → 로그/통계 후 반환 (백엔드 호출 없음)
//   5. ALLOW → backend_->generate() → ForwardOutcome 변형에 따라 결과 분류
// ---------------------------------------------------------------------------

#include "gate/prompt_gate.hpp"

#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

namespace {

std::shared_ptr<const SignatureSet> or_empty(std::shared_ptr<const SignatureSet> signatures) {
    if (signatures) {
        return signatures;
    }
    return std::make_shared<SignatureSet>();
}

OutcomeKind classify(const ForwardOutcome& outcome) noexcept {
    return std::visit(
        [](const auto& o) -> OutcomeKind {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, ForwardSuccess>) {
                return OutcomeKind::kSuccess;
            } else if constexpr (std::is_same_v<T, BackendUnreachable>) {
                return OutcomeKind::kBackendUnreachable;
            } else if constexpr (std::is_same_v<T, BackendError>) {
                return OutcomeKind::kBackendError;
            } else {
                return OutcomeKind::kMalformedResponse;
            }
        },
        outcome);
}

std::vector<std::string> format_matches(const std::vector<SignatureMatch>& matches) {
    std::vector<std::string> out;
    out.reserve(matches.size());
    for (const auto& m : matches) {
        out.push_back(std::string(to_string(m.kind)) + ":" + m.text);
    }
    return out;
}

// 실패 변형의 진단 문자열 (본문은 잘라서 사용)
std::string failure_detail(const ForwardOutcome& outcome) {
    if (const auto* u = std::get_if<BackendUnreachable>(&outcome)) {
        return u->detail;
    }
    if (const auto* e = std::get_if<BackendError>(&outcome)) {
        return "HTTP " + std::to_string(e->status) + ": " + truncate_for_log(e->body);
    }
    if (const auto* m = std::get_if<MalformedResponse>(&outcome)) {
        return truncate_for_log(m->body);
    }
    return {};
}

}  // namespace

const char* to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::kBlocked:            return "BLOCKED";
        case OutcomeKind::kSuccess:            return "SUCCESS";
        case OutcomeKind::kBackendUnreachable: return "BackendUnreachable";
        case OutcomeKind::kBackendError:       return "BackendError";
        case OutcomeKind::kMalformedResponse:  return "MalformedResponse";
        default:                               return "Unknown";
    }
}

const char* outcome_name(const ForwardOutcome& outcome) noexcept {
    switch (outcome.index()) {
        case 0:  return "ForwardSuccess";
        case 1:  return "BackendUnreachable";
        case 2:  return "BackendError";
        default: return "MalformedResponse";
    }
}

const std::string* RequestOutcome::response_text() const noexcept {
    if (!forward) {
        return nullptr;
    }
    const auto* success = std::get_if<ForwardSuccess>(&*forward);
    return success != nullptr ? &success->text : nullptr;
}

// ---------------------------------------------------------------------------
// PromptGate 생성자
// ---------------------------------------------------------------------------
PromptGate::PromptGate(std::shared_ptr<const SignatureSet> signatures,
                       PolicyConfig                        policy,
                       std::shared_ptr<GenerationBackend>  backend,
                       std::shared_ptr<StructuredLogger>   logger,
                       std::shared_ptr<StatsCollector>     stats)
    : signatures_(or_empty(std::move(signatures)))
    , detector_(signatures_)
    , policy_engine_(policy)
    , backend_(std::move(backend))
    , logger_(std::move(logger))
    , stats_(std::move(stats))
{
    if (!backend_) {
        throw std::invalid_argument("PromptGate: backend must not be null");
    }

    spdlog::info("prompt_gate: ready: signatures={}, model='{}', block_on_injection={}, "
                 "block_on_indirect_risk={}",
                 signatures_->total(), backend_->model(),
                 policy.block_on_injection, policy.block_on_indirect_risk);
}

// ---------------------------------------------------------------------------
// PromptGate::handle
// ---------------------------------------------------------------------------
RequestOutcome PromptGate::handle(std::string_view                      prompt,
                                  std::chrono::steady_clock::time_point deadline,
                                  RequestContext                        context) {
    const auto started = std::chrono::steady_clock::now();

    if (context.request_id == 0) {
        context.request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    }
    if (context.received_at == std::chrono::system_clock::time_point{}) {
        context.received_at = std::chrono::system_clock::now();
    }
    if (stats_) {
        stats_->on_request_start();
    }

    RequestOutcome outcome{};
    outcome.request_id = context.request_id;

    // Received → Classified → Decided
    outcome.decision = policy_engine_.decide(detector_.detect(prompt));

    if (outcome.decision.blocked()) {
        // Decided → Blocked
        outcome.kind    = OutcomeKind::kBlocked;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        report_block(context, prompt, outcome.decision);
        return outcome;
    }

    // Decided → Forwarded → Reported
    outcome.forward = backend_->generate(prompt, deadline);
    outcome.kind    = classify(*outcome.forward);
    outcome.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
    report_forward(context, prompt, outcome);
    return outcome;
}

void PromptGate::report_block(const RequestContext& context, std::string_view prompt,
                              const PolicyDecision& decision) {
    if (stats_) {
        stats_->on_blocked();
    }
    if (!logger_) {
        return;
    }
    logger_->log_block(BlockLog{
        .request_id       = context.request_id,
        .client_ip        = context.client_ip,
        .prompt           = truncate_for_log(std::string(prompt)),
        .direct_matches   = format_matches(decision.classification.direct_matches),
        .indirect_matches = decision.classification.indirect_matches,
        .reason           = decision.reason,
        .timestamp        = context.received_at,
    });
}

void PromptGate::report_forward(const RequestContext& context, std::string_view prompt,
                                const RequestOutcome& outcome) {
    if (const auto* text = outcome.response_text(); text != nullptr) {
        if (stats_) {
            stats_->on_forwarded();
        }
        if (logger_) {
            logger_->log_request(RequestLog{
                .request_id     = context.request_id,
                .client_ip      = context.client_ip,
                .prompt         = truncate_for_log(std::string(prompt)),
                .response_bytes = text->size(),
                .timestamp      = context.received_at,
                .duration       = outcome.elapsed,
            });
        }
        return;
    }

    if (stats_) {
        stats_->on_backend_failure();
    }
    if (!logger_) {
        return;
    }

    BackendFailureLog entry{
        .request_id = context.request_id,
        .client_ip  = context.client_ip,
        .prompt     = truncate_for_log(std::string(prompt)),
        .failure    = to_string(outcome.kind),
        .timestamp  = context.received_at,
        .duration   = outcome.elapsed,
    };
    if (const auto* u = std::get_if<BackendUnreachable>(&*outcome.forward)) {
        entry.detail = u->detail;
    } else if (const auto* e = std::get_if<BackendError>(&*outcome.forward)) {
        entry.status = e->status;
        entry.detail = truncate_for_log(e->body);
    } else if (const auto* m = std::get_if<MalformedResponse>(&*outcome.forward)) {
        entry.detail = truncate_for_log(m->body);
    }
    logger_->log_backend_failure(entry);
}

// ---------------------------------------------------------------------------
// describe
// ---------------------------------------------------------------------------
std::string describe(const RequestOutcome& outcome) {
    std::ostringstream out;
    const auto&        classification = outcome.decision.classification;

    switch (outcome.kind) {
        case OutcomeKind::kBlocked: {
            out << "STATUS: BLOCKED_PROMPT_INJECTION\n"
                << "REASON: " << outcome.decision.reason << '\n';
            if (!classification.direct_matches.empty()) {
                out << "DIRECT MATCHES:";
                for (const auto& m : classification.direct_matches) {
                    out << "\n  - " << to_string(m.kind) << ": '" << m.text << "'";
                }
                out << '\n';
            }
            if (!classification.indirect_matches.empty()) {
                out << "INDIRECT MATCHES:";
                for (const auto& phrase : classification.indirect_matches) {
                    out << "\n  - '" << phrase << "'";
                }
                out << '\n';
            }
            break;
        }
        case OutcomeKind::kSuccess: {
            out << "STATUS: SUCCESS\n";
            if (const auto* text = outcome.response_text(); text != nullptr) {
                out << "RESPONSE: " << *text << '\n';
            }
            break;
        }
        case OutcomeKind::kBackendUnreachable:
        case OutcomeKind::kBackendError:
        case OutcomeKind::kMalformedResponse: {
            out << "ERROR: " << to_string(outcome.kind);
            if (outcome.forward) {
                out << ": " << failure_detail(*outcome.forward);
            }
            out << '\n';
            break;
        }
    }

    return out.str();
}
