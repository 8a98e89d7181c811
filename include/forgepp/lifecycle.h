#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/lifecycle.h — Run cancellation and signal handling
// ═══════════════════════════════════════════════════════════════════
//
//  An interrupt never aborts a unit halfway: the orchestrator checks
//  the token between units, lets the running ones finish, and goes
//  straight to Summarize.
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <csignal>

namespace forgepp::lifecycle {

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

namespace detail {
    inline std::atomic<CancellationToken*>& activeToken() {
        static std::atomic<CancellationToken*> token{nullptr};
        return token;
    }
    inline volatile std::sig_atomic_t& lastSignal() {
        static volatile std::sig_atomic_t sig = 0;
        return sig;
    }
    inline void signalHandler(int sig) {
        lastSignal() = sig;
        if (auto* token = activeToken().load()) token->cancel();
    }
} // namespace detail

// ── Route SIGINT and SIGTERM to `token` ──
inline void enableInterruptHandling(CancellationToken& token) {
    detail::activeToken().store(&token);
    std::signal(SIGINT, detail::signalHandler);
    std::signal(SIGTERM, detail::signalHandler);
}

inline void disableInterruptHandling() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    detail::activeToken().store(nullptr);
}

// ── Signal that tripped the token, 0 if none ──
inline int interruptSignal() {
    return static_cast<int>(detail::lastSignal());
}

} // namespace forgepp::lifecycle
