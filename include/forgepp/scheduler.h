#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/scheduler.h — Bounded worker pool for per-phase unit builds
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    std::vector<BuildResult> results(units.size());
//    scheduler::forEach(units.size(), jobs, token, [&](std::size_t i) {
//        results[i] = build(units[i]);          // slot i belongs to task i
//    }, [&](std::size_t i) {
//        results[i] = BuildResult::skipped(units[i]);
//    });
//
//  Tasks never share mutable state; each writes only its own slot and
//  the caller reads the slots after the pool has joined.
//
// ═══════════════════════════════════════════════════════════════════

#include "lifecycle.h"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>

namespace forgepp::scheduler {

using Task = std::function<void(std::size_t)>;

// ── Runs task(i) for i in [0, count) on at most `jobs` threads ──
// Once `token` is cancelled, tasks that have not started run `onSkipped(i)`
// instead. jobs <= 1 runs inline on the calling thread, in order.
inline void forEach(std::size_t count, unsigned jobs,
                    const lifecycle::CancellationToken& token,
                    const Task& task, const Task& onSkipped) {
    auto runOne = [&](std::size_t i) {
        if (token.isCancelled()) {
            onSkipped(i);
        } else {
            task(i);
        }
    };

    if (jobs <= 1 || count <= 1) {
        for (std::size_t i = 0; i < count; ++i) runOne(i);
        return;
    }

    boost::asio::thread_pool pool(std::min<std::size_t>(jobs, count));
    for (std::size_t i = 0; i < count; ++i) {
        boost::asio::post(pool, [&runOne, i] { runOne(i); });
    }
    pool.join();
}

} // namespace forgepp::scheduler
