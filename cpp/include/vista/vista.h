#pragma once

/// @file vista.h
/// Umbrella header for the full vista C++ API.

#include "error.h"
#include "types.h"
#include "logging.h"
#include "store.h"
#include "filter.h"
#include "tree_rewriter.h"
#include "cache.h"
#include "history.h"
#include "inverse.h"
#include "dispatch.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <type_traits>

namespace vista {

/// Retry an operation with exponential backoff on transient store errors.
///
/// Calls `f()` up to `max_retries + 1` times. On each StoreIoError whose
/// transient() flag is set, sleeps min(10 * 2^attempt, 200) ms before
/// retrying. Persistent errors propagate immediately.
///
/// @code
///     auto tip = vista::retry_transient(5, [&]() {
///         return history.rewrite(filter, commit);
///     });
/// @endcode
template <typename F>
auto retry_transient(int max_retries, F&& f) -> decltype(f()) {
    for (int attempt = 0; ; ++attempt) {
        try {
            return f();
        } catch (const StoreIoError& e) {
            if (!e.transient() || attempt >= max_retries) throw;
            int delay_ms = std::min(10 * (1 << std::min(attempt, 5)), 200);
            Logger::Log(LogLevel::Warn, "transient store error, retry {} in {} ms: {}",
                        attempt + 1, delay_ms, e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
}

} // namespace vista
