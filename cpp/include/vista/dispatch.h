#pragma once

#include "cache.h"
#include "history.h"
#include "inverse.h"
#include "store.h"
#include "types.h"

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vista {

/// Counters kept by a Dispatcher.
struct DispatchStats {
    uint64_t flights   = 0; ///< Computations started.
    uint64_t coalesced = 0; ///< Requests that joined an in-flight computation.
};

/// Entry point for view and push requests.
///
/// Identical concurrent requests share one computation (single-flight),
/// keyed by filter identity and target. Each computation runs on its own
/// thread; a caller waits at most DispatchOptions::timeout and then gets a
/// TimeoutError while the computation carries on and fills the cache.
/// Failed computations are not remembered, so a later request retries.
///
/// Usage:
/// @code
///     vista::Dispatcher d(store);
///     auto view = d.resolve_view(":/lib", "refs/heads/main");
/// @endcode
class Dispatcher {
public:
    explicit Dispatcher(Store store, DispatchOptions opts = {});

    /// Joins every running computation.
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Rewrite the history of `ref_name` under `spec` and return the view
    /// tip. The tip is also recorded under the view ref namespace.
    ///
    /// @throws MalformedSpecError if `spec` does not parse.
    /// @throws NotFoundError if `ref_name` does not exist.
    /// @throws TimeoutError if the request outlives DispatchOptions::timeout.
    std::string resolve_view(const std::string& spec, const std::string& ref_name);

    /// Map `filtered` (a commit in the view) onto `base` and return the new
    /// unfiltered commit. No ref is updated.
    ///
    /// @throws ConflictError if the edit cannot be mapped back.
    std::string submit_push(const std::string& spec,
                            const std::string& filtered,
                            const std::string& base);

    /// submit_push() followed by a compare-and-swap of `ref_name` from
    /// `base` to the result.
    ///
    /// @throws StaleRefError if `ref_name` no longer points at `base`.
    std::string push(const std::string& spec,
                     const std::string& ref_name,
                     const std::string& filtered,
                     const std::string& base);

    /// Ref recording the view tip of `ref_name` under `filter_id`.
    std::string view_ref(const std::string& filter_id,
                         const std::string& ref_name) const;

    DispatchStats stats() const;

    RewriteCache& cache() { return cache_; }
    HistoryRewriter& history() { return history_; }

private:
    struct Worker {
        std::thread                     thread;
        std::shared_future<std::string> done;
    };

    /// Join the in-flight computation for `key`, or start `fn` as a new one.
    std::shared_future<std::string> single_flight(const std::string& key,
                                                  std::function<std::string()> fn);

    /// Wait for `flight` for at most DispatchOptions::timeout.
    std::string await(const std::shared_future<std::string>& flight,
                      const std::string& what);

    /// Join workers whose computation has completed. Caller holds mutex_.
    void reap_locked();

    std::string compute_view(const Filter& filter,
                             const std::string& filter_id,
                             const std::string& ref_name);

    Store           store_;
    DispatchOptions opts_;
    RewriteCache    cache_;
    HistoryRewriter history_;
    InverseRewriter inverse_;

    std::mutex mutex_;
    std::map<std::string, std::shared_future<std::string>> inflight_;
    std::vector<Worker> workers_;

    std::atomic<uint64_t> flights_{0};
    std::atomic<uint64_t> coalesced_{0};
};

} // namespace vista
