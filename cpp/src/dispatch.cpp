#include "vista/vista.h"

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace vista {

Dispatcher::Dispatcher(Store store, DispatchOptions opts)
    : store_(store),
      opts_(std::move(opts)),
      cache_(store, opts_.cache_memory_capacity),
      history_(store, cache_, opts_.tree_memo_capacity),
      inverse_(store) {}

Dispatcher::~Dispatcher() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        workers.swap(workers_);
    }
    // Workers take mutex_ on completion, so join outside of it.
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

std::string Dispatcher::view_ref(const std::string& filter_id,
                                 const std::string& ref_name) const {
    return opts_.view_ref_prefix + filter_id + "/" + ref_name;
}

DispatchStats Dispatcher::stats() const {
    DispatchStats s;
    s.flights   = flights_.load();
    s.coalesced = coalesced_.load();
    return s;
}

// ---------------------------------------------------------------------------
// Single-flight
// ---------------------------------------------------------------------------

void Dispatcher::reap_locked() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_future<std::string>
Dispatcher::single_flight(const std::string& key, std::function<std::string()> fn) {
    std::lock_guard<std::mutex> lk(mutex_);
    reap_locked();

    auto it = inflight_.find(key);
    if (it != inflight_.end()) {
        ++coalesced_;
        Logger::Log(LogLevel::Debug, "joining in-flight request {}", key);
        return it->second;
    }

    auto promise = std::make_shared<std::promise<std::string>>();
    std::shared_future<std::string> flight = promise->get_future().share();
    inflight_.emplace(key, flight);
    ++flights_;

    std::thread thread([this, key, promise, fn = std::move(fn)]() {
        std::string result;
        std::exception_ptr error;
        try {
            result = retry_transient(opts_.max_retries, fn);
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> done_lk(mutex_);
            inflight_.erase(key);
        }

        if (error) {
            Logger::Log(LogLevel::Debug, "request {} failed", key);
            promise->set_exception(error);
        } else {
            promise->set_value(std::move(result));
        }
    });
    workers_.push_back(Worker{std::move(thread), flight});
    return flight;
}

std::string Dispatcher::await(const std::shared_future<std::string>& flight,
                              const std::string& what) {
    if (flight.wait_for(opts_.timeout) != std::future_status::ready) {
        Logger::Log(LogLevel::Warn, "{} exceeded {} ms", what, opts_.timeout.count());
        throw TimeoutError(what + " exceeded " +
                           std::to_string(opts_.timeout.count()) + " ms");
    }
    return flight.get();
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

std::string Dispatcher::compute_view(const Filter& filter,
                                     const std::string& filter_id,
                                     const std::string& ref_name) {
    if (opts_.prefetch) opts_.prefetch(ref_name);

    auto tip = store_.read_ref(ref_name);
    if (!tip) throw NotFoundError("ref " + ref_name);

    std::string view = history_.rewrite(filter, *tip);

    std::string vref = view_ref(filter_id, ref_name);
    auto current = store_.read_ref(vref);
    if (current != view && !store_.compare_and_swap_ref(vref, current, view)) {
        Logger::Log(LogLevel::Warn, "view ref {} moved while updating", vref);
    }
    return view;
}

std::string Dispatcher::resolve_view(const std::string& spec,
                                     const std::string& ref_name) {
    Filter filter = compile(spec);
    std::string fid = filter_id(filter);

    auto flight = single_flight("view:" + fid + ":" + ref_name,
        [this, filter, fid, ref_name]() {
            return compute_view(filter, fid, ref_name);
        });
    return await(flight, "resolve_view " + ref_name);
}

std::string Dispatcher::submit_push(const std::string& spec,
                                    const std::string& filtered,
                                    const std::string& base) {
    Filter filter = compile(spec);
    std::string fid = filter_id(filter);

    auto flight = single_flight("push:" + fid + ":" + filtered + ":" + base,
        [this, filter, filtered, base]() {
            return inverse_.unapply(filter, filtered, base);
        });
    return await(flight, "submit_push " + filtered);
}

std::string Dispatcher::push(const std::string& spec,
                             const std::string& ref_name,
                             const std::string& filtered,
                             const std::string& base) {
    Filter filter = compile(spec);
    std::string fid = filter_id(filter);

    auto flight = single_flight(
        "push:" + fid + ":" + ref_name + ":" + filtered + ":" + base,
        [this, filter, ref_name, filtered, base]() {
            std::string result = inverse_.unapply(filter, filtered, base);
            if (!store_.compare_and_swap_ref(ref_name, base, result)) {
                throw StaleRefError(ref_name);
            }
            return result;
        });
    return await(flight, "push " + ref_name);
}

} // namespace vista
