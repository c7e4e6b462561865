#include "response_cache.hpp"
#include "../event_bus.hpp"
#include "../util.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace costgate {

ResponseCache::ResponseCache(Fetcher fetch, KeyFunction key_fn,
                             CacheSettings settings, Clock clock)
    : fetch_(std::move(fetch)),
      key_fn_(std::move(key_fn)),
      clock_(std::move(clock)),
      settings_(settings) {
    if (!fetch_) {
        throw std::invalid_argument("ResponseCache requires a fetch function");
    }
    if (settings_.ttl.count() < 1 || settings_.max_size < 1) {
        throw std::invalid_argument("ResponseCache requires ttl >= 1s and max_size >= 1");
    }
    if (!key_fn_) {
        key_fn_ = [](const CompletionRequest& r) {
            return make_cache_key(r, r.provider.value_or(""));
        };
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

ResponseCache::~ResponseCache() {
    stop_pruner();
}

Resolution ResponseCache::resolve(const CompletionRequest& request) {
    if (request.skip_cache) {
        return {fetch_(request), ResolveSource::Upstream};
    }

    CacheKey key = key_fn_(request);
    std::promise<Completion> promise;
    std::shared_future<Completion> pending;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (clock_() < it->second.expires_at) {
                ++hits_;
                return {it->second.completion, ResolveSource::Cache};
            }
            entries_.erase(it);
            ++expired_;
        }

        // Lookup and registration share this critical section, so two
        // concurrent misses for one key cannot both reach the fetch.
        auto fit = in_flight_.find(key);
        if (fit != in_flight_.end()) {
            ++coalesced_;
            pending = fit->second;
        } else {
            ++misses_;
            pending = promise.get_future().share();
            in_flight_.emplace(key, pending);
            leader = true;
        }
    }

    if (!leader) {
        if (debug_enabled()) {
            std::cerr << "[cache] Joining in-flight fetch key=" << key.to_string() << "\n";
        }
        return {pending.get(), ResolveSource::Coalesced};
    }

    Completion result;
    try {
        result = fetch_(request);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_locked(key, result);
        in_flight_.erase(key);
    }
    promise.set_value(result);
    return {std::move(result), ResolveSource::Upstream};
}

void ResponseCache::store_locked(const CacheKey& key, const Completion& completion) {
    TimePoint now = clock_();
    entries_[key] = Entry{completion, now, now + settings_.ttl, next_seq_++};
    evict_locked();
}

size_t ResponseCache::prune_locked(TimePoint now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expired_ += removed;
    return removed;
}

void ResponseCache::evict_locked() {
    if (entries_.size() <= settings_.max_size) return;

    // {created_at, seq, key}, oldest first
    std::vector<std::tuple<TimePoint, uint64_t, const CacheKey*>> order;
    order.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        order.emplace_back(entry.created_at, entry.seq, &key);
    }
    std::sort(order.begin(), order.end(),
              [](const auto& a, const auto& b) {
                  if (std::get<0>(a) != std::get<0>(b)) return std::get<0>(a) < std::get<0>(b);
                  return std::get<1>(a) < std::get<1>(b);
              });

    size_t to_remove = entries_.size() - settings_.max_size;
    std::vector<CacheKey> victims;
    victims.reserve(to_remove);
    for (size_t i = 0; i < to_remove; ++i) {
        victims.push_back(*std::get<2>(order[i]));
    }
    for (const auto& key : victims) {
        entries_.erase(key);
    }
    evictions_ += to_remove;
}

size_t ResponseCache::prune() {
    size_t removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = prune_locked(clock_());
    }
    if (removed > 0 && debug_enabled()) {
        std::cerr << "[cache] Pruned " << removed << " expired entries\n";
    }
    return removed;
}

void ResponseCache::clear() {
    CacheClearedEvent ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ev.entries_removed = entries_.size();
        entries_.clear();
        hits_ = 0;
        misses_ = 0;
        coalesced_ = 0;
        evictions_ = 0;
        expired_ = 0;
    }
    std::cerr << "[cache] Cache cleared: " << ev.entries_removed << " entries removed\n";
    publish_to(bus_, ev);
}

void ResponseCache::configure(std::chrono::seconds ttl, std::optional<size_t> max_size) {
    if (ttl.count() < 1) {
        throw std::invalid_argument("cache ttl must be at least 1 second");
    }
    if (max_size && *max_size < 1) {
        throw std::invalid_argument("cache max size must be at least 1");
    }

    CacheConfiguredEvent ev;
    size_t pruned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.ttl = ttl;
        if (max_size) settings_.max_size = *max_size;
        pruned = prune_locked(clock_());
        evict_locked();
        ev.ttl_seconds = static_cast<uint32_t>(ttl.count());
        ev.max_size = settings_.max_size;
    }
    std::cerr << "[cache] Settings updated: ttl=" << ev.ttl_seconds
              << "s, max_size=" << ev.max_size
              << " (pruned " << pruned << ")\n";
    publish_to(bus_, ev);
}

CacheMetrics ResponseCache::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheMetrics m;
    m.size = entries_.size();
    m.hits = hits_;
    m.misses = misses_;
    m.coalesced = coalesced_;
    m.evictions = evictions_;
    m.expired = expired_;
    uint64_t total = hits_ + misses_;
    m.hit_rate = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    return m;
}

CacheSettings ResponseCache::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

size_t ResponseCache::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

// ── Background pruning ──────────────────────────────────────────

void ResponseCache::start_pruner(std::chrono::milliseconds period) {
    stop_pruner();
    {
        std::lock_guard<std::mutex> lock(pruner_mutex_);
        pruner_stop_ = false;
    }
    pruner_ = std::thread([this, period]() { pruner_loop(period); });
}

void ResponseCache::stop_pruner() {
    {
        std::lock_guard<std::mutex> lock(pruner_mutex_);
        pruner_stop_ = true;
    }
    pruner_cv_.notify_all();
    if (pruner_.joinable()) pruner_.join();
}

void ResponseCache::pruner_loop(std::chrono::milliseconds period) {
    std::unique_lock<std::mutex> lock(pruner_mutex_);
    while (!pruner_cv_.wait_for(lock, period, [this] { return pruner_stop_; })) {
        lock.unlock();
        prune();
        lock.lock();
    }
}

} // namespace costgate
