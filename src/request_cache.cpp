#include "request_cache.hpp"

#include <iterator>
#include <stdexcept>

namespace cbers_tiler {

LruPolicy::LruPolicy(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("LRUキャッシュの容量は1以上である必要があります");
    }
}

void LruPolicy::on_insert(const CacheKey& key, Clock::time_point now) {
    if (positions_.contains(key)) {
        on_access(key, now);
        return;
    }
    order_.push_front(key);
    positions_.emplace(key, order_.begin());
}

void LruPolicy::on_access(const CacheKey& key, Clock::time_point) {
    auto it = positions_.find(key);
    if (it == positions_.end()) {
        return;
    }
    order_.splice(order_.begin(), order_, it->second);
}

void LruPolicy::on_erase(const CacheKey& key) {
    auto it = positions_.find(key);
    if (it == positions_.end()) {
        return;
    }
    order_.erase(it->second);
    positions_.erase(it);
}

auto LruPolicy::victims(Clock::time_point) const -> std::vector<CacheKey> {
    std::vector<CacheKey> keys;
    if (order_.size() <= capacity_) {
        return keys;
    }

    // 末尾 (最も古い) から超過分を選ぶ
    size_t excess = order_.size() - capacity_;
    for (auto it = order_.rbegin(); it != order_.rend() && keys.size() < excess; ++it) {
        keys.push_back(*it);
    }
    return keys;
}

TtlPolicy::TtlPolicy(Clock::duration ttl) : ttl_(ttl) {
    if (ttl_ <= Clock::duration::zero()) {
        throw std::invalid_argument("TTLは正の値である必要があります");
    }
}

void TtlPolicy::on_insert(const CacheKey& key, Clock::time_point now) {
    inserted_.insert_or_assign(key, now);
}

void TtlPolicy::on_erase(const CacheKey& key) { inserted_.erase(key); }

auto TtlPolicy::victims(Clock::time_point now) const -> std::vector<CacheKey> {
    std::vector<CacheKey> keys;
    for (const auto& [key, inserted_at] : inserted_) {
        if (now - inserted_at >= ttl_) {
            keys.push_back(key);
        }
    }
    return keys;
}

auto make_eviction_policy(const CachePolicyConfig& config) -> std::unique_ptr<EvictionPolicy> {
    if (config.ttl) {
        return std::make_unique<TtlPolicy>(*config.ttl);
    }
    if (config.capacity == 0) {
        return std::make_unique<UnboundedPolicy>();
    }
    return std::make_unique<LruPolicy>(config.capacity);
}

}  // namespace cbers_tiler
