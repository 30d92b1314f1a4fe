#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <iomanip>
#include <limits>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"

namespace cbers_tiler {

// 関数名と引数から作るリクエストの指紋
using CacheKey = std::string;

/**
 * @brief キャッシュの追い出し戦略
 *
 * 呼び出しは全てRequestCacheのロック内で行われる。
 */
class EvictionPolicy {
   public:
    using Clock = std::chrono::steady_clock;

    virtual ~EvictionPolicy() = default;

    virtual void on_insert(const CacheKey& key, Clock::time_point now) = 0;
    virtual void on_access(const CacheKey& key, Clock::time_point now) = 0;
    virtual void on_erase(const CacheKey& key) = 0;

    // 今追い出すべきキー (この呼び出しでは状態を変えない)
    [[nodiscard]] virtual auto victims(Clock::time_point now) const -> std::vector<CacheKey> = 0;
};

// 追い出しを行わない (プロセス終了まで保持)
class UnboundedPolicy final : public EvictionPolicy {
   public:
    void on_insert(const CacheKey&, Clock::time_point) override {}
    void on_access(const CacheKey&, Clock::time_point) override {}
    void on_erase(const CacheKey&) override {}
    [[nodiscard]] auto victims(Clock::time_point) const -> std::vector<CacheKey> override {
        return {};
    }
};

// 件数上限を超えたら最も長く使われていないものから追い出す
class LruPolicy final : public EvictionPolicy {
   public:
    explicit LruPolicy(size_t capacity);

    void on_insert(const CacheKey& key, Clock::time_point now) override;
    void on_access(const CacheKey& key, Clock::time_point now) override;
    void on_erase(const CacheKey& key) override;
    [[nodiscard]] auto victims(Clock::time_point now) const -> std::vector<CacheKey> override;

   private:
    size_t capacity_;
    std::list<CacheKey> order_;  // 先頭が最新
    std::unordered_map<CacheKey, std::list<CacheKey>::iterator> positions_;
};

// 登録から一定時間経過したものを追い出す
class TtlPolicy final : public EvictionPolicy {
   public:
    explicit TtlPolicy(Clock::duration ttl);

    void on_insert(const CacheKey& key, Clock::time_point now) override;
    void on_access(const CacheKey&, Clock::time_point) override {}
    void on_erase(const CacheKey& key) override;
    [[nodiscard]] auto victims(Clock::time_point now) const -> std::vector<CacheKey> override;

   private:
    Clock::duration ttl_;
    std::unordered_map<CacheKey, Clock::time_point> inserted_;
};

struct CachePolicyConfig {
    size_t capacity{0};                        // 0は無制限
    std::optional<std::chrono::seconds> ttl;  // 指定時はTTLで追い出す
};

// ttlがあればTtlPolicy、capacityが0ならUnboundedPolicy、それ以外はLruPolicy
[[nodiscard]] auto make_eviction_policy(const CachePolicyConfig& config)
    -> std::unique_ptr<EvictionPolicy>;

struct CacheStats {
    size_t hits{};
    size_t misses{};
    size_t shared{};  // 計算中の結果を待って共有した回数
    size_t evictions{};
    size_t entries{};
};

/**
 * @brief リクエスト単位のメモ化キャッシュ
 *
 * 同じキーの計算が進行中なら、後続の呼び出しはその結果を待って共有する (single-flight)。
 * 計算が例外で終わった場合は何も記録せず、待機中の全員に同じ例外を届ける。
 * 次の呼び出しは改めて計算する。
 */
template <typename Value>
class RequestCache {
   public:
    using Clock = EvictionPolicy::Clock;

    explicit RequestCache(std::unique_ptr<EvictionPolicy> policy = std::make_unique<UnboundedPolicy>())
        : policy_(std::move(policy)) {}

    RequestCache(const RequestCache&) = delete;
    RequestCache& operator=(const RequestCache&) = delete;

    auto get_or_compute(const CacheKey& key, const std::function<Value()>& compute) -> Value {
        std::unique_lock lock(mutex_);
        const auto now = Clock::now();
        evict_locked(now);

        if (auto it = entries_.find(key); it != entries_.end()) {
            ++stats_.hits;
            policy_->on_access(key, now);
            return it->second;
        }

        if (auto it = in_flight_.find(key); it != in_flight_.end()) {
            ++stats_.shared;
            std::shared_future<Value> pending = it->second;
            lock.unlock();
            return pending.get();
        }

        ++stats_.misses;
        std::promise<Value> promise;
        in_flight_.emplace(key, promise.get_future().share());
        lock.unlock();

        std::optional<Value> value;
        std::exception_ptr error;
        try {
            value.emplace(compute());
        } catch (...) {
            error = std::current_exception();
        }

        lock.lock();
        in_flight_.erase(key);
        if (error) {
            lock.unlock();
            promise.set_exception(error);
            std::rethrow_exception(error);
        }

        entries_.insert_or_assign(key, *value);
        policy_->on_insert(key, Clock::now());
        evict_locked(Clock::now());
        lock.unlock();

        promise.set_value(*value);
        return std::move(*value);
    }

    [[nodiscard]] auto find(const CacheKey& key) -> std::optional<Value> {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        for (const auto& [key, value] : entries_) {
            policy_->on_erase(key);
        }
        entries_.clear();
    }

    [[nodiscard]] auto stats() const -> CacheStats {
        std::lock_guard lock(mutex_);
        CacheStats stats = stats_;
        stats.entries = entries_.size();
        return stats;
    }

   private:
    void evict_locked(Clock::time_point now) {
        for (const auto& key : policy_->victims(now)) {
            policy_->on_erase(key);
            if (entries_.erase(key) > 0) {
                ++stats_.evictions;
            }
        }
    }

    mutable std::mutex mutex_;
    std::unique_ptr<EvictionPolicy> policy_;
    std::unordered_map<CacheKey, Value> entries_;
    std::unordered_map<CacheKey, std::shared_future<Value>> in_flight_;
    CacheStats stats_;
};

namespace detail {

inline void append_key_part(std::ostringstream& os, const BandList& bands) {
    for (size_t i = 0; i < bands.size(); ++i) {
        os << (i == 0 ? "" : ",") << bands[i];
    }
}

template <typename T>
void append_key_part(std::ostringstream& os, const T& value) {
    if constexpr (std::is_floating_point_v<T>) {
        // 異なる値が同じキーにならないよう往復可能な桁数で書く
        os << std::setprecision(std::numeric_limits<T>::max_digits10) << value;
    } else {
        os << value;
    }
}

}  // namespace detail

// fingerprint("tile", scene, x, y, z) -> "tile|scene|x|y|z"
template <typename... Args>
[[nodiscard]] auto fingerprint(std::string_view function, const Args&... args) -> CacheKey {
    std::ostringstream os;
    os << function;
    ((os << '|', detail::append_key_part(os, args)), ...);
    return os.str();
}

}  // namespace cbers_tiler
