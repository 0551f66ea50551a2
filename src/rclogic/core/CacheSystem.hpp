/**
 * @file CacheSystem.hpp
 * @brief 线程安全的LRU缓存，用于值驻留池和谓词缓存
 */

#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <utility>
#include <cstddef>

namespace rclogic {
namespace core {

/**
 * @brief LRU缓存实现
 *
 * 最近最少使用缓存，容量满时淘汰最久未使用的项目。
 * 容量为0时缓存关闭：put 不保存任何内容，get 总是未命中。
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class LRUCache {
public:
    using KeyType = Key;
    using ValueType = Value;

    /**
     * @brief 缓存统计信息
     */
    struct Statistics {
        size_t hit_count = 0;
        size_t miss_count = 0;
        size_t put_count = 0;
        size_t evict_count = 0;

        double hit_rate() const {
            size_t total = hit_count + miss_count;
            return total > 0 ? static_cast<double>(hit_count) / total : 0.0;
        }
    };

    explicit LRUCache(size_t max_size = 1000)
        : max_size_(max_size) {}

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    /**
     * @brief 获取缓存项，命中时移动到链表头部
     */
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            stats_.miss_count++;
            return std::nullopt;
        }

        cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
        stats_.hit_count++;
        return it->second->second;
    }

    /**
     * @brief 设置缓存项
     * @return 本次插入导致淘汰的项数
     */
    size_t put(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return putLocked(key, value);
    }

    /**
     * @brief 命中则返回已有值，否则调用 factory 生成并放入缓存
     *
     * factory 在锁内执行，保证同一个键只生成一次。
     * @param evicted 非空时写入本次插入淘汰的项数
     */
    template<typename Factory>
    Value getOrCreate(const Key& key, Factory&& factory, size_t* evicted = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
            stats_.hit_count++;
            if (evicted) {
                *evicted = 0;
            }
            return it->second->second;
        }

        stats_.miss_count++;
        Value created = factory();
        const size_t count = putLocked(key, created);
        if (evicted) {
            *evicted = count;
        }
        return created;
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.find(key) != cache_map_.end();
    }

    bool remove(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return false;
        }

        cache_list_.erase(it->second);
        cache_map_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_list_.clear();
        cache_map_.clear();
        stats_ = {};
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_list_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_list_.empty();
    }

    size_t capacity() const noexcept { return max_size_; }

    Statistics getStatistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    void resetStatistics() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_ = {};
    }

private:
    // 链表节点同时保存键，淘汰时无需反查 map
    using CacheList = std::list<std::pair<Key, Value>>;
    using CacheMap = std::unordered_map<Key, typename CacheList::iterator, Hash>;

    mutable std::mutex mutex_;
    size_t max_size_;
    CacheList cache_list_;
    CacheMap cache_map_;
    Statistics stats_;

    size_t putLocked(const Key& key, const Value& value) {
        if (max_size_ == 0) {
            return 0;
        }

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second->second = value;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
            return 0;
        }

        size_t evicted = 0;
        while (cache_list_.size() >= max_size_) {
            evictLRU();
            ++evicted;
        }

        cache_list_.emplace_front(key, value);
        cache_map_[key] = cache_list_.begin();
        stats_.put_count++;
        return evicted;
    }

    void evictLRU() {
        if (cache_list_.empty()) {
            return;
        }
        cache_map_.erase(cache_list_.back().first);
        cache_list_.pop_back();
        stats_.evict_count++;
    }
};

}} // namespace rclogic::core
