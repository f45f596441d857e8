#pragma once

#include <list>
#include <unordered_map>
#include <utility>

namespace lb {

/**
 * Generic cache with least-recently-used eviction policy.
 * Not thread-safe: the owner serializes access.
 */
template <typename Key, typename Val>
class LruCache {
public:
    using Node = std::pair<const Key, Val>;

    static constexpr size_t DEFAULT_CAPACITY = 128;

    /**
     * Initialize a new cache
     * @param max_size cache capacity, 0 means default
     */
    explicit LruCache(size_t max_size = DEFAULT_CAPACITY) {
        set_capacity(max_size);
    }

    /**
     * Insert a new key-value pair or update an existing one.
     * The new or updated entry becomes most-recently-used.
     * @return true if the key was not in the cache
     */
    bool insert(Key k, Val v) {
        if (auto i = m_mapped_values.find(k); i != m_mapped_values.end()) {
            m_key_values.splice(m_key_values.begin(), m_key_values, i->second);
            i->second->second = std::move(v);
            return false;
        }
        if (m_key_values.size() == m_max_size) {
            m_mapped_values.erase(m_key_values.back().first);
            m_key_values.pop_back();
        }
        m_key_values.emplace_front(k, std::move(v));
        m_mapped_values.emplace(std::move(k), m_key_values.begin());
        return true;
    }

    /**
     * Get the value associated with the given key.
     * The corresponding entry becomes most-recently-used.
     * The returned pointer is only valid until the next modification of the cache!
     * @return pointer to the found value, or nullptr if nothing was found
     */
    Val *get(const Key &k) {
        auto i = m_mapped_values.find(k);
        if (i == m_mapped_values.end()) {
            return nullptr;
        }
        m_key_values.splice(m_key_values.begin(), m_key_values, i->second);
        return &i->second->second;
    }

    /**
     * Forcibly make the specified cache entry least-recently-used
     */
    void make_lru(const Key &k) {
        if (auto i = m_mapped_values.find(k); i != m_mapped_values.end()) {
            m_key_values.splice(m_key_values.end(), m_key_values, i->second);
        }
    }

    /**
     * Delete the value with the given key from the cache
     */
    void erase(const Key &k) {
        if (auto i = m_mapped_values.find(k); i != m_mapped_values.end()) {
            m_key_values.erase(i->second);
            m_mapped_values.erase(i);
        }
    }

    void clear() {
        m_key_values.clear();
        m_mapped_values.clear();
    }

    size_t size() const {
        return m_mapped_values.size();
    }

    size_t max_size() const {
        return m_max_size;
    }

    /**
     * Set cache capacity. If the new capacity is less than the current size,
     * the least recently used entries are removed from the cache.
     * @param max_size new capacity, 0 means default capacity
     */
    void set_capacity(size_t max_size) {
        if (max_size == 0) {
            max_size = DEFAULT_CAPACITY;
        }
        while (m_key_values.size() > max_size) {
            m_mapped_values.erase(m_key_values.back().first);
            m_key_values.pop_back();
        }
        m_max_size = max_size;
    }

private:
    size_t m_max_size = DEFAULT_CAPACITY;
    /** MRU gravitate to the front, LRU gravitate to the back */
    std::list<Node> m_key_values;
    std::unordered_map<Key, typename std::list<Node>::iterator> m_mapped_values;
};

} // namespace lb
