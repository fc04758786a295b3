#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <mutex>

namespace accounts::utils {

/**
 * @brief unordered_map под одним shared_mutex
 *
 * Запись (insert) берёт эксклюзивную блокировку, чтение (find, values,
 * size) разделяемую, поэтому читатели работают параллельно,
 * но никогда не видят запись наполовину.
 *
 * Наружу отдаются только копии значений: ссылки на элементы
 * не переживают блокировку.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    /**
     * @brief Вставить или перезаписать значение по ключу
     */
    void insert(const K &key, const V &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.insert_or_assign(key, value);
    }

    std::optional<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Снимок всех значений в порядке обхода unordered_map
     */
    std::vector<V> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<V> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
        {
            result.push_back(value);
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, V> map_;
};

} // namespace accounts::utils
