#pragma once
/**
 * @file striped_map.hpp
 * @brief Hash map partitioned into independently locked stripes.
 *
 * Every per-key operation takes exactly one stripe lock, so unrelated keys do not contend.
 * Whole-map scans lock one stripe at a time and give a per-stripe snapshot, not a global one.
 */
#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mydiarelay::utils
{

template <typename Key, typename Value, size_t StripeCount = 16, typename Hash = std::hash<Key>>
class StripedMap
{
    static_assert(StripeCount > 0, "StripedMap needs at least one stripe");

  public:
    StripedMap() = default;
    StripedMap(const StripedMap &) = delete;
    StripedMap &operator=(const StripedMap &) = delete;

    /// @brief Inserts or overwrites. Returns true if the key was new.
    bool insert_or_assign(const Key &key, Value value)
    {
        auto &s = stripe_for(key);
        std::unique_lock lock(s.mutex);
        return s.map.insert_or_assign(key, std::move(value)).second;
    }

    /// @brief Inserts only if absent. Returns false (and leaves the map unchanged) otherwise.
    bool try_emplace(const Key &key, Value value)
    {
        auto &s = stripe_for(key);
        std::unique_lock lock(s.mutex);
        return s.map.try_emplace(key, std::move(value)).second;
    }

    std::optional<Value> find(const Key &key) const
    {
        const auto &s = stripe_for(key);
        std::shared_lock lock(s.mutex);
        auto it = s.map.find(key);
        if (it == s.map.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const Key &key) const
    {
        const auto &s = stripe_for(key);
        std::shared_lock lock(s.mutex);
        return s.map.find(key) != s.map.end();
    }

    /// @brief Removes the key. Returns false if it was absent.
    bool erase(const Key &key)
    {
        auto &s = stripe_for(key);
        std::unique_lock lock(s.mutex);
        return s.map.erase(key) > 0;
    }

    /// @brief Removes the key only if `pred(value)` holds, under the same lock.
    template <typename Pred> bool erase_if(const Key &key, Pred &&pred)
    {
        auto &s = stripe_for(key);
        std::unique_lock lock(s.mutex);
        auto it = s.map.find(key);
        if (it == s.map.end() || !pred(std::as_const(it->second)))
            return false;
        s.map.erase(it);
        return true;
    }

    /// @brief Atomic remove-and-return.
    std::optional<Value> extract(const Key &key)
    {
        auto &s = stripe_for(key);
        std::unique_lock lock(s.mutex);
        auto node = s.map.extract(key);
        if (node.empty())
            return std::nullopt;
        return std::optional<Value>(std::move(node.mapped()));
    }

    /// @brief Removes and returns every entry for which `pred(key, value)` holds.
    template <typename Pred> std::vector<std::pair<Key, Value>> extract_all_if(Pred &&pred)
    {
        std::vector<std::pair<Key, Value>> out;
        for (auto &s : m_stripes)
        {
            std::unique_lock lock(s.mutex);
            for (auto it = s.map.begin(); it != s.map.end();)
            {
                if (pred(it->first, std::as_const(it->second)))
                {
                    out.emplace_back(it->first, std::move(it->second));
                    it = s.map.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        return out;
    }

    /// @brief Runs `fn(value&)` under the stripe's exclusive lock. False if absent.
    template <typename Fn> bool update(const Key &key, Fn &&fn)
    {
        auto &s = stripe_for(key);
        std::unique_lock lock(s.mutex);
        auto it = s.map.find(key);
        if (it == s.map.end())
            return false;
        fn(it->second);
        return true;
    }

    /// @brief Calls `fn(key, value)` for every entry, one stripe under shared lock at a time.
    template <typename Fn> void for_each(Fn &&fn) const
    {
        for (const auto &s : m_stripes)
        {
            std::shared_lock lock(s.mutex);
            for (const auto &[k, v] : s.map)
                fn(k, v);
        }
    }

    size_t size() const
    {
        size_t total = 0;
        for (const auto &s : m_stripes)
        {
            std::shared_lock lock(s.mutex);
            total += s.map.size();
        }
        return total;
    }

    void clear()
    {
        for (auto &s : m_stripes)
        {
            std::unique_lock lock(s.mutex);
            s.map.clear();
        }
    }

  private:
    struct Stripe
    {
        mutable std::shared_mutex mutex;
        std::unordered_map<Key, Value, Hash> map;
    };

    Stripe &stripe_for(const Key &key) { return m_stripes[Hash{}(key) % StripeCount]; }
    const Stripe &stripe_for(const Key &key) const { return m_stripes[Hash{}(key) % StripeCount]; }

    std::array<Stripe, StripeCount> m_stripes;
};

} // namespace mydiarelay::utils
