//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Sharded key/value store with whole-value atomic replacement.
///
/// Each shard owns its own reader/writer lock, so writes to one key never
/// block readers or writers of keys that hash to another shard. Values are
/// immutable once published; readers receive a shared handle and never
/// observe a partially written value.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_CONCURRENT_STORE_H
#define FABLS_LSP_CONCURRENT_STORE_H

#include "llvm/ADT/STLFunctionalExtras.h"

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fabls::lsp
{

/// @brief Thread-safe string-keyed store of immutable values.
/// @tparam V Stored value type.
template <typename V>
class ConcurrentStore final
{
public:
    /// @brief Shared handle to a published value.
    using ValuePtr = std::shared_ptr<const V>;

    /// @brief Number of independently locked shards.
    static constexpr std::size_t ShardCount = 16;

    /// @brief Returns the current value for `key`, or `nullptr`.
    [[nodiscard]] ValuePtr get(const std::string& key) const
    {
        const Shard&                        shard = shardFor(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        const auto                          it = shard.entries.find(key);
        return it == shard.entries.end() ? nullptr : it->second;
    }

    [[nodiscard]] bool contains(const std::string& key) const
    {
        return get(key) != nullptr;
    }

    /// @brief Publishes `value`, replacing any previous value (last writer wins).
    void put(const std::string& key, ValuePtr value)
    {
        Shard&                              shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.entries.insert_or_assign(key, std::move(value));
    }

    /// @brief Publishes `value` only when `key` has no value yet.
    /// @return `true` when the value was inserted.
    bool insertIfAbsent(const std::string& key, ValuePtr value)
    {
        Shard&                              shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        return shard.entries.emplace(key, std::move(value)).second;
    }

    /// @brief Removes every entry for which `predicate` returns `true`.
    /// @return Number of removed entries.
    std::size_t eraseIf(llvm::function_ref<bool(const std::string&, const V&)> predicate)
    {
        std::size_t removed = 0;
        for (Shard& shard : shards_)
        {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            for (auto it = shard.entries.begin(); it != shard.entries.end();)
            {
                if (predicate(it->first, *it->second))
                {
                    it = shard.entries.erase(it);
                    ++removed;
                }
                else
                {
                    ++it;
                }
            }
        }
        return removed;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::size_t total = 0;
        for (const Shard& shard : shards_)
        {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            total += shard.entries.size();
        }
        return total;
    }

    /// @brief Returns a point-in-time copy of all entries, shard by shard.
    ///
    /// The copy is not atomic across shards; writers may interleave between
    /// shards.
    [[nodiscard]] std::vector<std::pair<std::string, ValuePtr>> snapshot() const
    {
        std::vector<std::pair<std::string, ValuePtr>> out;
        for (const Shard& shard : shards_)
        {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            out.insert(out.end(), shard.entries.begin(), shard.entries.end());
        }
        return out;
    }

private:
    struct Shard final
    {
        mutable std::shared_mutex                 mutex;
        std::unordered_map<std::string, ValuePtr> entries;
    };

    [[nodiscard]] Shard& shardFor(const std::string& key)
    {
        return shards_[std::hash<std::string>{}(key) % ShardCount];
    }

    [[nodiscard]] const Shard& shardFor(const std::string& key) const
    {
        return shards_[std::hash<std::string>{}(key) % ShardCount];
    }

    std::array<Shard, ShardCount> shards_;
};

}  // namespace fabls::lsp

#endif  // FABLS_LSP_CONCURRENT_STORE_H
