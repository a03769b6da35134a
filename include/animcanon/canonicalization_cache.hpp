#pragma once

#include <animcanon/animatable.hpp>
#include <animcanon/structural_equality.hpp>
#include <unordered_map>

namespace animcanon
{

// Memo table mapping a timeline to its canonical form, keyed by structure
// rather than identity. Holds shared handles only; entries are never evicted
// or replaced, so a canonical handle stays stable for the cache's lifetime.
template <typename T>
class CanonicalizationCache
{
   public:
    explicit CanonicalizationCache(SequenceHashMode mode = SequenceHashMode::OrderSensitive)
        : table_(16, AnimatableHash<T>{mode}, AnimatableEqual<T>{})
    {
    }

    // Canonical handle for a structurally equal key, or nullptr.
    AnimatableHandle<T> find(const AnimatableHandle<T>& key) const
    {
        auto it = table_.find(key);
        return it == table_.end() ? nullptr : it->second;
    }

    // Returns false and keeps the existing entry if an equal key is present.
    bool insert(AnimatableHandle<T> key, AnimatableHandle<T> canonical)
    {
        return table_.emplace(std::move(key), std::move(canonical)).second;
    }

    size_t size() const { return table_.size(); }
    bool empty() const { return table_.empty(); }

   private:
    std::unordered_map<AnimatableHandle<T>, AnimatableHandle<T>, AnimatableHash<T>, AnimatableEqual<T>>
        table_;
};

}   // namespace animcanon
