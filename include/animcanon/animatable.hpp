#pragma once

#include <animcanon/keyframe.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace animcanon
{

// A property timeline: the value before the first keyframe plus keyframes in
// strictly ascending frame order. Immutable once constructed; canonical
// results are shared through AnimatableHandle.
template <typename T>
class Animatable
{
   public:
    Animatable(T                          initial_value,
               std::vector<Keyframe<T>>   keyframes,
               std::optional<uint32_t>    property_index = std::nullopt)
        : initial_value_(std::move(initial_value)),
          keyframes_(std::move(keyframes)),
          property_index_(property_index)
    {
    }

    const T& initial_value() const { return initial_value_; }

    std::span<const Keyframe<T>> keyframes() const { return keyframes_; }
    size_t keyframe_count() const { return keyframes_.size(); }

    // Identifies the driven property of the owning object. Not part of
    // equality, and not preserved on optimized results.
    std::optional<uint32_t> property_index() const { return property_index_; }

    // False if there is at most one keyframe or every keyframe holds the
    // initial value.
    bool is_animated() const
    {
        if (keyframes_.size() <= 1)
            return false;
        for (const auto& kf : keyframes_)
        {
            if (!(kf.value == initial_value_))
                return true;
        }
        return false;
    }

   private:
    T                        initial_value_;
    std::vector<Keyframe<T>> keyframes_;
    std::optional<uint32_t>  property_index_;
};

template <typename T>
using AnimatableHandle = std::shared_ptr<const Animatable<T>>;

template <typename T>
AnimatableHandle<T> make_animatable(T                        initial_value,
                                    std::vector<Keyframe<T>> keyframes,
                                    std::optional<uint32_t>  property_index = std::nullopt)
{
    return std::make_shared<const Animatable<T>>(
        std::move(initial_value), std::move(keyframes), property_index);
}

}   // namespace animcanon
