#pragma once

#include <animcanon/error.hpp>
#include <animcanon/keyframe.hpp>
#include <animcanon/logger.hpp>
#include <cstddef>
#include <iterator>
#include <span>
#include <vector>

namespace animcanon
{

// Lazily yields the keyframes of a timeline that change its realized value.
//
// A single forward pass over the input keeps:
//   - landing frames, whose value differs from the value before them;
//   - launch frames, which hold the previous value but start a ramp to a
//     different next value. Their easing is forced to Linear since the
//     segment leading into them is constant.
// The last keyframe is kept only if something was already kept and it
// changes the value again.
//
// The range is a non-owning view: `initial_value` and `keyframes` must outlive
// it and every iterator obtained from it. Each begin() starts a fresh pass.
template <typename T>
class OptimizedKeyframes
{
   public:
    class iterator
    {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Keyframe<T>;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Keyframe<T>*;
        using reference         = const Keyframe<T>&;

        iterator() = default;

        reference operator*() const { return out_; }
        pointer operator->() const { return &out_; }

        iterator& operator++()
        {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) { return a.done_ == b.done_; }

       private:
        friend class OptimizedKeyframes;

        iterator(const T* initial_value, std::span<const Keyframe<T>> keyframes)
            : keyframes_(keyframes), previous_(initial_value), done_(false)
        {
            advance();
        }

        void advance()
        {
            while (current_ + 1 < keyframes_.size())
            {
                const Keyframe<T>& current = keyframes_[current_];
                const Keyframe<T>& next    = keyframes_[current_ + 1];

                bool emit = false;
                if (!(current.value == *previous_))
                {
                    out_ = current;
                    emit = true;
                }
                else if (!(current.value == next.value))
                {
                    out_ = current.easing.type == EasingType::Linear
                               ? current
                               : current.with_easing(Easing::linear());
                    emit = true;
                }

                previous_ = &current.value;
                ++current_;

                if (emit)
                {
                    emitted_any_ = true;
                    return;
                }
            }

            if (!trailing_checked_)
            {
                trailing_checked_          = true;
                const Keyframe<T>& closing = keyframes_[current_];
                if (emitted_any_ && !(closing.value == *previous_))
                {
                    out_ = closing;
                    return;
                }
            }

            done_ = true;
        }

        std::span<const Keyframe<T>> keyframes_;
        const T*                     previous_         = nullptr;
        size_t                       current_          = 0;
        bool                         emitted_any_      = false;
        bool                         trailing_checked_ = false;
        bool                         done_             = true;
        Keyframe<T>                  out_;
    };

    OptimizedKeyframes(const T& initial_value, std::span<const Keyframe<T>> keyframes)
        : initial_value_(&initial_value), keyframes_(keyframes)
    {
        if (keyframes_.empty())
        {
            ANIMCANON_LOG_ERROR("optimizer", "Refusing to optimize an empty keyframe sequence");
            throw InvariantViolation("optimize_keyframes: keyframe sequence is empty");
        }
    }

    iterator begin() const { return iterator(initial_value_, keyframes_); }
    iterator end() const { return iterator(); }

   private:
    const T*                     initial_value_;
    std::span<const Keyframe<T>> keyframes_;
};

template <typename T>
OptimizedKeyframes<T> optimize_keyframes(const T& initial_value, std::span<const Keyframe<T>> keyframes)
{
    return OptimizedKeyframes<T>(initial_value, keyframes);
}

// Drains a lazy keyframe range into a reusable vector.
template <typename Range>
auto materialize(const Range& range)
{
    using K = typename Range::iterator::value_type;
    std::vector<K> out;
    for (auto it = range.begin(); it != range.end(); ++it)
        out.push_back(*it);
    return out;
}

}   // namespace animcanon
