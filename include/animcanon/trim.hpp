#pragma once

#include <animcanon/keyframe.hpp>
#include <cstddef>
#include <iterator>
#include <span>

namespace animcanon
{

// Lazily yields the keyframes needed to play a timeline over
// [start_frame, end_frame]: at most one keyframe at or before start_frame
// (the one supplying the value at the window start), everything inside the
// window, and the first keyframe at or beyond end_frame, after which
// iteration stops. A keyframe at frame 0 after the start is yielded as the
// window anchor in place of any earlier candidate.
//
// Yields nothing if no keyframe lies after start_frame.
template <typename T>
class TrimmedKeyframes
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

        reference operator*() const { return *current_; }
        pointer operator->() const { return current_; }

        iterator& operator++()
        {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) { return a.done_ == b.done_; }

       private:
        friend class TrimmedKeyframes;

        iterator(std::span<const Keyframe<T>> keyframes, double start_frame, double end_frame)
            : keyframes_(keyframes), start_frame_(start_frame), end_frame_(end_frame), done_(false)
        {
            advance();
        }

        void yield(const Keyframe<T>* kf)
        {
            current_ = kf;
            if (kf->frame >= end_frame_)
                reached_end_ = true;
        }

        void advance()
        {
            if (pending_)
            {
                yield(pending_);
                pending_ = nullptr;
                return;
            }
            if (reached_end_)
            {
                done_ = true;
                return;
            }

            while (index_ < keyframes_.size())
            {
                const Keyframe<T>* kf = &keyframes_[index_++];
                if (kf->frame <= start_frame_)
                {
                    first_candidate_ = kf;
                }
                else if (kf->frame == 0.0)
                {
                    first_candidate_ = nullptr;
                    first_yielded_   = true;
                    current_         = kf;
                    return;
                }
                else
                {
                    if (!first_yielded_ && first_candidate_)
                    {
                        first_yielded_ = true;
                        current_       = first_candidate_;
                        pending_       = kf;
                        return;
                    }
                    yield(kf);
                    return;
                }
            }

            done_ = true;
        }

        std::span<const Keyframe<T>> keyframes_;
        double                       start_frame_     = 0.0;
        double                       end_frame_       = 0.0;
        size_t                       index_           = 0;
        const Keyframe<T>*           first_candidate_ = nullptr;
        const Keyframe<T>*           pending_         = nullptr;
        const Keyframe<T>*           current_         = nullptr;
        bool                         first_yielded_   = false;
        bool                         reached_end_     = false;
        bool                         done_            = true;
    };

    TrimmedKeyframes(std::span<const Keyframe<T>> keyframes, double start_frame, double end_frame)
        : keyframes_(keyframes), start_frame_(start_frame), end_frame_(end_frame)
    {
    }

    iterator begin() const { return iterator(keyframes_, start_frame_, end_frame_); }
    iterator end() const { return iterator(); }

   private:
    std::span<const Keyframe<T>> keyframes_;
    double                       start_frame_;
    double                       end_frame_;
};

template <typename T>
TrimmedKeyframes<T> trim_keyframes(std::span<const Keyframe<T>> keyframes,
                                   double                       start_frame,
                                   double                       end_frame)
{
    return TrimmedKeyframes<T>(keyframes, start_frame, end_frame);
}

}   // namespace animcanon
