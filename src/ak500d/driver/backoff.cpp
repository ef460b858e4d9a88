#include "ak500d/driver/backoff.hpp"

#include <algorithm>

namespace ak500d {

Backoff::Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
    : initial_(std::max(initial, std::chrono::milliseconds(1)))
    , max_(std::max(max, initial_))
    , current_(initial_)
{
}

std::chrono::milliseconds Backoff::next()
{
    const auto delay = current_;
    current_ = std::min(current_ * 2, max_);
    return delay;
}

void Backoff::reset()
{
    current_ = initial_;
}

} // namespace ak500d
