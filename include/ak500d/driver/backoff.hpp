#pragma once

#include <chrono>

namespace ak500d {

// Doubling retry delay, capped. next() never returns less than the
// previous value until reset().
class Backoff
{
public:
    Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max);

    std::chrono::milliseconds next();
    void reset();

    std::chrono::milliseconds initial() const { return initial_; }
    std::chrono::milliseconds max() const { return max_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds current_;
};

} // namespace ak500d
