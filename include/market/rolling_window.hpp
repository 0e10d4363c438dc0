#pragma once

#include <cstddef>
#include <vector>

namespace ramm {

// Fixed-capacity ring buffer with running sum and sum of squares.
// push() subtracts the evicted value before adding the new one.
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity)
        : buf_(capacity > 0 ? capacity : 1) {}

    void push(double value) {
        if (count_ == buf_.size()) {
            double old = buf_[head_];
            sum_    -= old;
            sum_sq_ -= old * old;
        } else {
            ++count_;
        }
        buf_[head_] = value;
        head_ = (head_ + 1) % buf_.size();
        sum_    += value;
        sum_sq_ += value * value;
    }

    // back(0) is the newest sample, back(size()-1) the oldest.
    double back(size_t age) const {
        return buf_[(head_ + buf_.size() - 1 - age) % buf_.size()];
    }

    size_t size()     const { return count_; }
    size_t capacity() const { return buf_.size(); }
    bool   full()     const { return count_ == buf_.size(); }
    bool   empty()    const { return count_ == 0; }

    double sum()    const { return sum_; }
    double sum_sq() const { return sum_sq_; }
    double mean()   const { return count_ ? sum_ / count_ : 0.0; }

    double variance() const {
        if (count_ == 0) return 0.0;
        double m = mean();
        return sum_sq_ / count_ - m * m;
    }

private:
    std::vector<double> buf_;
    size_t head_   = 0;
    size_t count_  = 0;
    double sum_    = 0.0;
    double sum_sq_ = 0.0;
};

} // namespace ramm
