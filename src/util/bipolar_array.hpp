#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>

namespace effdiff {

// Array indexed by -D..D; Myers tracks furthest reaching paths per diagonal k.
template <typename Type>
struct BipolarArray {
    int64_t min_;
    int64_t max_;
    std::size_t capacity_;
    std::unique_ptr<Type[]> arr_;

    BipolarArray(int64_t min, int64_t max)
        : min_(min), max_(max), capacity_(static_cast<std::size_t>(max - min + 1) /* +1 for zero */) {
        assert(max - min + 1 >= 0);
        arr_ = std::make_unique<Type[]>(capacity_);
    }

    BipolarArray(const BipolarArray& other) : min_(other.min_), max_(other.max_), capacity_(other.capacity_) {
        // Skip the value-initialization make_unique would do; every slot is copied below.
        arr_ = std::unique_ptr<Type[]>{new Type[capacity_]};
        std::memcpy(arr_.get(), other.arr_.get(), other.capacity_ * sizeof(Type));
    }

    BipolarArray(BipolarArray&&) noexcept = default;

    Type&
    operator[](int64_t index) {
        auto offset = -min_ + index;
        assert(offset >= 0);
        assert(offset < static_cast<int64_t>(capacity_));
        return arr_.get()[offset];
    }

    int64_t
    min() const {
        return min_;
    }

    int64_t
    max() const {
        return max_;
    }
};

}  // namespace effdiff
