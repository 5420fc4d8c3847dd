#pragma once

#include <amc/vector.hpp>
#include <cstddef>
#include <memory>

namespace routemap {

template <class T, class Alloc = std::allocator<T> >
using vector = amc::vector<T, Alloc>;

// Vector storing up to N elements inline before spilling to the heap.
template <class T, std::size_t N, class Alloc = std::allocator<T> >
using SmallVector = amc::SmallVector<T, N, Alloc>;

}  // namespace routemap
