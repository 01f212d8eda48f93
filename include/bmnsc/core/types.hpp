/*
 * Copyright 2025 BMNSC Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

// Kokkos mdspan, found through the mdspan CMake package
#include <experimental/mdspan>
#include <sycl/sycl.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <numeric>
#include <span>
#include <vector>

namespace bmnsc {

namespace s = sycl;
namespace stdex = std::experimental;

template <typename T>
using MatrixView = stdex::mdspan<
    T,
    stdex::extents<size_t, std::dynamic_extent, std::dynamic_extent>
>;

// Stable handles handed out by core::ParameterStore.
using ParamId = uint32_t;
using LayerId = uint32_t;

using Shape = std::vector<size_t>;

inline size_t shape_numel(std::span<const size_t> shape) {
    return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<size_t>{});
}

} // namespace bmnsc
