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

#include <algorithm>
#include <array>
#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

// Host-layout binary helpers shared by the optimizer state and training checkpoint formats.
namespace bmnsc
{
namespace core
{

using Magic = std::array<char, 8>;

template <class T> inline bool write_pod(std::ostream &os, const T &v)
{
    static_assert(std::is_trivially_copyable_v<T>);
    os.write(reinterpret_cast<const char *>(&v), sizeof(T));
    return static_cast<bool>(os);
}

template <class T> inline bool read_pod(std::istream &is, T &v)
{
    static_assert(std::is_trivially_copyable_v<T>);
    is.read(reinterpret_cast<char *>(&v), sizeof(T));
    return static_cast<bool>(is);
}

inline bool write_bytes(std::ostream &os, const void *ptr, size_t bytes)
{
    if (bytes == 0)
        return true;
    os.write(reinterpret_cast<const char *>(ptr), static_cast<std::streamsize>(bytes));
    return static_cast<bool>(os);
}

inline bool read_bytes(std::istream &is, void *ptr, size_t bytes)
{
    if (bytes == 0)
        return true;
    is.read(reinterpret_cast<char *>(ptr), static_cast<std::streamsize>(bytes));
    return static_cast<bool>(is);
}

inline bool write_vec_f32(std::ostream &os, const std::vector<float> &v)
{
    uint64_t n = static_cast<uint64_t>(v.size());
    if (!write_pod(os, n))
        return false;
    return write_bytes(os, v.data(), static_cast<size_t>(n) * sizeof(float));
}

inline bool read_vec_f32(std::istream &is, std::vector<float> &v)
{
    uint64_t n = 0;
    if (!read_pod(is, n))
        return false;
    if (n > (std::numeric_limits<size_t>::max() / sizeof(float)))
        return false;
    // Grow chunk by chunk so a corrupt length fails on end of stream before allocating it.
    constexpr uint64_t kChunk = uint64_t{1} << 16;
    v.clear();
    while (n > 0)
    {
        size_t take = static_cast<size_t>(std::min(n, kChunk));
        size_t at = v.size();
        v.resize(at + take);
        if (!read_bytes(is, v.data() + at, take * sizeof(float)))
            return false;
        n -= take;
    }
    return true;
}

inline bool write_string(std::ostream &os, const std::string &str)
{
    uint32_t n = static_cast<uint32_t>(str.size());
    if (!write_pod(os, n))
        return false;
    return write_bytes(os, str.data(), str.size());
}

inline bool read_string(std::istream &is, std::string &str, uint32_t max_len = 4096)
{
    uint32_t n = 0;
    if (!read_pod(is, n) || n > max_len)
        return false;
    str.assign(n, '\0');
    return read_bytes(is, str.data(), n);
}

inline bool write_magic(std::ostream &os, const Magic &magic)
{
    return write_bytes(os, magic.data(), magic.size());
}

inline bool expect_magic(std::istream &is, const Magic &magic)
{
    Magic got{};
    if (!read_bytes(is, got.data(), got.size()))
        return false;
    return std::equal(got.begin(), got.end(), magic.begin());
}

} // namespace core
} // namespace bmnsc
