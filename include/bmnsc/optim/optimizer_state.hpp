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

#include "bmnsc/core/binary_io.hpp"
#include "bmnsc/core/errors.hpp"
#include "bmnsc/core/types.hpp"
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace bmnsc
{
namespace optim
{

struct ParamSlotState
{
    ParamId id = 0;
    uint64_t numel = 0;
    bool has_momentum = false;
    std::vector<float> momentum;
};

struct GroupState
{
    std::string label;
    float lr = 0.0f;
    float base_lr = 0.0f;
    bool batch_manhattan = false;
    bool no_sign_change = false;
    std::vector<ParamSlotState> params;
};

struct OptimizerState
{
    uint32_t version = 1;
    float momentum = 0.0f;
    float weight_decay = 0.0f;
    std::vector<GroupState> groups;
};

inline constexpr core::Magic kOptimizerMagic = {'B', 'M', 'N', 'S', 'C', 'O', 'P', 'T'};
inline constexpr uint32_t kOptimizerStateVersion = 1;

inline void write_state(std::ostream &os, const OptimizerState &st)
{
    using namespace core;
    auto fail = [](const std::string &msg) { throw CheckpointError("writing optimizer state: " + msg); };

    if (!write_magic(os, kOptimizerMagic) || !write_pod(os, kOptimizerStateVersion))
        fail("header");
    uint32_t group_count = static_cast<uint32_t>(st.groups.size());
    if (!write_pod(os, st.momentum) || !write_pod(os, st.weight_decay) || !write_pod(os, group_count))
        fail("coefficients");

    for (const auto &g : st.groups)
    {
        uint8_t flags = 0u;
        if (g.batch_manhattan)
            flags |= 1u << 0;
        if (g.no_sign_change)
            flags |= 1u << 1;
        uint32_t param_count = static_cast<uint32_t>(g.params.size());
        if (!write_string(os, g.label) || !write_pod(os, g.lr) || !write_pod(os, g.base_lr) ||
            !write_pod(os, flags) || !write_pod(os, param_count))
            fail("group " + g.label);

        for (const auto &p : g.params)
        {
            uint8_t has_momentum = p.has_momentum ? 1u : 0u;
            if (!write_pod(os, p.id) || !write_pod(os, p.numel) || !write_pod(os, has_momentum))
                fail("parameter slot " + std::to_string(p.id));
            if (p.has_momentum && !write_vec_f32(os, p.momentum))
                fail("momentum of parameter " + std::to_string(p.id));
        }
    }
}

inline OptimizerState read_state(std::istream &is)
{
    using namespace core;
    auto fail = [](const std::string &msg) { throw CheckpointError("reading optimizer state: " + msg); };

    if (!expect_magic(is, kOptimizerMagic))
        fail("magic mismatch");

    OptimizerState st;
    uint32_t group_count = 0;
    if (!read_pod(is, st.version))
        fail("truncated header");
    if (st.version != kOptimizerStateVersion)
        fail("unsupported version " + std::to_string(st.version));
    if (!read_pod(is, st.momentum) || !read_pod(is, st.weight_decay) || !read_pod(is, group_count))
        fail("truncated coefficients");

    // Groups and slots are appended as they are read so a forged count fails on truncation.
    for (uint32_t gi = 0; gi < group_count; ++gi)
    {
        GroupState g;
        uint8_t flags = 0u;
        uint32_t param_count = 0;
        if (!read_string(is, g.label) || !read_pod(is, g.lr) || !read_pod(is, g.base_lr) || !read_pod(is, flags) ||
            !read_pod(is, param_count))
            fail("truncated group");
        g.batch_manhattan = (flags & (1u << 0)) != 0u;
        g.no_sign_change = (flags & (1u << 1)) != 0u;

        for (uint32_t pi = 0; pi < param_count; ++pi)
        {
            ParamSlotState p;
            uint8_t has_momentum = 0u;
            if (!read_pod(is, p.id) || !read_pod(is, p.numel) || !read_pod(is, has_momentum))
                fail("truncated parameter slot");
            p.has_momentum = has_momentum != 0u;
            if (p.has_momentum)
            {
                if (!read_vec_f32(is, p.momentum))
                    fail("truncated momentum of parameter " + std::to_string(p.id));
                if (p.momentum.size() != p.numel)
                    fail("momentum size disagrees with slot of parameter " + std::to_string(p.id));
            }
            g.params.push_back(std::move(p));
        }
        st.groups.push_back(std::move(g));
    }
    return st;
}

} // namespace optim
} // namespace bmnsc
