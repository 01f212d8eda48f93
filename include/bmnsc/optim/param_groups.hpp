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

#include "bmnsc/core/errors.hpp"
#include "bmnsc/core/parameter.hpp"
#include "bmnsc/core/types.hpp"
#include <cstdio>
#include <iostream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bmnsc
{
namespace optim
{

// Only families with a single, unambiguous final classification layer.
enum class ArchitectureFamily
{
    ResNet,  // final layer is `fc`
    AlexNet, // final layer is the last module of `classifier`
};

inline ArchitectureFamily architecture_family(const std::string &arch)
{
    if (arch.rfind("resnet", 0) == 0)
        return ArchitectureFamily::ResNet;
    if (arch.rfind("alexnet", 0) == 0)
        return ArchitectureFamily::AlexNet;
    throw ConfigurationError("unsupported architecture '" + arch + "' (only resnet* and alexnet* are supported)");
}

struct LayerPartition
{
    std::vector<core::Parameter *> non_last;
    std::vector<core::Parameter *> last;
};

/**
 * @brief Split every parameter of `store` into the last-layer set and the rest.
 *
 * @param arch Architecture identifier, must belong to a supported family
 * @param store Model parameters
 * @param last_layer Structural handle of the model's final classifier layer
 *
 * Membership is decided by parameter identity. Both sets keep declaration order.
 */
inline LayerPartition classify_parameters(const std::string &arch, core::ParameterStore &store, LayerId last_layer)
{
    architecture_family(arch);
    if (last_layer >= store.num_layers())
        throw ConfigurationError("last layer id " + std::to_string(last_layer) + " does not exist");

    LayerPartition out;
    out.last = store.layer_parameters(last_layer);
    if (out.last.empty())
        throw ConfigurationError("last layer '" + store.layer_name(last_layer) + "' exposes no parameters");

    std::unordered_set<ParamId> last_ids;
    for (const auto *p : out.last)
        last_ids.insert(p->id());

    for (auto *p : store.parameters())
    {
        if (last_ids.count(p->id()) == 0)
            out.non_last.push_back(p);
    }
    return out;
}

struct BiasSplit
{
    std::vector<core::Parameter *> bias;
    std::vector<core::Parameter *> non_bias;
};

inline BiasSplit split_bias(const std::vector<core::Parameter *> &params)
{
    BiasSplit out;
    for (auto *p : params)
    {
        if (p->is_bias())
            out.bias.push_back(p);
        else
            out.non_bias.push_back(p);
    }
    return out;
}

// Per-tier (non-last / last) update settings.
struct TierConfig
{
    float learning_rate = 0.1f;
    bool batch_manhattan = false;
    bool no_sign_change = false;
};

/**
 * @brief Parameters sharing one learning rate and one pair of update-policy flags.
 *
 * Membership and flags are fixed at construction; only the learning rate changes.
 */
class ParamGroup
{
  public:
    ParamGroup(std::string label, std::vector<core::Parameter *> params, float lr, bool batch_manhattan,
               bool no_sign_change)
        : label_(std::move(label)), params_(std::move(params)), lr_(lr), base_lr_(lr),
          batch_manhattan_(batch_manhattan), no_sign_change_(no_sign_change)
    {
    }

    const std::string &label() const { return label_; }
    const std::vector<core::Parameter *> &params() const { return params_; }
    bool empty() const { return params_.empty(); }
    size_t size() const { return params_.size(); }

    float learning_rate() const { return lr_; }
    void set_learning_rate(float lr) { lr_ = lr; }
    float base_learning_rate() const { return base_lr_; }

    bool batch_manhattan() const { return batch_manhattan_; }
    bool no_sign_change() const { return no_sign_change_; }

  private:
    std::string label_;
    std::vector<core::Parameter *> params_;
    float lr_;
    float base_lr_;
    bool batch_manhattan_;
    bool no_sign_change_;
};

inline void log_tier(const char *label, const TierConfig &tier)
{
    char lr_text[32];
    std::snprintf(lr_text, sizeof(lr_text), "%.0e", static_cast<double>(tier.learning_rate));
    std::cout << label << " layer(s): lr = " << lr_text << (tier.batch_manhattan ? ", using Batch Manhattan" : "")
              << (tier.no_sign_change ? ", using No-sign-change (bias excluded)" : "") << "\n";
}

/**
 * @brief Build the ordered group list: non-last groups first, then last groups.
 *
 * A tier with No-Sign-Change yields two groups, the bias-exempt one first. Both
 * are emitted even when empty so the group layout depends only on configuration.
 */
inline std::vector<ParamGroup> build_param_groups(const LayerPartition &partition, const TierConfig &non_last,
                                                  const TierConfig &last)
{
    std::vector<ParamGroup> groups;
    auto emit = [&](const std::string &label, const std::vector<core::Parameter *> &params, const TierConfig &tier) {
        log_tier(label.c_str(), tier);
        if (!tier.no_sign_change)
        {
            groups.emplace_back(label, params, tier.learning_rate, tier.batch_manhattan, false);
            return;
        }
        auto split = split_bias(params);
        groups.emplace_back(label + "/bias", std::move(split.bias), tier.learning_rate, tier.batch_manhattan, false);
        groups.emplace_back(label + "/weight", std::move(split.non_bias), tier.learning_rate, tier.batch_manhattan,
                            true);
    };

    emit("non-last", partition.non_last, non_last);
    emit("last", partition.last, last);
    return groups;
}

} // namespace optim
} // namespace bmnsc
