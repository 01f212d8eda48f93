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
#include "bmnsc/optim/lr_schedule.hpp"
#include "bmnsc/optim/optimizer_state.hpp"
#include "bmnsc/optim/param_groups.hpp"
#include "bmnsc/optim/update_policy.hpp"
#include <cmath>
#include <memory>
#include <string>
#include <sycl/sycl.hpp>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bmnsc {
namespace optim {

namespace s = sycl;

/**
 * @brief Momentum SGD with per-group Batch-Manhattan / No-Sign-Change policies.
 *
 * Per element of every parameter:
 * 1. Weight decay:   g <- g + wd * p
 * 2. Momentum:       v <- mu * v + g   (v zero on first touch)
 * 3. Magnitude:      delta = lr * v, or lr * sign(v) for Batch Manhattan
 * 4. Sign overlay:   delta clamped so p lands on zero instead of crossing it
 * 5. Apply:          p <- p - delta
 *
 * momentum and weight_decay are shared by all groups; each group owns its
 * learning rate and its update kernel, picked once at construction.
 */
class GroupedSgd {
public:
    struct Config {
        float momentum = 0.9f;
        float weight_decay = 1e-4f;
        int lr_decay_epochs = 10;
    };

    GroupedSgd(s::queue &q, std::vector<ParamGroup> groups, const Config &cfg)
        : queue_(q), groups_(std::move(groups)), cfg_(cfg), schedule_(cfg.lr_decay_epochs) {
        if (!(cfg_.momentum >= 0.0f) || !std::isfinite(cfg_.momentum))
            throw ConfigurationError("momentum must be a finite non-negative number");
        if (!(cfg_.weight_decay >= 0.0f) || !std::isfinite(cfg_.weight_decay))
            throw ConfigurationError("weight_decay must be a finite non-negative number");

        std::unordered_set<ParamId> seen;
        launchers_.reserve(groups_.size());
        for (const auto &g : groups_) {
            for (const auto *p : g.params()) {
                if (!seen.insert(p->id()).second)
                    throw std::invalid_argument("parameter '" + p->name() + "' appears in more than one group");
            }
            launchers_.push_back(select_update_launcher(g.batch_manhattan(), g.no_sign_change()));
        }
    }

    GroupedSgd(const GroupedSgd &) = delete;
    GroupedSgd &operator=(const GroupedSgd &) = delete;

    const std::vector<ParamGroup> &groups() const { return groups_; }
    float momentum() const { return cfg_.momentum; }
    float weight_decay() const { return cfg_.weight_decay; }
    const StepDecaySchedule &schedule() const { return schedule_; }

    // Start-of-epoch learning-rate update for every group.
    void set_epoch(int epoch) { schedule_.apply(groups_, epoch); }

    /**
     * @brief Apply one optimization step to every parameter of every group.
     *
     * @param grads One gradient per parameter, same element count
     * @param profile_events Optional, receives one event per launched kernel
     *
     * Kernels are only submitted; callers that read parameters on the host or
     * start the next forward pass rely on buffer dependencies or wait on the queue.
     */
    void step(core::GradientSet &grads, std::vector<s::event> *profile_events = nullptr) {
        for (size_t gi = 0; gi < groups_.size(); ++gi) {
            const auto &group = groups_[gi];
            StepCoefficients coeffs{group.learning_rate(), cfg_.momentum, cfg_.weight_decay};

            for (auto *p : group.params()) {
                if (!grads.has(p->id()))
                    throw ShapeMismatchError(p->name() + ": no gradient supplied");
                if (grads.numel(p->id()) != p->numel())
                    throw ShapeMismatchError(p->name() + ": gradient has " + std::to_string(grads.numel(p->id())) +
                                             " elements, parameter has " + std::to_string(p->numel()));

                auto &velocity = velocity_for(*p);
                auto ev = launchers_[gi](queue_, p->value(), grads[p->id()], velocity, p->numel(), coeffs);
                if (profile_events)
                    profile_events->push_back(ev);
            }
        }
    }

    bool has_momentum(ParamId id) const { return momentum_.count(id) != 0; }

    std::vector<float> momentum_host(ParamId id) {
        auto it = momentum_.find(id);
        if (it == momentum_.end())
            return {};
        std::vector<float> out(it->second->size());
        s::host_accessor acc(*it->second, s::read_only);
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = acc[i];
        return out;
    }

    OptimizerState export_state() {
        queue_.wait();

        OptimizerState st;
        st.momentum = cfg_.momentum;
        st.weight_decay = cfg_.weight_decay;
        st.groups.reserve(groups_.size());
        for (const auto &g : groups_) {
            GroupState gs;
            gs.label = g.label();
            gs.lr = g.learning_rate();
            gs.base_lr = g.base_learning_rate();
            gs.batch_manhattan = g.batch_manhattan();
            gs.no_sign_change = g.no_sign_change();
            for (const auto *p : g.params()) {
                ParamSlotState ps;
                ps.id = p->id();
                ps.numel = p->numel();
                ps.has_momentum = has_momentum(p->id());
                if (ps.has_momentum)
                    ps.momentum = momentum_host(p->id());
                gs.params.push_back(std::move(ps));
            }
            st.groups.push_back(std::move(gs));
        }
        return st;
    }

    /**
     * @brief Check that a saved state fits this optimizer without applying it.
     *
     * The saved group layout must match the live one exactly (group count, flags,
     * parameter ids and sizes, in order) and the shared coefficients must be
     * finite and non-negative; otherwise CheckpointError is thrown.
     */
    void validate_state(const OptimizerState &st) const {
        if (!(st.momentum >= 0.0f) || !std::isfinite(st.momentum))
            throw CheckpointError("saved momentum " + std::to_string(st.momentum) +
                                  " is not a finite non-negative number");
        if (!(st.weight_decay >= 0.0f) || !std::isfinite(st.weight_decay))
            throw CheckpointError("saved weight_decay " + std::to_string(st.weight_decay) +
                                  " is not a finite non-negative number");
        if (st.groups.size() != groups_.size())
            throw CheckpointError("optimizer has " + std::to_string(groups_.size()) + " groups, checkpoint has " +
                                  std::to_string(st.groups.size()));

        for (size_t gi = 0; gi < groups_.size(); ++gi) {
            const auto &live = groups_[gi];
            const auto &saved = st.groups[gi];
            const std::string where = "group " + std::to_string(gi) + " (" + live.label() + ")";
            if (saved.batch_manhattan != live.batch_manhattan() || saved.no_sign_change != live.no_sign_change())
                throw CheckpointError(where + ": update policy flags differ");
            if (!(saved.lr >= 0.0f) || !std::isfinite(saved.lr))
                throw CheckpointError(where + ": saved learning rate is not a finite non-negative number");
            if (saved.params.size() != live.size())
                throw CheckpointError(where + ": " + std::to_string(live.size()) + " parameters live, " +
                                      std::to_string(saved.params.size()) + " saved");
            for (size_t pi = 0; pi < live.size(); ++pi) {
                const auto *p = live.params()[pi];
                const auto &slot = saved.params[pi];
                if (slot.id != p->id() || slot.numel != p->numel())
                    throw CheckpointError(where + ": parameter " + std::to_string(pi) + " is '" + p->name() +
                                          "' with " + std::to_string(p->numel()) + " elements, checkpoint has id " +
                                          std::to_string(slot.id) + " with " + std::to_string(slot.numel));
                if (slot.has_momentum && slot.momentum.size() != p->numel())
                    throw CheckpointError(where + ": momentum size mismatch for '" + p->name() + "'");
            }
        }
    }

    /**
     * @brief Restore learning rates, coefficients and momentum buffers.
     *
     * Runs validate_state first; nothing is modified when it throws.
     * Base learning rates stay as configured.
     */
    void import_state(const OptimizerState &st) {
        validate_state(st);

        queue_.wait();
        cfg_.momentum = st.momentum;
        cfg_.weight_decay = st.weight_decay;
        momentum_.clear();
        for (size_t gi = 0; gi < groups_.size(); ++gi) {
            groups_[gi].set_learning_rate(st.groups[gi].lr);
            for (const auto &slot : st.groups[gi].params) {
                if (!slot.has_momentum)
                    continue;
                auto buf = std::make_unique<s::buffer<float, 1>>(s::range<1>(slot.momentum.size()));
                {
                    s::host_accessor acc(*buf, s::write_only);
                    for (size_t i = 0; i < slot.momentum.size(); ++i)
                        acc[i] = slot.momentum[i];
                }
                momentum_.emplace(slot.id, std::move(buf));
            }
        }
    }

private:
    s::buffer<float, 1> &velocity_for(core::Parameter &p) {
        auto it = momentum_.find(p.id());
        if (it != momentum_.end()) {
            if (it->second->size() != p.numel())
                throw ShapeMismatchError(p.name() + ": momentum buffer has " + std::to_string(it->second->size()) +
                                         " elements, parameter has " + std::to_string(p.numel()));
            return *it->second;
        }

        auto buf = std::make_unique<s::buffer<float, 1>>(s::range<1>(p.numel()));
        queue_.submit([&](s::handler &h) {
            s::accessor acc(*buf, h, s::write_only, s::no_init);
            h.fill(acc, 0.0f);
        });
        auto &ref = *buf;
        momentum_.emplace(p.id(), std::move(buf));
        return ref;
    }

    s::queue &queue_;
    std::vector<ParamGroup> groups_;
    std::vector<UpdateLauncher> launchers_;
    Config cfg_;
    StepDecaySchedule schedule_;
    std::unordered_map<ParamId, std::unique_ptr<s::buffer<float, 1>>> momentum_;
};

} // namespace optim
} // namespace bmnsc
