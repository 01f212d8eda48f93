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
#include "bmnsc/optim/param_groups.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace bmnsc
{
namespace optim
{

// lr = base_lr * 0.1^floor(epoch / decay_epochs), per group.
class StepDecaySchedule
{
  public:
    explicit StepDecaySchedule(int decay_epochs) : decay_epochs_(decay_epochs)
    {
        if (decay_epochs_ <= 0)
            throw ConfigurationError("lr_decay_epochs must be positive, got " + std::to_string(decay_epochs_));
    }

    int decay_epochs() const { return decay_epochs_; }

    float lr_at(float base_lr, int epoch) const
    {
        if (epoch < 0)
            throw std::invalid_argument("epoch must be non-negative");
        int decades = epoch / decay_epochs_;
        return static_cast<float>(static_cast<double>(base_lr) * std::pow(0.1, decades));
    }

    void apply(std::vector<ParamGroup> &groups, int epoch) const
    {
        for (auto &g : groups)
            g.set_learning_rate(lr_at(g.base_learning_rate(), epoch));
    }

  private:
    int decay_epochs_;
};

} // namespace optim
} // namespace bmnsc
