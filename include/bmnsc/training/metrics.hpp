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
#include "bmnsc/core/types.hpp"
#include <algorithm>
#include <cstdint>
#include <span>
#include <string>

namespace bmnsc
{
namespace training
{

// Current value and running average.
struct AverageMeter
{
    double val = 0.0;
    double avg = 0.0;
    double sum = 0.0;
    size_t count = 0;

    void reset() { *this = AverageMeter{}; }

    void update(double v, size_t n = 1)
    {
        val = v;
        sum += v * static_cast<double>(n);
        count += n;
        avg = count ? sum / static_cast<double>(count) : 0.0;
    }
};

/**
 * @brief Precision@k in percent over a batch of row-major logits.
 *
 * A row counts as correct when fewer than k classes score strictly higher than
 * the true class. k is clamped to the number of classes.
 */
inline double accuracy(std::span<const float> logits, std::span<const int32_t> labels, size_t num_classes, size_t k)
{
    const size_t batch = labels.size();
    if (logits.size() != batch * num_classes)
        throw ShapeMismatchError("accuracy: " + std::to_string(logits.size()) + " logits for " +
                                 std::to_string(batch) + " rows of " + std::to_string(num_classes) + " classes");
    if (batch == 0)
        return 0.0;
    k = std::clamp<size_t>(k, 1, num_classes);

    MatrixView<const float> view(logits.data(), batch, num_classes);
    size_t correct = 0;
    for (size_t b = 0; b < batch; ++b)
    {
        auto label = static_cast<size_t>(labels[b]);
        if (label >= num_classes)
            continue;
        float target = view[b, label];
        size_t higher = 0;
        for (size_t c = 0; c < num_classes; ++c)
        {
            if (view[b, c] > target)
                ++higher;
        }
        if (higher < k)
            ++correct;
    }
    return 100.0 * static_cast<double>(correct) / static_cast<double>(batch);
}

} // namespace training
} // namespace bmnsc
