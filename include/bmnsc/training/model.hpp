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

#include "bmnsc/core/parameter.hpp"
#include "bmnsc/core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bmnsc
{
namespace training
{

// Row-major [size, input_dim] inputs and one class index per row.
struct Batch
{
    size_t size = 0;
    size_t input_dim = 0;
    std::vector<float> inputs;
    std::vector<int32_t> labels;
};

// Mean loss over the batch and row-major [batch, num_classes] logits.
struct BatchResult
{
    float loss = 0.0f;
    size_t num_classes = 0;
    std::vector<float> logits;
};

/**
 * @brief What the orchestrator needs from a classifier.
 *
 * Parameters live in the model's ParameterStore; the optimizer mutates them in
 * place through their SYCL buffers.
 */
class Model
{
  public:
    virtual ~Model() = default;

    virtual const std::string &arch() const = 0;
    virtual core::ParameterStore &parameters() = 0;
    // Structural handle of the final classifier layer.
    virtual LayerId final_classifier() const = 0;

    // Forward pass, loss and gradients of every parameter into `grads`.
    virtual BatchResult forward_backward(const Batch &batch, core::GradientSet &grads) = 0;
    virtual BatchResult forward(const Batch &batch) = 0;
};

class BatchSource
{
  public:
    virtual ~BatchSource() = default;

    virtual size_t size() const = 0;
    virtual Batch batch(size_t index) = 0;
    // Reshuffle for the given epoch; deterministic for a given seed and epoch.
    virtual void set_epoch(int epoch) = 0;
};

} // namespace training
} // namespace bmnsc
