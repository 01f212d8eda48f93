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
#include "bmnsc/training/model.hpp"
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace bmnsc
{
namespace data
{

// Shared by the train and validation sources so both see the same class centers.
struct ClusterSpec
{
    size_t input_dim = 32;
    size_t num_classes = 10;
    float noise = 0.6f;
    uint32_t center_seed = 7;
};

/**
 * @brief Gaussian clusters, one center per class, sample i labeled i % classes.
 *
 * Samples are generated once. With shuffling enabled, set_epoch(e) permutes
 * the sample order deterministically from (sample_seed, e).
 */
class SyntheticClusters : public training::BatchSource
{
  public:
    SyntheticClusters(const ClusterSpec &spec, size_t num_samples, size_t batch_size, uint32_t sample_seed,
                      bool shuffle)
        : spec_(spec), num_samples_(num_samples), batch_size_(batch_size), sample_seed_(sample_seed),
          shuffle_(shuffle), inputs_(num_samples * spec.input_dim), labels_(num_samples), order_(num_samples)
    {
        if (num_samples == 0 || batch_size == 0 || spec.input_dim == 0 || spec.num_classes == 0)
            throw ConfigurationError("synthetic clusters need positive sample count, batch size and dimensions");

        std::mt19937 center_gen(spec_.center_seed);
        std::normal_distribution<float> unit(0.0f, 1.0f);
        std::vector<float> centers(spec_.num_classes * spec_.input_dim);
        for (auto &c : centers)
            c = unit(center_gen);

        std::mt19937 gen(sample_seed_);
        std::normal_distribution<float> jitter(0.0f, spec_.noise > 0.0f ? spec_.noise : 1.0f);
        MatrixView<float> x(inputs_.data(), num_samples_, spec_.input_dim);
        MatrixView<const float> mu(centers.data(), spec_.num_classes, spec_.input_dim);
        for (size_t n = 0; n < num_samples_; ++n)
        {
            size_t label = n % spec_.num_classes;
            labels_[n] = static_cast<int32_t>(label);
            for (size_t d = 0; d < spec_.input_dim; ++d)
                x[n, d] = mu[label, d] + (spec_.noise > 0.0f ? jitter(gen) : 0.0f);
        }

        std::iota(order_.begin(), order_.end(), size_t{0});
        if (shuffle_)
            set_epoch(0);
    }

    size_t size() const override { return (num_samples_ + batch_size_ - 1) / batch_size_; }

    size_t num_samples() const { return num_samples_; }

    training::Batch batch(size_t index) override
    {
        if (index >= size())
            throw std::out_of_range("batch " + std::to_string(index) + " of " + std::to_string(size()));

        size_t begin = index * batch_size_;
        size_t end = std::min(begin + batch_size_, num_samples_);

        training::Batch b;
        b.size = end - begin;
        b.input_dim = spec_.input_dim;
        b.inputs.resize(b.size * b.input_dim);
        b.labels.resize(b.size);
        for (size_t r = 0; r < b.size; ++r)
        {
            size_t src = order_[begin + r];
            std::copy_n(inputs_.begin() + static_cast<std::ptrdiff_t>(src * spec_.input_dim), spec_.input_dim,
                        b.inputs.begin() + static_cast<std::ptrdiff_t>(r * spec_.input_dim));
            b.labels[r] = labels_[src];
        }
        return b;
    }

    void set_epoch(int epoch) override
    {
        if (!shuffle_)
            return;
        std::iota(order_.begin(), order_.end(), size_t{0});
        std::mt19937 gen(sample_seed_ ^ (0x9E3779B9u * static_cast<uint32_t>(epoch + 1)));
        std::shuffle(order_.begin(), order_.end(), gen);
    }

  private:
    ClusterSpec spec_;
    size_t num_samples_;
    size_t batch_size_;
    uint32_t sample_seed_;
    bool shuffle_;
    std::vector<float> inputs_;
    std::vector<int32_t> labels_;
    std::vector<size_t> order_;
};

} // namespace data
} // namespace bmnsc
