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
#include <memory>
#include <span>
#include <string>
#include <sycl/sycl.hpp>
#include <utility>
#include <vector>

namespace bmnsc
{
namespace core
{

// Structural tag attached when a parameter is declared. Bias-ness is never
// inferred from the parameter name.
enum class ParamRole
{
    Weight,
    Bias
};

/**
 * @brief A named trainable tensor living in a SYCL buffer.
 *
 * Identity is the ParamId assigned by ParameterStore. Two parameters holding
 * equal values are still different parameters.
 */
class Parameter
{
  public:
    Parameter(ParamId id, LayerId layer, std::string name, ParamRole role, Shape shape)
        : id_(id), layer_(layer), name_(std::move(name)), role_(role), shape_(std::move(shape)),
          numel_(shape_numel(shape_)), value_(s::range<1>(numel_))
    {
        s::host_accessor acc(value_, s::write_only);
        for (size_t i = 0; i < numel_; ++i)
            acc[i] = 0.0f;
    }

    Parameter(const Parameter &) = delete;
    Parameter &operator=(const Parameter &) = delete;

    ParamId id() const { return id_; }
    LayerId layer() const { return layer_; }
    const std::string &name() const { return name_; }
    ParamRole role() const { return role_; }
    bool is_bias() const { return role_ == ParamRole::Bias; }
    const Shape &shape() const { return shape_; }
    size_t numel() const { return numel_; }

    s::buffer<float, 1> &value() { return value_; }

    void upload(std::span<const float> host)
    {
        if (host.size() != numel_)
            throw ShapeMismatchError(name_ + ": upload of " + std::to_string(host.size()) + " values into " +
                                     std::to_string(numel_) + " elements");
        s::host_accessor acc(value_, s::write_only);
        for (size_t i = 0; i < numel_; ++i)
            acc[i] = host[i];
    }

    std::vector<float> download()
    {
        std::vector<float> out(numel_);
        s::host_accessor acc(value_, s::read_only);
        for (size_t i = 0; i < numel_; ++i)
            out[i] = acc[i];
        return out;
    }

  private:
    ParamId id_;
    LayerId layer_;
    std::string name_;
    ParamRole role_;
    Shape shape_;
    size_t numel_;
    s::buffer<float, 1> value_;
};

/**
 * @brief Model-side registry of layers and their parameters.
 *
 * ParamId is the declaration index, so iterating parameters() always yields
 * declaration order. Parameter objects never move once declared.
 */
class ParameterStore
{
  public:
    LayerId add_layer(std::string name)
    {
        layer_names_.push_back(std::move(name));
        return static_cast<LayerId>(layer_names_.size() - 1);
    }

    Parameter &declare(LayerId layer, const std::string &local_name, ParamRole role, Shape shape)
    {
        if (layer >= layer_names_.size())
            throw std::out_of_range("unknown layer id " + std::to_string(layer));
        if (shape.empty() || shape_numel(shape) == 0)
            throw ShapeMismatchError(layer_names_[layer] + "." + local_name + ": empty shape");

        auto id = static_cast<ParamId>(params_.size());
        params_.push_back(std::make_unique<Parameter>(id, layer, layer_names_[layer] + "." + local_name, role,
                                                      std::move(shape)));
        return *params_.back();
    }

    size_t size() const { return params_.size(); }
    size_t num_layers() const { return layer_names_.size(); }
    const std::string &layer_name(LayerId layer) const { return layer_names_.at(layer); }

    Parameter &at(ParamId id) { return *params_.at(id); }
    const Parameter &at(ParamId id) const { return *params_.at(id); }

    std::vector<Parameter *> parameters()
    {
        std::vector<Parameter *> out;
        out.reserve(params_.size());
        for (auto &p : params_)
            out.push_back(p.get());
        return out;
    }

    std::vector<Parameter *> layer_parameters(LayerId layer)
    {
        std::vector<Parameter *> out;
        for (auto &p : params_)
        {
            if (p->layer() == layer)
                out.push_back(p.get());
        }
        return out;
    }

  private:
    std::vector<std::string> layer_names_;
    std::vector<std::unique_ptr<Parameter>> params_;
};

/**
 * @brief One gradient buffer per parameter, indexed by ParamId.
 *
 * Filled by the model's backward pass and consumed by the optimizer step.
 */
class GradientSet
{
  public:
    GradientSet() = default;

    explicit GradientSet(const ParameterStore &store)
    {
        for (ParamId id = 0; id < store.size(); ++id)
            assign(id, store.at(id).numel());
    }

    // (Re)allocate the gradient slot for `id` with `numel` zeroed elements.
    void assign(ParamId id, size_t numel)
    {
        if (id >= grads_.size())
            grads_.resize(static_cast<size_t>(id) + 1);
        grads_[id] = std::make_unique<s::buffer<float, 1>>(s::range<1>(numel));
        s::host_accessor acc(*grads_[id], s::write_only);
        for (size_t i = 0; i < numel; ++i)
            acc[i] = 0.0f;
    }

    bool has(ParamId id) const { return id < grads_.size() && grads_[id] != nullptr; }

    size_t numel(ParamId id) const { return has(id) ? grads_[id]->size() : 0; }

    s::buffer<float, 1> &operator[](ParamId id)
    {
        if (!has(id))
            throw ShapeMismatchError("no gradient for parameter id " + std::to_string(id));
        return *grads_[id];
    }

    void upload(ParamId id, std::span<const float> host)
    {
        auto &buf = (*this)[id];
        if (host.size() != buf.size())
            throw ShapeMismatchError("gradient upload of " + std::to_string(host.size()) + " values into " +
                                     std::to_string(buf.size()) + " elements");
        s::host_accessor acc(buf, s::write_only);
        for (size_t i = 0; i < host.size(); ++i)
            acc[i] = host[i];
    }

    std::vector<float> download(ParamId id)
    {
        auto &buf = (*this)[id];
        std::vector<float> out(buf.size());
        s::host_accessor acc(buf, s::read_only);
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = acc[i];
        return out;
    }

    void zero(s::queue &q)
    {
        for (auto &g : grads_)
        {
            if (!g)
                continue;
            q.submit([&](s::handler &h) {
                s::accessor acc(*g, h, s::write_only, s::no_init);
                h.fill(acc, 0.0f);
            });
        }
    }

  private:
    std::vector<std::unique_ptr<s::buffer<float, 1>>> grads_;
};

} // namespace core
} // namespace bmnsc
