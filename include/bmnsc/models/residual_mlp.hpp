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
#include "bmnsc/optim/param_groups.hpp"
#include "bmnsc/training/model.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <sycl/sycl.hpp>
#include <utility>
#include <vector>

namespace bmnsc
{
namespace models
{

namespace s = sycl;

// Y[b, o] = sum_i X[b, i] * W[o, i] + bias[o], optionally followed by ReLU.
inline s::event linear_forward(s::queue &q, s::buffer<float, 1> &input, s::buffer<float, 1> &weight,
                               s::buffer<float, 1> &bias, s::buffer<float, 1> &output, size_t batch, size_t in_dim,
                               size_t out_dim, bool relu)
{
    return q.submit([&](s::handler &h) {
        s::accessor x(input, h, s::read_only);
        s::accessor w(weight, h, s::read_only);
        s::accessor b(bias, h, s::read_only);
        s::accessor y(output, h, s::write_only, s::no_init);

        h.parallel_for(s::range<2>(batch, out_dim), [=](s::id<2> idx) {
            size_t r = idx[0];
            size_t o = idx[1];
            float acc = b[o];
            for (size_t i = 0; i < in_dim; ++i)
                acc += x[r * in_dim + i] * w[o * in_dim + i];
            y[r * out_dim + o] = relu ? s::fmax(acc, 0.0f) : acc;
        });
    });
}

// dW[o, i] = sum_b dY[b, o] * X[b, i];  dBias[o] = sum_b dY[b, o]
inline s::event linear_backward_params(s::queue &q, s::buffer<float, 1> &input, s::buffer<float, 1> &grad_output,
                                       s::buffer<float, 1> &grad_weight, s::buffer<float, 1> &grad_bias,
                                       size_t batch, size_t in_dim, size_t out_dim)
{
    q.submit([&](s::handler &h) {
        s::accessor dy(grad_output, h, s::read_only);
        s::accessor db(grad_bias, h, s::write_only, s::no_init);
        h.parallel_for(s::range<1>(out_dim), [=](s::id<1> idx) {
            size_t o = idx[0];
            float acc = 0.0f;
            for (size_t r = 0; r < batch; ++r)
                acc += dy[r * out_dim + o];
            db[o] = acc;
        });
    });

    return q.submit([&](s::handler &h) {
        s::accessor x(input, h, s::read_only);
        s::accessor dy(grad_output, h, s::read_only);
        s::accessor dw(grad_weight, h, s::write_only, s::no_init);
        h.parallel_for(s::range<2>(out_dim, in_dim), [=](s::id<2> idx) {
            size_t o = idx[0];
            size_t i = idx[1];
            float acc = 0.0f;
            for (size_t r = 0; r < batch; ++r)
                acc += dy[r * out_dim + o] * x[r * in_dim + i];
            dw[o * in_dim + i] = acc;
        });
    });
}

// dX[b, i] = sum_o dY[b, o] * W[o, i]
inline s::event linear_backward_input(s::queue &q, s::buffer<float, 1> &grad_output, s::buffer<float, 1> &weight,
                                      s::buffer<float, 1> &grad_input, size_t batch, size_t in_dim, size_t out_dim)
{
    return q.submit([&](s::handler &h) {
        s::accessor dy(grad_output, h, s::read_only);
        s::accessor w(weight, h, s::read_only);
        s::accessor dx(grad_input, h, s::write_only, s::no_init);
        h.parallel_for(s::range<2>(batch, in_dim), [=](s::id<2> idx) {
            size_t r = idx[0];
            size_t i = idx[1];
            float acc = 0.0f;
            for (size_t o = 0; o < out_dim; ++o)
                acc += dy[r * out_dim + o] * w[o * in_dim + i];
            dx[r * in_dim + i] = acc;
        });
    });
}

// grad <- grad where activation > 0, else 0
inline s::event relu_backward(s::queue &q, s::buffer<float, 1> &grad, s::buffer<float, 1> &activation, size_t n)
{
    return q.submit([&](s::handler &h) {
        s::accessor g(grad, h, s::read_write);
        s::accessor a(activation, h, s::read_only);
        h.parallel_for(s::range<1>(n), [=](s::id<1> idx) {
            if (!(a[idx] > 0.0f))
                g[idx] = 0.0f;
        });
    });
}

// dst <- a + b
inline s::event add_into(s::queue &q, s::buffer<float, 1> &a, s::buffer<float, 1> &b, s::buffer<float, 1> &dst,
                         size_t n)
{
    return q.submit([&](s::handler &h) {
        s::accessor x(a, h, s::read_only);
        s::accessor y(b, h, s::read_only);
        s::accessor z(dst, h, s::write_only, s::no_init);
        h.parallel_for(s::range<1>(n), [=](s::id<1> idx) { z[idx] = x[idx] + y[idx]; });
    });
}

struct DenseLayer
{
    LayerId layer = 0;
    core::Parameter *weight = nullptr; // [out, in]
    core::Parameter *bias = nullptr;   // [out]
    size_t in_dim = 0;
    size_t out_dim = 0;
};

/**
 * @brief Small classifier: stem -> residual block -> fc.
 *
 *   h1 = relu(stem(x))
 *   h2 = h1 + relu(block(h1))     (resnet family; alexnet family drops the skip)
 *   logits = fc(h2)
 *
 * Layer names follow the family's convention for the final classifier: `fc`
 * for resnet, `classifier.6` for alexnet. Loss is mean softmax cross-entropy.
 */
class ResidualMlp : public training::Model
{
  public:
    ResidualMlp(s::queue &q, std::string arch, size_t input_dim, size_t hidden_dim, size_t num_classes,
                uint32_t seed)
        : queue_(q), arch_(std::move(arch)), num_classes_(num_classes)
    {
        if (input_dim == 0 || hidden_dim == 0 || num_classes == 0)
            throw ConfigurationError("model dimensions must be positive");

        const bool resnet = optim::architecture_family(arch_) == optim::ArchitectureFamily::ResNet;
        residual_ = resnet;

        std::mt19937 gen(seed);
        stem_ = make_layer(resnet ? "stem" : "features.0", input_dim, hidden_dim, gen);
        block_ = make_layer(resnet ? "layer1" : "classifier.4", hidden_dim, hidden_dim, gen);
        fc_ = make_layer(resnet ? "fc" : "classifier.6", hidden_dim, num_classes, gen);
    }

    const std::string &arch() const override { return arch_; }
    core::ParameterStore &parameters() override { return store_; }
    LayerId final_classifier() const override { return fc_.layer; }

    size_t input_dim() const { return stem_.in_dim; }
    size_t num_classes() const { return num_classes_; }

    training::BatchResult forward(const training::Batch &batch) override
    {
        run_forward(batch);
        return loss_and_grad(batch, false);
    }

    training::BatchResult forward_backward(const training::Batch &batch, core::GradientSet &grads) override
    {
        run_forward(batch);
        training::BatchResult out = loss_and_grad(batch, true);

        for (auto *p : store_.parameters())
        {
            if (!grads.has(p->id()) || grads.numel(p->id()) != p->numel())
                grads.assign(p->id(), p->numel());
        }

        const size_t B = batch.size;
        const size_t H = stem_.out_dim;

        // fc
        linear_backward_params(queue_, h2_, dlogits_, grads[fc_.weight->id()], grads[fc_.bias->id()], B, fc_.in_dim,
                               fc_.out_dim);
        linear_backward_input(queue_, dlogits_, fc_.weight->value(), dh2_, B, fc_.in_dim, fc_.out_dim);

        // block: d(pre-activation) = dh2 masked by relu output
        copy(dh2_, dz_);
        relu_backward(queue_, dz_, a_, B * H);
        linear_backward_params(queue_, h1_, dz_, grads[block_.weight->id()], grads[block_.bias->id()], B,
                               block_.in_dim, block_.out_dim);
        linear_backward_input(queue_, dz_, block_.weight->value(), dh1_block_, B, block_.in_dim, block_.out_dim);

        // skip connection
        if (residual_)
            add_into(queue_, dh1_block_, dh2_, dh1_, B * H);
        else
            copy(dh1_block_, dh1_);

        // stem
        relu_backward(queue_, dh1_, h1_, B * H);
        linear_backward_params(queue_, x_, dh1_, grads[stem_.weight->id()], grads[stem_.bias->id()], B, stem_.in_dim,
                               stem_.out_dim);
        return out;
    }

  private:
    DenseLayer make_layer(const std::string &name, size_t in_dim, size_t out_dim, std::mt19937 &gen)
    {
        DenseLayer l;
        l.layer = store_.add_layer(name);
        l.in_dim = in_dim;
        l.out_dim = out_dim;
        l.weight = &store_.declare(l.layer, "weight", core::ParamRole::Weight, {out_dim, in_dim});
        l.bias = &store_.declare(l.layer, "bias", core::ParamRole::Bias, {out_dim});

        // Kaiming normal
        std::normal_distribution<float> d(0.0f, std::sqrt(2.0f / static_cast<float>(in_dim)));
        std::vector<float> w(in_dim * out_dim);
        MatrixView<float> view(w.data(), out_dim, in_dim);
        for (size_t o = 0; o < out_dim; ++o)
            for (size_t i = 0; i < in_dim; ++i)
                view[o, i] = d(gen);
        l.weight->upload(w);
        return l;
    }

    void copy(s::buffer<float, 1> &src, s::buffer<float, 1> &dst)
    {
        queue_.submit([&](s::handler &h) {
            s::accessor a(src, h, s::read_only);
            s::accessor b(dst, h, s::write_only, s::no_init);
            h.copy(a, b);
        });
    }

    void ensure_batch(size_t batch)
    {
        if (batch == cached_batch_)
            return;
        const size_t H = stem_.out_dim;
        x_ = s::buffer<float, 1>(s::range<1>(batch * stem_.in_dim));
        h1_ = s::buffer<float, 1>(s::range<1>(batch * H));
        a_ = s::buffer<float, 1>(s::range<1>(batch * H));
        h2_ = s::buffer<float, 1>(s::range<1>(batch * H));
        logits_ = s::buffer<float, 1>(s::range<1>(batch * num_classes_));
        dlogits_ = s::buffer<float, 1>(s::range<1>(batch * num_classes_));
        dh2_ = s::buffer<float, 1>(s::range<1>(batch * H));
        dz_ = s::buffer<float, 1>(s::range<1>(batch * H));
        dh1_block_ = s::buffer<float, 1>(s::range<1>(batch * H));
        dh1_ = s::buffer<float, 1>(s::range<1>(batch * H));
        cached_batch_ = batch;
    }

    void run_forward(const training::Batch &batch)
    {
        if (batch.size == 0)
            throw ShapeMismatchError("empty batch");
        if (batch.input_dim != stem_.in_dim || batch.inputs.size() != batch.size * batch.input_dim ||
            batch.labels.size() != batch.size)
            throw ShapeMismatchError("batch of " + std::to_string(batch.size) + " x " +
                                     std::to_string(batch.input_dim) + " does not fit model input " +
                                     std::to_string(stem_.in_dim));
        ensure_batch(batch.size);

        {
            s::host_accessor acc(x_, s::write_only, s::no_init);
            for (size_t i = 0; i < batch.inputs.size(); ++i)
                acc[i] = batch.inputs[i];
        }

        const size_t B = batch.size;
        const size_t H = stem_.out_dim;
        linear_forward(queue_, x_, stem_.weight->value(), stem_.bias->value(), h1_, B, stem_.in_dim, H, true);
        linear_forward(queue_, h1_, block_.weight->value(), block_.bias->value(), a_, B, H, H, true);
        if (residual_)
            add_into(queue_, h1_, a_, h2_, B * H);
        else
            copy(a_, h2_);
        linear_forward(queue_, h2_, fc_.weight->value(), fc_.bias->value(), logits_, B, H, num_classes_, false);
    }

    // Host-side softmax cross-entropy; fills dlogits_ with (softmax - onehot) / B when asked.
    training::BatchResult loss_and_grad(const training::Batch &batch, bool want_grad)
    {
        const size_t B = batch.size;
        const size_t C = num_classes_;

        training::BatchResult out;
        out.num_classes = C;
        out.logits.resize(B * C);
        {
            s::host_accessor acc(logits_, s::read_only);
            for (size_t i = 0; i < B * C; ++i)
                out.logits[i] = acc[i];
        }

        std::vector<float> dlogits(want_grad ? B * C : 0);
        MatrixView<const float> logits(out.logits.data(), B, C);
        double loss_sum = 0.0;
        for (size_t r = 0; r < B; ++r)
        {
            auto label = static_cast<size_t>(batch.labels[r]);
            if (label >= C)
                throw ShapeMismatchError("label " + std::to_string(batch.labels[r]) + " outside " +
                                         std::to_string(C) + " classes");
            float mx = logits[r, 0];
            for (size_t c = 1; c < C; ++c)
                mx = std::max(mx, logits[r, c]);
            double denom = 0.0;
            for (size_t c = 0; c < C; ++c)
                denom += std::exp(static_cast<double>(logits[r, c] - mx));
            loss_sum += std::log(denom) - static_cast<double>(logits[r, label] - mx);

            if (want_grad)
            {
                MatrixView<float> d(dlogits.data(), B, C);
                for (size_t c = 0; c < C; ++c)
                {
                    double p = std::exp(static_cast<double>(logits[r, c] - mx)) / denom;
                    d[r, c] = static_cast<float>((p - (c == label ? 1.0 : 0.0)) / static_cast<double>(B));
                }
            }
        }
        out.loss = static_cast<float>(loss_sum / static_cast<double>(B));

        if (want_grad)
        {
            s::host_accessor acc(dlogits_, s::write_only, s::no_init);
            for (size_t i = 0; i < B * C; ++i)
                acc[i] = dlogits[i];
        }
        return out;
    }

    s::queue &queue_;
    std::string arch_;
    size_t num_classes_;
    bool residual_ = true;
    core::ParameterStore store_;
    DenseLayer stem_;
    DenseLayer block_;
    DenseLayer fc_;

    size_t cached_batch_ = 0;
    s::buffer<float, 1> x_{s::range<1>(1)};
    s::buffer<float, 1> h1_{s::range<1>(1)};
    s::buffer<float, 1> a_{s::range<1>(1)};
    s::buffer<float, 1> h2_{s::range<1>(1)};
    s::buffer<float, 1> logits_{s::range<1>(1)};
    s::buffer<float, 1> dlogits_{s::range<1>(1)};
    s::buffer<float, 1> dh2_{s::range<1>(1)};
    s::buffer<float, 1> dz_{s::range<1>(1)};
    s::buffer<float, 1> dh1_block_{s::range<1>(1)};
    s::buffer<float, 1> dh1_{s::range<1>(1)};
};

} // namespace models
} // namespace bmnsc
