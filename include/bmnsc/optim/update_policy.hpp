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

#include <sycl/sycl.hpp>
#include <cstddef>

namespace bmnsc {
namespace optim {

namespace s = sycl;

enum class UpdateMagnitude {
    Plain,          // delta = lr * v
    BatchManhattan, // delta = lr * sign(v)
};

struct StepCoefficients {
    float lr = 0.0f;
    float momentum = 0.0f;
    float weight_decay = 0.0f;
};

template <UpdateMagnitude Magnitude>
inline float step_magnitude(float velocity, float lr) {
    if constexpr (Magnitude == UpdateMagnitude::BatchManhattan) {
        // sign(0) = 0: a zero velocity does not move the weight
        float dir = velocity > 0.0f ? 1.0f : (velocity < 0.0f ? -1.0f : 0.0f);
        return lr * dir;
    } else {
        return lr * velocity;
    }
}

/**
 * @brief No-Sign-Change overlay for one element.
 *
 * If `weight - delta` would land on the other side of zero, the step is cut so
 * the weight lands exactly on zero. Zero itself has no sign, so a weight that
 * is already zero may move either way.
 */
inline float clamp_sign_change(float weight, float delta) {
    float next = weight - delta;
    bool flips = (weight > 0.0f && next < 0.0f) || (weight < 0.0f && next > 0.0f);
    return flips ? weight : delta;
}

/**
 * @brief One SGD element update: weight decay, momentum, magnitude policy, overlay.
 *
 * @param weight In/out parameter element
 * @param velocity In/out momentum buffer element
 * @param grad Raw gradient element
 */
template <UpdateMagnitude Magnitude, bool NoSignChange>
inline void update_element(float &weight, float &velocity, float grad, const StepCoefficients &k) {
    float d_p = grad;
    if (k.weight_decay != 0.0f)
        d_p += k.weight_decay * weight;

    velocity = k.momentum * velocity + d_p;

    float delta = step_magnitude<Magnitude>(velocity, k.lr);
    if constexpr (NoSignChange)
        delta = clamp_sign_change(weight, delta);

    weight -= delta;
}

using UpdateLauncher = s::event (*)(s::queue &q,
                                    s::buffer<float, 1> &param,
                                    s::buffer<float, 1> &grad,
                                    s::buffer<float, 1> &velocity,
                                    size_t num_elements,
                                    const StepCoefficients &coeffs);

template <UpdateMagnitude Magnitude, bool NoSignChange>
s::event launch_update(s::queue &q,
                       s::buffer<float, 1> &param,
                       s::buffer<float, 1> &grad,
                       s::buffer<float, 1> &velocity,
                       size_t num_elements,
                       const StepCoefficients &coeffs) {
    StepCoefficients k = coeffs; // Capture for kernel

    return q.submit([&](s::handler &h) {
        s::accessor w(param, h, s::read_write);
        s::accessor g(grad, h, s::read_only);
        s::accessor v(velocity, h, s::read_write);

        h.parallel_for(s::range<1>{num_elements}, [=](s::id<1> idx) {
            float weight = w[idx];
            float vel = v[idx];
            update_element<Magnitude, NoSignChange>(weight, vel, g[idx], k);
            v[idx] = vel;
            w[idx] = weight;
        });
    });
}

// Resolved once per group at optimizer construction.
inline UpdateLauncher select_update_launcher(bool batch_manhattan, bool no_sign_change) {
    if (batch_manhattan)
        return no_sign_change ? &launch_update<UpdateMagnitude::BatchManhattan, true>
                              : &launch_update<UpdateMagnitude::BatchManhattan, false>;
    return no_sign_change ? &launch_update<UpdateMagnitude::Plain, true>
                          : &launch_update<UpdateMagnitude::Plain, false>;
}

} // namespace optim
} // namespace bmnsc
