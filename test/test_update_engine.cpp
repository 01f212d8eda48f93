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

#include "bmnsc/core/errors.hpp"
#include "bmnsc/core/parameter.hpp"
#include "bmnsc/optim/grouped_sgd.hpp"
#include "bmnsc/optim/param_groups.hpp"
#include "bmnsc/optim/update_policy.hpp"
#include "test_report.hpp"

#include <iostream>
#include <random>
#include <sycl/sycl.hpp>
#include <vector>

namespace s = sycl;
using namespace bmnsc;
using core::ParamRole;

namespace
{

struct StepSettings
{
    float lr = 0.1f;
    float momentum = 0.0f;
    float weight_decay = 0.0f;
    bool batch_manhattan = false;
    bool no_sign_change = false;
};

// One parameter in one group, stepped with caller-supplied gradients.
class SingleParam
{
  public:
    SingleParam(s::queue &q, const std::vector<float> &init, const StepSettings &st,
                ParamRole role = ParamRole::Weight)
        : q_(q)
    {
        LayerId layer = store_.add_layer("fc");
        param_ = &store_.declare(layer, role == ParamRole::Bias ? "bias" : "weight", role, {init.size()});
        param_->upload(init);

        std::vector<optim::ParamGroup> groups;
        groups.emplace_back("g", std::vector<core::Parameter *>{param_}, st.lr, st.batch_manhattan,
                            st.no_sign_change);
        optim::GroupedSgd::Config cfg;
        cfg.momentum = st.momentum;
        cfg.weight_decay = st.weight_decay;
        opt_ = std::make_unique<optim::GroupedSgd>(q_, std::move(groups), cfg);
        grads_ = core::GradientSet(store_);
    }

    std::vector<float> step(const std::vector<float> &grad)
    {
        grads_.upload(param_->id(), grad);
        opt_->step(grads_);
        q_.wait_and_throw();
        return param_->download();
    }

    core::Parameter &param() { return *param_; }
    optim::GroupedSgd &optimizer() { return *opt_; }
    core::GradientSet &grads() { return grads_; }

  private:
    s::queue &q_;
    core::ParameterStore store_;
    core::Parameter *param_ = nullptr;
    std::unique_ptr<optim::GroupedSgd> opt_;
    core::GradientSet grads_;
};

bool all_near(const std::vector<float> &a, const std::vector<float> &b, float tol = 1e-6f)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (!near(a[i], b[i], tol))
            return false;
    }
    return true;
}

} // namespace

void test_element_rules()
{
    std::cout << "\n=== Element update rules (host) ===\n";

    {
        float w = 0.05f, v = 0.0f;
        optim::update_element<optim::UpdateMagnitude::BatchManhattan, true>(w, v, -3.0f, {0.1f, 0.9f, 0.0f});
        bool passed = near(v, -3.0f) && near(w, 0.15f);
        report_test({"BM+NSC moving away from zero is unconstrained", passed, "Expected v=-3, p=0.15"});
    }

    {
        bool passed = optim::clamp_sign_change(0.2f, 0.5f) == 0.2f && optim::clamp_sign_change(-0.2f, -0.5f) == -0.2f &&
                      optim::clamp_sign_change(0.2f, 0.1f) == 0.1f && optim::clamp_sign_change(0.0f, 0.3f) == 0.3f;
        report_test({"sign clamp lands crossing steps on zero", passed, "Unexpected clamp"});
    }

    {
        bool passed = optim::step_magnitude<optim::UpdateMagnitude::BatchManhattan>(0.0f, 0.1f) == 0.0f &&
                      near(optim::step_magnitude<optim::UpdateMagnitude::BatchManhattan>(-1e-9f, 0.1f), -0.1f) &&
                      near(optim::step_magnitude<optim::UpdateMagnitude::Plain>(2.0f, 0.1f), 0.2f);
        report_test({"magnitude policies, sign(0) = 0", passed, "Unexpected magnitude"});
    }
}

void test_plain_sgd(s::queue &q)
{
    std::cout << "\n=== Plain momentum SGD ===\n";

    {
        std::vector<float> p0 = {1.0f, -2.0f, 0.5f, 0.0f};
        std::vector<float> g = {0.5f, 0.25f, -1.0f, 3.0f};
        SingleParam sp(q, p0, {0.1f, 0.0f, 0.0f, false, false});
        auto p1 = sp.step(g);
        std::vector<float> expect(p0.size());
        for (size_t i = 0; i < p0.size(); ++i)
            expect[i] = p0[i] - 0.1f * g[i];
        report_test({"wd=0, mu=0 is p - lr * g", all_near(p1, expect), "Mismatch against plain SGD"});
    }

    {
        SingleParam sp(q, {1.0f}, {0.1f, 0.9f, 0.1f, false, false});
        auto p1 = sp.step({0.5f});
        auto p2 = sp.step({0.5f});
        // d = 0.6, v = 0.6, p = 0.94; d = 0.594, v = 1.134, p = 0.8266
        bool passed = near(p1[0], 0.94f, 1e-6f) && near(p2[0], 0.8266f, 1e-5f) &&
                      near(sp.optimizer().momentum_host(sp.param().id())[0], 1.134f, 1e-5f);
        report_test({"weight decay and momentum over two steps", passed, "Unexpected trajectory"});
    }

    {
        SingleParam sp(q, {1.0f, 1.0f}, {0.1f, 0.9f, 0.0f, false, false});
        bool before = !sp.optimizer().has_momentum(sp.param().id());
        sp.step({1.0f, 0.0f});
        bool after = sp.optimizer().has_momentum(sp.param().id());
        auto v = sp.optimizer().momentum_host(sp.param().id());
        report_test({"momentum buffer created on first step", before && after && all_near(v, {1.0f, 0.0f}),
                     "Lazy momentum not initialised to the first gradient"});
    }
}

void test_batch_manhattan(s::queue &q)
{
    std::cout << "\n=== Batch Manhattan ===\n";

    std::vector<float> p0 = {0.3f, -0.4f, 0.2f, 0.7f};
    std::vector<float> g = {0.01f, -2.0f, 5.0f, 0.0f};
    StepSettings st{0.1f, 0.0f, 0.0f, true, false};

    SingleParam base(q, p0, st);
    auto p_base = base.step(g);
    bool unit = all_near(p_base, {0.2f, -0.3f, 0.1f, 0.7f});
    report_test({"step is lr * sign(v), zero velocity holds still", unit, "Unexpected BM step"});

    std::vector<float> scaled(g.size()), flipped(g.size());
    for (size_t i = 0; i < g.size(); ++i)
    {
        scaled[i] = 7.5f * g[i];
        flipped[i] = -3.0f * g[i];
    }

    SingleParam sp_scaled(q, p0, st);
    report_test({"positive gradient scale has no effect", all_near(sp_scaled.step(scaled), p_base),
                 "Scale leaked into the update"});

    SingleParam sp_flipped(q, p0, st);
    auto p_flip = sp_flipped.step(flipped);
    bool mirrored = true;
    for (size_t i = 0; i < p0.size(); ++i)
        mirrored = mirrored && near(p_flip[i] - p0[i], -(p_base[i] - p0[i]));
    report_test({"negative gradient scale flips every update", mirrored, "Updates not mirrored"});
}

void test_no_sign_change(s::queue &q)
{
    std::cout << "\n=== No-Sign-Change ===\n";

    {
        SingleParam sp(q, {0.05f, -0.05f, 0.5f, -0.5f}, {0.1f, 0.0f, 0.0f, false, true});
        auto p1 = sp.step({10.0f, -10.0f, 1.0f, -1.0f});
        report_test({"crossing steps clamp to exactly zero", all_near(p1, {0.0f, 0.0f, 0.4f, -0.4f}),
                     "Unexpected clamped values"});
    }

    {
        std::mt19937 gen(42);
        std::normal_distribution<float> d(0.0f, 1.0f);
        std::vector<float> p(256);
        for (auto &v : p)
            v = 0.05f * d(gen);
        SingleParam sp(q, p, {0.1f, 0.9f, 1e-4f, true, true});

        bool never_flips = true;
        for (int step = 0; step < 8; ++step)
        {
            std::vector<float> g(p.size());
            for (auto &v : g)
                v = 4.0f * d(gen);
            auto next = sp.step(g);
            for (size_t i = 0; i < p.size(); ++i)
            {
                if ((p[i] > 0.0f && next[i] < 0.0f) || (p[i] < 0.0f && next[i] > 0.0f))
                    never_flips = false;
            }
            p = next;
        }
        report_test({"never flips a sign over random steps", never_flips, "A weight crossed zero"});
    }

    {
        SingleParam sp(q, {0.0f}, {0.1f, 0.0f, 0.0f, false, true});
        auto p1 = sp.step({1.0f});
        auto p2 = sp.step({-10.0f});
        bool passed = near(p1[0], -0.1f) && p2[0] == 0.0f;
        report_test({"zero may move either way, then its sign is protected", passed, "Zero convention broken"});
    }

    {
        // Bias goes to the exempt group and may cross zero.
        core::ParameterStore store;
        LayerId stem = store.add_layer("stem");
        LayerId fc = store.add_layer("fc");
        auto &w = store.declare(stem, "weight", ParamRole::Weight, {1});
        auto &b = store.declare(stem, "bias", ParamRole::Bias, {1});
        store.declare(fc, "weight", ParamRole::Weight, {1});
        w.upload(std::vector<float>{0.05f});
        b.upload(std::vector<float>{0.05f});

        auto part = optim::classify_parameters("resnet18", store, fc);
        optim::GroupedSgd::Config cfg;
        cfg.momentum = 0.0f;
        cfg.weight_decay = 0.0f;
        optim::GroupedSgd opt(q, optim::build_param_groups(part, {0.1f, false, true}, {0.1f, false, false}), cfg);
        core::GradientSet grads(store);
        grads.upload(w.id(), std::vector<float>{10.0f});
        grads.upload(b.id(), std::vector<float>{10.0f});
        opt.step(grads);
        q.wait_and_throw();

        bool passed = w.download()[0] == 0.0f && near(b.download()[0], -0.95f);
        report_test({"bias exempt from the sign constraint", passed, "Bias was constrained or weight flipped"});
    }

    {
        SingleParam sp(q, {0.05f}, {0.1f, 0.9f, 0.0f, true, true});
        auto p1 = sp.step({-3.0f});
        bool passed = near(sp.optimizer().momentum_host(sp.param().id())[0], -3.0f) && near(p1[0], 0.15f);
        report_test({"BM+NSC scenario: p=0.05, g=-3 gives v=-3, p=0.15", passed, "Unexpected result"});
    }
}

void test_errors_and_profiling(s::queue &q)
{
    std::cout << "\n=== Shape checks and profiling ===\n";

    {
        SingleParam sp(q, {1.0f, 2.0f, 3.0f}, {});
        sp.grads().assign(sp.param().id(), 2);
        bool passed = throws_as<ShapeMismatchError>([&] { sp.optimizer().step(sp.grads()); });
        report_test({"gradient size mismatch throws", passed, "Expected ShapeMismatchError"});
    }

    {
        SingleParam sp(q, {1.0f}, {});
        core::GradientSet empty;
        bool passed = throws_as<ShapeMismatchError>([&] { sp.optimizer().step(empty); });
        report_test({"missing gradient throws", passed, "Expected ShapeMismatchError"});
    }

    {
        SingleParam sp(q, {1.0f}, {});
        bool passed = throws_as<ShapeMismatchError>([&] { sp.grads().upload(sp.param().id(), std::vector<float>{1.0f, 2.0f}); });
        report_test({"gradient upload size checked", passed, "Expected ShapeMismatchError"});
    }

    {
        core::ParameterStore store;
        LayerId l = store.add_layer("fc");
        store.declare(l, "weight", ParamRole::Weight, {4});
        store.declare(l, "bias", ParamRole::Bias, {2});
        std::vector<optim::ParamGroup> groups;
        groups.emplace_back("all", store.parameters(), 0.1f, true, true);
        optim::GroupedSgd opt(q, std::move(groups), optim::GroupedSgd::Config{});
        core::GradientSet grads(store);
        std::vector<s::event> events;
        opt.step(grads, &events);
        for (auto &e : events)
            e.wait();
        report_test({"one profiling event per parameter", events.size() == 2, "Unexpected event count"});
    }
}

int main()
{
    try
    {
        s::queue q{s::default_selector_v, s::property_list{s::property::queue::in_order{}}};
        std::cout << "Device: " << q.get_device().get_info<s::info::device::name>() << "\n";

        test_element_rules();
        test_plain_sgd(q);
        test_batch_manhattan(q);
        test_no_sign_change(q);
        test_errors_and_profiling(q);
    }
    catch (const std::exception &e)
    {
        std::cout << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
    return summarize("Update engine");
}
