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

#include "bmnsc/config/train_config.hpp"
#include "bmnsc/core/errors.hpp"
#include "bmnsc/data/synthetic_clusters.hpp"
#include "bmnsc/models/residual_mlp.hpp"
#include "bmnsc/training/trainer.hpp"
#include <iostream>
#include <string>
#include <sycl/sycl.hpp>

namespace s = sycl;
using namespace bmnsc;

int main(int argc, char **argv)
{
    training::CliArgs cli;
    std::string cli_err;
    if (!training::parse_cli_args(argc, argv, cli, cli_err))
    {
        std::cerr << cli_err << "\n";
        training::print_usage(argv[0]);
        return 1;
    }
    if (cli.help)
    {
        training::print_usage(argv[0]);
        return 0;
    }

    try
    {
        training::TrainingContext ctx;
        ctx.config = training::load_train_config(cli);
        const auto &cfg = ctx.config;

        uint32_t seed = training::resolve_seed(cfg);
        if (cfg.seed)
            std::cout << "warning: seeded run (seed = " << seed << "), results are reproducible on the same device\n";
        else
            std::cout << "=> random seed " << seed << "\n";

        s::queue q{s::default_selector_v, s::property_list{s::property::queue::in_order{}}};
        std::cout << "=> device: " << q.get_device().get_info<s::info::device::name>() << "\n";

        if (cfg.algorithm == "None")
            std::cout << "=> creating reference model '" << cfg.arch << "'\n";
        else
            std::cout << "=> creating asymmetric feedback model '" << cfg.arch << "' with non-last layer af_algo '"
                      << cfg.algorithm << "' and last layer af_algo '" << cfg.last_layer_algorithm << "'\n";

        models::ResidualMlp model(q, cfg.arch, static_cast<size_t>(cfg.input_dim),
                                  static_cast<size_t>(cfg.hidden_dim), static_cast<size_t>(cfg.num_classes), seed);

        data::ClusterSpec spec;
        spec.input_dim = static_cast<size_t>(cfg.input_dim);
        spec.num_classes = static_cast<size_t>(cfg.num_classes);
        spec.noise = cfg.noise;
        spec.center_seed = seed;
        data::SyntheticClusters train_data(spec, static_cast<size_t>(cfg.train_samples),
                                           static_cast<size_t>(cfg.batch_size), seed + 1, true);
        data::SyntheticClusters val_data(spec, static_cast<size_t>(cfg.val_samples),
                                         static_cast<size_t>(cfg.batch_size), seed + 2, false);

        training::Trainer trainer(q, model, train_data, val_data, ctx);
        trainer.resume();
        trainer.run();

        if (!cfg.evaluate)
            std::cout << "=> best Prec@1 " << ctx.best_prec1 << "\n";
    }
    catch (const s::exception &e)
    {
        std::cerr << "SYCL error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
