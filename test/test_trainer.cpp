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
#include "bmnsc/data/synthetic_clusters.hpp"
#include "bmnsc/models/residual_mlp.hpp"
#include "bmnsc/training/metrics.hpp"
#include "bmnsc/training/trainer.hpp"
#include "test_report.hpp"

#include <filesystem>
#include <iostream>
#include <sycl/sycl.hpp>
#include <vector>

namespace s = sycl;
namespace fs = std::filesystem;
using namespace bmnsc;

namespace
{

training::TrainConfig small_config(const fs::path &prefix)
{
    training::TrainConfig cfg;
    cfg.arch = "resnet18";
    cfg.algorithm = "None";
    cfg.input_dim = 16;
    cfg.hidden_dim = 32;
    cfg.num_classes = 4;
    cfg.batch_manhattan = true;
    cfg.no_sign_change = true;
    cfg.last_layer_no_sign_change = true;
    cfg.learning_rate = 0.01f;
    cfg.last_layer_learning_rate = 0.05f;
    cfg.lr_decay_epochs = 2;
    cfg.epochs = 3;
    cfg.batch_size = 32;
    cfg.print_freq = 8;
    cfg.seed = 5;
    cfg.train_samples = 512;
    cfg.val_samples = 128;
    cfg.noise = 0.5f;
    cfg.checkpoint_prefix = prefix.string();
    cfg.save_every_n_epochs = 2;
    training::validate_train_config(cfg);
    return cfg;
}

// Model and data built from one config, the way the training driver wires them.
struct Run
{
    models::ResidualMlp model;
    data::SyntheticClusters train_data;
    data::SyntheticClusters val_data;

    Run(s::queue &q, const training::TrainConfig &cfg)
        : model(q, cfg.arch, cfg.input_dim, cfg.hidden_dim, cfg.num_classes, *cfg.seed),
          train_data(spec(cfg), cfg.train_samples, cfg.batch_size, *cfg.seed + 1, true),
          val_data(spec(cfg), cfg.val_samples, cfg.batch_size, *cfg.seed + 2, false)
    {
    }

    static data::ClusterSpec spec(const training::TrainConfig &cfg)
    {
        data::ClusterSpec sp;
        sp.input_dim = cfg.input_dim;
        sp.num_classes = cfg.num_classes;
        sp.noise = cfg.noise;
        sp.center_seed = *cfg.seed;
        return sp;
    }
};

} // namespace

void test_metrics()
{
    std::cout << "\n=== Metrics ===\n";

    {
        training::AverageMeter m;
        m.update(2.0, 1);
        m.update(5.0, 3);
        bool passed = m.val == 5.0 && m.count == 4 && near(static_cast<float>(m.avg), 4.25f);
        report_test({"AverageMeter weights by count", passed, "Unexpected average"});
    }

    {
        // row 0: label scores highest; row 1: label ranks third
        std::vector<float> logits = {0.1f, 0.2f, 0.9f, 0.0f, 0.5f, 0.1f, 0.3f, 0.9f};
        std::vector<int32_t> labels = {2, 2};
        bool top1 = training::accuracy(logits, labels, 4, 1) == 50.0;
        bool top2 = training::accuracy(logits, labels, 4, 2) == 50.0;
        bool top3 = training::accuracy(logits, labels, 4, 3) == 100.0;
        bool clamp = training::accuracy(logits, labels, 4, 5) == 100.0;
        report_test({"precision@k in percent", top1 && top2 && top3, "Unexpected precision"});
        report_test({"k clamped to the class count", clamp, "Top-5 over 4 classes not clamped"});
        report_test({"logit count checked",
                     throws_as<ShapeMismatchError>([&] { training::accuracy(logits, labels, 3, 1); }),
                     "Expected ShapeMismatchError"});
    }
}

void test_training_run(s::queue &q)
{
    std::cout << "\n=== Short training run ===\n";

    fs::path dir = fs::temp_directory_path() / "bmnsc_test_trainer";
    fs::remove_all(dir);

    float best = 0.0f;
    {
        training::TrainingContext ctx;
        ctx.config = small_config(dir);
        Run run(q, ctx.config);
        training::Trainer trainer(q, run.model, run.train_data, run.val_data, ctx);

        auto before = trainer.validate();
        trainer.run();
        best = ctx.best_prec1;

        bool files = fs::exists(dir / "checkpoint.bin") && fs::exists(dir / "model_best.bin") &&
                     fs::exists(dir / "epoch000.bin") && !fs::exists(dir / "epoch001.bin") &&
                     fs::exists(dir / "epoch002.bin");
        report_test({"checkpoint, best and periodic files written", files, "Unexpected checkpoint files"});
        report_test({"beats chance on synthetic clusters", best > 50.0f, "Best Prec@1 at or below 50%"});
        report_test({"improves over the untrained model", best > before.prec1, "No improvement"});

        // Epoch 2 with decay every 2 epochs: one tenth of the base rates.
        bool lr = near(trainer.optimizer().groups().front().learning_rate(), 0.001f, 1e-7f) &&
                  near(trainer.optimizer().groups().back().learning_rate(), 0.005f, 1e-7f);
        report_test({"schedule applied per epoch", lr, "Unexpected learning rate after training"});
    }

    {
        training::TrainingContext ctx;
        ctx.config = small_config(dir);
        ctx.config.resume = "checkpoint.bin";
        ctx.config.epochs = 4;
        Run run(q, ctx.config);
        training::Trainer trainer(q, run.model, run.train_data, run.val_data, ctx);
        trainer.resume();
        bool resumed = ctx.start_epoch == 3 && ctx.best_prec1 == best;
        report_test({"resume restores next epoch and best Prec@1", resumed, "Unexpected resume state"});

        auto val = trainer.validate();
        report_test({"resumed model keeps its accuracy", val.prec1 > 50.0, "Restored model at chance"});

        trainer.run();
        report_test({"resumed run continues to the final epoch", ctx.epoch == 3 && ctx.best_prec1 >= best,
                     "Unexpected state after resumed run"});
    }

    {
        training::TrainingContext ctx;
        ctx.config = small_config(dir);
        ctx.config.resume = "missing.bin";
        Run run(q, ctx.config);
        training::Trainer trainer(q, run.model, run.train_data, run.val_data, ctx);
        report_test({"resume from a missing file fails", throws_as<CheckpointError>([&] { trainer.resume(); }),
                     "Expected CheckpointError"});
    }

    {
        // Saved with No-Sign-Change on the non-last tier; resumed with it off, so the group layout differs.
        training::TrainingContext ctx;
        ctx.config = small_config(dir);
        ctx.config.resume = "checkpoint.bin";
        ctx.config.no_sign_change = false;
        Run run(q, ctx.config);
        training::Trainer trainer(q, run.model, run.train_data, run.val_data, ctx);

        std::vector<std::vector<float>> before;
        for (auto *p : run.model.parameters().parameters())
            before.push_back(p->download());

        bool threw = throws_as<CheckpointError>([&] { trainer.resume(); });
        bool unchanged = true;
        auto params = run.model.parameters().parameters();
        for (size_t i = 0; i < params.size(); ++i)
            unchanged = unchanged && params[i]->download() == before[i];
        report_test({"mismatched optimizer layout rejected on resume", threw, "Expected CheckpointError"});
        report_test({"rejected resume leaves model weights untouched", unchanged,
                     "Model weights changed by a failed resume"});
        report_test({"rejected resume leaves the epoch untouched", ctx.start_epoch == 0 && ctx.best_prec1 == 0.0f,
                     "Context changed by a failed resume"});
    }

    {
        fs::path eval_dir = dir / "eval";
        training::TrainingContext ctx;
        ctx.config = small_config(eval_dir);
        ctx.config.evaluate = true;
        Run run(q, ctx.config);
        training::Trainer trainer(q, run.model, run.train_data, run.val_data, ctx);
        trainer.run();
        report_test({"evaluate mode writes no checkpoint", !fs::exists(eval_dir / "checkpoint.bin"),
                     "Checkpoint written in evaluate mode"});
    }

    fs::remove_all(dir);
}

int main()
{
    try
    {
        s::queue q{s::default_selector_v, s::property_list{s::property::queue::in_order{}}};
        std::cout << "Device: " << q.get_device().get_info<s::info::device::name>() << "\n";

        test_metrics();
        test_training_run(q);
    }
    catch (const std::exception &e)
    {
        std::cout << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
    return summarize("Trainer");
}
