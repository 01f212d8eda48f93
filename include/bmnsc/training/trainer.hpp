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

#include "bmnsc/config/train_config.hpp"
#include "bmnsc/core/parameter.hpp"
#include "bmnsc/optim/grouped_sgd.hpp"
#include "bmnsc/optim/param_groups.hpp"
#include "bmnsc/training/checkpoint.hpp"
#include "bmnsc/training/metrics.hpp"
#include "bmnsc/training/model.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <sycl/sycl.hpp>
#include <vector>

namespace bmnsc
{
namespace training
{

namespace s = sycl;

struct TrainingContext
{
    int epoch = 0;
    int start_epoch = 0;
    float best_prec1 = 0.0f;
    TrainConfig config;
};

struct EpochSummary
{
    double loss = 0.0;
    double prec1 = 0.0;
    double prec5 = 0.0;
};

/**
 * @brief Epoch loop around a Model, two BatchSources and a GroupedSgd.
 *
 * Parameter groups are built from the model once at construction. After every
 * optimizer step the queue is drained so the next forward pass sees the
 * updated parameters.
 */
class Trainer
{
  public:
    Trainer(s::queue &q, Model &model, BatchSource &train_data, BatchSource &val_data, TrainingContext &ctx)
        : queue_(q), model_(model), train_data_(train_data), val_data_(val_data), ctx_(ctx),
          grads_(model.parameters())
    {
        auto partition = optim::classify_parameters(model_.arch(), model_.parameters(), model_.final_classifier());
        auto groups = optim::build_param_groups(partition, non_last_tier(ctx_.config), last_tier(ctx_.config));
        optimizer_ = std::make_unique<optim::GroupedSgd>(queue_, std::move(groups), optimizer_config(ctx_.config));
        ctx_.start_epoch = ctx_.config.start_epoch;
        ctx_.epoch = ctx_.start_epoch;
    }

    optim::GroupedSgd &optimizer() { return *optimizer_; }

    // Restore model, optimizer, start epoch and best top-1 from <prefix>/<resume>.
    void resume()
    {
        if (ctx_.config.resume.empty())
            return;
        std::string path = (std::filesystem::path(ctx_.config.checkpoint_prefix) / ctx_.config.resume).string();
        std::cout << "=> loading checkpoint '" << path << "'\n";
        auto ckpt = load_checkpoint(path);
        // Both halves are checked before either the model or the optimizer changes.
        validate_for_model(ckpt, model_);
        optimizer_->validate_state(ckpt.optimizer);
        apply_to_model(ckpt, model_);
        optimizer_->import_state(ckpt.optimizer);
        ctx_.start_epoch = ckpt.epoch;
        ctx_.epoch = ckpt.epoch;
        ctx_.best_prec1 = ckpt.best_prec1;
        std::cout << "=> loaded checkpoint '" << path << "' (epoch " << ckpt.epoch << ")\n";
    }

    EpochSummary train_epoch(int epoch)
    {
        AverageMeter batch_time, data_time, losses, top1, top5;
        const size_t n = train_data_.size();

        auto end = Clock::now();
        for (size_t i = 0; i < n; ++i)
        {
            Batch batch = train_data_.batch(i);
            data_time.update(seconds_since(end));

            grads_.zero(queue_);
            BatchResult out = model_.forward_backward(batch, grads_);
            record(out, batch, losses, top1, top5);

            optimizer_->step(grads_);
            queue_.wait_and_throw();

            batch_time.update(seconds_since(end));
            end = Clock::now();

            if (i % static_cast<size_t>(ctx_.config.print_freq) == 0)
            {
                char line[256];
                std::snprintf(line, sizeof(line),
                              "Epoch: [%d][%zu/%zu]\tTime %.3f (%.3f)\tData %.3f (%.3f)\tLoss %.4f (%.4f)\t"
                              "Prec@1 %.3f (%.3f)\tPrec@5 %.3f (%.3f)",
                              epoch, i, n, batch_time.val, batch_time.avg, data_time.val, data_time.avg, losses.val,
                              losses.avg, top1.val, top1.avg, top5.val, top5.avg);
                std::cout << line << "\n";
            }
        }
        return {losses.avg, top1.avg, top5.avg};
    }

    EpochSummary validate()
    {
        AverageMeter batch_time, losses, top1, top5;
        const size_t n = val_data_.size();

        auto end = Clock::now();
        for (size_t i = 0; i < n; ++i)
        {
            Batch batch = val_data_.batch(i);
            BatchResult out = model_.forward(batch);
            record(out, batch, losses, top1, top5);

            batch_time.update(seconds_since(end));
            end = Clock::now();

            if (i % static_cast<size_t>(ctx_.config.print_freq) == 0)
            {
                char line[256];
                std::snprintf(line, sizeof(line),
                              "Test: [%zu/%zu]\tTime %.3f (%.3f)\tLoss %.4f (%.4f)\tPrec@1 %.3f (%.3f)\t"
                              "Prec@5 %.3f (%.3f)",
                              i, n, batch_time.val, batch_time.avg, losses.val, losses.avg, top1.val, top1.avg,
                              top5.val, top5.avg);
                std::cout << line << "\n";
            }
        }

        char line[96];
        std::snprintf(line, sizeof(line), " * Prec@1 %.3f Prec@5 %.3f", top1.avg, top5.avg);
        std::cout << line << "\n";
        return {losses.avg, top1.avg, top5.avg};
    }

    /**
     * @brief Run from ctx.start_epoch to config.epochs, or validate once in evaluate mode.
     *
     * Each epoch: learning rates, reshuffle, one pass of training, validation,
     * checkpoint. The checkpoint stores epoch + 1 as the next epoch to run.
     */
    void run()
    {
        if (ctx_.config.evaluate)
        {
            validate();
            return;
        }

        for (int epoch = ctx_.start_epoch; epoch < ctx_.config.epochs; ++epoch)
        {
            ctx_.epoch = epoch;
            optimizer_->set_epoch(epoch);
            train_data_.set_epoch(epoch);

            train_epoch(epoch);
            auto val = validate();

            float prec1 = static_cast<float>(val.prec1);
            bool is_best = prec1 > ctx_.best_prec1;
            ctx_.best_prec1 = std::max(prec1, ctx_.best_prec1);

            auto ckpt = make_checkpoint(model_, *optimizer_, epoch + 1, ctx_.best_prec1);
            save_checkpoint(ckpt, is_best, epoch, ctx_.config);
        }
    }

  private:
    using Clock = std::chrono::steady_clock;

    static double seconds_since(Clock::time_point t)
    {
        return std::chrono::duration<double>(Clock::now() - t).count();
    }

    static void record(const BatchResult &out, const Batch &batch, AverageMeter &losses, AverageMeter &top1,
                       AverageMeter &top5)
    {
        losses.update(out.loss, batch.size);
        top1.update(accuracy(out.logits, batch.labels, out.num_classes, 1), batch.size);
        top5.update(accuracy(out.logits, batch.labels, out.num_classes, 5), batch.size);
    }

    s::queue &queue_;
    Model &model_;
    BatchSource &train_data_;
    BatchSource &val_data_;
    TrainingContext &ctx_;
    core::GradientSet grads_;
    std::unique_ptr<optim::GroupedSgd> optimizer_;
};

} // namespace training
} // namespace bmnsc
