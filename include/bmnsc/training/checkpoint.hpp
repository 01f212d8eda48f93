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
#include "bmnsc/core/binary_io.hpp"
#include "bmnsc/core/errors.hpp"
#include "bmnsc/optim/grouped_sgd.hpp"
#include "bmnsc/optim/optimizer_state.hpp"
#include "bmnsc/training/model.hpp"
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace bmnsc
{
namespace training
{

namespace fs = std::filesystem;

struct ParamRecord
{
    std::string name;
    std::vector<float> values;
};

struct TrainingCheckpoint
{
    int32_t epoch = 0; // next epoch to run
    float best_prec1 = 0.0f;
    std::string arch;
    std::vector<ParamRecord> params;
    optim::OptimizerState optimizer;
};

inline constexpr core::Magic kCheckpointMagic = {'B', 'M', 'N', 'S', 'C', 'K', 'P', 'T'};
inline constexpr uint32_t kCheckpointVersion = 1;

inline void write_checkpoint(std::ostream &os, const TrainingCheckpoint &ckpt)
{
    using namespace core;
    auto fail = [](const std::string &msg) { throw CheckpointError("writing checkpoint: " + msg); };

    uint32_t param_count = static_cast<uint32_t>(ckpt.params.size());
    if (!write_magic(os, kCheckpointMagic) || !write_pod(os, kCheckpointVersion) || !write_pod(os, ckpt.epoch) ||
        !write_pod(os, ckpt.best_prec1) || !write_string(os, ckpt.arch) || !write_pod(os, param_count))
        fail("header");
    for (const auto &p : ckpt.params)
    {
        if (!write_string(os, p.name) || !write_vec_f32(os, p.values))
            fail("parameter " + p.name);
    }
    optim::write_state(os, ckpt.optimizer);
}

inline TrainingCheckpoint read_checkpoint(std::istream &is)
{
    using namespace core;
    auto fail = [](const std::string &msg) { throw CheckpointError("reading checkpoint: " + msg); };

    if (!expect_magic(is, kCheckpointMagic))
        fail("magic mismatch");
    uint32_t version = 0;
    if (!read_pod(is, version))
        fail("truncated header");
    if (version != kCheckpointVersion)
        fail("unsupported version " + std::to_string(version));

    TrainingCheckpoint ckpt;
    uint32_t param_count = 0;
    if (!read_pod(is, ckpt.epoch) || !read_pod(is, ckpt.best_prec1) || !read_string(is, ckpt.arch) ||
        !read_pod(is, param_count))
        fail("truncated header");
    if (ckpt.epoch < 0)
        fail("negative epoch " + std::to_string(ckpt.epoch));

    // Records are appended as they are read so a forged count fails on truncation.
    for (uint32_t i = 0; i < param_count; ++i)
    {
        ParamRecord rec;
        if (!read_string(is, rec.name) || !read_vec_f32(is, rec.values))
            fail("truncated parameter data");
        ckpt.params.push_back(std::move(rec));
    }
    ckpt.optimizer = optim::read_state(is);
    return ckpt;
}

inline std::vector<ParamRecord> capture_parameters(Model &model)
{
    std::vector<ParamRecord> out;
    for (auto *p : model.parameters().parameters())
        out.push_back({p->name(), p->download()});
    return out;
}

inline TrainingCheckpoint make_checkpoint(Model &model, optim::GroupedSgd &optimizer, int next_epoch,
                                          float best_prec1)
{
    TrainingCheckpoint ckpt;
    ckpt.epoch = next_epoch;
    ckpt.best_prec1 = best_prec1;
    ckpt.arch = model.arch();
    ckpt.optimizer = optimizer.export_state();
    ckpt.params = capture_parameters(model);
    return ckpt;
}

/**
 * @brief Copy checkpoint parameter values into the model.
 *
 * Architecture, parameter count, names and element counts are all checked
 * before any value is written.
 */
// Throws CheckpointError unless the saved parameters fit the model one to one.
inline void validate_for_model(const TrainingCheckpoint &ckpt, Model &model)
{
    if (ckpt.arch != model.arch())
        throw CheckpointError("architecture '" + ckpt.arch + "' does not match model '" + model.arch() + "'");
    auto params = model.parameters().parameters();
    if (params.size() != ckpt.params.size())
        throw CheckpointError("model has " + std::to_string(params.size()) + " parameters, checkpoint has " +
                              std::to_string(ckpt.params.size()));
    for (size_t i = 0; i < params.size(); ++i)
    {
        const auto &rec = ckpt.params[i];
        if (rec.name != params[i]->name() || rec.values.size() != params[i]->numel())
            throw CheckpointError("parameter " + std::to_string(i) + " is '" + params[i]->name() + "' (" +
                                  std::to_string(params[i]->numel()) + "), checkpoint has '" + rec.name + "' (" +
                                  std::to_string(rec.values.size()) + ")");
    }
}

inline void apply_to_model(const TrainingCheckpoint &ckpt, Model &model)
{
    validate_for_model(ckpt, model);
    auto params = model.parameters().parameters();
    for (size_t i = 0; i < params.size(); ++i)
        params[i]->upload(ckpt.params[i].values);
}

inline TrainingCheckpoint load_checkpoint(const std::string &path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw CheckpointError("no checkpoint found at '" + path + "'");
    std::ifstream is(path, std::ios::binary);
    if (!is)
        throw CheckpointError("cannot open '" + path + "'");
    return read_checkpoint(is);
}

static inline void copy_checkpoint(const fs::path &from, const fs::path &to)
{
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw CheckpointError("copying '" + from.string() + "' to '" + to.string() + "': " + ec.message());
}

/**
 * @brief Write <prefix>/checkpoint.bin and its best / periodic copies.
 *
 * @param epoch Index of the epoch that just finished
 * @return Path of the written checkpoint.bin
 *
 * The main file is written to a temporary name and renamed into place so an
 * interrupted save never leaves a truncated checkpoint.bin behind.
 */
inline fs::path save_checkpoint(const TrainingCheckpoint &ckpt, bool is_best, int epoch, const TrainConfig &cfg)
{
    fs::path prefix(cfg.checkpoint_prefix);
    std::error_code ec;
    fs::create_directories(prefix, ec);
    if (ec)
        throw CheckpointError("creating '" + prefix.string() + "': " + ec.message());

    fs::path target = prefix / "checkpoint.bin";
    fs::path tmp = prefix / "checkpoint.bin.tmp";
    {
        std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
        if (!os)
            throw CheckpointError("cannot open '" + tmp.string() + "' for writing");
        write_checkpoint(os, ckpt);
        os.flush();
        if (!os)
            throw CheckpointError("flushing '" + tmp.string() + "'");
    }
    fs::rename(tmp, target, ec);
    if (ec)
        throw CheckpointError("renaming '" + tmp.string() + "': " + ec.message());

    if (is_best)
        copy_checkpoint(target, prefix / "model_best.bin");
    if (cfg.save_every_epoch || (cfg.save_every_n_epochs > 0 && epoch % cfg.save_every_n_epochs == 0))
    {
        char name[32];
        std::snprintf(name, sizeof(name), "epoch%03d.bin", epoch);
        copy_checkpoint(target, prefix / name);
    }
    return target;
}

} // namespace training
} // namespace bmnsc
