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

#include "bmnsc/config/min_toml.hpp"
#include "bmnsc/core/errors.hpp"
#include "bmnsc/optim/grouped_sgd.hpp"
#include "bmnsc/optim/param_groups.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <system_error>

namespace bmnsc
{
namespace training
{

struct TrainConfig
{
    std::string arch = "resnet18";
    bool pretrained = false;
    int input_dim = 32;
    int hidden_dim = 64;
    int num_classes = 10;

    std::string algorithm = "sign_symmetry";
    std::string last_layer_algorithm = "None";
    bool batch_manhattan = false;
    bool last_layer_batch_manhattan = false;
    bool no_sign_change = false;
    bool last_layer_no_sign_change = false;

    float learning_rate = 0.1f;
    float last_layer_learning_rate = 0.1f;
    int lr_decay_epochs = 10;
    float momentum = 0.9f;
    float weight_decay = 1e-4f;

    int epochs = 90;
    int start_epoch = 0;
    int batch_size = 256;
    int print_freq = 10;
    std::optional<uint32_t> seed;
    bool evaluate = false;

    int train_samples = 4096;
    int val_samples = 1024;
    float noise = 0.6f;

    std::string checkpoint_prefix = ".";
    std::string resume;
    bool save_every_epoch = false;
    int save_every_n_epochs = -1;
};

struct CliArgs
{
    std::string config_path;
    std::string resume_path;
    bool evaluate = false;
    bool help = false;
};

inline constexpr std::array<const char *, 6> kAlgorithmNames = {
    "sign_symmetry", "feedback_alignment", "sham", "feedback_alignment_signed_init", "sign_symmetry_random_weights",
    "None"};

inline bool is_known_algorithm(const std::string &name)
{
    for (const char *a : kAlgorithmNames)
    {
        if (name == a)
            return true;
    }
    return false;
}

static inline void print_usage(const char *prog)
{
    std::cout << "usage: " << prog << " [--config <path>] [--resume <ckpt>] [--evaluate] [--help]\n";
    std::cout << "Without --config, config.toml in the working directory is read when present, "
                 "otherwise built-in defaults are used.\n";
    std::cout << "--resume names a checkpoint file inside checkpoint.prefix.\n";
}

static inline bool parse_cli_args(int argc, char **argv, CliArgs &out, std::string &err)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            out.help = true;
            continue;
        }
        if (arg == "--evaluate" || arg == "-e")
        {
            out.evaluate = true;
            continue;
        }
        if (arg == "--config" && i + 1 < argc)
        {
            out.config_path = argv[++i];
            continue;
        }
        if (arg.rfind("--config=", 0) == 0)
        {
            out.config_path = arg.substr(std::string("--config=").size());
            continue;
        }
        if (arg == "--resume" && i + 1 < argc)
        {
            out.resume_path = argv[++i];
            continue;
        }
        if (arg.rfind("--resume=", 0) == 0)
        {
            out.resume_path = arg.substr(std::string("--resume=").size());
            continue;
        }

        err = "unknown argument: " + arg;
        return false;
    }
    return true;
}

static inline uint32_t make_random_seed_u32()
{
    std::random_device rd;
    uint32_t a = static_cast<uint32_t>(rd());
    uint32_t b = static_cast<uint32_t>(rd());
    uint32_t c = static_cast<uint32_t>(rd());
    return (a << 16) ^ (b << 1) ^ c;
}

// Seed actually used by the run: the configured one, else a fresh random one.
inline uint32_t resolve_seed(const TrainConfig &cfg)
{
    return cfg.seed ? *cfg.seed : make_random_seed_u32();
}

/**
 * @brief Check option values and combinations.
 *
 * Throws ConfigurationError on the first violation. The only silent fix-up is
 * forcing the last-layer algorithm to None when the main algorithm is None.
 */
inline void validate_train_config(TrainConfig &cfg)
{
    optim::architecture_family(cfg.arch);

    if (!is_known_algorithm(cfg.algorithm))
        throw ConfigurationError("unknown algorithm '" + cfg.algorithm + "'");
    if (!is_known_algorithm(cfg.last_layer_algorithm))
        throw ConfigurationError("unknown last-layer algorithm '" + cfg.last_layer_algorithm + "'");
    if (cfg.pretrained && cfg.algorithm != "None")
        throw ConfigurationError("pretrained weights require algorithm = None, got '" + cfg.algorithm + "'");
    if (cfg.algorithm == "None" && cfg.last_layer_algorithm != "None")
    {
        std::cout << "warning: algorithm is None, ignoring last_layer_algorithm = " << cfg.last_layer_algorithm
                  << "\n";
        cfg.last_layer_algorithm = "None";
    }

    auto positive = [](const char *key, int v) {
        if (v <= 0)
            throw ConfigurationError(std::string(key) + " must be positive, got " + std::to_string(v));
    };
    positive("model.input", cfg.input_dim);
    positive("model.hidden", cfg.hidden_dim);
    positive("model.classes", cfg.num_classes);
    positive("optim.lr_decay_epochs", cfg.lr_decay_epochs);
    positive("train.epochs", cfg.epochs);
    positive("train.batch_size", cfg.batch_size);
    positive("train.print_freq", cfg.print_freq);
    positive("data.train_samples", cfg.train_samples);
    positive("data.val_samples", cfg.val_samples);
    if (cfg.start_epoch < 0)
        throw ConfigurationError("train.start_epoch must be non-negative, got " + std::to_string(cfg.start_epoch));

    auto non_negative = [](const char *key, float v) {
        if (!(v >= 0.0f))
            throw ConfigurationError(std::string(key) + " must be non-negative, got " + std::to_string(v));
    };
    non_negative("optim.learning_rate", cfg.learning_rate);
    non_negative("optim.last_layer_learning_rate", cfg.last_layer_learning_rate);
    non_negative("optim.momentum", cfg.momentum);
    non_negative("optim.weight_decay", cfg.weight_decay);
    non_negative("data.noise", cfg.noise);
}

/**
 * @brief Read every known key from a parsed table into `cfg`.
 *
 * Keys that are absent keep their current value. Parser warnings and keys
 * nobody reads are logged, not fatal.
 */
inline void apply_toml(const toml_min::Table &t, TrainConfig &cfg)
{
    cfg.arch = t.get_string("model.arch", cfg.arch);
    cfg.pretrained = t.get_bool("model.pretrained", cfg.pretrained);
    cfg.input_dim = t.get_int("model.input", cfg.input_dim);
    cfg.hidden_dim = t.get_int("model.hidden", cfg.hidden_dim);
    cfg.num_classes = t.get_int("model.classes", cfg.num_classes);

    cfg.algorithm = t.get_string("algo.algorithm", cfg.algorithm);
    cfg.last_layer_algorithm = t.get_string("algo.last_layer_algorithm", cfg.last_layer_algorithm);
    cfg.batch_manhattan = t.get_bool("algo.batch_manhattan", cfg.batch_manhattan);
    cfg.last_layer_batch_manhattan = t.get_bool("algo.last_layer_batch_manhattan", cfg.last_layer_batch_manhattan);
    cfg.no_sign_change = t.get_bool("algo.no_sign_change", cfg.no_sign_change);
    cfg.last_layer_no_sign_change = t.get_bool("algo.last_layer_no_sign_change", cfg.last_layer_no_sign_change);

    cfg.learning_rate = t.get_float("optim.learning_rate", cfg.learning_rate);
    cfg.last_layer_learning_rate = t.get_float("optim.last_layer_learning_rate", cfg.last_layer_learning_rate);
    cfg.lr_decay_epochs = t.get_int("optim.lr_decay_epochs", cfg.lr_decay_epochs);
    cfg.momentum = t.get_float("optim.momentum", cfg.momentum);
    cfg.weight_decay = t.get_float("optim.weight_decay", cfg.weight_decay);

    cfg.epochs = t.get_int("train.epochs", cfg.epochs);
    cfg.start_epoch = t.get_int("train.start_epoch", cfg.start_epoch);
    cfg.batch_size = t.get_int("train.batch_size", cfg.batch_size);
    cfg.print_freq = t.get_int("train.print_freq", cfg.print_freq);
    cfg.evaluate = t.get_bool("train.evaluate", cfg.evaluate);
    if (auto seed = t.get_optional_i64("train.seed"))
    {
        if (*seed == -1)
            cfg.seed.reset();
        else if (*seed >= 0 && *seed <= 0xFFFFFFFFll)
            cfg.seed = static_cast<uint32_t>(*seed);
        else
            throw ConfigurationError("train.seed must be -1 or fit in 32 bits, got " + std::to_string(*seed));
    }

    cfg.train_samples = t.get_int("data.train_samples", cfg.train_samples);
    cfg.val_samples = t.get_int("data.val_samples", cfg.val_samples);
    cfg.noise = t.get_float("data.noise", cfg.noise);

    cfg.checkpoint_prefix = t.get_string("checkpoint.prefix", cfg.checkpoint_prefix);
    cfg.resume = t.get_string("checkpoint.resume", cfg.resume);
    cfg.save_every_epoch = t.get_bool("checkpoint.save_every_epoch", cfg.save_every_epoch);
    cfg.save_every_n_epochs = t.get_int("checkpoint.save_every_n_epochs", cfg.save_every_n_epochs);

    for (const auto &w : t.warnings)
        std::cout << "warning: config: " << w << "\n";
    for (const auto &k : t.unused_keys())
        std::cout << "warning: config: unknown key '" << k << "' (ignored)\n";
}

inline TrainConfig parse_train_config(const std::string &toml_text)
{
    TrainConfig cfg;
    apply_toml(toml_min::parse_string(toml_text), cfg);
    validate_train_config(cfg);
    return cfg;
}

static inline bool file_exists(const std::string &path)
{
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

/**
 * @brief Resolve the run configuration from the command line.
 *
 * --config wins; otherwise ./config.toml when present; otherwise defaults.
 * Command-line --resume and --evaluate override the file.
 */
inline TrainConfig load_train_config(const CliArgs &cli)
{
    TrainConfig cfg;
    std::string path = cli.config_path;
    if (path.empty() && file_exists("config.toml"))
        path = "config.toml";

    if (!path.empty())
    {
        apply_toml(toml_min::parse_file(path), cfg);
        std::cout << "=> loaded config '" << path << "'\n";
    }

    if (!cli.resume_path.empty())
        cfg.resume = cli.resume_path;
    if (cli.evaluate)
        cfg.evaluate = true;

    validate_train_config(cfg);
    return cfg;
}

inline optim::TierConfig non_last_tier(const TrainConfig &cfg)
{
    return {cfg.learning_rate, cfg.batch_manhattan, cfg.no_sign_change};
}

inline optim::TierConfig last_tier(const TrainConfig &cfg)
{
    return {cfg.last_layer_learning_rate, cfg.last_layer_batch_manhattan, cfg.last_layer_no_sign_change};
}

inline optim::GroupedSgd::Config optimizer_config(const TrainConfig &cfg)
{
    optim::GroupedSgd::Config out;
    out.momentum = cfg.momentum;
    out.weight_decay = cfg.weight_decay;
    out.lr_decay_epochs = cfg.lr_decay_epochs;
    return out;
}

} // namespace training
} // namespace bmnsc
