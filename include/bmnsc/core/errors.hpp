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

#include <stdexcept>
#include <string>

namespace bmnsc {

// Bad architecture, algorithm name, option combination or config value.
class ConfigurationError : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string &msg) : std::runtime_error("configuration: " + msg) {}
};

// Missing/corrupt checkpoint, or saved structure that does not line up with the live one.
class CheckpointError : public std::runtime_error {
  public:
    explicit CheckpointError(const std::string &msg) : std::runtime_error("checkpoint: " + msg) {}
};

// Programmer error: parameter, gradient and momentum sizes must agree.
class ShapeMismatchError : public std::logic_error {
  public:
    explicit ShapeMismatchError(const std::string &msg) : std::logic_error("shape mismatch: " + msg) {}
};

} // namespace bmnsc
