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
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// Reader for the TOML subset used by training configs: [section] headers,
// key = value lines, '#' comments, quoted strings, bools, ints and floats.
namespace bmnsc
{
namespace toml_min
{

static inline std::string trim(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

static inline std::string strip_comment(std::string_view s)
{
    bool in_str = false;
    for (size_t i = 0; i < s.size(); ++i)
    {
        char c = s[i];
        if (c == '"' && (i == 0 || s[i - 1] != '\\'))
            in_str = !in_str;
        if (!in_str && c == '#')
            return std::string(s.substr(0, i));
    }
    return std::string(s);
}

// TOML allows '_' as a digit separator.
static inline std::string normalize_number_token(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        if (c != '_')
            out.push_back(c);
    }
    return out;
}

static inline std::optional<std::string> unquote(std::string_view raw)
{
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"')
        return std::nullopt;
    std::string out;
    out.reserve(raw.size() - 2);
    for (size_t i = 1; i + 1 < raw.size(); ++i)
    {
        char c = raw[i];
        if (c == '\\' && i + 2 < raw.size())
        {
            char n = raw[++i];
            if (n == 'n')
                out.push_back('\n');
            else if (n == 't')
                out.push_back('\t');
            else
                out.push_back(n);
            continue;
        }
        out.push_back(c);
    }
    return out;
}

struct Entry
{
    std::string value;
    size_t line = 0;
};

class Table
{
  public:
    std::vector<std::string> warnings;

    void set(std::string key, std::string value, size_t line)
    {
        if (kv_.count(key))
            warnings.push_back("duplicate key '" + key + "' on line " + std::to_string(line) + " overrides line " +
                               std::to_string(kv_[key].line));
        kv_[std::move(key)] = Entry{std::move(value), line};
    }

    bool has(std::string_view key) const { return kv_.find(std::string(key)) != kv_.end(); }

    std::optional<std::string> get_raw(std::string_view key) const
    {
        auto it = kv_.find(std::string(key));
        if (it == kv_.end())
            return std::nullopt;
        used_.insert(it->first);
        return it->second.value;
    }

    std::string get_string(std::string_view key, std::string def) const
    {
        auto raw = get_raw(key);
        if (!raw)
            return def;
        if (auto s = unquote(*raw))
            return *s;
        // Bare words are accepted for identifiers such as `arch = resnet18`.
        return *raw;
    }

    bool get_bool(std::string_view key, bool def) const
    {
        auto raw = get_raw(key);
        if (!raw)
            return def;
        std::string v = *raw;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "true")
            return true;
        if (v == "false")
            return false;
        throw malformed(key, *raw, "a boolean");
    }

    int get_int(std::string_view key, int def) const
    {
        auto raw = get_raw(key);
        if (!raw)
            return def;
        std::string v = normalize_number_token(*raw);
        try
        {
            size_t pos = 0;
            long long out = std::stoll(v, &pos, 10);
            if (pos == v.size() && out >= INT32_MIN && out <= INT32_MAX)
                return static_cast<int>(out);
        }
        catch (const std::logic_error &)
        {
        }
        throw malformed(key, *raw, "an integer");
    }

    std::optional<int64_t> get_optional_i64(std::string_view key) const
    {
        auto raw = get_raw(key);
        if (!raw)
            return std::nullopt;
        std::string v = normalize_number_token(*raw);
        try
        {
            size_t pos = 0;
            long long out = std::stoll(v, &pos, 10);
            if (pos == v.size())
                return static_cast<int64_t>(out);
        }
        catch (const std::logic_error &)
        {
        }
        throw malformed(key, *raw, "an integer");
    }

    float get_float(std::string_view key, float def) const
    {
        auto raw = get_raw(key);
        if (!raw)
            return def;
        std::string v = normalize_number_token(*raw);
        try
        {
            size_t pos = 0;
            float out = std::stof(v, &pos);
            if (pos == v.size() && std::isfinite(out))
                return out;
        }
        catch (const std::logic_error &)
        {
        }
        throw malformed(key, *raw, "a finite number");
    }

    // Keys present in the file that no getter asked for.
    std::vector<std::string> unused_keys() const
    {
        std::set<std::string> sorted;
        for (const auto &[k, e] : kv_)
        {
            if (!used_.count(k))
                sorted.insert(k);
        }
        return {sorted.begin(), sorted.end()};
    }

  private:
    ConfigurationError malformed(std::string_view key, const std::string &raw, const char *expected) const
    {
        auto it = kv_.find(std::string(key));
        size_t line = it == kv_.end() ? 0 : it->second.line;
        return ConfigurationError("'" + std::string(key) + "' on line " + std::to_string(line) + " must be " +
                                  expected + ", got '" + raw + "'");
    }

    std::unordered_map<std::string, Entry> kv_;
    mutable std::set<std::string> used_;
};

static inline Table parse_stream(std::istream &is)
{
    Table t;
    std::string line;
    std::string prefix;
    size_t line_no = 0;
    while (std::getline(is, line))
    {
        line_no++;
        std::string raw = trim(strip_comment(line));
        if (raw.empty())
            continue;

        if (raw.front() == '[' && raw.back() == ']')
        {
            std::string sec = trim(std::string_view(raw).substr(1, raw.size() - 2));
            if (sec.empty() || sec.front() == '.' || sec.back() == '.')
            {
                t.warnings.push_back("malformed section header on line " + std::to_string(line_no) + " (ignored)");
                prefix.clear();
            }
            else
            {
                prefix = sec;
            }
            continue;
        }

        size_t eq = raw.find('=');
        if (eq == std::string::npos)
        {
            t.warnings.push_back("line " + std::to_string(line_no) + " has no '=' (ignored)");
            continue;
        }

        std::string key = trim(std::string_view(raw).substr(0, eq));
        std::string val = trim(std::string_view(raw).substr(eq + 1));
        if (key.empty())
        {
            t.warnings.push_back("empty key on line " + std::to_string(line_no) + " (ignored)");
            continue;
        }

        t.set(prefix.empty() ? key : (prefix + "." + key), val, line_no);
    }
    return t;
}

static inline Table parse_string(const std::string &text)
{
    std::istringstream is(text);
    return parse_stream(is);
}

static inline Table parse_file(const std::string &path)
{
    std::ifstream is(path);
    if (!is)
        throw ConfigurationError("cannot open config file '" + path + "'");
    return parse_stream(is);
}

} // namespace toml_min
} // namespace bmnsc
