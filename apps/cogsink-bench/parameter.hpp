// Copyright (c) 2018-2025 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of cogsink

// cogsink is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. cogsink is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with cogsink. If not, see
// <https://www.gnu.org/licenses/>.

#pragma once
#include <cogsink/logger/logger.h>

#include <list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <toml++/toml.hpp>
#include <unordered_map>
#include <vector>

#include "fmt/format.h"
#include "validators.hpp"

// Formatter for cogsink::logger::LogLevel
template <>
struct fmt::formatter<cogsink::logger::LogLevel> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  template <typename Context>
  auto format(const cogsink::logger::LogLevel& level, Context& ctx) const {
    switch (level) {
      case cogsink::logger::LogLevel::trace:
        return fmt::format_to(ctx.out(), "trace");
      case cogsink::logger::LogLevel::debug:
        return fmt::format_to(ctx.out(), "debug");
      case cogsink::logger::LogLevel::info:
        return fmt::format_to(ctx.out(), "info");
      case cogsink::logger::LogLevel::warning:
        return fmt::format_to(ctx.out(), "warning");
      default:
        return fmt::format_to(ctx.out(), "unknown");
    }
  }
};

inline cogsink::logger::LogLevel loglevel_from_string(const std::string& s) {
  if (s == "trace") return cogsink::logger::LogLevel::trace;
  if (s == "debug") return cogsink::logger::LogLevel::debug;
  if (s == "info") return cogsink::logger::LogLevel::info;
  if (s == "warning") return cogsink::logger::LogLevel::warning;
  throw std::runtime_error("Invalid argument for LogLevel: " + s + ".");
}

struct ConfigParameter {
  std::string longname_;
  std::optional<char> shortname_;
  std::string help_;
  ConfigParameter(std::string longname, char shortname, std::string help)
      : longname_(longname), shortname_(shortname), help_(help){};
  ConfigParameter(std::string longname, std::string help)
      : longname_(longname), help_(help){};
  virtual ~ConfigParameter() = default;

  virtual std::optional<std::string> validate() = 0;

  virtual std::list<std::string>::iterator set(
      std::list<std::string>& args, std::list<std::string>::iterator it) = 0;
  virtual void unset() = 0;

  virtual void set_from_toml(const toml::table& table,
                             const std::string& name) = 0;

  virtual std::string description() = 0;
  virtual std::string type_description() = 0;
  virtual std::string to_string() = 0;
  virtual std::string default_to_string() = 0;
  virtual std::string cli_flag() = 0;
};

template <typename T>
struct ConfigParameterByReference : public ConfigParameter {
  T& value_;
  T default_value_;
  std::vector<Validator<T>> _validators;

  ConfigParameterByReference(std::string longname, std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, help),
        value_(value),
        default_value_(value),
        _validators(validators){};
  ConfigParameterByReference(std::string longname, char shortname,
                             std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, shortname, help),
        value_(value),
        default_value_(value),
        _validators(validators){};

  std::optional<std::string> validate() override {
    for (auto& validator : _validators) {
      if (auto error_msg = validator(value_)) {
        return error_msg;
      }
    }
    return std::nullopt;
  }

  std::string to_string() override { return fmt::format("{}", value_); }

  std::string default_to_string() override {
    std::string s = fmt::format("{}", default_value_);
    if (s.size() == 0) {
      return "<no value>";
    }
    return s;
  }

  std::string cli_flag() override {
    if (shortname_.has_value()) {
      return fmt::format("-{}, --{}", shortname_.value(), longname_);
    } else {
      if constexpr (std::is_same_v<T, bool>) {
        return fmt::format("--[no-]{}", longname_);
      } else {
        return fmt::format("--{}", longname_);
      }
    }
  }

  void unset() override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = false;
    } else {
      value_ = default_value_;
    }
  }

  std::list<std::string>::iterator set(
      std::list<std::string>& args,
      std::list<std::string>::iterator it) override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = true;
      return it;
    } else {
      if (it == args.end()) {
        throw std::runtime_error("Missing argument for parameter");
      } else if constexpr (std::is_same_v<T, int>) {
        value_ = std::stoi(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, std::string>) {
        value_ = *it;
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, cogsink::logger::LogLevel>) {
        value_ = loglevel_from_string(*it);
        return args.erase(it);
      } else {
        static_assert(!std::is_same_v<T, T>,
                      "Unsupported type for ConfigParameterByReference::set()");
      }
    }
  }

  void set_from_toml(const toml::table& table,
                     const std::string& name) override {
    if constexpr (std::is_same_v<T, cogsink::logger::LogLevel>) {
      if (const toml::value<std::string>* s = table[name].as_string()) {
        value_ = loglevel_from_string(s->get());
      }
    } else {
      if (auto value = table[name].value<T>(); value.has_value()) {
        value_ = *value;
      } else {
        throw std::runtime_error("Failed to read value for " + name +
                                 " from config file.");
      }
    }
  }

  std::string description() override { return help_; }

  std::string type_description() override {
    if constexpr (std::is_same_v<T, bool>) {
      return "";
    } else if constexpr (std::is_same_v<T, int>) {
      return "<int>";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return "<string>";
    } else if constexpr (std::is_same_v<T, cogsink::logger::LogLevel>) {
      return "(trace|debug|info|warning)";
    } else {
      static_assert(!std::is_same_v<T, T>,
                    "Unsupported type for "
                    "ConfigParameterByReference::type_description()");
    }
  }
};

class ParameterVector {
 public:
  std::vector<std::unique_ptr<ConfigParameter>> params_;

  ParameterVector(){};
  ~ParameterVector() = default;

  ParameterVector(ParameterVector&&) = default;
  ParameterVector& operator=(ParameterVector&&) = default;

  ParameterVector(const ParameterVector&) = delete;
  ParameterVector& operator=(const ParameterVector&) = delete;

  template <typename T>
  ConfigParameter& add(const std::string& longname, const std::string& help,
                       T& value, std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, help, value, std::move(validators)));
    return *params_.back();
  }

  template <typename T>
  ConfigParameter& add(const std::string& longname, const char shortname,
                       const std::string& help, T& value,
                       std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, shortname, help, value, std::move(validators)));
    return *params_.back();
  }

  void add_to_index(std::unordered_map<std::string, ConfigParameter*>& index) {
    for (auto& param : params_) {
      index[param->longname_] = param.get();
      if (param->shortname_.has_value()) {
        index[std::string(1, param->shortname_.value())] = param.get();
      }
    }
  }

  auto begin() { return params_.begin(); }
  auto end() { return params_.end(); }
  auto begin() const { return params_.begin(); }
  auto end() const { return params_.end(); }
  auto size() const { return params_.size(); }
  auto empty() const { return params_.empty(); }
};
