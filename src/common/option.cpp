#include "common/option.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

#include <spdlog/spdlog.h>

#include "common/string_utils.h"

namespace airwaiter {

namespace {

constexpr const char* DEFAULT_CONFIG_FILE_NAME = "airwaiter.conf";

std::string ReadEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value == nullptr ? std::string() : std::string(value);
}

std::string ResolveConfigFilePath(const Options& options, const std::string& file_path) {
    if (!file_path.empty()) {
        return file_path;
    }
    auto from_env = ReadEnv(AIRWAITER_OPTIONS_FILE_PATH);
    if (!from_env.empty()) {
        return from_env;
    }
    auto from_options = GetOptionValue<std::string>(options, AIRWAITER_OPTIONS_FILE_PATH);
    if (!from_options.empty()) {
        return from_options;
    }
    return (std::filesystem::current_path() / DEFAULT_CONFIG_FILE_NAME).string();
}

// Integer conversion which rejects trailing characters ("10ms") and out of range values
template <typename Integer, typename Convert>
Integer ParseInteger(const std::string& name, const std::string& text, Convert convert) {
    std::string trimmed = TrimCopy(text);
    size_t consumed = 0;
    Integer value{};
    try {
        value = convert(trimmed, &consumed);
    } catch (const std::logic_error& e) {
        throw std::invalid_argument("Option " + name + " is not a valid integer: '" + text + "' (" + e.what() + ")");
    }
    if (consumed != trimmed.size()) {
        throw std::invalid_argument("Option " + name + " is not a valid integer: '" + text + "'");
    }
    return value;
}

} // namespace

std::string ToString(const Options& options) {
    std::map<std::string, std::string> sorted(options.begin(), options.end());
    std::ostringstream oss;
    oss << "{";
    const char* separator = "";
    for (const auto& [name, value] : sorted) {
        oss << separator << name << ": " << value;
        separator = ", ";
    }
    oss << "}";
    return oss.str();
}

const char* OptionTypeName(OptionType type) {
    switch (type) {
        case OptionType::INT:
            return "INT";
        case OptionType::INT64:
            return "INT64";
        case OptionType::BOOL:
            return "BOOL";
        case OptionType::STRING:
            return "STRING";
    }
    return "UNKNOWN";
}

OptionRegistry& OptionRegistry::Instance() {
    static OptionRegistry registry;
    return registry;
}

void OptionRegistry::Register(const std::string& name, OptionType type, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [iter, inserted] = specs_.emplace(name, OptionSpec{type, default_value});
    if (inserted) {
        return;
    }
    if (iter->second.type != type || iter->second.default_value != default_value) {
        SPDLOG_ERROR(
            "Option {} registered twice: {}='{}' kept, {}='{}' dropped",
            name,
            OptionTypeName(iter->second.type),
            iter->second.default_value,
            OptionTypeName(type),
            default_value);
    }
}

const OptionSpec* OptionRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iter = specs_.find(name);
    return iter == specs_.end() ? nullptr : &iter->second;
}

std::vector<std::string> OptionRegistry::GetNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(specs_.size());
    for (const auto& entry : specs_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

int ParseIntOption(const std::string& name, const std::string& text) {
    return ParseInteger<int>(
        name, text, [](const std::string& str, size_t* consumed) { return std::stoi(str, consumed); });
}

int64_t ParseInt64Option(const std::string& name, const std::string& text) {
    return ParseInteger<int64_t>(
        name, text, [](const std::string& str, size_t* consumed) { return std::stoll(str, consumed); });
}

bool ParseBoolOption(const std::string& name, const std::string& text) {
    auto upper = ToUpper(TrimCopy(text));
    if (upper == "TRUE" || upper == "1") {
        return true;
    }
    if (upper == "FALSE" || upper == "0") {
        return false;
    }
    throw std::invalid_argument("Option " + name + " is not a valid bool: '" + text + "'");
}

void PutOptionValue(Options& options, const std::string& name, const std::string& value) {
    if (value.empty()) {
        SPDLOG_INFO("Skip empty value of option {}", name);
        return;
    }
    auto [iter, inserted] = options.insert_or_assign(name, value);
    if (!inserted) {
        SPDLOG_WARN("Option {} overridden with {}", name, iter->second);
    }
}

void LoadOptions(Options& options) {
    auto mode = ReadEnv(AIRWAITER_OPTIONS_LOAD_MODE);
    if (mode.empty()) {
        mode = GetOptionValue<std::string>(options, AIRWAITER_OPTIONS_LOAD_MODE);
    }

    mode = ToUpper(mode);
    if (mode == "FILE") {
        LoadOptionsFromFile(options);
    } else if (mode == "ENV") {
        LoadOptionsFromEnv(options);
    } else {
        SPDLOG_ERROR("Unknown {} '{}', expected ENV or FILE", AIRWAITER_OPTIONS_LOAD_MODE, mode);
    }
}

void LoadOptionsFromEnv(Options& options) {
    for (const auto& name : OptionRegistry::Instance().GetNames()) {
        auto value = ReadEnv(name);
        if (!value.empty()) {
            PutOptionValue(options, name, value);
        }
    }
    SPDLOG_INFO("Options from ENV: {}", ToString(options));
}

void LoadOptionsFromFile(Options& options, std::string file_path) {
    file_path = ResolveConfigFilePath(options, file_path);

    std::ifstream input(file_path);
    if (!input) {
        SPDLOG_WARN("No config file at {}, options unchanged", file_path);
        return;
    }

    const auto& registry = OptionRegistry::Instance();
    std::string line;
    for (int line_number = 1; std::getline(input, line); ++line_number) {
        auto content = TrimCopy(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }

        auto equal_pos = content.find('=');
        if (equal_pos == std::string::npos) {
            SPDLOG_WARN("{}:{}: expected NAME = value, got '{}'", file_path, line_number, content);
            continue;
        }
        auto name = TrimCopy(std::string_view(content).substr(0, equal_pos));
        auto value = TrimCopy(std::string_view(content).substr(equal_pos + 1));
        if (registry.Find(name) == nullptr) {
            SPDLOG_WARN("{}:{}: unknown option {}", file_path, line_number, name);
            continue;
        }
        PutOptionValue(options, name, value);
    }

    SPDLOG_INFO("Options from {}: {}", file_path, ToString(options));
}

} // namespace airwaiter
