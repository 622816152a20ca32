#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace airwaiter {

// Loaded configuration, option name to raw text value
using Options = std::unordered_map<std::string, std::string>;

/*
 * @return "{name: value, ...}" sorted by name
 */
std::string ToString(const Options& options);

enum class OptionType : uint8_t {
    INT,
    INT64,
    BOOL,
    STRING
};

const char* OptionTypeName(OptionType type);

struct OptionSpec {
    OptionType type;
    std::string default_value;
};

/**
 * Process wide table of the known options, filled by AIRWAITER_OPTION at
 * static initialization time.
 */
class OptionRegistry {
 public:
    static OptionRegistry& Instance();

    void Register(const std::string& name, OptionType type, const std::string& default_value);

    /**
     * @return the spec of the option, or nullptr if it is unknown
     */
    [[nodiscard]] const OptionSpec* Find(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> GetNames() const;

 private:
    OptionRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, OptionSpec> specs_;
};

struct OptionRegistrar {
    OptionRegistrar(const std::string& name, OptionType type, const std::string& default_value) {
        OptionRegistry::Instance().Register(name, type, default_value);
    }
};

#define AIRWAITER_OPTION(name, type, default_value) \
    inline const std::string name = #name; \
    inline const ::airwaiter::OptionRegistrar option_registrar_##name(name, ::airwaiter::OptionType::type, default_value);

/********** [Option Name, Option Type, Default Value] ***********/
AIRWAITER_OPTION(AIRWAITER_OPTIONS_LOAD_MODE, STRING, "ENV") // ENV, FILE
AIRWAITER_OPTION(AIRWAITER_OPTIONS_FILE_PATH, STRING, "") // ./airwaiter.conf when empty

// Default wait policy
AIRWAITER_OPTION(AIRWAITER_WAIT_TIMEOUT_MS, INT64, "10000") // 0 for no time limit
AIRWAITER_OPTION(AIRWAITER_WAIT_MAX_ATTEMPTS, INT, "0") // 0 for no count limit
AIRWAITER_OPTION(AIRWAITER_WAIT_INTERVAL_MS, INT64, "100")
AIRWAITER_OPTION(AIRWAITER_WAIT_EXPONENTIAL, BOOL, "false")
AIRWAITER_OPTION(AIRWAITER_WAIT_MAX_INTERVAL_MS, INT64, "0") // 0 for no ceiling

// Logging
AIRWAITER_OPTION(AIRWAITER_LOG_DIR, STRING, "/tmp/airwaiter")
AIRWAITER_OPTION(AIRWAITER_LOG_LEVEL, STRING, "INFO") // DEBUG, INFO, WARNING, ERROR
AIRWAITER_OPTION(AIRWAITER_LOG_TO_CONSOLE, BOOL, "false")
AIRWAITER_OPTION(AIRWAITER_LOG_TO_FILE, BOOL, "true")
AIRWAITER_OPTION(AIRWAITER_LOG_MAX_FILE_DAYS, INT, "5")
/********** [Option Name, Option Type, Default Value] ***********/

// Text to value conversions, throw std::invalid_argument on malformed text
int ParseIntOption(const std::string& name, const std::string& text);
int64_t ParseInt64Option(const std::string& name, const std::string& text);
bool ParseBoolOption(const std::string& name, const std::string& text);

/**
 * Typed value of an option: the loaded text if present, the default otherwise.
 * T must match the registered type (int, int64_t, bool or std::string).
 *
 * Unknown options and options without a value yield T{}.
 *
 * @throws std::invalid_argument on a type mismatch or malformed value
 */
template <typename T>
T GetOptionValue(const Options& options, const std::string& name) {
    const OptionSpec* spec = OptionRegistry::Instance().Find(name);
    if (spec == nullptr) {
        SPDLOG_ERROR("Unknown option {}", name);
        return T{};
    }

    OptionType expected;
    if constexpr (std::is_same_v<T, std::string>) {
        expected = OptionType::STRING;
    } else if constexpr (std::is_same_v<T, bool>) {
        expected = OptionType::BOOL;
    } else if constexpr (std::is_same_v<T, int>) {
        expected = OptionType::INT;
    } else if constexpr (std::is_same_v<T, int64_t>) {
        expected = OptionType::INT64;
    } else {
        static_assert(!std::is_same_v<T, T>, "Unsupported option value type");
    }
    if (spec->type != expected) {
        throw std::invalid_argument(
            "Option " + name + " is " + OptionTypeName(spec->type) + ", read as " + OptionTypeName(expected));
    }

    auto iter = options.find(name);
    const std::string& text = iter != options.end() ? iter->second : spec->default_value;
    if (text.empty()) {
        if constexpr (!std::is_same_v<T, std::string>) {
            SPDLOG_ERROR("Option {} has no value", name);
        }
        return T{};
    }

    if constexpr (std::is_same_v<T, std::string>) {
        return text;
    } else if constexpr (std::is_same_v<T, bool>) {
        return ParseBoolOption(name, text);
    } else if constexpr (std::is_same_v<T, int>) {
        return ParseIntOption(name, text);
    } else {
        return ParseInt64Option(name, text);
    }
}

/*
 * Sets an option, empty values are skipped.
 */
void PutOptionValue(Options& options, const std::string& name, const std::string& value);

/*
 * Loads options from ENV or from a file, as AIRWAITER_OPTIONS_LOAD_MODE says.
 */
void LoadOptions(Options& options);

void LoadOptionsFromEnv(Options& options);

/*
 * Loads `NAME = value` lines; '#' starts a comment line.
 * @param file_path the file, AIRWAITER_OPTIONS_FILE_PATH or ./airwaiter.conf if empty
 */
void LoadOptionsFromFile(Options& options, std::string file_path = "");

} // namespace airwaiter
