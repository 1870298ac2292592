#pragma once

#include "quire/domain.hpp"
#include "quire/log.hpp"
#include "quire/utility.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

inline constexpr std::string_view CONFIG_FILENAME = "quire.json";

/** @brief Project configuration, read from `quire.json`. Every key is optional. */
struct SiteConfig {
    std::filesystem::path src_dir = "site";
    std::filesystem::path out_dir = "dist";
    std::filesystem::path cache_dir = ".quire";
    bool include_drafts = false;
    size_t jobs = 0; // 0 means auto-detect
    log::Level log_level = log::Level::Info;
    std::string renderer = "raw";
    std::vector<std::string> render_command; ///< For the `exec` renderer; supports {input} {output} {url}.
    int64_t render_timeout_seconds = 60;
    int64_t watch_debounce_ms = 150;
    int64_t watch_poll_ms = 250;
    IsgPolicy isg;
};

enum class ConfigErrorCode : uint8_t {
    InvalidTtl,
    InvalidMaxAgeCap,
    InvalidAgingRule,
    DuplicateAgingRule,
    UnsortedAgingRules,
    AgingRuleExceedsCap,
    InvalidDrift,
    InvalidValue,
};

/** @brief Stable identifier, e.g. `ISG_INVALID_TTL`. */
std::string_view to_string(ConfigErrorCode code);

struct ConfigError {
    ConfigErrorCode code = ConfigErrorCode::InvalidValue;
    std::string field;
    std::string message;

    std::string describe() const;
};

/**
 * @brief Checks an ISG policy for values that are invalid or almost certainly mistakes.
 *
 * TTLs must be non-negative and at most a year, the cap positive and at most ten years,
 * aging rules positive, unique, ascending and within the cap, the drift tolerance between
 * zero and one day.
 */
std::expected<void, ConfigError> validate_isg_policy(const IsgPolicy &policy);

/** @brief Parses and validates configuration JSON. */
std::expected<SiteConfig, ConfigError> parse_config(std::string_view text);

/**
 * @brief Loads `<project_root>/quire.json`, or @p explicit_path when given.
 *
 * A missing default file yields the defaults. A missing explicit file, unreadable JSON
 * or an invalid value is an error.
 */
Result<SiteConfig> load_config(const std::filesystem::path &project_root,
                               const std::optional<std::filesystem::path> &explicit_path = std::nullopt);

} // namespace quire
