#include "quire/config.hpp"

#include "quire/mmap.hpp"

#include <format>
#include <nlohmann/json.hpp>
#include <set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace quire {

namespace {

constexpr int64_t SECONDS_PER_DAY = 24 * 3600;

std::unexpected<ConfigError> fail(ConfigErrorCode code, std::string field, std::string message) {
    return std::unexpected(ConfigError{code, std::move(field), std::move(message)});
}

std::expected<int64_t, ConfigError> read_int(const json &j, std::string_view field, ConfigErrorCode code) {
    if (!j.is_number_integer())
        return fail(code, std::string(field), std::format("{} must be an integer, got {}", field, j.dump()));
    return j.get<int64_t>();
}

std::expected<void, ConfigError> parse_isg(const json &j, IsgPolicy &policy) {
    if (!j.is_object())
        return fail(ConfigErrorCode::InvalidValue, "isg", "isg must be an object");

    if (auto it = j.find("ttlSeconds"); it != j.end()) {
        auto v = read_int(*it, "isg.ttlSeconds", ConfigErrorCode::InvalidTtl);
        if (!v)
            return std::unexpected(v.error());
        policy.default_ttl_seconds = *v;
    }
    if (auto it = j.find("maxAgeCapDays"); it != j.end() && !it->is_null()) {
        auto v = read_int(*it, "isg.maxAgeCapDays", ConfigErrorCode::InvalidMaxAgeCap);
        if (!v)
            return std::unexpected(v.error());
        policy.max_age_cap_days = *v;
    }
    if (auto it = j.find("clockDriftToleranceSeconds"); it != j.end()) {
        auto v = read_int(*it, "isg.clockDriftToleranceSeconds", ConfigErrorCode::InvalidDrift);
        if (!v)
            return std::unexpected(v.error());
        policy.clock_drift_tolerance_seconds = *v;
    }
    if (auto it = j.find("pendingInvalidationTtlSeconds"); it != j.end() && !it->is_null()) {
        auto v = read_int(*it, "isg.pendingInvalidationTtlSeconds", ConfigErrorCode::InvalidTtl);
        if (!v)
            return std::unexpected(v.error());
        policy.pending_invalidation_ttl_seconds = *v;
    }
    if (auto it = j.find("aging"); it != j.end()) {
        if (!it->is_array())
            return fail(ConfigErrorCode::InvalidAgingRule, "isg.aging", "aging must be an array of rules");
        for (size_t i = 0; i < it->size(); ++i) {
            const json &rule = (*it)[i];
            const std::string field = std::format("isg.aging[{}]", i);
            if (!rule.is_object() || !rule.contains("untilDays") || !rule.contains("ttlSeconds")) {
                return fail(ConfigErrorCode::InvalidAgingRule,
                            field,
                            "Aging rule must be an object with untilDays and ttlSeconds properties.");
            }
            auto until = read_int(rule["untilDays"], field + ".untilDays", ConfigErrorCode::InvalidAgingRule);
            if (!until)
                return std::unexpected(until.error());
            auto ttl = read_int(rule["ttlSeconds"], field + ".ttlSeconds", ConfigErrorCode::InvalidAgingRule);
            if (!ttl)
                return std::unexpected(ttl.error());
            policy.aging.push_back({*until, *ttl});
        }
    }
    return {};
}

} // namespace

std::string_view to_string(ConfigErrorCode code) {
    switch (code) {
    case ConfigErrorCode::InvalidTtl:
        return "ISG_INVALID_TTL";
    case ConfigErrorCode::InvalidMaxAgeCap:
        return "ISG_INVALID_MAX_AGE_CAP";
    case ConfigErrorCode::InvalidAgingRule:
        return "ISG_INVALID_AGING_RULE";
    case ConfigErrorCode::DuplicateAgingRule:
        return "ISG_DUPLICATE_AGING_RULE";
    case ConfigErrorCode::UnsortedAgingRules:
        return "ISG_UNSORTED_AGING_RULES";
    case ConfigErrorCode::AgingRuleExceedsCap:
        return "ISG_AGING_RULE_EXCEEDS_CAP";
    case ConfigErrorCode::InvalidDrift:
        return "ISG_INVALID_DRIFT";
    case ConfigErrorCode::InvalidValue:
        return "CONFIG_INVALID_VALUE";
    }
    return "CONFIG_UNKNOWN";
}

std::string ConfigError::describe() const {
    return std::format("{} ({}): {}", to_string(code), field, message);
}

std::expected<void, ConfigError> validate_isg_policy(const IsgPolicy &policy) {
    const int64_t ttl = policy.default_ttl_seconds;
    if (ttl < 0) {
        return fail(ConfigErrorCode::InvalidTtl,
                    "isg.ttlSeconds",
                    "ttlSeconds cannot be negative. Use 0 for immediate expiration or a positive value.");
    }
    if (ttl > MAX_TTL_SECONDS) {
        return fail(ConfigErrorCode::InvalidTtl,
                    "isg.ttlSeconds",
                    "ttlSeconds is unusually large (>1 year). Consider using maxAgeCapDays for long-term caching.");
    }

    if (policy.max_age_cap_days) {
        if (*policy.max_age_cap_days <= 0) {
            return fail(ConfigErrorCode::InvalidMaxAgeCap,
                        "isg.maxAgeCapDays",
                        "maxAgeCapDays must be positive. Use a value like 30, 90, or 365 days.");
        }
        if (*policy.max_age_cap_days > MAX_AGE_CAP_DAYS) {
            return fail(ConfigErrorCode::InvalidMaxAgeCap,
                        "isg.maxAgeCapDays",
                        "maxAgeCapDays is unusually large (>10 years).");
        }
    }

    std::set<int64_t> seen;
    for (size_t i = 0; i < policy.aging.size(); ++i) {
        const AgingRule &rule = policy.aging[i];
        const std::string field = std::format("isg.aging[{}]", i);
        if (rule.until_days <= 0) {
            return fail(ConfigErrorCode::InvalidAgingRule,
                        field + ".untilDays",
                        "untilDays must be a positive integer representing days. Example: 7, 30, 90");
        }
        if (rule.ttl_seconds < 0) {
            return fail(ConfigErrorCode::InvalidAgingRule,
                        field + ".ttlSeconds",
                        "ttlSeconds must be a non-negative integer representing seconds.");
        }
        if (rule.ttl_seconds > 30 * SECONDS_PER_DAY) {
            return fail(ConfigErrorCode::InvalidAgingRule,
                        field + ".ttlSeconds",
                        std::format("ttlSeconds in aging rule is unusually large (>30 days) for content up to {} days old.",
                                    rule.until_days));
        }
        if (!seen.insert(rule.until_days).second) {
            return fail(ConfigErrorCode::DuplicateAgingRule,
                        field + ".untilDays",
                        std::format("Duplicate aging rule for {} days. Each untilDays value must be unique.",
                                    rule.until_days));
        }
        if (policy.max_age_cap_days && rule.until_days > *policy.max_age_cap_days) {
            return fail(ConfigErrorCode::AgingRuleExceedsCap,
                        field + ".untilDays",
                        std::format("Aging rule for {} days exceeds maxAgeCapDays ({}). Rule will never be used.",
                                    rule.until_days,
                                    *policy.max_age_cap_days));
        }
        if (i > 0 && rule.until_days < policy.aging[i - 1].until_days) {
            return fail(ConfigErrorCode::UnsortedAgingRules,
                        "isg.aging",
                        "Aging rules must be sorted by untilDays in ascending order.");
        }
    }

    if (policy.clock_drift_tolerance_seconds < 0 || policy.clock_drift_tolerance_seconds > SECONDS_PER_DAY) {
        return fail(ConfigErrorCode::InvalidDrift,
                    "isg.clockDriftToleranceSeconds",
                    "clockDriftToleranceSeconds must be between 0 and 86400.");
    }

    if (policy.pending_invalidation_ttl_seconds && *policy.pending_invalidation_ttl_seconds <= 0) {
        return fail(ConfigErrorCode::InvalidTtl,
                    "isg.pendingInvalidationTtlSeconds",
                    "pendingInvalidationTtlSeconds must be positive when set.");
    }
    return {};
}

std::expected<SiteConfig, ConfigError> parse_config(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error &err) {
        return fail(ConfigErrorCode::InvalidValue, "(root)", std::format("invalid JSON: {}", err.what()));
    }
    if (!j.is_object())
        return fail(ConfigErrorCode::InvalidValue, "(root)", "configuration must be a JSON object");

    SiteConfig config;

    auto read_path = [&](std::string_view key, fs::path &out) -> std::expected<void, ConfigError> {
        if (auto it = j.find(std::string(key)); it != j.end()) {
            if (!it->is_string() || it->get_ref<const std::string &>().empty())
                return fail(ConfigErrorCode::InvalidValue, std::string(key), std::format("{} must be a non-empty string", key));
            out = it->get<std::string>();
        }
        return {};
    };
    auto read_positive = [&](std::string_view key, int64_t &out) -> std::expected<void, ConfigError> {
        if (auto it = j.find(std::string(key)); it != j.end()) {
            auto v = read_int(*it, key, ConfigErrorCode::InvalidValue);
            if (!v)
                return std::unexpected(v.error());
            if (*v <= 0)
                return fail(ConfigErrorCode::InvalidValue, std::string(key), std::format("{} must be positive", key));
            out = *v;
        }
        return {};
    };

    for (auto [key, out] : {std::pair<std::string_view, fs::path *>{"srcDir", &config.src_dir},
                            {"outDir", &config.out_dir},
                            {"cacheDir", &config.cache_dir}}) {
        if (auto res = read_path(key, *out); !res)
            return std::unexpected(res.error());
    }
    for (auto [key, out] : {std::pair<std::string_view, int64_t *>{"renderTimeoutSeconds", &config.render_timeout_seconds},
                            {"watchDebounceMs", &config.watch_debounce_ms},
                            {"watchPollMs", &config.watch_poll_ms}}) {
        if (auto res = read_positive(key, *out); !res)
            return std::unexpected(res.error());
    }

    if (auto it = j.find("includeDrafts"); it != j.end()) {
        if (!it->is_boolean())
            return fail(ConfigErrorCode::InvalidValue, "includeDrafts", "includeDrafts must be a boolean");
        config.include_drafts = it->get<bool>();
    }
    if (auto it = j.find("jobs"); it != j.end()) {
        if (!it->is_number_unsigned())
            return fail(ConfigErrorCode::InvalidValue, "jobs", "jobs must be a non-negative integer");
        config.jobs = it->get<size_t>();
    }
    if (auto it = j.find("logLevel"); it != j.end()) {
        auto level = it->is_string() ? log::parse_level(it->get_ref<const std::string &>()) : std::nullopt;
        if (!level)
            return fail(ConfigErrorCode::InvalidValue, "logLevel", "logLevel must be one of debug, info, warn, error, off");
        config.log_level = *level;
    }
    if (auto it = j.find("renderer"); it != j.end()) {
        if (!it->is_string())
            return fail(ConfigErrorCode::InvalidValue, "renderer", "renderer must be a string");
        config.renderer = it->get<std::string>();
    }
    if (auto it = j.find("renderCommand"); it != j.end()) {
        if (!it->is_array() || it->empty())
            return fail(ConfigErrorCode::InvalidValue, "renderCommand", "renderCommand must be a non-empty array of strings");
        for (const auto &arg : *it) {
            if (!arg.is_string())
                return fail(ConfigErrorCode::InvalidValue, "renderCommand", "renderCommand must contain only strings");
            config.render_command.push_back(arg.get<std::string>());
        }
    }
    if (auto it = j.find("isg"); it != j.end()) {
        if (auto res = parse_isg(*it, config.isg); !res)
            return std::unexpected(res.error());
    }

    if (auto res = validate_isg_policy(config.isg); !res)
        return std::unexpected(res.error());
    return config;
}

Result<SiteConfig> load_config(const fs::path &project_root, const std::optional<fs::path> &explicit_path) {
    const fs::path path = explicit_path.value_or(project_root / CONFIG_FILENAME);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (explicit_path)
            return std::unexpected(std::format("Config file {} does not exist.", path.string()));
        return SiteConfig{};
    }

    auto file = MappedFile::open(path);
    if (!file)
        return std::unexpected(std::format("Cannot read config {}: {}", path.string(), file.error()));

    auto config = parse_config((*file)->content());
    if (!config)
        return std::unexpected(std::format("Invalid config {}: {}", path.string(), config.error().describe()));
    return *config;
}

} // namespace quire
