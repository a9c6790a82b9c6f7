#include <canopy/caching/config.hpp>

#include <algorithm>
#include <cmath>

#include <nlohmann/json.hpp>

#include <canopy/caching/entry.hpp>
#include <canopy/fs/file_io.h>
#include <canopy/utilities/errors.h>

namespace canopy {

namespace {

[[noreturn]] void
throw_bad_option(char const* option, string const& value)
{
    CANOPY_THROW(
        configuration_error() << config_option_info(option)
                              << config_value_info(value));
}

void
check_option(bool condition, char const* option, integer value)
{
    if (!condition)
        throw_bad_option(option, std::to_string(value));
}

void
check_option(bool condition, char const* option, double value)
{
    if (!condition)
        throw_bad_option(option, std::to_string(value));
}

} // namespace

resolved_cache_config
resolve_cache_config(completeness_cache_config const& config)
{
    resolved_cache_config resolved;
    resolved.enable_oom_protection
        = config.enable_oom_protection.value_or(true);
    resolved.max_entries = config.max_entries.value_or(10000);
    resolved.max_memory_mb = config.max_memory_mb.value_or(100);
    resolved.max_path_depth = config.max_path_depth.value_or(30);
    resolved.max_tracked_nodes = config.max_tracked_nodes.value_or(10000);
    resolved.validation_ttl_seconds
        = config.validation_ttl_seconds.value_or(5.0);
    resolved.max_depth = config.max_depth.value_or(default_max_depth);
    resolved.default_depth = config.default_depth.value_or(1);
    // Left unset, the cache depth limit shrinks to fit a smaller max_depth.
    resolved.max_cache_depth = config.max_cache_depth.value_or(
        std::min<integer>(50, resolved.max_depth));

    check_option(resolved.max_depth >= 1, "max_depth", resolved.max_depth);
    check_option(
        is_valid_depth(resolved.default_depth, resolved.max_depth),
        "default_depth",
        resolved.default_depth);
    check_option(
        resolved.max_entries >= 0, "max_entries", resolved.max_entries);
    check_option(
        std::isfinite(resolved.max_memory_mb) && resolved.max_memory_mb > 0,
        "max_memory_mb",
        resolved.max_memory_mb);
    check_option(
        resolved.max_cache_depth >= 0
            && resolved.max_cache_depth <= resolved.max_depth,
        "max_cache_depth",
        resolved.max_cache_depth);
    check_option(
        resolved.max_path_depth >= 1,
        "max_path_depth",
        resolved.max_path_depth);
    check_option(
        resolved.max_tracked_nodes >= 0,
        "max_tracked_nodes",
        resolved.max_tracked_nodes);
    check_option(
        !std::isnan(resolved.validation_ttl_seconds),
        "validation_ttl_seconds",
        resolved.validation_ttl_seconds);

    return resolved;
}

namespace {

template<class Value>
void
read_option(
    nlohmann::json const& json, char const* option, optional<Value>& field)
{
    auto i = json.find(option);
    if (i == json.end() || i->is_null())
        return;
    bool type_ok;
    if constexpr (std::is_same_v<Value, bool>)
        type_ok = i->is_boolean();
    else if constexpr (std::is_integral_v<Value>)
        type_ok = i->is_number_integer();
    else
        type_ok = i->is_number();
    if (!type_ok)
        throw_bad_option(option, i->dump());
    field = i->template get<Value>();
}

} // namespace

completeness_cache_config
parse_cache_config(string const& json_text)
{
    nlohmann::json json;
    try
    {
        json = nlohmann::json::parse(json_text);
    }
    catch (nlohmann::json::parse_error& e)
    {
        CANOPY_THROW(
            configuration_error() << internal_error_message_info(e.what()));
    }
    if (!json.is_object())
    {
        CANOPY_THROW(
            configuration_error()
            << internal_error_message_info("expected a JSON object")
            << config_value_info(json.dump()));
    }

    static char const* const known_options[] = {
        "enable_oom_protection",
        "max_entries",
        "max_memory_mb",
        "max_cache_depth",
        "max_path_depth",
        "max_tracked_nodes",
        "validation_ttl_seconds",
        "max_depth",
        "default_depth"};
    for (auto const& item : json.items())
    {
        bool known = false;
        for (char const* option : known_options)
        {
            if (item.key() == option)
                known = true;
        }
        if (!known)
        {
            CANOPY_THROW(
                configuration_error()
                << config_option_info(item.key())
                << internal_error_message_info("unknown option"));
        }
    }

    completeness_cache_config config;
    read_option(json, "enable_oom_protection", config.enable_oom_protection);
    read_option(json, "max_entries", config.max_entries);
    read_option(json, "max_memory_mb", config.max_memory_mb);
    read_option(json, "max_cache_depth", config.max_cache_depth);
    read_option(json, "max_path_depth", config.max_path_depth);
    read_option(json, "max_tracked_nodes", config.max_tracked_nodes);
    read_option(json, "validation_ttl_seconds", config.validation_ttl_seconds);
    read_option(json, "max_depth", config.max_depth);
    read_option(json, "default_depth", config.default_depth);
    return config;
}

completeness_cache_config
read_cache_config_file(file_path const& path)
{
    return parse_cache_config(read_file_contents(path));
}

} // namespace canopy
