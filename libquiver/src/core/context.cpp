// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include "quiver/core/context.hpp"
#include "quiver/core/util.hpp"
#include "quiver/util/string.hpp"

namespace quiver
{
    namespace
    {
        auto configuration_error(std::string msg) -> quiver_error
        {
            return quiver_error(std::move(msg), quiver_error_code::configuration_error);
        }

        template <typename T>
        void read_key(const YAML::Node& config, const char* key, T& out)
        {
            if (const auto node = config[key]; node && !node.IsNull())
            {
                out = node.as<T>();
            }
        }

        auto parse_index_url(std::string_view str) -> specs::IndexUrl
        {
            auto url = specs::IndexUrl::parse(str);
            if (!url)
            {
                throw configuration_error(url.error().what());
            }
            return std::move(url).value();
        }

        auto parse_bool(std::string_view str) -> std::optional<bool>
        {
            const auto lower = util::to_lower(util::strip(str));
            if ((lower == "1") || (lower == "true") || (lower == "yes") || (lower == "on"))
            {
                return true;
            }
            if ((lower == "0") || (lower == "false") || (lower == "no") || (lower == "off")
                || lower.empty())
            {
                return false;
            }
            return std::nullopt;
        }

        auto parse_python_version(std::string_view str) -> std::pair<std::size_t, std::size_t>
        {
            auto [major_str, minor_str] = util::split_once(util::strip(str), '.');
            auto out = std::pair<std::size_t, std::size_t>{ 0, 0 };
            const auto parse_number = [&](std::string_view num, std::size_t& val)
            {
                const auto [ptr, ec] = std::from_chars(num.data(), num.data() + num.size(), val);
                return (ec == std::errc()) && (ptr == num.data() + num.size()) && !num.empty();
            };
            if (!minor_str || !parse_number(major_str, out.first)
                || !parse_number(*minor_str, out.second))
            {
                throw configuration_error(
                    fmt::format(R"(Invalid python version "{}": expected "<major>.<minor>".)", str)
                );
            }
            return out;
        }

        void read_indexes(const YAML::Node& config, Context::IndexParams& params)
        {
            if (const auto node = config["indexes"]; node && node.IsSequence())
            {
                for (const auto& item : node)
                {
                    auto index = specs::Index::from_extra_index_url(
                        parse_index_url(item["url"].as<std::string>())
                    );
                    if (const auto name = item["name"]; name && !name.IsNull())
                    {
                        index.name = name.as<std::string>();
                    }
                    read_key(item, "explicit", index.explicit_index);
                    read_key(item, "default", index.default_index);
                    params.indexes.push_back(std::move(index));
                }
            }

            auto extra_index_urls = std::vector<std::string>();
            read_key(config, "extra_index_url", extra_index_urls);
            for (const auto& url : extra_index_urls)
            {
                params.indexes.push_back(specs::Index::from_extra_index_url(parse_index_url(url)));
            }

            if (const auto node = config["index_url"]; node && !node.IsNull())
            {
                params.indexes.push_back(
                    specs::Index::from_index_url(parse_index_url(node.as<std::string>()))
                );
            }

            auto find_links = std::vector<std::string>();
            read_key(config, "find_links", find_links);
            for (const auto& url : find_links)
            {
                params.find_links.push_back(parse_index_url(url));
            }

            read_key(config, "no_index", params.no_index);
        }

        void read_hashes(const YAML::Node& config, Context::HashParams& params)
        {
            if (const auto node = config["hash_checking"]; node && !node.IsNull())
            {
                const auto mode_str = node.as<std::string>();
                const auto mode = specs::hash_checking_mode_parse(mode_str);
                if (!mode)
                {
                    throw configuration_error(
                        fmt::format(R"(Invalid hash checking mode "{}".)", mode_str)
                    );
                }
                params.mode = *mode;
            }

            const auto node = config["hashes"];
            if (!node || !node.IsMap())
            {
                return;
            }
            for (const auto& item : node)
            {
                const auto pin = item.first.as<std::string>();
                const auto [name_str, version_str] = util::split_once(pin, '=');
                if (!version_str || !util::starts_with(*version_str, '='))
                {
                    throw configuration_error(
                        fmt::format(R"(Invalid hash pin "{}": expected "<name>==<version>".)", pin)
                    );
                }
                auto name = specs::PackageName::parse(name_str);
                auto version = specs::Version::parse(version_str->substr(1));
                if (!name || !version)
                {
                    throw configuration_error(fmt::format(
                        R"(Invalid hash pin "{}": {})",
                        pin,
                        !name ? name.error().what() : version.error().what()
                    ));
                }

                auto digests = specs::HashDigestList();
                for (const auto& digest_node : item.second)
                {
                    auto digest = specs::HashDigest::parse(digest_node.as<std::string>());
                    if (!digest)
                    {
                        throw configuration_error(digest.error().what());
                    }
                    digests.push_back(std::move(digest).value());
                }
                auto key = specs::HashStrategy::key_type{ std::move(name).value(),
                                                          std::move(version).value() };
                params.digests.insert_or_assign(std::move(key), std::move(digests));
            }
        }

        void read_logging(const YAML::Node& config, LoggingParams& params)
        {
            if (const auto node = config["log_level"]; node && !node.IsNull())
            {
                const auto level_str = node.as<std::string>();
                const auto level = log_level_parse(level_str);
                if (!level)
                {
                    throw configuration_error(fmt::format(R"(Invalid log level "{}".)", level_str));
                }
                params.logging_level = *level;
            }
            read_key(config, "log_pattern", params.log_pattern);
            read_key(config, "log_backtrace", params.log_backtrace);
        }

        void read_tags(const YAML::Node& config, specs::TagsParams& params)
        {
            read_key(config, "implementation", params.implementation);
            if (const auto node = config["python_version"]; node && !node.IsNull())
            {
                params.python_version = parse_python_version(node.as<std::string>());
            }
            read_key(config, "free_threaded", params.free_threaded);
            read_key(config, "platforms", params.platforms);
        }
    }

    auto Context::default_cache_dir() -> fs::u8path
    {
        if (auto xdg = get_env("XDG_CACHE_HOME"); xdg && !xdg->empty())
        {
            return fs::u8path(*xdg) / "quiver";
        }
        return fs::u8path(get_env("HOME").value_or(".")) / ".cache" / "quiver";
    }

    Context::Context()
        : cache_params{ default_cache_dir() }
    {
    }

    auto Context::from_yaml(const YAML::Node& config) -> expected_t<Context>
    {
        auto ctx = Context();
        if (!config || config.IsNull())
        {
            return { std::move(ctx) };
        }
        if (!config.IsMap())
        {
            return make_unexpected(
                "The configuration must be a map of keys to values",
                quiver_error_code::configuration_error
            );
        }

        try
        {
            read_logging(config, ctx.logging);
            if (const auto node = config["cache_dir"]; node && !node.IsNull())
            {
                ctx.cache_params.cache_dir = node.as<std::string>();
            }
            read_indexes(config, ctx.index_params);
            read_tags(config, ctx.tags_params);
            read_hashes(config, ctx.hash_params);
        }
        catch (const quiver_error& e)
        {
            return tl::make_unexpected(e);
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format("Invalid configuration value: {}", e.what()),
                quiver_error_code::configuration_error
            );
        }
        return { std::move(ctx) };
    }

    auto Context::from_file(const fs::u8path& file) -> expected_t<Context>
    {
        auto config = YAML::Node();
        try
        {
            std::ifstream in_file(file);
            if (!in_file)
            {
                return make_unexpected(
                    fmt::format("Could not open configuration file '{}'", file.string()),
                    quiver_error_code::configuration_error
                );
            }
            std::stringstream content;
            content << in_file.rdbuf();
            config = YAML::Load(content.str());
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format(
                    "YAML parsing error in configuration file '{}': {}",
                    file.string(),
                    e.what()
                ),
                quiver_error_code::configuration_error
            );
        }
        LOG_DEBUG << "Loaded configuration file " << file.string();
        return from_yaml(config);
    }

    auto Context::load_env() -> expected_t<void>
    {
        if (auto cache_dir = get_env("QUIVER_CACHE_DIR"); cache_dir && !cache_dir->empty())
        {
            cache_params.cache_dir = *cache_dir;
        }

        if (auto index_url = get_env("QUIVER_INDEX_URL"); index_url && !index_url->empty())
        {
            auto url = specs::IndexUrl::parse(*index_url);
            if (!url)
            {
                return make_unexpected(
                    fmt::format("Invalid QUIVER_INDEX_URL: {}", url.error().what()),
                    quiver_error_code::configuration_error
                );
            }
            // Replaces the configured default indexes
            auto& indexes = index_params.indexes;
            indexes.erase(
                std::remove_if(
                    indexes.begin(),
                    indexes.end(),
                    [](const specs::Index& index) { return index.default_index; }
                ),
                indexes.end()
            );
            indexes.push_back(specs::Index::from_index_url(std::move(url).value()));
        }

        if (auto no_index = get_env("QUIVER_NO_INDEX"))
        {
            const auto value = parse_bool(*no_index);
            if (!value)
            {
                return make_unexpected(
                    fmt::format(R"(Invalid QUIVER_NO_INDEX "{}": expected a boolean.)", *no_index),
                    quiver_error_code::configuration_error
                );
            }
            index_params.no_index = *value;
        }

        if (auto level_str = get_env("QUIVER_LOG_LEVEL"); level_str && !level_str->empty())
        {
            const auto level = log_level_parse(*level_str);
            if (!level)
            {
                return make_unexpected(
                    fmt::format(R"(Invalid QUIVER_LOG_LEVEL "{}".)", *level_str),
                    quiver_error_code::configuration_error
                );
            }
            logging.logging_level = *level;
        }
        return {};
    }

    void Context::init_logging() const
    {
        logging::set_logging_params(logging);
    }

    auto Context::index_locations() const -> specs::IndexLocations
    {
        return { index_params.indexes, index_params.find_links, index_params.no_index };
    }

    auto Context::tags() const -> specs::Tags
    {
        return specs::Tags::from_env(tags_params);
    }

    auto Context::hash_strategy() const -> specs::HashStrategy
    {
        switch (hash_params.mode)
        {
            case specs::HashCheckingMode::none:
                return specs::HashStrategy::none();
            case specs::HashCheckingMode::generate:
                return specs::HashStrategy::generate();
            case specs::HashCheckingMode::verify:
                return specs::HashStrategy::verify(hash_params.digests);
            case specs::HashCheckingMode::require:
                return specs::HashStrategy::require(hash_params.digests);
        }
        return specs::HashStrategy::none();
    }

    auto Context::cache() const -> Cache
    {
        return Cache(cache_params.cache_dir);
    }
}
