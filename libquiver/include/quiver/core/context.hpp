// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CORE_CONTEXT_HPP
#define QUIVER_CORE_CONTEXT_HPP

#include <vector>

#include <yaml-cpp/yaml.h>

#include "quiver/cache/cache.hpp"
#include "quiver/core/error_handling.hpp"
#include "quiver/core/logging.hpp"
#include "quiver/fs/filesystem.hpp"
#include "quiver/specs/hash.hpp"
#include "quiver/specs/index_url.hpp"
#include "quiver/specs/tags.hpp"

namespace quiver
{
    /**
     * The configuration of a resolution.
     *
     * A context is loaded from a YAML file, then overridden by environment variables.
     * It builds the collaborators of the registry wheel index.
     *
     * Recognized keys:
     * - ``log_level``, ``log_pattern``, ``log_backtrace``;
     * - ``cache_dir``;
     * - ``index_url``, ``extra_index_url``, ``find_links``, ``no_index``, and ``indexes``, a
     *   list of maps with ``url``, and optional ``name``, ``explicit``, ``default``;
     * - ``implementation``, ``python_version``, ``free_threaded``, ``platforms``;
     * - ``hash_checking``, and ``hashes``, a map of ``name==version`` to digests.
     */
    class Context
    {
    public:

        struct CacheParams
        {
            fs::u8path cache_dir = {};
        };

        struct IndexParams
        {
            /** The configured indexes, in order of priority. */
            std::vector<specs::Index> indexes = {};
            std::vector<specs::IndexUrl> find_links = {};
            bool no_index = false;
        };

        struct HashParams
        {
            specs::HashCheckingMode mode = specs::HashCheckingMode::none;
            specs::HashStrategy::digest_map digests = {};
        };

        /** The default cache directory, under ``XDG_CACHE_HOME`` or ``~/.cache``. */
        [[nodiscard]] static auto default_cache_dir() -> fs::u8path;

        [[nodiscard]] static auto from_yaml(const YAML::Node& config) -> expected_t<Context>;
        [[nodiscard]] static auto from_file(const fs::u8path& file) -> expected_t<Context>;

        Context();

        /**
         * Apply the ``QUIVER_CACHE_DIR``, ``QUIVER_INDEX_URL``, ``QUIVER_NO_INDEX``, and
         * ``QUIVER_LOG_LEVEL`` environment variables.
         */
        auto load_env() -> expected_t<void>;

        /** Configure the library logger. */
        void init_logging() const;

        [[nodiscard]] auto index_locations() const -> specs::IndexLocations;
        [[nodiscard]] auto tags() const -> specs::Tags;
        [[nodiscard]] auto hash_strategy() const -> specs::HashStrategy;
        [[nodiscard]] auto cache() const -> Cache;

        LoggingParams logging = {};
        CacheParams cache_params = {};
        IndexParams index_params = {};
        specs::TagsParams tags_params = {};
        HashParams hash_params = {};
    };
}

#endif
