// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "quiver/specs/tags.hpp"

namespace quiver::specs
{
    auto incompatible_tag_name(IncompatibleTag tag) -> std::string_view
    {
        switch (tag)
        {
            case IncompatibleTag::invalid:
                return "invalid";
            case IncompatibleTag::python:
                return "python";
            case IncompatibleTag::abi:
                return "abi";
            case IncompatibleTag::platform:
                return "platform";
        }
        return "invalid";
    }

    /*************************************
     *  TagCompatibility implementation  *
     *************************************/

    TagCompatibility::TagCompatibility(
        bool compatible,
        priority_type priority,
        IncompatibleTag reason
    )
        : m_priority(priority)
        , m_reason(reason)
        , m_compatible(compatible)
    {
    }

    auto TagCompatibility::compatible(priority_type priority) -> TagCompatibility
    {
        return { true, priority, IncompatibleTag::invalid };
    }

    auto TagCompatibility::incompatible(IncompatibleTag reason) -> TagCompatibility
    {
        return { false, 0, reason };
    }

    auto TagCompatibility::is_compatible() const noexcept -> bool
    {
        return m_compatible;
    }

    auto TagCompatibility::priority() const noexcept -> priority_type
    {
        return m_priority;
    }

    auto TagCompatibility::reason() const noexcept -> IncompatibleTag
    {
        return m_reason;
    }

    auto TagCompatibility::to_string() const -> std::string
    {
        if (m_compatible)
        {
            return fmt::format("compatible (priority {})", m_priority);
        }
        return fmt::format("incompatible ({})", incompatible_tag_name(m_reason));
    }

    auto operator==(const TagCompatibility& left, const TagCompatibility& right) -> bool
    {
        return (left.m_compatible == right.m_compatible) && (left.m_priority == right.m_priority)
               && (left.m_reason == right.m_reason);
    }

    auto operator!=(const TagCompatibility& left, const TagCompatibility& right) -> bool
    {
        return !(left == right);
    }

    auto operator<(const TagCompatibility& left, const TagCompatibility& right) -> bool
    {
        if (left.m_compatible != right.m_compatible)
        {
            return right.m_compatible;
        }
        if (left.m_compatible)
        {
            return left.m_priority < right.m_priority;
        }
        return left.m_reason < right.m_reason;
    }

    auto operator<=(const TagCompatibility& left, const TagCompatibility& right) -> bool
    {
        return !(right < left);
    }

    auto operator>(const TagCompatibility& left, const TagCompatibility& right) -> bool
    {
        return right < left;
    }

    auto operator>=(const TagCompatibility& left, const TagCompatibility& right) -> bool
    {
        return !(left < right);
    }

    /************************
     *  Tag implementation  *
     ************************/

    auto Tag::to_string() const -> std::string
    {
        return fmt::format("{}", *this);
    }

    auto operator==(const Tag& left, const Tag& right) -> bool
    {
        return (left.python == right.python) && (left.abi == right.abi)
               && (left.platform == right.platform);
    }

    /*************************
     *  Tags implementation  *
     *************************/

    namespace
    {
        auto version_nodot(std::size_t major, std::size_t minor) -> std::string
        {
            return fmt::format("{}{}", major, minor);
        }

        // py312, py3, py311, ..., py30
        auto py_interpreter_range(std::size_t major, std::size_t minor) -> std::vector<std::string>
        {
            auto out = std::vector<std::string>();
            out.push_back(fmt::format("py{}", version_nodot(major, minor)));
            out.push_back(fmt::format("py{}", major));
            for (std::size_t m = minor; m-- > 0;)
            {
                out.push_back(fmt::format("py{}", version_nodot(major, m)));
            }
            return out;
        }
    }

    auto Tags::from_env(const TagsParams& params) -> Tags
    {
        const auto [major, minor] = params.python_version;
        const auto& platforms = params.platforms;
        const auto interpreter = params.implementation + version_nodot(major, minor);

        auto tags = tag_list();
        auto add_all = [&](const std::string& python, const std::string& abi)
        {
            for (const auto& platform : platforms)
            {
                tags.push_back({ python, abi, platform });
            }
        };

        if (params.implementation == "cp")
        {
            const bool use_abi3 = !params.free_threaded
                                  && ((major > 3) || ((major == 3) && (minor >= 2)));
            add_all(interpreter, params.free_threaded ? interpreter + "t" : interpreter);
            if (use_abi3)
            {
                add_all(interpreter, "abi3");
            }
            add_all(interpreter, "none");
            if (use_abi3)
            {
                for (std::size_t m = minor; m-- > 2;)
                {
                    add_all(fmt::format("cp{}", version_nodot(major, m)), "abi3");
                }
            }
        }
        else
        {
            add_all(interpreter, "none");
        }

        const auto generic = py_interpreter_range(major, minor);
        for (const auto& python : generic)
        {
            add_all(python, "none");
        }
        tags.push_back({ interpreter, "none", "any" });
        for (const auto& python : generic)
        {
            tags.push_back({ python, "none", "any" });
        }

        return Tags(std::move(tags));
    }

    Tags::Tags(tag_list tags)
        : m_tags(std::move(tags))
    {
        const auto size = m_tags.size();
        for (std::size_t i = 0; i < size; ++i)
        {
            const auto& tag = m_tags[i];
            // Earlier tags are preferred, a duplicate keeps its first priority
            m_map[tag.python][tag.abi].emplace(tag.platform, size - i);
        }
    }

    auto Tags::tags() const noexcept -> const tag_list&
    {
        return m_tags;
    }

    auto Tags::size() const noexcept -> std::size_t
    {
        return m_tags.size();
    }

    auto Tags::empty() const noexcept -> bool
    {
        return m_tags.empty();
    }

    auto Tags::compatibility(
        const std::vector<std::string>& python_tags,
        const std::vector<std::string>& abi_tags,
        const std::vector<std::string>& platform_tags
    ) const -> TagCompatibility
    {
        auto max_compatibility = TagCompatibility::incompatible(IncompatibleTag::invalid);

        for (const auto& python_tag : python_tags)
        {
            const auto abis = m_map.find(python_tag);
            if (abis == m_map.cend())
            {
                max_compatibility = std::max(
                    max_compatibility,
                    TagCompatibility::incompatible(IncompatibleTag::python)
                );
                continue;
            }
            for (const auto& abi_tag : abi_tags)
            {
                const auto platforms = abis->second.find(abi_tag);
                if (platforms == abis->second.cend())
                {
                    max_compatibility = std::max(
                        max_compatibility,
                        TagCompatibility::incompatible(IncompatibleTag::abi)
                    );
                    continue;
                }
                for (const auto& platform_tag : platform_tags)
                {
                    const auto priority = platforms->second.find(platform_tag);
                    max_compatibility = std::max(
                        max_compatibility,
                        (priority == platforms->second.cend())
                            ? TagCompatibility::incompatible(IncompatibleTag::platform)
                            : TagCompatibility::compatible(priority->second)
                    );
                }
            }
        }
        return max_compatibility;
    }

    auto Tags::is_compatible(const Tag& tag) const -> bool
    {
        return compatibility({ tag.python }, { tag.abi }, { tag.platform }).is_compatible();
    }
}
