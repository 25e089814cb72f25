#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Catalog Cache
// ═══════════════════════════════════════════════════════════════════════════
// Last successfully fetched tools, prompts, resources and resource templates
// of one connection. Each list is replaced wholesale by a fetch and never
// edited in place; lookups see that snapshot until the next re-list.

#include "mcplink/client/client_error.hpp"
#include "mcplink/protocol/mcp_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

enum class CatalogKind {
    Tools,
    Prompts,
    Resources,
    ResourceTemplates
};

[[nodiscard]] constexpr std::string_view to_string(CatalogKind kind) noexcept {
    switch (kind) {
        case CatalogKind::Tools:             return "tools";
        case CatalogKind::Prompts:           return "prompts";
        case CatalogKind::Resources:         return "resources";
        case CatalogKind::ResourceTemplates: return "resource templates";
    }
    return "unknown";
}

/// List method for a catalog, e.g. "tools/list"
[[nodiscard]] const char* list_method(CatalogKind kind) noexcept;

/// Key holding the items in a list result, e.g. "resourceTemplates"
[[nodiscard]] const char* result_key(CatalogKind kind) noexcept;

template <typename T>
struct CatalogPage {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

// Parse one page of a list result. A missing or non-array item key is a
// protocol error; unknown fields inside items are ignored.
[[nodiscard]] ClientResult<CatalogPage<Tool>> parse_tool_page(const Json& result);
[[nodiscard]] ClientResult<CatalogPage<Prompt>> parse_prompt_page(const Json& result);
[[nodiscard]] ClientResult<CatalogPage<Resource>> parse_resource_page(const Json& result);
[[nodiscard]] ClientResult<CatalogPage<ResourceTemplate>> parse_resource_template_page(const Json& result);

class CatalogCache {
public:
    void replace_tools(std::vector<Tool> tools);
    void replace_prompts(std::vector<Prompt> prompts);
    void replace_resources(std::vector<Resource> resources);
    void replace_resource_templates(std::vector<ResourceTemplate> templates);

    [[nodiscard]] const std::vector<Tool>& tools() const noexcept { return tools_; }
    [[nodiscard]] const std::vector<Prompt>& prompts() const noexcept { return prompts_; }
    [[nodiscard]] const std::vector<Resource>& resources() const noexcept { return resources_; }
    [[nodiscard]] const std::vector<ResourceTemplate>& resource_templates() const noexcept {
        return resource_templates_;
    }

    /// True once the catalog has been fetched at least once
    [[nodiscard]] bool has(CatalogKind kind) const noexcept;

    [[nodiscard]] const Tool* find_tool(std::string_view name) const;
    [[nodiscard]] const Prompt* find_prompt(std::string_view name) const;

    /// Matches either the resource's URI or its name
    [[nodiscard]] const Resource* find_resource(std::string_view name_or_uri) const;

    [[nodiscard]] const ResourceTemplate* find_resource_template(std::string_view name) const;

    void clear();

private:
    std::vector<Tool> tools_;
    std::vector<Prompt> prompts_;
    std::vector<Resource> resources_;
    std::vector<ResourceTemplate> resource_templates_;

    bool has_tools_{false};
    bool has_prompts_{false};
    bool has_resources_{false};
    bool has_resource_templates_{false};
};

}  // namespace mcplink
