#include "mcplink/client/catalog_cache.hpp"

#include <algorithm>

namespace mcplink {

namespace {

template <typename T>
ClientResult<CatalogPage<T>> parse_page(const Json& result, CatalogKind kind) {
    const char* key = result_key(kind);
    if (!result.is_object() || !result.contains(key) || !result[key].is_array()) {
        return tl::unexpected(ClientError::protocol_error(
            std::string("List result has no '") + key + "' array"));
    }

    CatalogPage<T> page;
    try {
        page.items.reserve(result[key].size());
        for (const auto& entry : result[key]) {
            if (!entry.is_object()) {
                return tl::unexpected(ClientError::protocol_error(
                    std::string("Non-object entry in '") + key + "'"));
            }
            page.items.push_back(T::from_json(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(ClientError::protocol_error(
            "Malformed " + std::string(to_string(kind)) + " entry: " + e.what()));
    }

    if (result.contains("nextCursor") && result["nextCursor"].is_string()) {
        page.next_cursor = result["nextCursor"].get<std::string>();
    }
    return page;
}

template <typename T, typename Pred>
const T* find_in(const std::vector<T>& items, Pred pred) {
    const auto it = std::find_if(items.begin(), items.end(), pred);
    return it == items.end() ? nullptr : &*it;
}

}  // namespace

const char* list_method(CatalogKind kind) noexcept {
    switch (kind) {
        case CatalogKind::Tools:             return method::ToolsList;
        case CatalogKind::Prompts:           return method::PromptsList;
        case CatalogKind::Resources:         return method::ResourcesList;
        case CatalogKind::ResourceTemplates: return method::ResourceTemplatesList;
    }
    return method::ToolsList;
}

const char* result_key(CatalogKind kind) noexcept {
    switch (kind) {
        case CatalogKind::Tools:             return "tools";
        case CatalogKind::Prompts:           return "prompts";
        case CatalogKind::Resources:         return "resources";
        case CatalogKind::ResourceTemplates: return "resourceTemplates";
    }
    return "tools";
}

ClientResult<CatalogPage<Tool>> parse_tool_page(const Json& result) {
    return parse_page<Tool>(result, CatalogKind::Tools);
}

ClientResult<CatalogPage<Prompt>> parse_prompt_page(const Json& result) {
    return parse_page<Prompt>(result, CatalogKind::Prompts);
}

ClientResult<CatalogPage<Resource>> parse_resource_page(const Json& result) {
    return parse_page<Resource>(result, CatalogKind::Resources);
}

ClientResult<CatalogPage<ResourceTemplate>> parse_resource_template_page(const Json& result) {
    return parse_page<ResourceTemplate>(result, CatalogKind::ResourceTemplates);
}

// ─────────────────────────────────────────────────────────────────────────────
// CatalogCache
// ─────────────────────────────────────────────────────────────────────────────

void CatalogCache::replace_tools(std::vector<Tool> tools) {
    tools_ = std::move(tools);
    has_tools_ = true;
}

void CatalogCache::replace_prompts(std::vector<Prompt> prompts) {
    prompts_ = std::move(prompts);
    has_prompts_ = true;
}

void CatalogCache::replace_resources(std::vector<Resource> resources) {
    resources_ = std::move(resources);
    has_resources_ = true;
}

void CatalogCache::replace_resource_templates(std::vector<ResourceTemplate> templates) {
    resource_templates_ = std::move(templates);
    has_resource_templates_ = true;
}

bool CatalogCache::has(CatalogKind kind) const noexcept {
    switch (kind) {
        case CatalogKind::Tools:             return has_tools_;
        case CatalogKind::Prompts:           return has_prompts_;
        case CatalogKind::Resources:         return has_resources_;
        case CatalogKind::ResourceTemplates: return has_resource_templates_;
    }
    return false;
}

const Tool* CatalogCache::find_tool(std::string_view name) const {
    return find_in(tools_, [name](const Tool& t) { return t.name == name; });
}

const Prompt* CatalogCache::find_prompt(std::string_view name) const {
    return find_in(prompts_, [name](const Prompt& p) { return p.name == name; });
}

const Resource* CatalogCache::find_resource(std::string_view name_or_uri) const {
    if (const auto* by_uri = find_in(resources_, [name_or_uri](const Resource& r) { return r.uri == name_or_uri; })) {
        return by_uri;
    }
    return find_in(resources_, [name_or_uri](const Resource& r) { return r.name == name_or_uri; });
}

const ResourceTemplate* CatalogCache::find_resource_template(std::string_view name) const {
    return find_in(resource_templates_, [name](const ResourceTemplate& t) { return t.name == name; });
}

void CatalogCache::clear() {
    tools_.clear();
    prompts_.clear();
    resources_.clear();
    resource_templates_.clear();
    has_tools_ = false;
    has_prompts_ = false;
    has_resources_ = false;
    has_resource_templates_ = false;
}

}  // namespace mcplink
