#include "mcp/ToolCatalog.h"
#include <set>

ToolDescriptor ToolDescriptor::fromJson(const nlohmann::json& j) {
    ToolDescriptor d;
    d.name = j.value("name", "");
    if (j.contains("description") && j["description"].is_string()) {
        d.description = j["description"].get<std::string>();
    }
    d.inputSchema = j.value("inputSchema", nlohmann::json::object());

    std::set<std::string> required;
    if (d.inputSchema.contains("required") && d.inputSchema["required"].is_array()) {
        for (const auto& r : d.inputSchema["required"]) {
            if (r.is_string()) required.insert(r.get<std::string>());
        }
    }
    if (d.inputSchema.contains("properties") && d.inputSchema["properties"].is_object()) {
        for (const auto& [key, prop] : d.inputSchema["properties"].items()) {
            Parameter p;
            if (prop.is_object() && prop.contains("type") && prop["type"].is_string()) {
                p.type = prop["type"].get<std::string>();
            }
            p.required = required.count(key) > 0;
            d.parameters[key] = p;
        }
    }
    return d;
}

void ToolCatalog::replace(const nlohmann::json& toolArray) {
    tools.clear();
    if (!toolArray.is_array()) return;
    for (const auto& item : toolArray) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) continue;
        auto descriptor = ToolDescriptor::fromJson(item);
        tools[descriptor.name] = std::move(descriptor);
    }
}

const ToolDescriptor* ToolCatalog::find(const std::string& name) const {
    auto it = tools.find(name);
    if (it == tools.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> ToolCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(tools.size());
    for (const auto& [name, descriptor] : tools) out.push_back(name);
    return out;
}

std::optional<std::string> ToolCatalog::resolve(const std::vector<std::string>& candidates) const {
    for (const auto& name : candidates) {
        if (contains(name)) return name;
    }
    return std::nullopt;
}
