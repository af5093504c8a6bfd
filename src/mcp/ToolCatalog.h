#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

/**
 * @brief One tool advertised by the server's tools/list.
 */
struct ToolDescriptor {
    struct Parameter {
        std::string type;
        bool required = false;
    };

    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    std::map<std::string, Parameter> parameters;

    static ToolDescriptor fromJson(const nlohmann::json& j);
};

/**
 * @brief Tools discovered on the current connection, keyed by name.
 *
 * Rebuilt on every (re)connect and read-only in between. An empty catalog
 * means "no tools known", never an error by itself.
 */
class ToolCatalog {
public:
    /** Replaces the catalog with the entries of a tools/list "tools" array. */
    void replace(const nlohmann::json& tools);
    void clear() { tools.clear(); }

    bool contains(const std::string& name) const { return tools.count(name) > 0; }
    const ToolDescriptor* find(const std::string& name) const;
    bool empty() const { return tools.empty(); }
    size_t size() const { return tools.size(); }
    std::vector<std::string> names() const;

    /**
     * @brief First candidate present in the catalog.
     * Candidate order encodes preference.
     */
    std::optional<std::string> resolve(const std::vector<std::string>& candidates) const;

private:
    std::map<std::string, ToolDescriptor> tools;
};
