#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <nlohmann/json.hpp>

namespace toolchat {

// Launch recipe for one external tool server. Immutable once registered.
struct ServerDefinition {
    std::string id;
    std::string name;          // display name, also accepted as a tool namespace
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // merged over the parent environment
    std::string working_dir;

    nlohmann::json to_json() const;
    static ServerDefinition from_json(const std::string& id, const nlohmann::json& j);
};

using ServerDefinitionPtr = std::shared_ptr<const ServerDefinition>;

class ServerRegistry {
public:
    // Throws std::invalid_argument on an empty or duplicate id.
    void add(ServerDefinition def, bool enabled = false);
    bool remove(const std::string& id);
    // Replaces the stored record; the enabled flag is left untouched.
    bool update(ServerDefinition def);

    ServerDefinitionPtr find(const std::string& id) const;
    std::vector<ServerDefinitionPtr> list() const;

    void set_enabled(const std::string& id, bool enabled);
    bool is_enabled(const std::string& id) const;
    std::vector<ServerDefinition> enabled() const;

    size_t size() const { return servers_.size(); }

private:
    std::map<std::string, ServerDefinitionPtr> servers_;
    std::set<std::string> enabled_;
};

} // namespace toolchat
