#include "server_registry.hpp"
#include <stdexcept>

namespace toolchat {

nlohmann::json ServerDefinition::to_json() const {
    nlohmann::json j;
    if (!name.empty()) j["name"] = name;
    if (!description.empty()) j["description"] = description;
    j["command"] = command;
    if (!args.empty()) j["args"] = args;
    if (!env.empty()) j["env"] = env;
    if (!working_dir.empty()) j["working_dir"] = working_dir;
    return j;
}

ServerDefinition ServerDefinition::from_json(const std::string& id, const nlohmann::json& j) {
    ServerDefinition def;
    def.id = id;
    def.name = j.value("name", id);
    def.description = j.value("description", "");
    def.command = j.value("command", "");
    def.working_dir = j.value("working_dir", "");
    if (j.contains("args") && j["args"].is_array()) {
        for (auto& a : j["args"]) {
            if (a.is_string()) def.args.push_back(a.get<std::string>());
        }
    }
    if (j.contains("env") && j["env"].is_object()) {
        for (auto& [k, v] : j["env"].items()) {
            if (v.is_string()) def.env[k] = v.get<std::string>();
        }
    }
    return def;
}

void ServerRegistry::add(ServerDefinition def, bool enabled) {
    if (def.id.empty()) {
        throw std::invalid_argument("Server definition has an empty id");
    }
    if (servers_.count(def.id)) {
        throw std::invalid_argument("Server '" + def.id + "' is already registered");
    }
    std::string id = def.id;
    if (def.name.empty()) def.name = id;
    servers_[id] = std::make_shared<const ServerDefinition>(std::move(def));
    if (enabled) enabled_.insert(id);
}

bool ServerRegistry::remove(const std::string& id) {
    enabled_.erase(id);
    return servers_.erase(id) > 0;
}

bool ServerRegistry::update(ServerDefinition def) {
    auto it = servers_.find(def.id);
    if (it == servers_.end()) return false;
    if (def.name.empty()) def.name = def.id;
    it->second = std::make_shared<const ServerDefinition>(std::move(def));
    return true;
}

ServerDefinitionPtr ServerRegistry::find(const std::string& id) const {
    auto it = servers_.find(id);
    return it == servers_.end() ? nullptr : it->second;
}

std::vector<ServerDefinitionPtr> ServerRegistry::list() const {
    std::vector<ServerDefinitionPtr> out;
    for (auto& [_, def] : servers_) out.push_back(def);
    return out;
}

void ServerRegistry::set_enabled(const std::string& id, bool enabled) {
    if (!servers_.count(id)) return;
    if (enabled) enabled_.insert(id);
    else enabled_.erase(id);
}

bool ServerRegistry::is_enabled(const std::string& id) const {
    return enabled_.count(id) > 0;
}

std::vector<ServerDefinition> ServerRegistry::enabled() const {
    std::vector<ServerDefinition> out;
    for (auto& id : enabled_) {
        auto it = servers_.find(id);
        if (it != servers_.end()) out.push_back(*it->second);
    }
    return out;
}

} // namespace toolchat
