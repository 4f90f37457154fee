#include "agent_registry.h"

#include "errors.h"
#include "logging.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <shared_mutex>
#include <sstream>
#include <system_error>

namespace Mirage {

// --- FileAgentStore ---

FileAgentStore::FileAgentStore(std::string directory) : directory_(std::move(directory)) {}

std::string FileAgentStore::path_for(const std::string& key) const {
    std::string name;
    name.reserve(key.size());
    for (unsigned char c : key) {
        name.push_back((std::isalnum(c) || c == '_' || c == '@' || c == '.' || c == '-') ? static_cast<char>(c) : '_');
    }
    return (std::filesystem::path(directory_) / ("agent_" + name + ".bin")).string();
}

bool FileAgentStore::contains(const std::string& key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for(key), ec);
}

bool FileAgentStore::read(const std::string& key, std::vector<uint8_t>& blob) const {
    std::ifstream file(path_for(key), std::ios::binary);
    if (!file.is_open()) return false;
    blob.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool FileAgentStore::write(const std::string& key, const std::vector<uint8_t>& blob) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        logger()->error("cannot create agent directory {}: {}", directory_, ec.message());
        return false;
    }
    const std::string path = path_for(key);
    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) return false;
        file.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
        if (!file) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    return !ec;
}

// --- AgentRegistry ---

AgentRegistry::AgentRegistry(const AgentConfig& defaults, std::shared_ptr<AgentStore> store)
    : defaults_(defaults), store_(std::move(store)) {}

std::shared_ptr<AgentRegistry::Slot> AgentRegistry::slot(const std::string& key) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::shared_ptr<Slot>& s = slots_[key];
    if (!s) s = std::make_shared<Slot>();
    return s;
}

std::shared_ptr<Agent> AgentRegistry::read_stored(const std::string& key) const {
    if (!store_ || !store_->contains(key)) return nullptr;
    std::vector<uint8_t> blob;
    if (!store_->read(key, blob)) {
        logger()->warn("agent '{}': stored blob could not be read", key);
        return nullptr;
    }
    std::istringstream in(std::string(blob.begin(), blob.end()), std::ios::binary);
    std::unique_ptr<Agent> agent = Agent::load(in, defaults_);
    if (!agent) {
        logger()->warn("agent '{}': stored blob is malformed", key);
        return nullptr;
    }
    return std::shared_ptr<Agent>(std::move(agent));
}

std::shared_ptr<Agent> AgentRegistry::get_or_create(const std::string& key, int state_dim, int action_dim) {
    std::shared_ptr<Slot> s = slot(key);
    std::lock_guard<std::mutex> lock(s->mutex);

    if (!s->agent) {
        s->agent = read_stored(key);
        if (s->agent) {
            logger()->info("agent '{}' loaded from store", key);
        } else {
            AgentConfig config = defaults_;
            config.model.state_dim = state_dim;
            config.model.action_dim = action_dim;
            config.model.seed = defaults_.model.seed ^ static_cast<unsigned int>(std::hash<std::string>{}(key));
            s->agent = std::make_shared<Agent>(config);
            logger()->info("agent '{}' created fresh ({} -> {})", key, state_dim, action_dim);
        }
    }

    if (s->agent->state_dim() != state_dim || s->agent->action_dim() != action_dim) {
        logger()->error("agent '{}' has dims ({}, {}), requested ({}, {})", key, s->agent->state_dim(),
                        s->agent->action_dim(), state_dim, action_dim);
        throw ConfigurationError("agent '" + key + "' dimension mismatch: has (" + std::to_string(s->agent->state_dim()) +
                                 ", " + std::to_string(s->agent->action_dim()) + "), requested (" +
                                 std::to_string(state_dim) + ", " + std::to_string(action_dim) + ")");
    }
    return s->agent;
}

std::shared_ptr<Agent> AgentRegistry::find(const std::string& key) const {
    std::shared_ptr<Slot> s;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) return nullptr;
        s = it->second;
    }
    std::lock_guard<std::mutex> lock(s->mutex);
    return s->agent;
}

bool AgentRegistry::save(const std::string& key, bool confirm_after_instability) {
    std::shared_ptr<Agent> agent = find(key);
    if (!agent) {
        logger()->warn("save: no agent cached for '{}'", key);
        return false;
    }
    if (!store_) return false;

    // Held through the write so no update can flag the agent between the check and the blob.
    std::shared_lock<std::shared_mutex> lock(agent->mutex());
    if (agent->instability_flagged() && !confirm_after_instability) {
        logger()->warn("save: agent '{}' skipped an unstable update; not persisting without confirmation", key);
        return false;
    }
    std::ostringstream out(std::ios::binary);
    if (!agent->save(out)) return false;
    const std::string bytes = out.str();
    if (!store_->write(key, std::vector<uint8_t>(bytes.begin(), bytes.end()))) {
        logger()->error("save: writing agent '{}' failed", key);
        return false;
    }
    if (confirm_after_instability) agent->clear_instability_flag();
    logger()->info("agent '{}' saved ({} bytes)", key, bytes.size());
    return true;
}

std::shared_ptr<Agent> AgentRegistry::load(const std::string& key) {
    std::shared_ptr<Slot> s = slot(key);
    std::lock_guard<std::mutex> lock(s->mutex);
    std::shared_ptr<Agent> stored = read_stored(key);
    if (!stored) {
        logger()->info("load: nothing stored for '{}'", key);
        return nullptr;
    }
    if (!s->agent) {
        s->agent = stored;
        return stored;
    }
    if (stored->state_dim() != s->agent->state_dim() || stored->action_dim() != s->agent->action_dim()) {
        logger()->warn("load: stored agent '{}' has dims ({}, {}), cached has ({}, {}); keeping the cached one", key,
                       stored->state_dim(), stored->action_dim(), s->agent->state_dim(), s->agent->action_dim());
        return nullptr;
    }
    // Holders of the cached pointer (an in-flight training run) keep updating the same object.
    std::unique_lock<std::shared_mutex> agent_lock(s->agent->mutex());
    s->agent->restore_from(*stored);
    return s->agent;
}

size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    size_t count = 0;
    for (const auto& entry : slots_) {
        std::lock_guard<std::mutex> slot_lock(entry.second->mutex);
        if (entry.second->agent) count++;
    }
    return count;
}

} // namespace Mirage
