#ifndef MIRAGE_AGENT_REGISTRY_H
#define MIRAGE_AGENT_REGISTRY_H

#include "agent.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Mirage {

// Durable blob storage keyed by character identity.
class AgentStore {
public:
    virtual ~AgentStore() = default;

    virtual bool contains(const std::string& key) const = 0;
    // False when the key is absent or the read failed.
    virtual bool read(const std::string& key, std::vector<uint8_t>& blob) const = 0;
    virtual bool write(const std::string& key, const std::vector<uint8_t>& blob) = 0;
};

// One agent_<key>.bin per identity under a directory. Characters outside [A-Za-z0-9_@.-] in the
// key are replaced by '_' in the file name.
class FileAgentStore : public AgentStore {
public:
    explicit FileAgentStore(std::string directory);

    bool contains(const std::string& key) const override;
    bool read(const std::string& key, std::vector<uint8_t>& blob) const override;
    bool write(const std::string& key, const std::vector<uint8_t>& blob) override;

    std::string path_for(const std::string& key) const;

private:
    std::string directory_;
};

// Process-wide key -> Agent cache backed by an optional AgentStore.
//
// get_or_create() for one key is serialized on a per-key mutex, so concurrent first requests
// observe a single Agent; different keys never wait on each other beyond the short map lookup.
class AgentRegistry {
public:
    AgentRegistry(const AgentConfig& defaults, std::shared_ptr<AgentStore> store);

    // Cached agent, else the stored one, else a freshly initialised one (a missing blob is not an
    // error). Throws ConfigurationError if the agent found has different dimensions.
    std::shared_ptr<Agent> get_or_create(const std::string& key, int state_dim, int action_dim);

    // Cached agent or nullptr; never touches the store.
    std::shared_ptr<Agent> find(const std::string& key) const;

    // Snapshot of the cached agent, taken and written under its shared lock so an in-flight update
    // is never half-written. Refuses (returns false) while the agent carries an instability flag
    // unless confirm_after_instability is set, in which case the flag is cleared on success.
    bool save(const std::string& key, bool confirm_after_instability = false);

    // Reads the stored agent into the cached one in place (under its exclusive lock), so existing
    // holders see the loaded parameters. nullptr when nothing is stored for the key, the blob is
    // unreadable, or its dimensions differ from the cached agent's.
    std::shared_ptr<Agent> load(const std::string& key);

    const AgentConfig& defaults() const { return defaults_; }
    size_t size() const;

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<Agent> agent;
    };

    std::shared_ptr<Slot> slot(const std::string& key);
    std::shared_ptr<Agent> read_stored(const std::string& key) const;

    AgentConfig defaults_;
    std::shared_ptr<AgentStore> store_;
    mutable std::mutex slots_mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace Mirage

#endif
