#ifndef MIRAGE_GODOT_AGENT_STORE_H
#define MIRAGE_GODOT_AGENT_STORE_H

#include "agent_registry.h"

#include <godot_cpp/variant/string.hpp>

namespace Mirage {

// AgentStore over godot::FileAccess, so agent blobs can live under user:// or res://.
class GodotAgentStore : public AgentStore {
public:
    explicit GodotAgentStore(const godot::String& directory);

    bool contains(const std::string& key) const override;
    bool read(const std::string& key, std::vector<uint8_t>& blob) const override;
    bool write(const std::string& key, const std::vector<uint8_t>& blob) override;

private:
    godot::String path_for(const std::string& key) const;

    godot::String directory_;
};

} // namespace Mirage

#endif
