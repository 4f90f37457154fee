#include "godot_agent_store.h"

#include <godot_cpp/classes/dir_access.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/variant/packed_byte_array.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

#include <cctype>
#include <cstring>

namespace Mirage {

GodotAgentStore::GodotAgentStore(const godot::String& directory) : directory_(directory) {}

godot::String GodotAgentStore::path_for(const std::string& key) const {
    std::string name;
    for (unsigned char c : key) {
        name.push_back((std::isalnum(c) || c == '_' || c == '@' || c == '.' || c == '-') ? static_cast<char>(c) : '_');
    }
    return directory_.path_join(godot::String(("agent_" + name + ".bin").c_str()));
}

bool GodotAgentStore::contains(const std::string& key) const {
    return godot::FileAccess::file_exists(path_for(key));
}

bool GodotAgentStore::read(const std::string& key, std::vector<uint8_t>& blob) const {
    godot::Ref<godot::FileAccess> file = godot::FileAccess::open(path_for(key), godot::FileAccess::READ);
    if (file.is_null() || !file->is_open()) return false;
    godot::PackedByteArray buffer = file->get_buffer(static_cast<int64_t>(file->get_length()));
    godot::Error err = file->get_error();
    file->close();
    if (err != godot::OK && err != godot::ERR_FILE_EOF) return false;
    blob.resize(buffer.size());
    if (buffer.size() > 0) std::memcpy(blob.data(), buffer.ptr(), buffer.size());
    return true;
}

bool GodotAgentStore::write(const std::string& key, const std::vector<uint8_t>& blob) {
    godot::Error dir_err = godot::DirAccess::make_dir_recursive_absolute(directory_);
    if (dir_err != godot::OK && dir_err != godot::ERR_ALREADY_EXISTS) {
        godot::UtilityFunctions::print("Mirage: cannot create agent directory ", directory_);
        return false;
    }
    godot::Ref<godot::FileAccess> file = godot::FileAccess::open(path_for(key), godot::FileAccess::WRITE);
    if (file.is_null() || !file->is_open()) {
        godot::UtilityFunctions::print("Mirage: cannot open agent file for ", godot::String(key.c_str()));
        return false;
    }
    godot::PackedByteArray buffer;
    buffer.resize(static_cast<int64_t>(blob.size()));
    if (!blob.empty()) std::memcpy(buffer.ptrw(), blob.data(), blob.size());
    file->store_buffer(buffer);
    godot::Error err = file->get_error();
    file->close();
    return err == godot::OK;
}

} // namespace Mirage
