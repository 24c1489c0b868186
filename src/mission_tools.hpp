#pragma once
#include "errors.hpp"
#include "tool_registry.hpp"
#include <string>
#include <vector>

namespace spychat {

class MissionBackend {
public:
    virtual ~MissionBackend() = default;
    virtual Result<std::string> fetch_mission_context(const std::string& mission_id) = 0;
};

// Reads <dir>/<mission_id>.txt.
class FileMissionBackend : public MissionBackend {
public:
    explicit FileMissionBackend(std::string dir) : dir_(std::move(dir)) {}
    Result<std::string> fetch_mission_context(const std::string& mission_id) override;

private:
    std::string dir_;
};

bool is_valid_mission_id(const std::string& id);

// Mission ids the text names explicitly: "mission atlas-9", "mission #42",
// "mission id: paris", or a bare "mission_123" token. Order of appearance,
// no duplicates.
std::vector<std::string> extract_mission_ids(const std::string& text);

bool mentions_mission(const std::string& text);

void register_mission_tools(ToolRegistry& reg, MissionBackend& backend);

} // namespace spychat
