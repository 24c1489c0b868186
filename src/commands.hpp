#pragma once
#include <string>
#include <vector>

namespace spychat {

int cmd_init();
int cmd_chat(const std::string& spy_id, const std::string& message, const std::string& conversation_id);
int cmd_spies(const std::vector<std::string>& args);
int cmd_history(const std::string& conversation_id);

} // namespace spychat
