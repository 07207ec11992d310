/*
 * vibecli C++17 - Session state
 *
 * The one mutable value threaded through the control loop. Only the
 * Session and the dispatcher acting on its behalf change it.
 */
#ifndef vibecli_CORE_SESSION_STATE_HPP
#define vibecli_CORE_SESSION_STATE_HPP

#include "package_manager.hpp"
#include <vibecli/ai/ai.hpp>
#include <string>
#include <vector>

namespace vibecli {

struct SessionState {
    std::string root_directory;
    std::string current_working_directory;  // always an existing directory inside the root
    std::vector<ConversationMessage> message_history;
    PackageManager package_manager;
    
    SessionState() : package_manager(PackageManager::NPM) {}
};

// Rebuilds the context entry in state's history for its current working
// directory and returns the new tree rendering.
class ContextRefresher {
public:
    virtual ~ContextRefresher() {}
    virtual std::string refresh_context(SessionState& state) = 0;
};

} // namespace vibecli

#endif // vibecli_CORE_SESSION_STATE_HPP
