#include <vibecli/core/commands.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/session.hpp>
#include <vibecli/core/utils.hpp>
#include <sstream>

namespace vibecli {

void CommandTable::add(const CommandDef& def) {
    commands_[def.name] = def;
}

bool CommandTable::handle(const std::string& line, Session& session, CommandReply& reply) const {
    std::string input = trim(line);
    size_t space = input.find_first_of(" \t");
    std::string name = to_lower(input.substr(0, space));
    std::string args = space == std::string::npos ? "" : trim(input.substr(space));
    
    std::map<std::string, CommandDef>::const_iterator it = commands_.find(name);
    if (it == commands_.end()) {
        return false;
    }
    LOG_DEBUG("Operator command %s", name.c_str());
    reply = it->second.handler(session, args);
    return true;
}

std::string CommandTable::help_text() const {
    std::ostringstream oss;
    oss << "Commands:\n";
    for (std::map<std::string, CommandDef>::const_iterator it = commands_.begin();
         it != commands_.end(); ++it) {
        oss << "  " << it->first << " - " << it->second.description << "\n";
    }
    oss << "\nAnything else is sent to the assistant.";
    return oss.str();
}

void register_core_commands(CommandTable& table) {
    table.add(CommandDef("exit", "Leave vibecli", commands::cmd_quit));
    table.add(CommandDef("quit", "Leave vibecli", commands::cmd_quit));
    table.add(CommandDef("/tree", "Show the tree of the current directory", commands::cmd_tree));
    table.add(CommandDef("/refresh", "Rescan the project context", commands::cmd_refresh));
    table.add(CommandDef("/status", "Show session status", commands::cmd_status));
    table.add(CommandDef("/clear", "Forget the conversation, keep the context", commands::cmd_clear));
    table.add(CommandDef("/help", "Show this help",
        [&table](Session&, const std::string&) { return CommandReply::say(table.help_text()); }));
    LOG_DEBUG("Operator commands registered: %zu", table.commands().size());
}

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

CommandReply cmd_quit(Session& /*session*/, const std::string& /*args*/) {
    return CommandReply::exit();
}

CommandReply cmd_tree(Session& session, const std::string& /*args*/) {
    return CommandReply::say(session.context_builder().render_tree(session.state().current_working_directory));
}

CommandReply cmd_refresh(Session& session, const std::string& /*args*/) {
    std::string tree = session.refresh_context(session.state());
    return CommandReply::say("Context refreshed.\n\nCurrent Structure:\n" + tree);
}

CommandReply cmd_status(Session& session, const std::string& /*args*/) {
    const SessionState& state = session.state();
    int ctx = session.find_context_entry();
    
    std::ostringstream oss;
    oss << "Root: " << state.root_directory << "\n"
        << "Directory: " << state.current_working_directory << "\n"
        << "Package manager: " << package_manager_name(state.package_manager) << "\n"
        << "Messages: " << state.message_history.size()
        << " (" << estimate_message_chars(state.message_history) << " chars)\n"
        << "Context: " << (ctx >= 0 ? "loaded" : "not loaded") << "\n"
        << "Backups: " << session.backups().directory();
    return CommandReply::say(oss.str());
}

CommandReply cmd_clear(Session& session, const std::string& /*args*/) {
    session.clear_conversation();
    return CommandReply::say("Conversation cleared. Project context kept.");
}

} // namespace commands

} // namespace vibecli
