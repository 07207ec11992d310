/*
 * vibecli C++17 - Operator commands
 *
 * Lines typed at the prompt that are handled locally instead of being sent
 * to the backend: exit, quit, /help, /tree, /refresh, /status, /clear.
 */
#ifndef vibecli_CORE_COMMANDS_HPP
#define vibecli_CORE_COMMANDS_HPP

#include <functional>
#include <map>
#include <string>

namespace vibecli {

class Session;

struct CommandReply {
    std::string text;
    bool quit;
    
    CommandReply() : quit(false) {}
    
    static CommandReply say(const std::string& text) {
        CommandReply r;
        r.text = text;
        return r;
    }
    
    static CommandReply exit() {
        CommandReply r;
        r.quit = true;
        return r;
    }
};

typedef std::function<CommandReply(Session& session, const std::string& args)> CommandHandler;

struct CommandDef {
    std::string name;
    std::string description;
    CommandHandler handler;
    
    CommandDef() {}
    CommandDef(const std::string& n, const std::string& d, CommandHandler h)
        : name(n), description(d), handler(h) {}
};

class CommandTable {
public:
    void add(const CommandDef& def);
    
    // False when line is not a registered command
    bool handle(const std::string& line, Session& session, CommandReply& reply) const;
    
    std::string help_text() const;
    
    const std::map<std::string, CommandDef>& commands() const { return commands_; }

private:
    std::map<std::string, CommandDef> commands_;
};

void register_core_commands(CommandTable& table);

namespace commands {

CommandReply cmd_quit(Session& session, const std::string& args);
CommandReply cmd_tree(Session& session, const std::string& args);
CommandReply cmd_refresh(Session& session, const std::string& args);
CommandReply cmd_status(Session& session, const std::string& args);
CommandReply cmd_clear(Session& session, const std::string& args);

} // namespace commands

} // namespace vibecli

#endif // vibecli_CORE_COMMANDS_HPP
