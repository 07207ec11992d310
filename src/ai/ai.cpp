#include <vibecli/ai/ai.hpp>
#include <vibecli/core/utils.hpp>

namespace vibecli {

std::string role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::SYSTEM: return "system";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::USER: break;
    }
    return "user";
}

MessageRole string_to_role(const std::string& str) {
    std::string s = to_lower(trim(str));
    if (s == "system") return MessageRole::SYSTEM;
    if (s == "assistant") return MessageRole::ASSISTANT;
    return MessageRole::USER;
}

size_t estimate_message_chars(const std::vector<ConversationMessage>& messages) {
    size_t total = 0;
    for (size_t i = 0; i < messages.size(); ++i) {
        total += messages[i].content.size();
    }
    return total;
}

bool is_context_limit_error(const std::string& error) {
    std::string e = to_lower(error);
    bool mentions_limit = e.find("context") != std::string::npos ||
                          e.find("token") != std::string::npos;
    return (e.find("exceeds") != std::string::npos && mentions_limit) ||
           e.find("too long") != std::string::npos ||
           e.find("context length") != std::string::npos ||
           e.find("maximum context") != std::string::npos ||
           e.find("token limit") != std::string::npos;
}

} // namespace vibecli
