/*
 * vibecli C++17 - AI backend interface
 *
 * Plain chat-completion contract consumed by the session. No function
 * calling or structured output is assumed: actions travel inside the
 * response text.
 */
#ifndef vibecli_AI_AI_HPP
#define vibecli_AI_AI_HPP

#include <string>
#include <vector>
#include <functional>

namespace vibecli {

class Config;

enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT
};

std::string role_to_string(MessageRole role);
MessageRole string_to_role(const std::string& str);

struct ConversationMessage {
    MessageRole role;
    std::string content;
    
    ConversationMessage() : role(MessageRole::USER) {}
    ConversationMessage(MessageRole r, const std::string& c) : role(r), content(c) {}
    
    static ConversationMessage system(const std::string& content) {
        return ConversationMessage(MessageRole::SYSTEM, content);
    }
    static ConversationMessage user(const std::string& content) {
        return ConversationMessage(MessageRole::USER, content);
    }
    static ConversationMessage assistant(const std::string& content) {
        return ConversationMessage(MessageRole::ASSISTANT, content);
    }
};

struct CompletionOptions {
    std::string model;          // empty = provider default
    std::string system_prompt;  // prepended as a system message when set
    int max_tokens;             // 0 = provider default
    double temperature;         // < 0 = provider default
    
    CompletionOptions() : max_tokens(0), temperature(-1.0) {}
};

struct TokenUsage {
    int input_tokens;
    int output_tokens;
    int total_tokens;
    
    TokenUsage() : input_tokens(0), output_tokens(0), total_tokens(0) {}
};

struct CompletionResult {
    bool success;
    std::string content;
    std::string error;
    std::string model;
    std::string stop_reason;
    TokenUsage usage;
    
    CompletionResult() : success(false) {}
    
    static CompletionResult ok(const std::string& content) {
        CompletionResult r;
        r.success = true;
        r.content = content;
        return r;
    }
    
    static CompletionResult fail(const std::string& error) {
        CompletionResult r;
        r.success = false;
        r.error = error;
        return r;
    }
};

size_t estimate_message_chars(const std::vector<ConversationMessage>& messages);

// Provider error text that means the request did not fit the model window
bool is_context_limit_error(const std::string& error);

// Receives each text fragment of a streamed response as it arrives
typedef std::function<void(const std::string&)> FragmentCallback;

class AIPlugin {
public:
    virtual ~AIPlugin() {}
    
    virtual bool init(const Config& cfg) = 0;
    virtual std::string provider_id() const = 0;
    virtual std::string default_model() const = 0;
    virtual bool is_configured() const = 0;
    
    virtual CompletionResult chat(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts = CompletionOptions()
    ) = 0;
    
    // Streaming variant. The returned result carries the full concatenated
    // content. Providers without streaming deliver the whole text as one
    // fragment.
    virtual CompletionResult chat_stream(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts,
        const FragmentCallback& on_fragment
    ) {
        CompletionResult r = chat(messages, opts);
        if (r.success && on_fragment && !r.content.empty()) {
            on_fragment(r.content);
        }
        return r;
    }
};

} // namespace vibecli

#endif // vibecli_AI_AI_HPP
