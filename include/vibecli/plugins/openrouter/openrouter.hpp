/*
 * vibecli C++17 - OpenRouter AI Plugin
 * 
 * Implementation of the OpenRouter API.
 * Uses the OpenAI-compatible API (https://openrouter.ai/api/v1/chat/completions).
 * 
 * Config:
 *   openrouter.api_key     - OpenRouter API key (OPENROUTER_API_KEY overrides)
 *   openrouter.model       - Default model (optional, defaults to openai/gpt-4o)
 *   openrouter.api_url     - API base URL (optional, defaults to https://openrouter.ai/api/v1)
 *   openrouter.stream      - Stream responses (default true)
 *   openrouter.max_tokens  - Response token cap (0 = provider default)
 *   openrouter.temperature - Sampling temperature (< 0 = provider default)
 *   openrouter.timeout     - Total request timeout in seconds (default 300)
 *   openrouter.app_title   - Value sent in the X-Title header
 */
#ifndef vibecli_PLUGINS_OPENROUTER_HPP
#define vibecli_PLUGINS_OPENROUTER_HPP

#include <vibecli/ai/ai.hpp>
#include <vibecli/core/http_client.hpp>
#include <vibecli/core/json.hpp>
#include <string>
#include <vector>

namespace vibecli {

// Incremental decoder for the Server-Sent Events body of a streamed
// completion. Network chunks may split lines anywhere.
class SseStreamDecoder {
public:
    SseStreamDecoder();
    
    // Feed raw bytes; returns the content fragments completed by them.
    std::vector<std::string> feed(const std::string& chunk);
    
    // Flush a trailing line without newline.
    std::vector<std::string> finish();
    
    bool done() const { return done_; }
    const std::string& model() const { return model_; }
    const std::string& stop_reason() const { return stop_reason_; }
    const std::string& error() const { return error_; }
    const TokenUsage& usage() const { return usage_; }

private:
    std::string pending_;
    bool done_;
    std::string model_;
    std::string stop_reason_;
    std::string error_;
    TokenUsage usage_;
    
    void handle_line(const std::string& line, std::vector<std::string>& out);
};

// "<code>: <message>" from an OpenAI-style error object, or "API error"
std::string decode_api_error(const Json& resp);

class OpenRouterAI : public AIPlugin {
public:
    OpenRouterAI();
    
    bool init(const Config& cfg) override;
    std::string provider_id() const override;
    std::string default_model() const override;
    bool is_configured() const override;
    
    CompletionResult chat(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts = CompletionOptions()
    ) override;
    
    CompletionResult chat_stream(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts,
        const FragmentCallback& on_fragment
    ) override;
    
    bool streaming_enabled() const { return stream_; }

private:
    std::string api_key_;
    std::string default_model_;
    std::string api_url_;
    std::string app_title_;
    bool stream_;
    int max_tokens_;
    double temperature_;
    long timeout_seconds_;
    bool initialized_;
    
    std::string build_request(const std::vector<ConversationMessage>& messages,
                              const CompletionOptions& opts,
                              bool stream) const;
    std::map<std::string, std::string> build_headers() const;
};

} // namespace vibecli

#endif // vibecli_PLUGINS_OPENROUTER_HPP
