#include <vibecli/plugins/openrouter/openrouter.hpp>
#include <vibecli/core/config.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include <cstdlib>

namespace vibecli {

// ============================================================================
// SSE decoding
// ============================================================================

SseStreamDecoder::SseStreamDecoder()
    : done_(false)
{}

std::vector<std::string> SseStreamDecoder::feed(const std::string& chunk) {
    std::vector<std::string> out;
    pending_ += chunk;
    
    size_t pos;
    while ((pos = pending_.find('\n')) != std::string::npos) {
        std::string line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        handle_line(line, out);
    }
    return out;
}

std::vector<std::string> SseStreamDecoder::finish() {
    std::vector<std::string> out;
    if (!pending_.empty()) {
        std::string line = rtrim(pending_);
        pending_.clear();
        handle_line(line, out);
    }
    return out;
}

void SseStreamDecoder::handle_line(const std::string& line, std::vector<std::string>& out) {
    // Blank lines separate events; ':' lines are keep-alive comments
    if (line.empty() || line[0] == ':' || done_) {
        return;
    }
    if (!starts_with(line, "data:")) {
        return;
    }
    
    std::string payload = trim(line.substr(5));
    if (payload == "[DONE]") {
        done_ = true;
        return;
    }
    
    Json event;
    try {
        event = Json::parse(payload);
    } catch (const std::exception& e) {
        LOG_DEBUG("Skipping malformed SSE payload: %s", e.what());
        return;
    }
    if (!event.is_object()) {
        return;
    }
    
    if (event.contains("error")) {
        error_ = decode_api_error(event);
        return;
    }
    
    if (model_.empty()) {
        model_ = event.value("model", std::string(""));
    }
    
    if (event.contains("choices") && event["choices"].is_array() && !event["choices"].empty()) {
        const Json& choice = event["choices"][0];
        if (choice.contains("delta") && choice["delta"].is_object()) {
            const Json& delta = choice["delta"];
            if (delta.contains("content") && delta["content"].is_string()) {
                std::string text = delta["content"].get<std::string>();
                if (!text.empty()) {
                    out.push_back(text);
                }
            }
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            stop_reason_ = choice["finish_reason"].get<std::string>();
        }
    }
    
    if (event.contains("usage") && event["usage"].is_object()) {
        const Json& usage = event["usage"];
        usage_.input_tokens = usage.value("prompt_tokens", 0);
        usage_.output_tokens = usage.value("completion_tokens", 0);
        usage_.total_tokens = usage.value("total_tokens", 0);
    }
}

std::string decode_api_error(const Json& resp) {
    std::string error_msg = "API error";
    if (resp.is_object() && resp.contains("error") && resp["error"].is_object()) {
        const Json& err = resp["error"];
        std::string msg = err.value("message", std::string(""));
        // code may be a string or a number
        std::string code_str;
        if (err.contains("code")) {
            const Json& code_field = err["code"];
            if (code_field.is_string()) {
                code_str = code_field.get<std::string>();
            } else if (code_field.is_number()) {
                code_str = std::to_string(code_field.get<int64_t>());
            }
        }
        if (!msg.empty()) {
            error_msg = code_str.empty() ? msg : (code_str + ": " + msg);
        }
    }
    return error_msg;
}

// ============================================================================
// OpenRouterAI
// ============================================================================

OpenRouterAI::OpenRouterAI()
    : api_key_()
    , default_model_("openai/gpt-4o")
    , api_url_("https://openrouter.ai/api/v1")
    , app_title_("vibecli")
    , stream_(true)
    , max_tokens_(0)
    , temperature_(-1.0)
    , timeout_seconds_(300)
    , initialized_(false)
{}

bool OpenRouterAI::init(const Config& cfg) {
    api_key_ = cfg.get_string("openrouter.api_key", "");
    const char* env_key = getenv("OPENROUTER_API_KEY");
    if (env_key && env_key[0] != '\0') {
        api_key_ = env_key;
    }
    
    std::string model = cfg.get_string("openrouter.model", "");
    if (!model.empty()) {
        default_model_ = model;
    }
    
    std::string url = cfg.get_string("openrouter.api_url", "");
    if (!url.empty()) {
        api_url_ = url;
    }
    
    // Remove trailing slash from URL
    while (!api_url_.empty() && api_url_[api_url_.length() - 1] == '/') {
        api_url_ = api_url_.substr(0, api_url_.length() - 1);
    }
    
    app_title_ = cfg.get_string("openrouter.app_title", app_title_);
    stream_ = cfg.get_bool("openrouter.stream", true);
    max_tokens_ = static_cast<int>(cfg.get_int("openrouter.max_tokens", 0));
    temperature_ = cfg.get_double("openrouter.temperature", -1.0);
    timeout_seconds_ = static_cast<long>(cfg.get_int("openrouter.timeout", 300));
    
    if (api_key_.empty()) {
        LOG_WARN("OpenRouter AI: No API key configured (set openrouter.api_key or OPENROUTER_API_KEY)");
        initialized_ = false;
        return false;
    }
    
    LOG_INFO("OpenRouter AI initialized with model: %s (streaming %s)",
             default_model_.c_str(), stream_ ? "on" : "off");
    initialized_ = true;
    return true;
}

std::string OpenRouterAI::provider_id() const { return "openrouter"; }

std::string OpenRouterAI::default_model() const { return default_model_; }

bool OpenRouterAI::is_configured() const { return !api_key_.empty(); }

std::string OpenRouterAI::build_request(const std::vector<ConversationMessage>& messages,
                                        const CompletionOptions& opts,
                                        bool stream) const {
    Json request = Json::object();
    
    std::string model = opts.model.empty() ? default_model_ : opts.model;
    request["model"] = model;
    
    Json msgs = Json::array();
    if (!opts.system_prompt.empty()) {
        Json sys_msg = Json::object();
        sys_msg["role"] = "system";
        sys_msg["content"] = sanitize_utf8(opts.system_prompt);
        msgs.push_back(sys_msg);
    }
    
    for (size_t i = 0; i < messages.size(); ++i) {
        const ConversationMessage& msg = messages[i];
        Json m = Json::object();
        m["role"] = role_to_string(msg.role);
        m["content"] = sanitize_utf8(msg.content);
        msgs.push_back(m);
        
        LOG_DEBUG("▶ [%zu] %s (%zu chars): %.200s%s", 
                  i, role_to_string(msg.role).c_str(), 
                  msg.content.size(), msg.content.c_str(),
                  msg.content.size() > 200 ? "..." : "");
    }
    request["messages"] = msgs;
    
    double temperature = opts.temperature >= 0.0 ? opts.temperature : temperature_;
    if (temperature >= 0.0) {
        request["temperature"] = temperature;
    }
    
    int max_tokens = opts.max_tokens > 0 ? opts.max_tokens : max_tokens_;
    if (max_tokens > 0) {
        request["max_tokens"] = static_cast<int64_t>(max_tokens);
    }
    
    if (stream) {
        request["stream"] = true;
    }
    
    return request.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::map<std::string, std::string> OpenRouterAI::build_headers() const {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Authorization"] = "Bearer " + api_key_;
    headers["X-Title"] = app_title_;
    return headers;
}

CompletionResult OpenRouterAI::chat(
    const std::vector<ConversationMessage>& messages,
    const CompletionOptions& opts
) {
    if (!initialized_) {
        return CompletionResult::fail("OpenRouter AI not initialized");
    }
    if (messages.empty()) {
        return CompletionResult::fail("No messages provided");
    }
    
    std::string endpoint = api_url_ + "/chat/completions";
    std::string request_body = build_request(messages, opts, false);
    LOG_DEBUG("▶ IN  Sending request to %s (%zu bytes)", endpoint.c_str(), request_body.size());
    
    HttpClient http;
    http.set_timeout(timeout_seconds_);
    HttpResponse response = http.post_json(endpoint, request_body, build_headers());
    
    if (response.aborted) {
        return CompletionResult::fail("interrupted");
    }
    if (response.status_code == 0) {
        LOG_ERROR("HTTP request failed: %s", response.error.c_str());
        return CompletionResult::fail("HTTP request failed: " + response.error);
    }
    
    LOG_DEBUG("◀ OUT Received response [HTTP %d] (%zu bytes)", 
              response.status_code, response.body.size());
    
    Json resp;
    try {
        resp = Json::parse(sanitize_utf8(response.body));
    } catch (const std::exception& e) {
        if (response.status_code != 200) {
            return CompletionResult::fail("API error (HTTP " + std::to_string(response.status_code) + ")");
        }
        LOG_ERROR("Failed to parse JSON response: %s", e.what());
        return CompletionResult::fail("Invalid JSON response: " + std::string(e.what()));
    }
    
    if (response.status_code != 200) {
        std::string error_msg = decode_api_error(resp);
        LOG_ERROR("API error: %s (HTTP %d)", error_msg.c_str(), response.status_code);
        return CompletionResult::fail(error_msg + " (HTTP " +
                                      std::to_string(response.status_code) + ")");
    }
    
    CompletionResult result;
    result.success = true;
    result.model = resp.value("model", std::string(""));
    
    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const Json& first_choice = resp["choices"][0];
        if (first_choice.contains("message") && first_choice["message"].is_object()) {
            const Json& message = first_choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                result.content = message["content"].get<std::string>();
            }
        }
        if (first_choice.contains("finish_reason") && first_choice["finish_reason"].is_string()) {
            result.stop_reason = first_choice["finish_reason"].get<std::string>();
        }
    }
    
    if (resp.contains("usage") && resp["usage"].is_object()) {
        const Json& usage = resp["usage"];
        result.usage.input_tokens = usage.value("prompt_tokens", 0);
        result.usage.output_tokens = usage.value("completion_tokens", 0);
        result.usage.total_tokens = usage.value("total_tokens", 0);
    }
    
    LOG_DEBUG("◀ OUT Model: %s, Stop reason: %s, Tokens: %d",
              result.model.c_str(), result.stop_reason.c_str(), result.usage.total_tokens);
    return result;
}

CompletionResult OpenRouterAI::chat_stream(
    const std::vector<ConversationMessage>& messages,
    const CompletionOptions& opts,
    const FragmentCallback& on_fragment
) {
    if (!stream_) {
        return AIPlugin::chat_stream(messages, opts, on_fragment);
    }
    if (!initialized_) {
        return CompletionResult::fail("OpenRouter AI not initialized");
    }
    if (messages.empty()) {
        return CompletionResult::fail("No messages provided");
    }
    
    std::string endpoint = api_url_ + "/chat/completions";
    std::string request_body = build_request(messages, opts, true);
    LOG_DEBUG("▶ IN  Streaming request to %s (%zu bytes)", endpoint.c_str(), request_body.size());
    
    SseStreamDecoder decoder;
    std::string content;
    
    StreamChunkCallback on_chunk = [&](const char* data, size_t len) -> bool {
        std::vector<std::string> fragments = decoder.feed(std::string(data, len));
        for (size_t i = 0; i < fragments.size(); ++i) {
            content += fragments[i];
            if (on_fragment) {
                on_fragment(fragments[i]);
            }
        }
        return !decoder.done();
    };
    
    HttpClient http;
    http.set_timeout(timeout_seconds_);
    HttpResponse response = http.post_stream(endpoint, request_body, build_headers(), on_chunk);
    
    if (response.aborted) {
        return CompletionResult::fail("interrupted");
    }
    if (response.status_code == 0) {
        LOG_ERROR("HTTP request failed: %s", response.error.c_str());
        return CompletionResult::fail("HTTP request failed: " + response.error);
    }
    if (response.status_code != 200) {
        std::string error_msg = "API error";
        try {
            error_msg = decode_api_error(Json::parse(sanitize_utf8(response.body)));
        } catch (const std::exception& e) {
            LOG_DEBUG("Error body is not JSON: %s", e.what());
        }
        LOG_ERROR("API error: %s (HTTP %d)", error_msg.c_str(), response.status_code);
        return CompletionResult::fail(error_msg + " (HTTP " +
                                      std::to_string(response.status_code) + ")");
    }
    
    std::vector<std::string> tail = decoder.finish();
    for (size_t i = 0; i < tail.size(); ++i) {
        content += tail[i];
        if (on_fragment) {
            on_fragment(tail[i]);
        }
    }
    
    if (!decoder.error().empty()) {
        LOG_ERROR("API stream error: %s", decoder.error().c_str());
        return CompletionResult::fail(decoder.error());
    }
    
    CompletionResult result = CompletionResult::ok(content);
    result.model = decoder.model();
    result.stop_reason = decoder.stop_reason();
    result.usage = decoder.usage();
    LOG_DEBUG("◀ OUT Streamed %zu chars, stop reason: %s",
              content.size(), result.stop_reason.c_str());
    return result;
}

} // namespace vibecli
