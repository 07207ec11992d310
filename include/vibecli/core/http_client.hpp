/*
 * vibecli C++17 - HTTP client
 *
 * Thin wrapper over libcurl easy handles. curl_global_init() must have
 * been called (Application does it at startup).
 */
#ifndef vibecli_CORE_HTTP_CLIENT_HPP
#define vibecli_CORE_HTTP_CLIENT_HPP

#include <string>
#include <map>
#include <functional>

namespace vibecli {

struct HttpResponse {
    int status_code;        // 0 when the transfer itself failed
    std::string body;
    std::string error;
    bool aborted;           // transfer cancelled by an operator interrupt
    
    HttpResponse() : status_code(0), aborted(false) {}
};

// Receives body chunks of a successful (HTTP 200) streamed response.
// Returning false cancels the transfer.
typedef std::function<bool(const char* data, size_t len)> StreamChunkCallback;

class HttpClient {
public:
    HttpClient();
    
    void set_timeout(long seconds) { timeout_seconds_ = seconds; }
    void set_connect_timeout(long seconds) { connect_timeout_seconds_ = seconds; }
    
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers);
    
    // Streams the body to on_chunk as it arrives. Error responses
    // (status != 200) are collected into HttpResponse::body instead.
    HttpResponse post_stream(const std::string& url,
                             const std::string& body,
                             const std::map<std::string, std::string>& headers,
                             const StreamChunkCallback& on_chunk);

private:
    long timeout_seconds_;
    long connect_timeout_seconds_;
    
    HttpResponse perform(const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers,
                         const StreamChunkCallback* on_chunk);
};

} // namespace vibecli

#endif // vibecli_CORE_HTTP_CLIENT_HPP
