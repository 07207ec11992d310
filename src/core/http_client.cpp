#include <vibecli/core/http_client.hpp>
#include <vibecli/core/interrupt.hpp>
#include <vibecli/core/logger.hpp>
#include <curl/curl.h>

namespace vibecli {

namespace {

struct TransferState {
    CURL* curl;
    HttpResponse* response;
    const StreamChunkCallback* on_chunk;
    bool cancelled;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    TransferState* state = static_cast<TransferState*>(userdata);
    size_t total = size * nmemb;
    
    if (!state->on_chunk) {
        state->response->body.append(ptr, total);
        return total;
    }
    
    long code = 0;
    curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &code);
    if (code != 200) {
        state->response->body.append(ptr, total);
        return total;
    }
    
    if (!(*state->on_chunk)(ptr, total)) {
        state->cancelled = true;
        return 0;
    }
    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    TransferState* state = static_cast<TransferState*>(userdata);
    if (interrupt_requested()) {
        state->response->aborted = true;
        return 1;
    }
    return 0;
}

} // namespace

HttpClient::HttpClient()
    : timeout_seconds_(300)
    , connect_timeout_seconds_(30)
{}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers) {
    return perform(url, body, headers, nullptr);
}

HttpResponse HttpClient::post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& headers,
                                     const StreamChunkCallback& on_chunk) {
    return perform(url, body, headers, &on_chunk);
}

HttpResponse HttpClient::perform(const std::string& url,
                                 const std::string& body,
                                 const std::map<std::string, std::string>& headers,
                                 const StreamChunkCallback* on_chunk) {
    HttpResponse response;
    
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }
    
    TransferState state;
    state.curl = curl;
    state.response = &response;
    state.on_chunk = on_chunk;
    state.cancelled = false;
    
    struct curl_slist* header_list = nullptr;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    
    CURLcode res = curl_easy_perform(curl);
    
    if (res == CURLE_OK) {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status_code = static_cast<int>(code);
    } else if (response.aborted) {
        response.error = "interrupted";
        LOG_DEBUG("HTTP transfer aborted by operator interrupt");
    } else if (state.cancelled) {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status_code = static_cast<int>(code);
    } else {
        response.error = curl_easy_strerror(res);
        LOG_DEBUG("HTTP transfer failed: %s", response.error.c_str());
    }
    
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace vibecli
