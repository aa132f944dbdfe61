#include "kraken/http_client.hpp"

#include <memory>
#include <utility>

namespace kraken {
namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

HttpClient::HttpClient(HttpOptions options)
    : options_(std::move(options)),
      global_initialized_(false) {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw HttpError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
    global_initialized_ = true;
}

HttpClient::~HttpClient() {
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

HttpResponse HttpClient::get(const std::string& url, const HttpHeaders& headers) const {
    return perform("GET", url, headers, "");
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const HttpHeaders& headers) const {
    return perform("POST", url, headers, body);
}

HttpResponse HttpClient::perform(const std::string& method,
                                 const std::string& url,
                                 const HttpHeaders& headers,
                                 const std::string& body) const {
    std::unique_ptr<CURL, EasyHandleDeleter> handle(curl_easy_init());
    if (!handle) {
        throw HttpError("Failed to create CURL easy handle");
    }

    std::string response_body;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, options_.timeout_ms);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    std::unique_ptr<curl_slist, HeaderListDeleter> header_list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), (header.first + ": " + header.second).c_str());
        if (appended == nullptr) {
            throw HttpError("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    if (header_list) {
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    if (method == "POST") {
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const auto perform_code = curl_easy_perform(handle.get());
    if (perform_code != CURLE_OK) {
        throw HttpError("libcurl request failed: " + std::string(curl_easy_strerror(perform_code)));
    }

    long status_code = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status_code);
    if (status_code >= 400) {
        throw HttpError("HTTP error: " + response_body, status_code);
    }

    double total_seconds = 0.0;
    HttpResponse response{status_code, std::move(response_body), 0.0};
    if (curl_easy_getinfo(handle.get(), CURLINFO_TOTAL_TIME, &total_seconds) == CURLE_OK) {
        response.total_ms = total_seconds * 1000.0;
    }
    return response;
}

} // namespace kraken
