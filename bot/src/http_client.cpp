#include "http_client.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <memory>

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse perform(const std::string& method,
                     const std::string& url,
                     const std::string* body,
                     const std::vector<std::string>& headers,
                     long timeout_secs) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw HttpError("Failed to initialize CURL", false);
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& h : headers) {
        header_list = curl_slist_append(header_list, h.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(header_list, curl_slist_free_all);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_secs);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, std::min(timeout_secs, 10L));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "pivot-ai-trader/1.0");
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list);
    }

    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body ? body->c_str() : "");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, body ? static_cast<long>(body->size()) : 0L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw HttpError("HTTP request failed: " + std::string(curl_easy_strerror(res)),
                        res == CURLE_OPERATION_TIMEDOUT);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace

void http_global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void http_global_cleanup() {
    curl_global_cleanup();
}

HttpResponse http_get(const std::string& url, const std::vector<std::string>& headers, long timeout_secs) {
    return perform("GET", url, nullptr, headers, timeout_secs);
}

HttpResponse http_post(const std::string& url, const std::string& body,
                       const std::vector<std::string>& headers, long timeout_secs) {
    return perform("POST", url, &body, headers, timeout_secs);
}

json parse_json_response(const HttpResponse& response, const std::string& what) {
    if (!response.ok()) {
        throw std::runtime_error(what + " returned HTTP " + std::to_string(response.status) + ": " +
                                 response.body.substr(0, 200));
    }
    try {
        return json::parse(response.body);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse JSON response from " + what + ": " + std::string(e.what()));
    }
}
