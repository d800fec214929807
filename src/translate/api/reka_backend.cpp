#include "reka_backend.hpp"

#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

RekaBackend::RekaBackend(std::string endpoint)
    : endpoint_(std::move(endpoint)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

RekaBackend::~RekaBackend() {
    curl_global_cleanup();
}

Result<HttpResponse> RekaBackend::post(const std::string& json_body, const std::string& api_key) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error(ErrorCode::NetworkError, "curl_easy_init failed");
    }

    std::string key_header = "X-Api-Key: " + api_key;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, key_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(json_body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return make_error(ErrorCode::NetworkError,
                          std::string("Failed to connect to API: ") + curl_easy_strerror(res));
    }
    return response;
}
