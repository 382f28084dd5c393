#include "infrastructure/network/HttpClient.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace hostwatch::infra {

namespace {

constexpr const char* USER_AGENT = "hostwatch/1.0";
constexpr std::size_t MAX_BODY_BYTES = 1024 * 1024;

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void initializeCurl() {
    static std::once_flag once;
    std::call_once(once, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("Failed to initialize libcurl: {}", curl_easy_strerror(rc));
        }
    });
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<std::string> urlPart(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(handle, part, &value, flags) != CURLUE_OK) {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

size_t appendBody(char* data, size_t size, size_t count, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t bytes = size * count;
    if (body->size() + bytes > MAX_BODY_BYTES) {
        return 0;
    }
    body->append(data, bytes);
    return bytes;
}

} // namespace

HttpClient::HttpClient() {
    initializeCurl();
}

std::optional<Url> HttpClient::parseUrl(const std::string& url) {
    CurlUrlHandle handle(curl_url(), curl_url_cleanup);
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    Url result;
    result.scheme = toLower(urlPart(handle.get(), CURLUPART_SCHEME).value_or(""));
    if (result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    auto host = urlPart(handle.get(), CURLUPART_HOST);
    if (!host || host->empty()) {
        return std::nullopt;
    }
    if (host->front() == '[' && host->back() == ']') {
        *host = host->substr(1, host->size() - 2);
    }
    result.host = *host;

    auto port = urlPart(handle.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
    if (!port) {
        return std::nullopt;
    }
    int number = std::stoi(*port);
    if (number < 1 || number > 65535) {
        return std::nullopt;
    }
    result.port = static_cast<uint16_t>(number);

    result.target = urlPart(handle.get(), CURLUPART_PATH).value_or("/");
    if (result.target.empty()) {
        result.target = "/";
    }
    if (auto query = urlPart(handle.get(), CURLUPART_QUERY)) {
        result.target += "?" + *query;
    }
    return result;
}

HttpResponse HttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
    return perform(url, nullptr, {}, timeout);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& payload,
                              const std::map<std::string, std::string>& headers,
                              std::chrono::milliseconds timeout) {
    return perform(url, &payload, headers, timeout);
}

HttpResponse HttpClient::perform(const std::string& url, const std::string* payload,
                                 const std::map<std::string, std::string>& headers,
                                 std::chrono::milliseconds timeout) {
    HttpResponse response;
    if (!parseUrl(url)) {
        response.errorMessage = "Invalid URL: " + url;
        return response;
    }

    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        response.errorMessage = "Failed to create a libcurl handle";
        return response;
    }

    CurlHeaders headerList(nullptr, curl_slist_free_all);
    for (const auto& [name, value] : headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended) {
            response.errorMessage = "Failed to build request headers";
            return response;
        }
        if (!headerList) {
            headerList.reset(appended);
        }
    }

    char errorBuffer[CURL_ERROR_SIZE] = {};
    const long timeoutMs = static_cast<long>(timeout.count());

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, "");
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (headerList) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }
    if (payload) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(payload->size()));
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload->data());
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        response.errorMessage = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(rc);
        spdlog::debug("Request to {} failed: {}", url, response.errorMessage);
        return response;
    }

    long statusCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &statusCode);
    response.statusCode = static_cast<int>(statusCode);
    response.completed = true;
    response.success = response.statusCode >= 200 && response.statusCode < 300;
    if (!response.success) {
        response.errorMessage = "HTTP " + std::to_string(response.statusCode);
    }
    return response;
}

} // namespace hostwatch::infra
