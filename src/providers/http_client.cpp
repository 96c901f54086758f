#include "riskdesk/providers/http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <new>

namespace riskdesk {

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

}  // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    ensure_curl_initialized();
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb,
                                      std::string* body) {
    body->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t CurlHttpClient::header_callback(char* buffer, size_t size, size_t nitems,
                                       HttpResponse* response) {
    const size_t length = size * nitems;
    std::string line(buffer, length);

    const std::string name = "retry-after:";
    if (line.size() > name.size()) {
        std::string prefix = line.substr(0, name.size());
        for (auto& c : prefix) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (prefix == name) {
            try {
                response->retry_after_seconds = std::stol(line.substr(name.size()));
            } catch (const std::exception&) {
                // HTTP-date form is not used by the providers we talk to
            }
        }
    }
    return length;
}

Result<HttpResponse> CurlHttpClient::get(const std::string& url,
                                         const std::vector<std::string>& headers,
                                         std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::TRANSIENT_ERROR, "Failed to initialize CURL",
                                        "CurlHttpClient");
    }

    HttpResponse response;

    std::unique_ptr<curl_slist, HeaderListDeleter> header_list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            return make_error<HttpResponse>(ErrorCode::TRANSIENT_ERROR,
                                            "Failed to build request headers", "CurlHttpClient");
        }
        header_list.release();
        header_list.reset(appended);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlHttpClient::write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, CurlHttpClient::header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(ErrorCode::TRANSIENT_ERROR,
                                        "CURL error: " + std::string(curl_easy_strerror(res)),
                                        "CurlHttpClient");
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return Result<HttpResponse>(std::move(response));
}

std::string url_encode(const std::string& value) {
    ensure_curl_initialized();
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::bad_alloc();
    }

    char* escaped = curl_easy_escape(curl.get(), value.data(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        throw std::bad_alloc();
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

}  // namespace riskdesk
