#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include "logger.hpp"

namespace melt {

namespace {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t write_header(char* ptr, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(ptr, size * nitems);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string val = line.substr(colon + 1);
        auto first = val.find_first_not_of(" \t");
        auto last = val.find_last_not_of(" \t\r\n");
        val = first == std::string::npos ? "" : val.substr(first, last - first + 1);
        (*headers)[key] = val;
    }
    return size * nitems;
}

} // namespace

CurlGlobalGuard::CurlGlobalGuard() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlGlobalGuard::~CurlGlobalGuard() { curl_global_cleanup(); }

std::optional<std::string> HttpResponse::header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout, std::string user_agent)
    : timeout_(timeout), user_agent_(std::move(user_agent)) {
    share_ = curl_share_init();
    if (share_) {
        for (curl_lock_data data : HTTP_SHARED_DATA)
            curl_share_setopt(share_, CURLSHOPT_SHARE, data);
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &HttpClient::lock_cb);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &HttpClient::unlock_cb);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    }
}

HttpClient::~HttpClient() {
    if (share_)
        curl_share_cleanup(share_);
}

void HttpClient::lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* user) {
    static_cast<HttpClient*>(user)->share_mtx_[data].lock();
}

void HttpClient::unlock_cb(CURL*, curl_lock_data data, void* user) {
    static_cast<HttpClient*>(user)->share_mtx_[data].unlock();
}

std::optional<HttpResponse> HttpClient::get(const std::string& url,
                                            const std::vector<std::string>& headers,
                                            Error* error) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        set_error(error, ErrorKind::Network, "failed to create HTTP handle");
        return std::nullopt;
    }
    HttpResponse resp;
    struct curl_slist* hdrs = nullptr;
    for (const auto& h : headers)
        hdrs = curl_slist_append(hdrs, h.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    if (!user_agent_.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    if (hdrs)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    if (share_)
        curl_easy_setopt(curl, CURLOPT_SHARE, share_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp.headers);

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        log_debug("HTTP request failed", {{"url", url}, {"error", curl_easy_strerror(rc)}});
        set_error(error, rc == CURLE_OPERATION_TIMEDOUT ? ErrorKind::Timeout : ErrorKind::Network,
                  curl_easy_strerror(rc));
        return std::nullopt;
    }
    log_debug("HTTP GET", {{"url", url}, {"status", std::to_string(resp.status)}});
    return resp;
}

} // namespace melt
