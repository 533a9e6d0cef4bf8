#ifndef MELT_HTTP_CLIENT_HPP
#define MELT_HTTP_CLIENT_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "errors.hpp"

namespace melt {

/**
 * @brief RAII helper managing global libcurl initialization.
 */
struct CurlGlobalGuard {
    CurlGlobalGuard();  ///< Calls `curl_global_init()`
    ~CurlGlobalGuard(); ///< Calls `curl_global_cleanup()`
};

struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers; ///< Keys are lower-case
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    std::optional<std::string> header(const std::string& lower_name) const;
};

/**
 * @brief Minimal abstraction over GET requests so forge clients can be tested
 *        without a network.
 */
class HttpTransport {
  public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform a GET request.
     *
     * @param url     Absolute URL.
     * @param headers Extra request headers in `Name: value` form.
     * @param error   Receives ErrorKind::Network or ErrorKind::Timeout on
     *                transport failure.
     * @return Response of any status, or `std::nullopt` when no response was
     *         received.
     */
    virtual std::optional<HttpResponse> get(const std::string& url,
                                            const std::vector<std::string>& headers,
                                            Error* error = nullptr) = 0;
};

/** Data HttpClient shares between its requests. */
inline constexpr curl_lock_data HTTP_SHARED_DATA[] = {CURL_LOCK_DATA_DNS,
                                                      CURL_LOCK_DATA_SSL_SESSION};

/**
 * @brief libcurl backed transport safe to call from several threads at once.
 *
 * Every request uses its own easy handle. DNS results and TLS sessions are
 * shared between them; connections are not, since libcurl does not support
 * a connection cache shared by concurrent transfers.
 */
class HttpClient : public HttpTransport {
  public:
    explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(30),
                        std::string user_agent = "");
    ~HttpClient() override;
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::optional<HttpResponse> get(const std::string& url,
                                    const std::vector<std::string>& headers,
                                    Error* error = nullptr) override;

  private:
    static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* user);
    static void unlock_cb(CURL* handle, curl_lock_data data, void* user);

    CURLSH* share_ = nullptr;
    std::mutex share_mtx_[CURL_LOCK_DATA_LAST];
    std::chrono::milliseconds timeout_;
    std::string user_agent_;
};

} // namespace melt

#endif // MELT_HTTP_CLIENT_HPP
