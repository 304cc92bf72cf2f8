#include "http_client.hpp"

#include <base/base.hpp>
#include <fmsave/exceptions.hpp>

#include <curl/curl.h>

#include <memory>

namespace geonames {

namespace {

class curl_global
{
public:
    curl_global()
    {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    curl_global(const curl_global&) = delete;
    curl_global& operator=(const curl_global&) = delete;

    ~curl_global()
    {
        curl_global_cleanup();
    }
};

void ensure_curl_initialized()
{
    static curl_global instance;
}

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp)
{
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

curl_ptr make_handle()
{
    ensure_curl_initialized();
    curl_ptr handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        throw fmsave::transient_lookup_error("cannot initialize libcurl");
    }
    return handle;
}

std::string escape(CURL* curl, const std::string& text)
{
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size())), &curl_free);
    return escaped ? std::string(escaped.get()) : text;
}

} // namespace

std::string build_url(std::string_view base_url, const query_params& params)
{
    auto curl = make_handle();
    std::string url(base_url);
    char separator = '?';
    for (const auto& [key, value] : params) {
        url += separator;
        url += escape(curl.get(), key);
        url += '=';
        url += escape(curl.get(), value);
        separator = '&';
    }
    return url;
}

http_response http_get(const std::string& url, std::chrono::seconds timeout)
{
    auto curl = make_handle();
    http_response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    base::log_debug(base::log_channel::geonames, "GET {}", url.substr(0, url.find('?')));
    const auto res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw fmsave::transient_lookup_error(curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    base::log_debug(base::log_channel::geonames, "HTTP {} with {} bytes", response.status, response.body.size());
    return response;
}

} // namespace geonames
