#pragma once

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "transport.hpp"

namespace libetcdgw {

namespace detail {

struct CurlPtrCleanup
{
    void operator()(CURL *c) const { curl_easy_cleanup(c); }
};

struct CurlShareCleanup
{
    void operator()(CURLSH *s) const { curl_share_cleanup(s); }
};

struct CurlSlistCleanup
{
    void operator()(curl_slist *s) const { curl_slist_free_all(s); }
};

using CurlPtr = std::unique_ptr<CURL, CurlPtrCleanup>;
using CurlShare = std::unique_ptr<CURLSH, CurlShareCleanup>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistCleanup>;

inline void ensure_curl_initialized_()
{
    static const CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
    if (code != CURLE_OK)
        throw ConnectionLoss(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
}

[[noreturn]] inline void throw_curl_error_(CURLcode code, const std::string &url, const char *detail)
{
    std::string what = "CURL error[" + std::to_string(code) + "] " + curl_easy_strerror(code);
    if (detail && *detail)
        what.append(": ").append(detail);
    what.append(" (").append(url).append(")");

    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            throw Timeout(std::move(what));
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            throw InvalidAddress(std::move(what));
        default:
            throw ConnectionLoss(std::move(what));
    }
}

} // namespace detail


class CurlTransport : public Transport
{
    struct StreamContext_
    {
        CURL *handle;
        const DataSink *sink;
        const std::atomic<bool> *cancelled;
        std::string error_body;
        std::exception_ptr sink_error;
        bool streaming = false;
        bool status_known = false;
    };

    std::string base_url_;
    std::chrono::milliseconds connect_timeout_;

    // connection cache shared by every easy handle of this transport
    detail::CurlShare share_;
    std::mutex share_locks_[CURL_LOCK_DATA_LAST];


    static void lock_(CURL *, curl_lock_data data, curl_lock_access, void *self)
    {
        static_cast<CurlTransport *>(self)->share_locks_[data].lock();
    }

    static void unlock_(CURL *, curl_lock_data data, void *self)
    {
        static_cast<CurlTransport *>(self)->share_locks_[data].unlock();
    }

    static size_t write_body_(char *data, size_t size, size_t nmemb, void *userdata)
    {
        static_cast<std::string *>(userdata)->append(data, size * nmemb);
        return size * nmemb;
    }

    static size_t write_stream_(char *data, size_t size, size_t nmemb, void *userdata)
    {
        auto *ctx = static_cast<StreamContext_ *>(userdata);
        const size_t n = size * nmemb;

        if (ctx->cancelled->load())
            return 0;

        if (!ctx->status_known) {
            long status = 0;
            curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
            ctx->streaming = status >= 200 && status < 300;
            ctx->status_known = true;
        }

        if (!ctx->streaming) {
            ctx->error_body.append(data, n);
            return n;
        }

        // exceptions must not unwind through libcurl
        try {
            (*ctx->sink)(std::string_view(data, n));
        } catch (...) {
            ctx->sink_error = std::current_exception();
            return 0;
        }
        return n;
    }

    static int progress_(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
    {
        auto *ctx = static_cast<StreamContext_ *>(userdata);
        return ctx->cancelled->load() ? 1 : 0;
    }

    detail::CurlPtr make_handle_(const std::string &url, const std::string &body, curl_slist *headers)
    {
        detail::CurlPtr handle(curl_easy_init());
        if (!handle)
            throw ConnectionLoss("curl_easy_init failed");

        CURL *h = handle.get();
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_SHARE, share_.get());
        if (connect_timeout_.count() > 0)
            curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
        return handle;
    }

    static detail::CurlHeaders json_headers_()
    {
        detail::CurlHeaders headers(curl_slist_append(nullptr, "Content-Type: application/json"));
        if (!headers)
            throw ConnectionLoss("curl_slist_append failed");
        return headers;
    }

public:
    explicit CurlTransport(std::string base_url,
                           std::chrono::milliseconds connect_timeout = std::chrono::milliseconds::zero())
        : base_url_(std::move(base_url))
        , connect_timeout_{connect_timeout}
    {
        detail::ensure_curl_initialized_();

        share_.reset(curl_share_init());
        if (!share_)
            throw ConnectionLoss("curl_share_init failed");
        curl_share_setopt(share_.get(), CURLSHOPT_LOCKFUNC, &CurlTransport::lock_);
        curl_share_setopt(share_.get(), CURLSHOPT_UNLOCKFUNC, &CurlTransport::unlock_);
        curl_share_setopt(share_.get(), CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    }

    CurlTransport(const CurlTransport &) = delete;
    CurlTransport& operator =(const CurlTransport &) = delete;

    const std::string& base_url() const { return base_url_; }

    HttpResponse post(const std::string &path, const std::string &body,
                      std::chrono::milliseconds timeout) override
    {
        const std::string url = base_url_ + path;
        auto headers = json_headers_();
        auto handle = make_handle_(url, body, headers.get());

        HttpResponse response;
        char error[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &CurlTransport::write_body_);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error);
        if (timeout.count() > 0)
            curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

        CURLcode code = curl_easy_perform(handle.get());
        if (code != CURLE_OK)
            detail::throw_curl_error_(code, url, error);

        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

    HttpResponse post_streaming(const std::string &path, const std::string &body,
                                const DataSink &sink, const std::atomic<bool> &cancelled) override
    {
        const std::string url = base_url_ + path;
        auto headers = json_headers_();
        auto handle = make_handle_(url, body, headers.get());

        StreamContext_ ctx{handle.get(), &sink, &cancelled, {}};
        char error[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &CurlTransport::write_stream_);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, &CurlTransport::progress_);
        curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error);
        curl_easy_setopt(handle.get(), CURLOPT_TCP_KEEPALIVE, 1L);

        CURLcode code = curl_easy_perform(handle.get());
        if (ctx.sink_error)
            std::rethrow_exception(ctx.sink_error);
        if (code != CURLE_OK)
            detail::throw_curl_error_(code, url, error);

        HttpResponse response;
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
        response.body = std::move(ctx.error_body);
        return response;
    }
};

} // namespace libetcdgw
