#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace libetcdgw {

struct HttpResponse
{
    long status = 0;
    std::string body;
};

// HTTP POST carrier for JSON bodies. Implementations must allow concurrent
// calls from several threads.
class Transport
{
public:
    using DataSink = std::function<void(std::string_view)>;

    // Zero timeout means none.
    virtual HttpResponse post(const std::string &path, const std::string &body,
                              std::chrono::milliseconds timeout) = 0;

    // Long-lived POST. A 2xx body is handed to `sink` block by block as it
    // arrives and the returned body is empty; any other body is returned.
    // Setting `cancelled` aborts the call with ConnectionLoss.
    virtual HttpResponse post_streaming(const std::string &path, const std::string &body,
                                        const DataSink &sink, const std::atomic<bool> &cancelled) = 0;

    virtual ~Transport() = default;
};

} // namespace libetcdgw
