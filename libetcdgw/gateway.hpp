#pragma once

#include <glog/logging.h>
#include <google/protobuf/message.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <libetcdgw/config.hpp>

#include "errors.hpp"
#include "transport.hpp"
#include "wire_codec.hpp"

namespace libetcdgw {

struct Stats
{
    struct Snapshot
    {
        uint64_t requests;
        uint64_t failed_requests;
        uint64_t bytes_sent;
        uint64_t bytes_received;
        uint64_t watch_events;
        uint64_t watch_callback_failures;
    };

    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> failed_requests{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> watch_events{0};
    std::atomic<uint64_t> watch_callback_failures{0};

    Snapshot snapshot() const
    {
        return {requests.load(), failed_requests.load(), bytes_sent.load(), bytes_received.load(),
                watch_events.load(), watch_callback_failures.load()};
    }
};

// Passed from the composition root down to everything a client creates.
struct Observability
{
    std::string tag = "etcdgw";
    std::shared_ptr<Stats> stats = std::make_shared<Stats>();
};

struct ClientOptions
{
    std::string api_prefix = LIBETCDGW_DEFAULT_API_PREFIX;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connect_timeout{0};
    size_t watch_queue_capacity = 1024;
    Observability observability;
};


namespace detail {

class Gateway
{
    std::shared_ptr<Transport> transport_;
    std::string api_prefix_;
    std::chrono::milliseconds timeout_;
    Observability obs_;

public:
    Gateway(std::shared_ptr<Transport> transport, const ClientOptions &options)
        : transport_(std::move(transport))
        , api_prefix_(options.api_prefix)
        , timeout_{options.timeout}
        , obs_(options.observability)
    {
        if (!transport_)
            throw InvalidArgument("transport must not be null");
        if (!obs_.stats)
            obs_.stats = std::make_shared<Stats>();
    }

    const Observability& observability() const { return obs_; }

    const std::string& tag() const { return obs_.tag; }

    Stats& stats() const { return *obs_.stats; }

    std::string path(const char *endpoint) const { return api_prefix_ + endpoint; }

    Transport& transport() const { return *transport_; }

    // Raw reply body of a successful call.
    std::string call_raw(const char *endpoint, const google::protobuf::Message &request,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
    {
        const std::string body = wire::to_json(request);
        const std::string url_path = path(endpoint);

        VLOG(2) << "[" << obs_.tag << "] POST " << url_path << " " << body;
        obs_.stats->requests++;
        obs_.stats->bytes_sent += body.size();

        try {
            auto response = transport_->post(url_path, body, timeout.count() > 0 ? timeout : timeout_);
            obs_.stats->bytes_received += response.body.size();
            wire::ensure_no_gateway_error(response.status, response.body);
            return std::move(response.body);
        } catch (const Error &e) {
            obs_.stats->failed_requests++;
            LOG(WARNING) << "[" << obs_.tag << "] " << url_path << " failed: " << e.what();
            throw;
        }
    }

    template<class Response>
    Response call(const char *endpoint, const google::protobuf::Message &request,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
    {
        auto body = call_raw(endpoint, request, timeout);
        try {
            return wire::from_json<Response>(body);
        } catch (const ProtocolError &e) {
            obs_.stats->failed_requests++;
            LOG(WARNING) << "[" << obs_.tag << "] " << endpoint << " replied with malformed body: " << e.what();
            throw;
        }
    }
};

} // namespace detail

} // namespace libetcdgw
