#pragma once

#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "gateway.hpp"
#include "types.hpp"
#include "wire_codec.hpp"

namespace libetcdgw {

namespace detail {

// The keepalive endpoint streams; a single request yields one record.
inline pb::LeaseKeepAliveResponse parse_keepalive_reply(std::string_view body)
{
    auto end = body.find('\n');
    while (end == 0) {
        body.remove_prefix(1);
        end = body.find('\n');
    }
    if (end != std::string_view::npos)
        body = body.substr(0, end);

    auto message = wire::from_json<pb::KeepAliveStreamMessage>(body);
    if (message.has_error())
        throw StoreError(message.error().grpc_code(), message.error().message());
    if (!message.has_result())
        throw ProtocolError("keepalive reply carries no result");
    return message.result();
}

} // namespace detail


// A TTL-bound lease. Once any operation observes that the store no longer
// holds it, the lease stays expired and every call fails with Expired
// without contacting the store.
class Lease
{
    std::shared_ptr<detail::Gateway> gateway_;
    int64_t lease_id_;
    int64_t ttl_;
    Header header_;
    std::atomic<bool> expired_{false};

    void ensure_active_() const
    {
        if (expired_.load())
            throw Expired(lease_id_);
    }

    [[noreturn]] void expire_and_throw_()
    {
        expire_();
        throw Expired(lease_id_);
    }

    void expire_()
    {
        if (!expired_.exchange(true))
            VLOG(1) << "[" << gateway_->tag() << "] lease " << lease_id_ << " expired";
    }

    pb::LeaseTimeToLiveResponse time_to_live_(bool keys, std::chrono::milliseconds timeout)
    {
        ensure_active_();

        pb::LeaseTimeToLiveRequest request;
        request.set_id(lease_id_);
        request.set_keys(keys);

        auto response = gateway_->call<pb::LeaseTimeToLiveResponse>(wire::LEASE_TIMETOLIVE, request, timeout);
        if (response.ttl() <= 0)
            expire_and_throw_();
        return response;
    }

public:
    Lease(std::shared_ptr<detail::Gateway> gateway, int64_t lease_id, int64_t ttl, Header header)
        : gateway_(std::move(gateway))
        , lease_id_{lease_id}
        , ttl_{ttl}
        , header_(header)
    {}

    Lease(const Lease &) = delete;
    Lease& operator =(const Lease &) = delete;

    int64_t lease_id() const { return lease_id_; }

    // TTL granted by the store
    int64_t ttl() const { return ttl_; }

    // header of the grant reply
    const Header& header() const { return header_; }

    bool expired() const { return expired_.load(); }

    // seconds left
    int64_t remaining(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
    {
        return time_to_live_(false, timeout).ttl();
    }

    std::vector<std::string> keys(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
    {
        auto response = time_to_live_(true, timeout);
        return {response.keys().begin(), response.keys().end()};
    }

    Header refresh(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
    {
        ensure_active_();

        pb::LeaseKeepAliveRequest request;
        request.set_id(lease_id_);

        auto reply = detail::parse_keepalive_reply(gateway_->call_raw(wire::LEASE_KEEPALIVE, request, timeout));
        if (reply.ttl() <= 0)
            expire_and_throw_();
        return wire::parse_header(reply.header());
    }

    // Attached keys are deleted by the store.
    Header revoke(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
    {
        ensure_active_();

        pb::LeaseRevokeRequest request;
        request.set_id(lease_id_);

        auto response = gateway_->call<pb::LeaseRevokeResponse>(wire::LEASE_REVOKE, request, timeout);
        expire_();
        return wire::parse_header(response.header());
    }
};

} // namespace libetcdgw
