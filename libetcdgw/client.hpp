#pragma once

#include <glog/logging.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "gateway.hpp"
#include "key_range.hpp"
#include "lease.hpp"
#include "transport.hpp"
#include "types.hpp"
#include "watch.hpp"
#include "wire_codec.hpp"

namespace libetcdgw {

// Synchronous client of the store's JSON gateway. Calls may be issued from
// several threads at once; each is a single POST through the transport.
class Client
{
    std::shared_ptr<detail::Gateway> gateway_;
    size_t watch_queue_capacity_;

public:
    using Duration = std::chrono::milliseconds;

    explicit Client(std::shared_ptr<Transport> transport, const ClientOptions &options = {})
        : gateway_(std::make_shared<detail::Gateway>(std::move(transport), options))
        , watch_queue_capacity_{options.watch_queue_capacity}
    {}

    const Observability& observability() const { return gateway_->observability(); }

    Status status(Duration timeout = Duration::zero())
    {
        return wire::parse_status(
            gateway_->call<pb::StatusResponse>(wire::STATUS, pb::StatusRequest{}, timeout));
    }

    Revision set(std::string key, std::string value, int64_t lease_id = 0, bool return_previous = false,
                 Duration timeout = Duration::zero())
    {
        auto request = wire::marshal_put(OpSet(std::move(key), std::move(value), lease_id, return_previous));
        return wire::parse_put(gateway_->call<pb::PutResponse>(wire::PUT, request, timeout));
    }

    Range get(const KeyRange &range, const GetOptions &options = {}, Duration timeout = Duration::zero())
    {
        auto request = wire::marshal_get(OpGet(range, options));
        return wire::parse_range(gateway_->call<pb::RangeResponse>(wire::RANGE, request, timeout));
    }

    Deleted erase(const KeyRange &range, bool return_previous = false, Duration timeout = Duration::zero())
    {
        auto request = wire::marshal_delete(OpDel(range, return_previous));
        return wire::parse_delete(gateway_->call<pb::DeleteRangeResponse>(wire::DELETE_RANGE, request, timeout));
    }

    // A false comparison is a regular outcome, not an error.
    TxnOutcome submit(const Transaction &txn, Duration timeout = Duration::zero())
    {
        auto outcome = wire::parse_txn(
            gateway_->call<pb::TxnResponse>(wire::TXN, wire::marshal_txn(txn), timeout));

        VLOG(1) << "[" << gateway_->tag() << "] txn with " << txn.compare.size() << " comparator(s) "
                << (outcome.succeeded ? "succeeded" : "failed") << " at revision " << outcome.header.revision;
        return outcome;
    }

    std::shared_ptr<Lease> lease(int64_t ttl, int64_t lease_id = 0, Duration timeout = Duration::zero())
    {
        if (ttl < 1)
            throw InvalidArgument("lease ttl must be a positive number of seconds, got " + std::to_string(ttl));

        pb::LeaseGrantRequest request;
        request.set_ttl(ttl);
        request.set_id(lease_id);

        auto response = gateway_->call<pb::LeaseGrantResponse>(wire::LEASE_GRANT, request, timeout);
        if (!response.error().empty())
            throw StoreError(2, response.error());

        return std::make_shared<Lease>(gateway_, response.id(), response.ttl(), wire::parse_header(response.header()));
    }

    std::unique_ptr<Watch> watch(const std::vector<KeyRange> &ranges, Watch::Callback callback,
                                 const WatchOptions &options = {})
    {
        return std::make_unique<Watch>(gateway_, ranges, std::move(callback), options, watch_queue_capacity_);
    }
};

} // namespace libetcdgw
