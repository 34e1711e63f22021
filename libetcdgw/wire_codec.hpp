#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/repeated_field.h>
#include <google/protobuf/util/json_util.h>

#include <libetcdgw/gateway.pb.h>
#include <libetcdgw/kv.pb.h>
#include <libetcdgw/rpc.pb.h>

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "key_range.hpp"
#include "types.hpp"
#include "util.hpp"

namespace libetcdgw::wire {

// Gateway endpoints, relative to the API prefix.
inline constexpr const char *STATUS = "/maintenance/status";
inline constexpr const char *PUT = "/kv/put";
inline constexpr const char *RANGE = "/kv/range";
inline constexpr const char *DELETE_RANGE = "/kv/deleterange";
inline constexpr const char *TXN = "/kv/txn";
inline constexpr const char *WATCH = "/watch";
inline constexpr const char *LEASE_GRANT = "/lease/grant";
inline constexpr const char *LEASE_KEEPALIVE = "/lease/keepalive";
inline constexpr const char *LEASE_REVOKE = "/kv/lease/revoke";
inline constexpr const char *LEASE_TIMETOLIVE = "/kv/lease/timetolive";


// The proto3 JSON mapping is exactly the gateway's encoding: bytes travel as
// base64 and 64-bit integers as decimal strings.
inline std::string to_json(const google::protobuf::Message &message)
{
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string result;
    auto status = google::protobuf::util::MessageToJsonString(message, &result, options);
    if (!status.ok())
        throw ProtocolError("cannot encode " + message.GetTypeName() + ": " + status.ToString());
    return result;
}

inline void from_json(std::string_view body, google::protobuf::Message *message)
{
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(
        google::protobuf::StringPiece(body.data(), body.size()), message, options);
    if (!status.ok())
        throw ProtocolError("cannot decode " + message->GetTypeName() + ": " + status.ToString());
}

template<class Message>
Message from_json(std::string_view body)
{
    Message message;
    from_json(body, &message);
    return message;
}

// Raises the structured error carried by a gateway reply, if any.
inline void ensure_no_gateway_error(long http_status, const std::string &body)
{
    const bool ok = http_status >= 200 && http_status < 300;

    pb::GatewayError error;
    bool parsed = false;
    if (!body.empty()) {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;
        parsed = google::protobuf::util::JsonStringToMessage(body, &error, options).ok();
    }

    if (parsed && error.code() != 0)
        throw StoreError(error.code(), error.error().empty() ? error.message() : error.error());

    if (!ok)
        throw ServiceError(http_status, "gateway replied with HTTP " + std::to_string(http_status) +
                                        (body.empty() ? "" : ": " + body));
}


inline Header parse_header(const pb::ResponseHeader &header)
{
    return {header.revision(), header.raft_term(), header.cluster_id(), header.member_id()};
}

inline KeyValue parse_kv(const pb::KeyValue &kv)
{
    return {kv.key(), kv.value(), kv.version(), kv.create_revision(), kv.mod_revision(), kv.lease()};
}

inline std::vector<KeyValue> parse_kvs(const google::protobuf::RepeatedPtrField<pb::KeyValue> &kvs)
{
    std::vector<KeyValue> result;
    result.reserve(kvs.size());
    for (const auto &kv : kvs)
        result.push_back(parse_kv(kv));
    return result;
}

inline Status parse_status(const pb::StatusResponse &response)
{
    Status status;
    status.header = parse_header(response.header());
    status.version = response.version();
    status.db_size = response.dbsize();
    status.leader = response.leader();
    status.raft_index = response.raftindex();
    status.raft_term = response.raftterm();
    return status;
}

inline Revision parse_put(const pb::PutResponse &response)
{
    Revision revision{parse_header(response.header()), std::nullopt};
    if (response.has_prev_kv())
        revision.previous = parse_kv(response.prev_kv());
    return revision;
}

inline Deleted parse_delete(const pb::DeleteRangeResponse &response)
{
    return {parse_header(response.header()), response.deleted(), parse_kvs(response.prev_kvs())};
}

inline Range parse_range(const pb::RangeResponse &response)
{
    return {parse_header(response.header()), parse_kvs(response.kvs()), response.count(), response.more()};
}


template<class Request>
void set_key_range(Request *request, const KeyRange &range)
{
    request->set_key(range.start());
    if (auto end = range.resolve_end())
        request->set_range_end(*end);
}

inline pb::RangeRequest marshal_get(const OpGet &op)
{
    pb::RangeRequest request;
    set_key_range(&request, op.range);

    const auto &options = op.options;
    request.set_count_only(options.count_only);
    request.set_keys_only(options.keys_only);
    request.set_limit(options.limit);
    request.set_revision(options.revision);
    request.set_min_create_revision(options.min_create_revision);
    request.set_max_create_revision(options.max_create_revision);
    request.set_min_mod_revision(options.min_mod_revision);
    request.set_max_mod_revision(options.max_mod_revision);
    request.set_serializable(options.serializable);

    switch (options.sort_order) {
        case GetOptions::SortOrder::NONE:    request.set_sort_order(pb::RangeRequest::NONE); break;
        case GetOptions::SortOrder::ASCEND:  request.set_sort_order(pb::RangeRequest::ASCEND); break;
        case GetOptions::SortOrder::DESCEND: request.set_sort_order(pb::RangeRequest::DESCEND); break;
    }

    switch (options.sort_target) {
        case GetOptions::SortTarget::KEY:     request.set_sort_target(pb::RangeRequest::KEY); break;
        case GetOptions::SortTarget::VERSION: request.set_sort_target(pb::RangeRequest::VERSION); break;
        case GetOptions::SortTarget::CREATE:  request.set_sort_target(pb::RangeRequest::CREATE); break;
        case GetOptions::SortTarget::MOD:     request.set_sort_target(pb::RangeRequest::MOD); break;
        case GetOptions::SortTarget::VALUE:   request.set_sort_target(pb::RangeRequest::VALUE); break;
    }

    return request;
}

inline pb::PutRequest marshal_put(const OpSet &op)
{
    pb::PutRequest request;
    request.set_key(op.key);
    request.set_value(op.value);
    request.set_lease(op.lease);
    request.set_prev_kv(op.return_previous);
    return request;
}

inline pb::DeleteRangeRequest marshal_delete(const OpDel &op)
{
    pb::DeleteRangeRequest request;
    set_key_range(&request, op.range);
    request.set_prev_kv(op.return_previous);
    return request;
}

inline pb::Compare marshal_compare(const Comparator &cmp)
{
    pb::Compare compare;
    compare.set_key(cmp.key);

    switch (cmp.op) {
        case Comparator::Op::EQUAL:     compare.set_result(pb::Compare::EQUAL); break;
        case Comparator::Op::NOT_EQUAL: compare.set_result(pb::Compare::NOT_EQUAL); break;
        case Comparator::Op::GREATER:   compare.set_result(pb::Compare::GREATER); break;
        case Comparator::Op::LESS:      compare.set_result(pb::Compare::LESS); break;
    }

    switch (cmp.target) {
        case Comparator::Target::VALUE:
            compare.set_target(pb::Compare::VALUE);
            compare.set_value(cmp.bytes);
            break;
        case Comparator::Target::VERSION:
            compare.set_target(pb::Compare::VERSION);
            compare.set_version(cmp.number);
            break;
        case Comparator::Target::CREATE:
            compare.set_target(pb::Compare::CREATE);
            compare.set_create_revision(cmp.number);
            break;
        case Comparator::Target::MOD:
            compare.set_target(pb::Compare::MOD);
            compare.set_mod_revision(cmp.number);
            break;
    }

    return compare;
}

inline void marshal_op(const Operation &op, pb::RequestOp *request)
{
    std::visit([request](auto &&arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, OpGet>) {
            *request->mutable_request_range() = marshal_get(arg);
        } else if constexpr (std::is_same_v<T, OpSet>) {
            *request->mutable_request_put() = marshal_put(arg);
        } else if constexpr (std::is_same_v<T, OpDel>) {
            *request->mutable_request_delete_range() = marshal_delete(arg);
        } else static_assert(util::always_false<T>::value, "non-exhaustive visitor");
    }, op);
}

inline pb::TxnRequest marshal_txn(const Transaction &txn)
{
    pb::TxnRequest request;
    for (const auto &cmp : txn.compare)
        *request.add_compare() = marshal_compare(cmp);
    for (const auto &op : txn.success)
        marshal_op(op, request.add_success());
    for (const auto &op : txn.failure)
        marshal_op(op, request.add_failure());
    return request;
}

inline OpResult parse_response(const pb::ResponseOp &response)
{
    switch (response.response_case()) {
        case pb::ResponseOp::kResponsePut:
            return parse_put(response.response_put());
        case pb::ResponseOp::kResponseDeleteRange:
            return parse_delete(response.response_delete_range());
        case pb::ResponseOp::kResponseRange:
            return parse_range(response.response_range());
        case pb::ResponseOp::RESPONSE_NOT_SET:
            break;
    }
    throw ProtocolError("transaction response item carries no recognized result tag");
}

inline TxnOutcome parse_txn(const pb::TxnResponse &response)
{
    TxnOutcome outcome;
    outcome.succeeded = response.succeeded();
    outcome.header = parse_header(response.header());
    outcome.responses.reserve(response.responses_size());
    for (const auto &item : response.responses())
        outcome.responses.push_back(parse_response(item));
    return outcome;
}

} // namespace libetcdgw::wire
