#pragma once

#include <stdint.h>
#include <exception>
#include <string>
#include <utility>

namespace libetcdgw {

class Error : public std::exception
{
    std::string what_;
public:
    explicit Error(std::string what) : what_(std::move(what)) {}

    const char *what() const noexcept override { return what_.c_str(); }
};

class InvalidArgument : public Error
{
public:
    explicit InvalidArgument(std::string what) : Error(std::move(what)) {}
};

class InvalidAddress : public InvalidArgument
{
public:
    explicit InvalidAddress(std::string addr) : InvalidArgument(std::move(addr)) {}
};

class ConnectionLoss : public Error
{
public:
    ConnectionLoss() : Error("connection loss") {}
    explicit ConnectionLoss(std::string what) : Error(std::move(what)) {}
};

class Timeout : public ConnectionLoss
{
public:
    explicit Timeout(std::string what) : ConnectionLoss(std::move(what)) {}
};

// Reply of an unexpected shape.
class ProtocolError : public Error
{
public:
    explicit ProtocolError(std::string what) : Error(std::move(what)) {}
};

// Structured error reported by the gateway.
class StoreError : public Error
{
    int code_;
    std::string message_;

public:
    StoreError(int code, std::string message)
        : Error("store error " + std::to_string(code) + ": " + message)
        , code_{code}
        , message_(std::move(message))
    {}

    int code() const { return code_; }

    const std::string& message() const { return message_; }
};

class ServiceError : public Error
{
    long http_status_;
public:
    ServiceError(long http_status, std::string what)
        : Error(std::move(what))
        , http_status_{http_status}
    {}

    long http_status() const { return http_status_; }
};

class Expired : public Error
{
    int64_t lease_id_;
public:
    explicit Expired(int64_t lease_id)
        : Error("lease " + std::to_string(lease_id) + " expired")
        , lease_id_{lease_id}
    {}

    int64_t lease_id() const { return lease_id_; }
};

class TxnFailed : public Error
{
    int64_t revision_;
public:
    explicit TxnFailed(int64_t revision)
        : Error("transaction failed at revision " + std::to_string(revision))
        , revision_{revision}
    {}

    int64_t revision() const { return revision_; }
};

class InvalidTxnState : public Error
{
public:
    explicit InvalidTxnState(std::string what) : Error(std::move(what)) {}
};

class CodecError : public Error
{
public:
    explicit CodecError(std::string what) : Error(std::move(what)) {}
};

} // namespace libetcdgw
