#pragma once

#include <glog/logging.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "blocking_queue.hpp"
#include "errors.hpp"
#include "gateway.hpp"
#include "key_range.hpp"
#include "types.hpp"
#include "util.hpp"
#include "wire_codec.hpp"

namespace libetcdgw {

struct WatchOptions
{
    // 0 watches from the current revision on
    int64_t start_revision = 0;
    bool prev_kv = false;
    bool progress_notify = true;
    bool no_put = false;
    bool no_delete = false;
};


namespace detail {

// Splits a byte stream into newline-terminated records.
class ChunkAssembler
{
    std::string buffer_;

public:
    template<class Handler>
    void feed(std::string_view data, Handler &&on_chunk)
    {
        buffer_.append(data.data(), data.size());

        size_t begin = 0;
        for (size_t pos; (pos = buffer_.find('\n', begin)) != std::string::npos; begin = pos + 1) {
            std::string_view chunk(buffer_.data() + begin, pos - begin);
            if (!chunk.empty() && chunk.back() == '\r')
                chunk.remove_suffix(1);
            if (!chunk.empty())
                on_chunk(chunk);
        }
        buffer_.erase(0, begin);
    }

    const std::string& pending() const { return buffer_; }
};

inline std::string marshal_watch_request(const std::vector<KeyRange> &ranges, const WatchOptions &options)
{
    std::string body;
    for (const auto &range : ranges) {
        pb::WatchRequest request;
        auto *create = request.mutable_create_request();
        wire::set_key_range(create, range);
        create->set_start_revision(options.start_revision);
        create->set_progress_notify(options.progress_notify);
        create->set_prev_kv(options.prev_kv);
        if (options.no_put)
            create->add_filters(pb::WatchCreateRequest::NOPUT);
        if (options.no_delete)
            create->add_filters(pb::WatchCreateRequest::NODELETE);

        if (!body.empty())
            body.push_back('\n');
        body.append(wire::to_json(request));
    }
    return body;
}

// Decodes one stream record into the key-values of its events. A record that
// does not parse raises ProtocolError; a stream error or a server-side cancel
// raises StoreError, which ends the stream.
inline std::vector<KeyValue> decode_watch_chunk(std::string_view chunk)
{
    auto message = wire::from_json<pb::WatchStreamMessage>(chunk);

    if (message.has_error()) {
        const auto &error = message.error();
        throw StoreError(error.grpc_code(), error.message());
    }

    const auto &result = message.result();
    if (result.canceled())
        throw StoreError(1, "watch canceled by server" +
                            (result.cancel_reason().empty() ? std::string() : ": " + result.cancel_reason()));

    std::vector<KeyValue> kvs;
    kvs.reserve(result.events_size());
    for (const auto &event : result.events())
        kvs.push_back(wire::parse_kv(event.kv()));
    return kvs;
}

} // namespace detail


// A running watch over one or more key ranges. Events are read off the
// stream by one thread and handed to the callback by another, through a
// bounded queue; a full queue stalls the reader.
class Watch
{
public:
    using Callback = std::function<void(const KeyValue &)>;

    enum class State
    {
        IDLE,
        REQUESTING,
        STREAMING,
        CANCELLED,
        CLOSED,
        ERRORED,
    };

private:
    std::shared_ptr<detail::Gateway> gateway_;
    std::string body_;
    Callback callback_;

    std::atomic<State> state_{State::IDLE};
    std::atomic<bool> cancelled_{false};
    detail::BlockingQueue<KeyValue> queue_;

    std::mutex lock_;
    std::condition_variable finished_cv_;
    bool finished_ = false;
    std::exception_ptr error_;

    std::thread transport_thread_;
    std::thread delivery_thread_;


    // moves to `to` unless the watch already ended
    void advance_(State to)
    {
        auto current = state_.load();
        while (current != State::CANCELLED && current != State::CLOSED && current != State::ERRORED) {
            if (state_.compare_exchange_weak(current, to))
                return;
        }
    }

    void finish_(State terminal, std::exception_ptr error)
    {
        {
            std::lock_guard<std::mutex> lock(lock_);
            if (!cancelled_.load()) {
                error_ = std::move(error);
                advance_(terminal);
            }
        }

        if (cancelled_.load())
            queue_.close_and_clear();
        else
            queue_.close();
    }

    void on_data_(detail::ChunkAssembler &assembler, std::string_view data)
    {
        advance_(State::STREAMING);
        assembler.feed(data, [this](std::string_view chunk) {
            std::vector<KeyValue> kvs;
            try {
                kvs = detail::decode_watch_chunk(chunk);
            } catch (const ProtocolError &e) {
                LOG(WARNING) << "[" << gateway_->tag() << "] skipping malformed watch record: " << e.what();
                return;
            }
            for (auto &kv : kvs)
                queue_.put(std::move(kv));
        });
    }

    void run_transport_()
    {
        advance_(State::REQUESTING);

        detail::ChunkAssembler assembler;
        try {
            gateway_->stats().requests++;
            auto response = gateway_->transport().post_streaming(
                gateway_->path(wire::WATCH), body_,
                [this, &assembler](std::string_view data) { on_data_(assembler, data); },
                cancelled_);

            wire::ensure_no_gateway_error(response.status, response.body);

            if (cancelled_.load()) {
                finish_(State::CANCELLED, nullptr);
            } else {
                VLOG(1) << "[" << gateway_->tag() << "] watch stream closed by remote end";
                finish_(State::CLOSED, std::make_exception_ptr(ConnectionLoss("watch stream closed by remote end")));
            }
        } catch (const detail::QueueClosed &) {
            finish_(State::CANCELLED, nullptr);
        } catch (const ConnectionLoss &e) {
            if (!cancelled_.load())
                LOG(WARNING) << "[" << gateway_->tag() << "] watch stream lost: " << e.what();
            finish_(State::ERRORED, std::current_exception());
        } catch (const std::exception &e) {
            LOG(WARNING) << "[" << gateway_->tag() << "] watch stream failed: " << e.what();
            gateway_->stats().failed_requests++;
            finish_(State::ERRORED, std::current_exception());
        }
    }

    void run_delivery_()
    {
        KeyValue kv;
        while (queue_.get(kv)) {
            if (cancelled_.load())
                break;
            try {
                callback_(kv);
                gateway_->stats().watch_events++;
            } catch (const std::exception &e) {
                gateway_->stats().watch_callback_failures++;
                LOG(WARNING) << "[" << gateway_->tag() << "] watch callback failed on key '"
                             << util::printable(kv.key) << "': " << e.what();
            } catch (...) {
                gateway_->stats().watch_callback_failures++;
                LOG(WARNING) << "[" << gateway_->tag() << "] watch callback failed on key '"
                             << util::printable(kv.key) << "' with a non-standard exception";
            }
        }

        std::lock_guard<std::mutex> lock(lock_);
        finished_ = true;
        finished_cv_.notify_all();
    }

public:
    Watch(std::shared_ptr<detail::Gateway> gateway, const std::vector<KeyRange> &ranges,
          Callback callback, const WatchOptions &options, size_t queue_capacity)
        : gateway_(std::move(gateway))
        , callback_(std::move(callback))
        , queue_(queue_capacity)
    {
        if (ranges.empty())
            throw InvalidArgument("watch needs at least one key range");
        if (!callback_)
            throw InvalidArgument("watch callback must not be empty");

        body_ = detail::marshal_watch_request(ranges, options);

        delivery_thread_ = std::thread([this] { run_delivery_(); });
        try {
            transport_thread_ = std::thread([this] { run_transport_(); });
        } catch (const std::system_error &) {
            queue_.close();
            delivery_thread_.join();
            throw;
        }
    }

    Watch(const Watch &) = delete;
    Watch& operator =(const Watch &) = delete;

    State state() const { return state_.load(); }

    // Non-blocking; safe to call more than once and from the callback.
    void cancel()
    {
        if (cancelled_.exchange(true))
            return;

        {
            std::lock_guard<std::mutex> lock(lock_);
            auto current = state_.load();
            if (current != State::CLOSED && current != State::ERRORED)
                state_.store(State::CANCELLED);
        }
        queue_.close_and_clear();
    }

    // Blocks until the stream ends. A local cancel returns normally; any
    // other termination is rethrown.
    void wait()
    {
        std::unique_lock<std::mutex> lock(lock_);
        finished_cv_.wait(lock, [this]() { return finished_; });
        if (error_)
            std::rethrow_exception(error_);
    }

    ~Watch()
    {
        cancel();
        if (transport_thread_.joinable())
            transport_thread_.join();
        if (delivery_thread_.joinable())
            delivery_thread_.join();
    }
};

} // namespace libetcdgw
