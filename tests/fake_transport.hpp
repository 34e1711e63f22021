#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <libetcdgw/errors.hpp>
#include <libetcdgw/transport.hpp>

namespace libetcdgw::test {

// Replays canned replies and records what was sent.
class FakeTransport : public Transport {
public:
    struct Request {
        std::string path;
        std::string body;
        std::chrono::milliseconds timeout;
    };

    struct Stream {
        std::vector<std::string> blocks;
        // keep the call open until it is cancelled
        bool hang = false;
        long status = 200;
        std::string error_body;
    };

    std::mutex lock;
    std::vector<Request> requests;
    std::deque<HttpResponse> replies;
    std::deque<Stream> streams;
    std::atomic<int> open_streams{0};

    void reply(std::string body, long status = 200)
    {
        std::lock_guard<std::mutex> guard(lock);
        replies.push_back({status, std::move(body)});
    }

    void stream(Stream s)
    {
        std::lock_guard<std::mutex> guard(lock);
        streams.push_back(std::move(s));
    }

    Request last_request()
    {
        std::lock_guard<std::mutex> guard(lock);
        return requests.back();
    }

    HttpResponse post(const std::string &path, const std::string &body,
                                 std::chrono::milliseconds timeout) override
    {
        std::lock_guard<std::mutex> guard(lock);
        requests.push_back({path, body, timeout});
        if (replies.empty())
            throw ConnectionLoss("no reply scripted for " + path);
        auto reply = std::move(replies.front());
        replies.pop_front();
        return reply;
    }

    HttpResponse post_streaming(const std::string &path, const std::string &body,
                                           const DataSink &sink, const std::atomic<bool> &cancelled) override
    {
        Stream s;
        {
            std::lock_guard<std::mutex> guard(lock);
            requests.push_back({path, body, std::chrono::milliseconds::zero()});
            if (streams.empty())
                throw ConnectionLoss("no stream scripted for " + path);
            s = std::move(streams.front());
            streams.pop_front();
        }

        if (s.status != 200)
            return {s.status, s.error_body};

        open_streams++;
        for (const auto &block : s.blocks) {
            if (cancelled.load())
                break;
            sink(block);
        }

        if (s.hang) {
            while (!cancelled.load())
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        open_streams--;

        if (cancelled.load())
            throw ConnectionLoss("aborted by callback");
        return {200, ""};
    }
};

} // namespace libetcdgw::test
