#include "kv/zmq_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <string>

#include <fmt/format.h>
#include <zmq_addon.hpp>

#include "utils/logger.hpp"

namespace rangekv::kv
{

namespace
{

// Frame layout: ['C', method, json_body]
constexpr char kFrameTypeControl = 'C';

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds until(Clock::time_point t, Clock::time_point now)
{
    return std::max(std::chrono::milliseconds(0),
                    std::chrono::ceil<std::chrono::milliseconds>(t - now));
}

} // anonymous namespace

KvResult<nlohmann::json> ZmqTransport::send(const std::vector<AddressedRequest> &requests,
                                            std::string_view method, const RpcOptions &options)
{
    const auto start = Clock::now();
    const auto deadline = start + options.timeout;
    const std::string method_str(method);

    std::vector<zmq::socket_t> sockets;
    std::vector<size_t> socket_candidate; // index into requests, parallel to sockets
    sockets.reserve(requests.size());
    size_t next = 0;
    auto next_send = start;
    std::string last_error;
    std::string codec_error; // last malformed reply; reported if no candidate answers properly

    while (true)
    {
        auto now = Clock::now();

        // Contact the next candidate when its turn has come.
        while (next < requests.size() && now >= next_send)
        {
            const auto &req = requests[next];
            if (next > 0)
            {
                LOGGER_DEBUG("{}: no reply after {}ms; also sending to {}", method,
                             std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count(),
                             req.address);
            }
            try
            {
                zmq::socket_t socket(context_, zmq::socket_type::dealer);
                socket.set(zmq::sockopt::linger, 0);
                socket.connect(req.address);

                const std::string body = req.body.dump();
                std::vector<zmq::const_buffer> msgs = {zmq::buffer(&kFrameTypeControl, 1),
                                                       zmq::buffer(method_str), zmq::buffer(body)};
                if (!zmq::send_multipart(socket, msgs, zmq::send_flags::dontwait))
                {
                    throw zmq::error_t();
                }
                sockets.push_back(std::move(socket));
                socket_candidate.push_back(next);
                next_send = now + options.send_next_timeout;
            }
            catch (const zmq::error_t &e)
            {
                LOGGER_WARN("{}: cannot send to {}: {}", method, req.address, e.what());
                last_error = fmt::format("{}: {}", req.address, e.what());
                next_send = now; // try the following candidate straight away
            }
            ++next;
        }

        if (sockets.empty() && next >= requests.size())
        {
            if (!codec_error.empty())
            {
                return KvResult<nlohmann::json>::error(KvError{ErrorCode::Codec, codec_error});
            }
            return KvResult<nlohmann::json>::error(
                KvError{ErrorCode::Unreachable,
                        fmt::format("{}: no replica reachable ({})", method, last_error)});
        }

        now = Clock::now();
        if (now >= deadline)
        {
            return KvResult<nlohmann::json>::error(KvError{
                ErrorCode::Timeout,
                fmt::format("{}: no reply from {} replica(s) within {}ms", method, sockets.size(),
                            options.timeout.count())});
        }

        auto wake = deadline;
        if (next < requests.size())
        {
            wake = std::min(wake, next_send);
        }

        std::vector<zmq::pollitem_t> items;
        items.reserve(sockets.size());
        for (auto &s : sockets)
        {
            items.push_back({s.handle(), 0, ZMQ_POLLIN, 0});
        }
        try
        {
            zmq::poll(items, until(wake, now));
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_WARN("{}: poll failed: {}", method, e.what());
            return KvResult<nlohmann::json>::error(
                KvError{ErrorCode::Unreachable, fmt::format("{}: poll failed: {}", method, e.what())});
        }

        std::vector<size_t> dropped;
        for (size_t i = 0; i < items.size(); ++i)
        {
            if ((items[i].revents & ZMQ_POLLIN) == 0)
            {
                continue;
            }
            const std::string &address = requests[socket_candidate[i]].address;
            std::vector<zmq::message_t> reply;
            try
            {
                static_cast<void>(zmq::recv_multipart(sockets[i], std::back_inserter(reply)));
            }
            catch (const zmq::error_t &e)
            {
                LOGGER_WARN("{}: receive from {} failed: {}", method, address, e.what());
                continue;
            }
            // Layout: ['C', method, json_body]
            if (reply.size() != 3 || reply[0].size() != 1 ||
                *reply[0].data<char>() != kFrameTypeControl || reply[1].to_string_view() != method)
            {
                codec_error = fmt::format("{}: malformed reply from {}", method, address);
                LOGGER_WARN("{}", codec_error);
                dropped.push_back(i);
                continue;
            }
            auto body = nlohmann::json::parse(reply[2].to_string_view(), nullptr,
                                              /*allow_exceptions=*/false);
            if (body.is_discarded())
            {
                codec_error = fmt::format("{}: reply from {} is not JSON", method, address);
                LOGGER_WARN("{}", codec_error);
                dropped.push_back(i);
                continue;
            }
            return KvResult<nlohmann::json>::ok(std::move(body));
        }

        // A candidate that answered with garbage will not answer again; stop
        // waiting on it and contact the next candidate straight away.
        for (auto it = dropped.rbegin(); it != dropped.rend(); ++it)
        {
            sockets.erase(sockets.begin() + static_cast<std::ptrdiff_t>(*it));
            socket_candidate.erase(socket_candidate.begin() + static_cast<std::ptrdiff_t>(*it));
        }
        if (!dropped.empty())
        {
            next_send = Clock::now();
        }
    }
}

} // namespace rangekv::kv
