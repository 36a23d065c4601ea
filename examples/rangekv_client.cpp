/**
 * @file rangekv_client.cpp
 * @brief Example: command-line client routing requests over ZeroMQ.
 *
 * Usage:
 *
 *   rangekv_client [--config router.json] <node_id>=<endpoint>... <command>
 *
 * Commands:
 *
 *   bootstrap               point both metadata levels at the first node
 *   get <key>               print the JSON value stored at key
 *   put <key> <json>        store a JSON value
 *   incr <key> <delta>      increment an integer counter
 *   del <key>               delete key
 *
 * Node addresses are published into a static InMemoryGossip; the first node
 * listed is gossiped as the holder of the first range. Example:
 *
 *   rangekv_client 1=tcp://127.0.0.1:5570 2=tcp://127.0.0.1:5571 put greeting '"hello"'
 */
#include "rkv_kv.hpp"

#include <zmq.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace rangekv::kv;
using namespace rangekv::utils;

namespace
{

int usage()
{
    std::cerr << "usage: rangekv_client [--config file] <node_id>=<endpoint>... "
                 "(bootstrap | get <key> | put <key> <json> | incr <key> <delta> | del <key>)\n";
    return 2;
}

/// Parses "<id>=<endpoint>"; false if @p arg is not of that form.
bool parse_node(const std::string &arg, int32_t &id, std::string &endpoint)
{
    const auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0)
        return false;
    try
    {
        size_t pos = 0;
        id = std::stoi(arg.substr(0, eq), &pos);
        if (pos != eq)
            return false;
    }
    catch (const std::exception &)
    {
        return false;
    }
    endpoint = arg.substr(eq + 1);
    return !endpoint.empty();
}

int report(const std::optional<KvError> &error)
{
    if (!error)
        return 0;
    std::cerr << "error: " << error->to_string() << "\n";
    return 1;
}

} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    size_t i = 0;

    RouterConfig config;
    try
    {
        if (i + 1 < args.size() && args[i] == "--config")
        {
            config = RouterConfig::from_json_file(args[i + 1]);
            i += 2;
        }
        else
        {
            config = RouterConfig::from_env();
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << "\n";
        return 2;
    }

    auto &logger = Logger::instance();
    logger.set_console();
    logger.set_level(config.log_level);

    InMemoryGossip gossip;
    std::vector<int32_t> nodes;
    for (int32_t id = 0; i < args.size(); ++i)
    {
        std::string endpoint;
        if (!parse_node(args[i], id, endpoint))
            break;
        gossip.add_info(make_node_id_gossip_key(id), endpoint);
        nodes.push_back(id);
    }
    if (nodes.empty() || i >= args.size())
        return usage();

    RangeLocations first_range;
    first_range.start_key = KeyMin;
    first_range.replicas = {Replica{nodes.front(), std::nullopt}};
    gossip.add_info(std::string(kGossipFirstRangeKey), nlohmann::json(first_range));

    zmq::context_t context;
    ZmqTransport transport(context);
    int rc = 0;
    {
        DistDB db(gossip, transport, config);

        const std::string &cmd = args[i];
        const size_t nargs = args.size() - i - 1;
        if (cmd == "bootstrap" && nargs == 0)
        {
            auto done = bootstrap_range_locations(db, first_range.replicas.front());
            rc = done.is_ok() ? 0 : report(done.error());
        }
        else if (cmd == "get" && nargs == 1)
        {
            auto read = get_value<nlohmann::json>(db, args[i + 1]);
            if (read.is_error())
                rc = report(read.error());
            else if (!read.content().found)
                std::cout << "(not found)\n";
            else
                std::cout << read.content().value->dump() << " @" << read.content().timestamp << "\n";
        }
        else if (cmd == "put" && nargs == 2)
        {
            const auto value = nlohmann::json::parse(args[i + 2], nullptr, /*allow_exceptions=*/false);
            if (value.is_discarded())
            {
                std::cerr << "error: value is not JSON\n";
                rc = 2;
            }
            else
            {
                auto written = put_value(db, args[i + 1], value);
                rc = written.is_ok() ? 0 : report(written.error());
            }
        }
        else if (cmd == "incr" && nargs == 2)
        {
            IncrementRequest req;
            req.key = args[i + 1];
            req.increment = std::strtoll(args[i + 2].c_str(), nullptr, 10);
            auto resp = db.increment(req).get();
            rc = report(resp.header.error);
            if (rc == 0)
                std::cout << resp.new_value << "\n";
        }
        else if (cmd == "del" && nargs == 1)
        {
            DeleteRequest req;
            req.key = args[i + 1];
            rc = report(db.delete_key(req).get().header.error);
        }
        else
        {
            rc = usage();
        }
    }

    logger.shutdown();
    return rc;
}
