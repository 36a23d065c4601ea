#pragma once
/**
 * @file rkv_kv.hpp
 * @brief Layer 3: Client routing for the range-partitioned key-value store.
 *
 * Include this to talk to a cluster: DistDB and the typed helpers on top of
 * it, the gossip and transport seams it needs, and the ZeroMQ transport.
 */
#include "rkv_service.hpp"

#include "kv/api.hpp"
#include "kv/codec.hpp"
#include "kv/dist_db.hpp"
#include "kv/error.hpp"
#include "kv/gossip.hpp"
#include "kv/router.hpp"
#include "kv/router_config.hpp"
#include "kv/typed_access.hpp"
#include "kv/types.hpp"
#include "kv/zmq_transport.hpp"
