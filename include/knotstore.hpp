#pragma once

// knotstore: ledger store, mempool, coordinator workers and event fan-out

#include "knotstore/common/config.hpp"
#include "knotstore/common/error.hpp"
#include "knotstore/common/logger.hpp"
#include "knotstore/events/cluster_publisher.hpp"
#include "knotstore/events/dispatcher.hpp"
#include "knotstore/events/socket_publisher.hpp"
#include "knotstore/events/webhook_publisher.hpp"
#include "knotstore/ledger/types.hpp"
#include "knotstore/mempool/mempool.hpp"
#include "knotstore/node/node.hpp"
#include "knotstore/storage/ledger_store.hpp"
