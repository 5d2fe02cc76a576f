#pragma once

// Umbrella header of the splicenet library.

#include "splicenet/byte-reader.hpp"
#include "splicenet/connection.hpp"
#include "splicenet/file.hpp"
#include "splicenet/generic-copy.hpp"
#include "splicenet/log.hpp"
#include "splicenet/op-error.hpp"
#include "splicenet/proxy.hpp"
#include "splicenet/socket-ops.hpp"
#include "splicenet/socket.hpp"
#include "splicenet/splice-config.hpp"
#include "splicenet/splice-engine.hpp"
#include "splicenet/splice-source.hpp"
#include "splicenet/tcp-connector.hpp"
#include "splicenet/transfer-result.hpp"
