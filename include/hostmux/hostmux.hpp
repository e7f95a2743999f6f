#pragma once

#include "aggregator.hpp"
#include "capture.hpp"
#include "client.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "json.hpp"
#include "secrets.hpp"
#include "server_config.hpp"
#include "types.hpp"
#include "utils.hpp"
#include "version.hpp"
