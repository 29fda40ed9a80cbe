#pragma once

// Primary public header. Most users should include this header only.

// Error & result model
#include <strata/error.hpp>
#include <strata/expected.hpp>
#include <strata/log.hpp>
#include <strata/result.hpp>

// Coroutines & execution
#include <strata/awaitable.hpp>
#include <strata/co_sleep.hpp>
#include <strata/co_spawn.hpp>
#include <strata/io_context.hpp>
#include <strata/notify_event.hpp>
#include <strata/runtime.hpp>
#include <strata/steady_timer.hpp>
#include <strata/strand.hpp>
#include <strata/this_coro.hpp>
#include <strata/work_guard.hpp>

// Bytes & framing
#include <strata/buffer.hpp>
#include <strata/codec.hpp>

// Services
#include <strata/middleware.hpp>
#include <strata/pipeline.hpp>
#include <strata/service.hpp>
#include <strata/service_factory.hpp>

// Connections
#include <strata/acceptor.hpp>
#include <strata/address.hpp>
#include <strata/connection_counter.hpp>
#include <strata/connector.hpp>
#include <strata/dispatcher.hpp>
#include <strata/io_object.hpp>
#include <strata/resolver.hpp>
#include <strata/server.hpp>
#include <strata/socket_transport.hpp>
#include <strata/tls.hpp>
#include <strata/transport.hpp>
