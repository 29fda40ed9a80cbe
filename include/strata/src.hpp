#pragma once

// Out-of-line definitions. Include from exactly one translation unit per executable.

#include <strata/impl/assert.ipp>
#include <strata/impl/error.ipp>
#include <strata/impl/log.ipp>

#include <strata/impl/reactor.ipp>
#include <strata/impl/steady_timer.ipp>
#include <strata/impl/thread_pool.ipp>
#include <strata/impl/work_stealing_pool.ipp>
#include <strata/impl/runtime.ipp>

#include <strata/impl/buffer.ipp>
#include <strata/impl/codec.ipp>

#include <strata/impl/address.ipp>
#include <strata/impl/resolver.ipp>
#include <strata/impl/socket_transport.ipp>
#include <strata/impl/acceptor.ipp>
#include <strata/impl/io_object.ipp>
#include <strata/impl/tls.ipp>
#include <strata/impl/connector.ipp>
