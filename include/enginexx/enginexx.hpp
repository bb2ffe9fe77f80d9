/*

enginexx.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

// Utilities
#include <enginexx/detail/log.hpp>
#include <enginexx/detail/reconnection.hpp>
#include <enginexx/detail/transport_fault.hpp>

// Session pooling
#include <enginexx/pool.hpp>

// Engine WebSocket transport
#include <enginexx/engine/engine_options.hpp>
#include <enginexx/engine/engine_session.hpp>
#include <enginexx/engine/engine_pool.hpp>
