/*

awaitable_traits.hpp
--------------------

Small utilities to extract value types from Asio awaitables.

*/

#pragma once

#include <type_traits>

#include <enginexx/detail/asio_decl.hpp>

namespace enginexx::detail
{

template<class>
struct awaitable_value;

template<class T, class Executor>
struct awaitable_value<enginexx::asio::awaitable<T, Executor>>
{
    using type = T;
};

template<class T>
using awaitable_value_t = typename awaitable_value<std::remove_cvref_t<T>>::type;

/// Value produced by co_await-ing the result of Fn(Args...)
template<class Fn, class... Args>
using invoke_awaitable_t = awaitable_value_t<std::invoke_result_t<Fn, Args...>>;

} // namespace enginexx::detail
