/**
 * @file task.hpp
 * @brief Run a callable on a Boost.Asio thread pool and get a future back
 */

#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace fm {

namespace asio = boost::asio;

/**
 * @brief Run a callable on a thread pool and hand back its future
 *
 * The callable runs exactly once on one of the pool's threads. Its return
 * value (or exception) is delivered through the returned future.
 *
 * EXAMPLE:
 * asio::thread_pool pool(2);
 * auto future = post_task(pool, [] { return 42; });
 * int value = future.get();
 */
template<typename Fn>
std::future<std::invoke_result_t<std::decay_t<Fn>>> post_task(asio::thread_pool& pool, Fn&& fn) {
    using R = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    asio::post(pool, [task]() { (*task)(); });
    return future;
}

} // namespace fm
