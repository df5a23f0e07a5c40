#pragma once

#include "nyayacpp/errors.hpp"
#include "nyayacpp/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace nyayacpp {

namespace detail {

// Runs `fn` on a detached thread and waits up to `timeout`. A call that times out keeps running
// in the background, so `fn` must own everything it touches (capture by value or shared_ptr).
template <typename Fn>
std::invoke_result_t<Fn&> RunWithTimeout(std::chrono::milliseconds timeout, const std::string& what, Fn fn) {
  using Result = std::invoke_result_t<Fn&>;
  if (timeout.count() <= 0) {
    return fn();
  }

  auto promise = std::make_shared<std::promise<Result>>();
  auto future = promise->get_future();
  std::thread([promise, fn = std::move(fn)]() mutable {
    try {
      if constexpr (std::is_void_v<Result>) {
        fn();
        promise->set_value();
      } else {
        promise->set_value(fn());
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(timeout) == std::future_status::timeout) {
    throw ProviderTransientError(what + " timed out after " + std::to_string(timeout.count()) + " ms");
  }
  return future.get();
}

}  // namespace detail

// Applies the per-call timeout and at most one retry on ProviderTransientError. Every other
// exception, ConfigurationError included, propagates on the first attempt.
template <typename Fn>
std::invoke_result_t<Fn&> CallWithPolicy(const CallPolicy& policy, const std::string& what, Fn fn) {
  const int attempts = 1 + std::clamp(policy.max_retries, 0, 1);
  for (int attempt = 1;; ++attempt) {
    try {
      return detail::RunWithTimeout(policy.timeout, what, fn);
    } catch (const ProviderTransientError& e) {
      if (attempt >= attempts) {
        throw;
      }
      spdlog::warn("{} failed ({}), retrying in {} ms", what, e.what(), policy.backoff.count());
      std::this_thread::sleep_for(policy.backoff);
    }
  }
}

}  // namespace nyayacpp
