// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <mutex>
#include <stop_token>

namespace readalong
{

/// @brief Identity and cancellation handle of one synthesis run.
struct GenerationTicket
{
    std::uint64_t id = 0;
    std::stop_token stopToken;
};

/// @brief Owns the "current generation" token.
///
/// Every asynchronous result is tagged with the id it was issued under and
/// compared against current() on completion; stale results are dropped.
/// Starting a new generation requests stop on the previous one.
class GenerationTracker
{
  public:
    /// @brief Starts a new generation, cancelling the in-flight work of the previous one.
    [[nodiscard]] auto begin() -> GenerationTicket
    {
        auto lock = std::lock_guard(_mutex);
        _source.request_stop();
        _source = std::stop_source {};
        ++_current;
        return GenerationTicket { .id = _current, .stopToken = _source.get_token() };
    }

    /// @brief Cancels the current generation's in-flight work without starting a new one.
    void cancel()
    {
        auto lock = std::lock_guard(_mutex);
        _source.request_stop();
    }

    /// @brief Id of the newest generation (0 before the first one).
    [[nodiscard]] auto current() const -> std::uint64_t
    {
        auto lock = std::lock_guard(_mutex);
        return _current;
    }

    [[nodiscard]] auto isCurrent(std::uint64_t id) const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return id != 0 && id == _current;
    }

  private:
    mutable std::mutex _mutex;
    std::uint64_t _current = 0;
    std::stop_source _source;
};

} // namespace readalong
