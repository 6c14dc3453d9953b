// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <chrono>
#include <optional>
#include <stop_token>
namespace ObjectFS::Core
{
    /// <summary>
    /// Carries a caller's stop request and/or deadline down to every fetch of a read session.
    /// A default constructed token never cancels.
    /// </summary>
    class CancellationToken
    {
    public:
        using Deadline = std::chrono::system_clock::time_point;

    private:
        std::stop_token m_stopToken;
        std::optional<Deadline> m_deadline;

    public:
        CancellationToken() = default;
        explicit CancellationToken(std::stop_token stopToken);
        CancellationToken(std::stop_token stopToken, Deadline deadline);

        [[nodiscard]] static CancellationToken WithTimeout(std::chrono::milliseconds timeout, std::stop_token stopToken = {});

        [[nodiscard]] bool IsStopRequested() const noexcept;
        [[nodiscard]] bool IsExpired() const noexcept;
        [[nodiscard]] bool IsCancellationRequested() const noexcept;

        [[nodiscard]] const std::stop_token& GetStopToken() const noexcept;
        [[nodiscard]] const std::optional<Deadline>& GetDeadline() const noexcept;

        /// <summary>
        /// Throws ObjectError with ObjectErrorCode::Cancelled if a stop was requested or the deadline passed.
        /// </summary>
        void ThrowIfCancellationRequested() const;
    };
}
