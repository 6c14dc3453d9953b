// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ObjectFS/Core/CancellationToken.hpp"
#include "ObjectFS/Core/ObjectError.hpp"
namespace ObjectFS::Core
{
    CancellationToken::CancellationToken(std::stop_token stopToken)
        : m_stopToken(std::move(stopToken))
    {
    }

    CancellationToken::CancellationToken(std::stop_token stopToken, const Deadline deadline)
        : m_stopToken(std::move(stopToken)),
        m_deadline(deadline)
    {
    }

    CancellationToken CancellationToken::WithTimeout(const std::chrono::milliseconds timeout, std::stop_token stopToken)
    {
        return CancellationToken{ std::move(stopToken), std::chrono::system_clock::now() + timeout };
    }

    bool CancellationToken::IsStopRequested() const noexcept
    {
        return m_stopToken.stop_requested();
    }

    bool CancellationToken::IsExpired() const noexcept
    {
        return m_deadline && std::chrono::system_clock::now() >= *m_deadline;
    }

    bool CancellationToken::IsCancellationRequested() const noexcept
    {
        return IsStopRequested() || IsExpired();
    }

    const std::stop_token& CancellationToken::GetStopToken() const noexcept
    {
        return m_stopToken;
    }

    const std::optional<CancellationToken::Deadline>& CancellationToken::GetDeadline() const noexcept
    {
        return m_deadline;
    }

    void CancellationToken::ThrowIfCancellationRequested() const
    {
        if (IsStopRequested())
        {
            throw ObjectError(ObjectErrorCode::Cancelled, "Operation was cancelled");
        }

        if (IsExpired())
        {
            throw ObjectError(ObjectErrorCode::Cancelled, "Operation deadline expired");
        }
    }
}
