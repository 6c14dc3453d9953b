// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/BodyStream.hpp"

#include <azure/core/context.hpp>
#include <azure/core/io/body_stream.hpp>

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
namespace ObjectFS::Azure::Impl
{
    using StopCallback = std::stop_callback<std::function<void()>>;

    /// <summary>
    /// Reads a download's body under the context of the download. The stop callback that cancels
    /// the context stays registered until the body is released.
    /// </summary>
    class AzureBodyStream final : public Core::BodyStream
    {
        std::string m_key;
        std::unique_ptr<::Azure::Core::IO::BodyStream> m_stream;
        ::Azure::Core::Context m_context;
        std::unique_ptr<StopCallback> m_stopCallback;

    public:
        AzureBodyStream(std::string key,
            std::unique_ptr<::Azure::Core::IO::BodyStream> stream,
            ::Azure::Core::Context context,
            std::unique_ptr<StopCallback> stopCallback);

        virtual int64_t Read(std::span<char> buffer) override;
    };
}
