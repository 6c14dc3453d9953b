// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ObjectFS/Core/ObjectClient.hpp"
#include <gmock/gmock.h>
namespace ObjectFS::Core::Mocks
{
    class ObjectClientMock : public ObjectClient
    {
    public:
        ObjectClientMock();
        virtual ~ObjectClientMock();

        MOCK_METHOD(FetchResponse, Fetch, (const std::string& key, const std::optional<ByteRange>& range, const CancellationToken& cancellation), (override));
    };
}
