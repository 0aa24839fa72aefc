/*
 * Copyright (C) 2025 The olmover authors
 *
 * This file is part of olmover.
 *
 * olmover is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * olmover is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with olmover.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <variant>

#include "core/http/ClientRequestParameters.hpp"

namespace olmover::core::http
{
    class ClientRequest
    {
    public:
        ClientRequest(ClientGETRequestParameters&& GETParams)
            : _parameters{ std::move(GETParams) } {}
        ClientRequest(ClientPOSTRequestParameters&& POSTParams)
            : _parameters{ std::move(POSTParams) } {}

        std::size_t retryCount{};

        const ClientRequestParameters& getParameters() const
        {
            return std::visit([](const auto& parameters) -> const ClientRequestParameters& { return parameters; }, _parameters);
        }

        enum class Type
        {
            GET,
            POST,
        };
        Type getType() const
        {
            return std::holds_alternative<ClientGETRequestParameters>(_parameters) ? Type::GET : Type::POST;
        }

        const ClientGETRequestParameters& getGETParameters() const { return std::get<ClientGETRequestParameters>(_parameters); }
        const ClientPOSTRequestParameters& getPOSTParameters() const { return std::get<ClientPOSTRequestParameters>(_parameters); }

    private:
        std::variant<ClientGETRequestParameters, ClientPOSTRequestParameters> _parameters;
    };
} // namespace olmover::core::http
