/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of MTG.
 *
 * MTG is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MTG is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MTG.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <string>

#include "core/Exception.hpp"

namespace mtg::transfer
{
    enum class TransferErrorKind
    {
        BadRequest,
        NotFound,
        PayloadTooLarge,
        RangeNotSatisfiable,
        GatewayTimeout,
        InternalError,
    };

    unsigned toHttpStatus(TransferErrorKind kind);
    const char* getReasonPhrase(TransferErrorKind kind);

    // Only upstream slowness is worth a retry, everything else is terminal
    constexpr bool isRetryable(TransferErrorKind kind)
    {
        return kind == TransferErrorKind::GatewayTimeout;
    }

    class TransferException : public core::MtgException
    {
    public:
        TransferException(TransferErrorKind kind, const std::string& message)
            : core::MtgException{ message }
            , _kind{ kind }
        {
        }

        TransferErrorKind getKind() const { return _kind; }

    private:
        TransferErrorKind _kind;
    };
} // namespace mtg::transfer
