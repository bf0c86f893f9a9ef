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

#include "transfer/TransferError.hpp"

namespace mtg::transfer
{
    unsigned toHttpStatus(TransferErrorKind kind)
    {
        switch (kind)
        {
        case TransferErrorKind::BadRequest:
            return 400;
        case TransferErrorKind::NotFound:
            return 404;
        case TransferErrorKind::PayloadTooLarge:
            return 413;
        case TransferErrorKind::RangeNotSatisfiable:
            return 416;
        case TransferErrorKind::GatewayTimeout:
            return 504;
        case TransferErrorKind::InternalError:
            return 500;
        }
        return 500;
    }

    const char* getReasonPhrase(TransferErrorKind kind)
    {
        switch (kind)
        {
        case TransferErrorKind::BadRequest:
            return "Bad Request";
        case TransferErrorKind::NotFound:
            return "Not Found";
        case TransferErrorKind::PayloadTooLarge:
            return "Payload Too Large";
        case TransferErrorKind::RangeNotSatisfiable:
            return "Range Not Satisfiable";
        case TransferErrorKind::GatewayTimeout:
            return "Gateway Timeout";
        case TransferErrorKind::InternalError:
            return "Internal Server Error";
        }
        return "Internal Server Error";
    }
} // namespace mtg::transfer
