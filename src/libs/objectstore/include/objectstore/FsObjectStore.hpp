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

#include <cstddef>
#include <filesystem>
#include <memory>

#include "transfer/IObjectStore.hpp"

namespace mtg::objectstore
{
    // Objects are stored under <rootDirectory>/objects/<key>, their content type under <rootDirectory>/meta/<key>
    // IO is done on a dedicated pool of threadCount threads
    // Streams must not outlive the store
    // throws MtgException if the directories cannot be created
    std::unique_ptr<transfer::IObjectStore> createFsObjectStore(const std::filesystem::path& rootDirectory, std::size_t threadCount);
} // namespace mtg::objectstore
