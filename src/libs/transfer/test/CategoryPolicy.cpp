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

#include <gtest/gtest.h>

#include "core/SizeLiterals.hpp"
#include "transfer/CategoryPolicy.hpp"
#include "transfer/MediaCategory.hpp"
#include "transfer/TransferError.hpp"

namespace mtg::transfer::tests
{
    using namespace core::literals;

    TEST(MediaCategory, names)
    {
        for (const MediaCategory category : mediaCategories)
            EXPECT_EQ(parseCategoryName(getCategoryName(category)), category);

        EXPECT_EQ(getKeyPrefix(MediaCategory::Book), "books");
        EXPECT_EQ(getKeyPrefix(MediaCategory::Image), "images");
        EXPECT_EQ(getKeyPrefix(MediaCategory::Cover), "covers");
        EXPECT_FALSE(parseCategoryName("books"));
        EXPECT_FALSE(parseCategoryName("Audio"));
        EXPECT_FALSE(parseCategoryName(""));
    }

    TEST(CategoryPolicy, normalizeContentType)
    {
        EXPECT_EQ(normalizeContentType("audio/mpeg"), "audio/mpeg");
        EXPECT_EQ(normalizeContentType("Audio/MPEG; foo=bar"), "audio/mpeg");
        EXPECT_EQ(normalizeContentType("  image/png  "), "image/png");
        EXPECT_EQ(normalizeContentType(""), "");
    }

    TEST(CategoryPolicy, contentTypeAllowed)
    {
        const CategoryPolicy policy{ getDefaultCategoryPolicy(MediaCategory::Audio) };

        EXPECT_TRUE(policy.isContentTypeAllowed("audio/mpeg"));
        EXPECT_TRUE(policy.isContentTypeAllowed("AUDIO/MPEG"));
        EXPECT_TRUE(policy.isContentTypeAllowed("audio/flac; charset=binary"));
        EXPECT_FALSE(policy.isContentTypeAllowed("video/mp4"));
        EXPECT_FALSE(policy.isContentTypeAllowed("text/html"));
        EXPECT_FALSE(policy.isContentTypeAllowed(""));
    }

    TEST(CategoryPolicy, defaults)
    {
        EXPECT_EQ(getDefaultCategoryPolicy(MediaCategory::Book).maxSizeBytes, 100_MiB);
        EXPECT_EQ(getDefaultCategoryPolicy(MediaCategory::Audio).maxSizeBytes, 500_MiB);
        EXPECT_EQ(getDefaultCategoryPolicy(MediaCategory::Video).maxSizeBytes, 2_GiB);
        EXPECT_EQ(getDefaultCategoryPolicy(MediaCategory::Image).maxSizeBytes, 100_MiB);
        EXPECT_EQ(getDefaultCategoryPolicy(MediaCategory::Cover).maxSizeBytes, 5_MiB);

        EXPECT_TRUE(getDefaultCategoryPolicy(MediaCategory::Book).isContentTypeAllowed("application/pdf"));
        EXPECT_TRUE(getDefaultCategoryPolicy(MediaCategory::Cover).isContentTypeAllowed("image/jpeg"));
        EXPECT_FALSE(getDefaultCategoryPolicy(MediaCategory::Cover).isContentTypeAllowed("image/svg+xml"));

        for (const MediaCategory category : mediaCategories)
            EXPECT_FALSE(getDefaultCategoryPolicy(category).allowedContentTypes.empty()) << getCategoryName(category);
    }

    TEST(TransferError, httpStatus)
    {
        EXPECT_EQ(toHttpStatus(TransferErrorKind::BadRequest), 400);
        EXPECT_EQ(toHttpStatus(TransferErrorKind::NotFound), 404);
        EXPECT_EQ(toHttpStatus(TransferErrorKind::PayloadTooLarge), 413);
        EXPECT_EQ(toHttpStatus(TransferErrorKind::RangeNotSatisfiable), 416);
        EXPECT_EQ(toHttpStatus(TransferErrorKind::GatewayTimeout), 504);
        EXPECT_EQ(toHttpStatus(TransferErrorKind::InternalError), 500);

        EXPECT_STREQ(getReasonPhrase(TransferErrorKind::GatewayTimeout), "Gateway Timeout");
    }

    TEST(TransferError, retryable)
    {
        static_assert(isRetryable(TransferErrorKind::GatewayTimeout));

        EXPECT_FALSE(isRetryable(TransferErrorKind::BadRequest));
        EXPECT_FALSE(isRetryable(TransferErrorKind::NotFound));
        EXPECT_FALSE(isRetryable(TransferErrorKind::PayloadTooLarge));
        EXPECT_FALSE(isRetryable(TransferErrorKind::RangeNotSatisfiable));
        EXPECT_FALSE(isRetryable(TransferErrorKind::InternalError));
    }
} // namespace mtg::transfer::tests
