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

#include <set>

#include <gtest/gtest.h>

#include "transfer/KeyPathValidator.hpp"
#include "transfer/TransferError.hpp"

namespace mtg::transfer::tests
{
    namespace
    {
        std::optional<KeyRejectionReason> getRejection(std::string_view key, MediaCategory category)
        {
            const KeyValidationResult result{ validateStorageKey(key, category) };
            if (const KeyRejectionReason* reason{ std::get_if<KeyRejectionReason>(&result) })
                return *reason;

            return std::nullopt;
        }
    } // namespace

    TEST(KeyPathValidator, accepted)
    {
        const KeyValidationResult result{ validateStorageKey("audio/user_42/track.mp3", MediaCategory::Audio) };
        const StorageKey* key{ std::get_if<StorageKey>(&result) };
        ASSERT_NE(key, nullptr);

        EXPECT_EQ(key->getAsString(), "audio/user_42/track.mp3");
        EXPECT_EQ(key->getCategory(), MediaCategory::Audio);
        EXPECT_EQ(key->getOwnerId(), "user_42");
        EXPECT_EQ(key->getFilename(), "track.mp3");
        EXPECT_EQ(key->getExtension(), "mp3");
    }

    TEST(KeyPathValidator, acceptedForEachCategory)
    {
        EXPECT_FALSE(getRejection("books/a/b.pdf", MediaCategory::Book));
        EXPECT_FALSE(getRejection("audio/a/b.mp3", MediaCategory::Audio));
        EXPECT_FALSE(getRejection("video/a/b.mp4", MediaCategory::Video));
        EXPECT_FALSE(getRejection("images/a/b.png", MediaCategory::Image));
        EXPECT_FALSE(getRejection("covers/a/b.jpg", MediaCategory::Cover));
    }

    TEST(KeyPathValidator, noExtension)
    {
        const KeyValidationResult result{ validateStorageKey("video/abc/movie", MediaCategory::Video) };
        ASSERT_TRUE(std::holds_alternative<StorageKey>(result));
        EXPECT_EQ(std::get<StorageKey>(result).getExtension(), "");
    }

    TEST(KeyPathValidator, traversal)
    {
        EXPECT_EQ(getRejection("../../etc/passwd", MediaCategory::Audio), KeyRejectionReason::ParentReference);
        EXPECT_EQ(getRejection("audio/abc/../x", MediaCategory::Audio), KeyRejectionReason::ParentReference);
        EXPECT_EQ(getRejection("audio/../audio/x", MediaCategory::Audio), KeyRejectionReason::ParentReference);
        EXPECT_EQ(getRejection("audio/abc/..", MediaCategory::Audio), KeyRejectionReason::ParentReference);
        // any double dot, even inside a file name
        EXPECT_EQ(getRejection("audio/abc/a..mp3", MediaCategory::Audio), KeyRejectionReason::ParentReference);
    }

    TEST(KeyPathValidator, segments)
    {
        EXPECT_EQ(getRejection("", MediaCategory::Audio), KeyRejectionReason::Empty);
        EXPECT_EQ(getRejection("audio/", MediaCategory::Audio), KeyRejectionReason::WrongSegmentCount);
        EXPECT_EQ(getRejection("audio", MediaCategory::Audio), KeyRejectionReason::WrongSegmentCount);
        EXPECT_EQ(getRejection("audio/abc", MediaCategory::Audio), KeyRejectionReason::WrongSegmentCount);
        EXPECT_EQ(getRejection("audio/abc/def/x.mp3", MediaCategory::Audio), KeyRejectionReason::WrongSegmentCount);
        EXPECT_EQ(getRejection("/audio/abc/x", MediaCategory::Audio), KeyRejectionReason::WrongSegmentCount);
        EXPECT_EQ(getRejection("audio//x", MediaCategory::Audio), KeyRejectionReason::DoubledSeparator);
        EXPECT_EQ(getRejection("audio/abc/", MediaCategory::Audio), KeyRejectionReason::InvalidFilename);
        EXPECT_EQ(getRejection("audio/abc/.", MediaCategory::Audio), KeyRejectionReason::InvalidFilename);
    }

    TEST(KeyPathValidator, categoryMismatch)
    {
        EXPECT_EQ(getRejection("video/abc/x", MediaCategory::Audio), KeyRejectionReason::CategoryMismatch);
        EXPECT_EQ(getRejection("Audio/abc/x", MediaCategory::Audio), KeyRejectionReason::CategoryMismatch);
        EXPECT_EQ(getRejection("book/abc/x.pdf", MediaCategory::Book), KeyRejectionReason::CategoryMismatch);
        EXPECT_EQ(getRejection("images/abc/x.png", MediaCategory::Cover), KeyRejectionReason::CategoryMismatch);
    }

    TEST(KeyPathValidator, hostileCharacters)
    {
        using namespace std::string_literals;

        EXPECT_EQ(getRejection("audio\\abc\\x", MediaCategory::Audio), KeyRejectionReason::ForbiddenCharacter);
        EXPECT_EQ(getRejection("audio/abc/x\\y", MediaCategory::Audio), KeyRejectionReason::ForbiddenCharacter);
        EXPECT_EQ(getRejection("audio/abc/x\ny", MediaCategory::Audio), KeyRejectionReason::ForbiddenCharacter);
        EXPECT_EQ(getRejection("audio/abc/x\0y"s, MediaCategory::Audio), KeyRejectionReason::ForbiddenCharacter);
        EXPECT_EQ(getRejection("audio/a b/x", MediaCategory::Audio), KeyRejectionReason::InvalidOwner);
        EXPECT_EQ(getRejection("audio/a%2e/x", MediaCategory::Audio), KeyRejectionReason::InvalidOwner);
        EXPECT_EQ(getRejection("audio/./x", MediaCategory::Audio), KeyRejectionReason::InvalidOwner);
    }

    TEST(KeyPathValidator, lengths)
    {
        EXPECT_EQ(getRejection("audio/abc/" + std::string(1100, 'a'), MediaCategory::Audio), KeyRejectionReason::TooLong);
        EXPECT_EQ(getRejection("audio/abc/" + std::string(256, 'a'), MediaCategory::Audio), KeyRejectionReason::InvalidFilename);
        EXPECT_FALSE(getRejection("audio/abc/" + std::string(255, 'a'), MediaCategory::Audio));
        EXPECT_EQ(getRejection("audio/" + std::string(129, 'a') + "/x", MediaCategory::Audio), KeyRejectionReason::InvalidOwner);
        EXPECT_FALSE(getRejection("audio/" + std::string(128, 'a') + "/x", MediaCategory::Audio));
    }

    TEST(KeyPathValidator, ownerIds)
    {
        EXPECT_TRUE(isValidOwnerId("abc"));
        EXPECT_TRUE(isValidOwnerId("A-b_9"));
        EXPECT_FALSE(isValidOwnerId(""));
        EXPECT_FALSE(isValidOwnerId("a/b"));
        EXPECT_FALSE(isValidOwnerId("a.b"));
        EXPECT_FALSE(isValidOwnerId("é"));
    }

    TEST(KeyPathValidator, fileExtension)
    {
        EXPECT_EQ(computeFileExtension("song.MP3", "audio/mpeg"), "mp3");
        EXPECT_EQ(computeFileExtension("archive.tar.flac", "audio/flac"), "flac");
        EXPECT_EQ(computeFileExtension("", "audio/mpeg"), "mp3");
        EXPECT_EQ(computeFileExtension("noext", "image/jpeg"), "jpg");
        EXPECT_EQ(computeFileExtension("weird.e x", "application/pdf"), "pdf");
        EXPECT_EQ(computeFileExtension("long.abcdefghij", "video/mp4"), "mp4");
        EXPECT_EQ(computeFileExtension("", "application/x-unknown"), "bin");
    }

    TEST(KeyPathValidator, generation)
    {
        const StorageKey key{ generateStorageKey(MediaCategory::Cover, "owner-1", "png") };

        EXPECT_EQ(key.getCategory(), MediaCategory::Cover);
        EXPECT_EQ(key.getOwnerId(), "owner-1");
        EXPECT_EQ(key.getExtension(), "png");
        EXPECT_TRUE(key.getAsString().starts_with("covers/owner-1/"));
        EXPECT_EQ(key.getFilename().size(), 36 + 4);

        // generated keys always pass validation
        EXPECT_TRUE(std::holds_alternative<StorageKey>(validateStorageKey(key.getAsString(), MediaCategory::Cover)));
    }

    TEST(KeyPathValidator, generationIsUnique)
    {
        std::set<std::string> keys;
        for (int i{}; i < 1000; ++i)
            keys.insert(generateStorageKey(MediaCategory::Audio, "owner", "mp3").getAsString());

        EXPECT_EQ(keys.size(), 1000);
    }

    TEST(KeyPathValidator, generationRejectsInvalidOwner)
    {
        try
        {
            generateStorageKey(MediaCategory::Audio, "../etc", "mp3");
            FAIL() << "Expected an exception";
        }
        catch (const TransferException& e)
        {
            EXPECT_EQ(e.getKind(), TransferErrorKind::BadRequest);
        }
    }
} // namespace mtg::transfer::tests
