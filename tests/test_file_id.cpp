#include <gtest/gtest.h>
#include <string>
#include <unordered_set>

#include "proto/file_id.hpp"

using proto::FileId;

TEST(FileId, GenerateIsRandomV4)
{
    FileId a = FileId::generate();
    FileId b = FileId::generate();
    EXPECT_NE(a, b);
    EXPECT_FALSE(a.is_nil());

    // version nibble 4, variant bits 10
    EXPECT_EQ(a.bytes[6] >> 4, 0x4);
    EXPECT_EQ(a.bytes[8] & 0xC0, 0x80);
}

TEST(FileId, StringRoundtrip)
{
    FileId      id = FileId::generate();
    std::string s  = id.to_string();
    ASSERT_EQ(s.size(), 36u);
    EXPECT_EQ(s[8], '-');
    EXPECT_EQ(s[23], '-');

    auto back = FileId::from_string(s);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, id);
}

TEST(FileId, FromStringAcceptsUpperCase)
{
    auto id = FileId::from_string("7E0F8F20-CC0B-4C6E-8A3E-5D21B2F8A9C4");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->to_string(), "7e0f8f20-cc0b-4c6e-8a3e-5d21b2f8a9c4");
}

TEST(FileId, FromStringRejectsGarbage)
{
    EXPECT_FALSE(FileId::from_string("").has_value());
    EXPECT_FALSE(FileId::from_string("7e0f8f20cc0b4c6e8a3e5d21b2f8a9c4").has_value());
    EXPECT_FALSE(FileId::from_string("7e0f8f20-cc0b-4c6e-8a3e-5d21b2f8a9cg").has_value());
    EXPECT_FALSE(FileId::from_string("7e0f8f20-cc0b-4c6e-8a3e_5d21b2f8a9c4").has_value());
}

TEST(FileId, NilAndHash)
{
    FileId nil{};
    EXPECT_TRUE(nil.is_nil());
    EXPECT_EQ(nil.to_string(), "00000000-0000-0000-0000-000000000000");

    std::unordered_set<FileId> ids;
    for (int i = 0; i < 256; ++i)
        ids.insert(FileId::generate());
    EXPECT_EQ(ids.size(), 256u);
}
