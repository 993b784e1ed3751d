/*
 * CHRONOID
 * Version 1.0, October 2026
 *
 * Copyright (c) 2026 The chronoid Authors.
 *
 * This source code is licensed under the MIT License.
 * See the LICENSE file in the project root for the full text.
 */

/**
 * @file uuid_test.cpp
 * @brief Unit tests for the `Uuid` value type.
 */

#include "chronoid/core/uuid.hpp"
#include "framework.hpp"

#include <cstdint>
#include <sstream>
#include <string>

using chronoid::core::Uuid;

void test_uuid_nil()
{
    Uuid nil;
    ASSERT_TRUE(nil.is_nil());
    ASSERT_EQ(nil.to_string(), std::string("00000000-0000-0000-0000-000000000000"));
}

/**
 * @brief Canonical text is lowercase 8-4-4-4-12, most significant half first.
 */
void test_uuid_to_string()
{
    Uuid id(0x138140051dd211b2ULL, 0x8000000000000001ULL);
    ASSERT_EQ(id.to_string(), std::string("13814005-1dd2-11b2-8000-000000000001"));

    std::stringstream ss;
    ss << id;
    ASSERT_EQ(ss.str(), id.to_string());
}

void test_uuid_parse()
{
    auto id = Uuid::parse("  C232AB00-9414-11EC-B3C8-9F6BDECED846 ");
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(id->most_significant_bits(), 0xc232ab00941411ecULL);
    ASSERT_EQ(id->least_significant_bits(), 0xb3c89f6bdeced846ULL);
    ASSERT_EQ(id->to_string(), std::string("c232ab00-9414-11ec-b3c8-9f6bdeced846"));
}

/**
 * @brief Wrong length, misplaced hyphens and non-hex digits are rejected.
 */
void test_uuid_parse_rejects_malformed()
{
    ASSERT_FALSE(Uuid::parse("").has_value());
    ASSERT_FALSE(Uuid::parse("c232ab00-9414-11ec-b3c8-9f6bdeced84").has_value());
    ASSERT_FALSE(Uuid::parse("c232ab0009414-11ec-b3c8-9f6bdeced846").has_value());
    ASSERT_FALSE(Uuid::parse("g232ab00-9414-11ec-b3c8-9f6bdeced846").has_value());
    ASSERT_FALSE(Uuid::parse("c232ab00-9414-11ec-b3c8-9f6bdeced846-").has_value());
}

/**
 * @brief Decodes the version nibble and the variable-length variant field.
 */
void test_uuid_version_and_variant()
{
    Uuid v1(0x0000000000001000ULL, 0x8000000000000000ULL);
    ASSERT_EQ(v1.version(), 1);
    ASSERT_EQ(v1.variant(), 2);

    ASSERT_EQ(Uuid(0, 0x3000000000000000ULL).variant(), 0);
    ASSERT_EQ(Uuid(0, 0xb000000000000000ULL).variant(), 2);
    ASSERT_EQ(Uuid(0, 0xc000000000000000ULL).variant(), 6);
    ASSERT_EQ(Uuid(0, 0xe000000000000000ULL).variant(), 7);
    ASSERT_EQ(Uuid(0x4000, 0).version(), 4);
}

/**
 * @brief Clock sequence and node are read from the least significant half.
 */
void test_uuid_fields()
{
    // Variant 10, sequence 0x2a5c, node 02:42:ac:11:00:02.
    Uuid id(0x138140051dd211b2ULL, 0x8000000000000000ULL | (0x2a5cULL << 48) | 0x0242ac110002ULL);
    ASSERT_EQ(id.clock_sequence(), static_cast<uint16_t>(0x2a5c));
    ASSERT_EQ(id.node(), 0x0242ac110002ULL);
    ASSERT_EQ(id.variant(), 2);
    ASSERT_EQ(id.timestamp(), 0x01b21dd213814005ULL);
    ASSERT_EQ(id.unix_millis(), static_cast<int64_t>(0));
}

void test_uuid_ordering()
{
    Uuid a(1, 5);
    Uuid b(1, 6);
    Uuid c(2, 0);
    ASSERT_TRUE(a < b);
    ASSERT_TRUE(b < c);
    ASSERT_FALSE(c < a);
    ASSERT_TRUE(a == Uuid(1, 5));
    ASSERT_NE(a, b);
}
