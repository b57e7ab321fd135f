// Pool state construction and parsing

#include <catch2/catch_test_macros.hpp>
#include "pool_state.hpp"
#include "quote_errors.hpp"

using namespace cpswap;

TEST_CASE("Pool state validates its fee", "[pool_state]") {
    SECTION("Typical 0.3% pool") {
        PoolState pool(1000, 2000, 30, 10000);
        REQUIRE(pool.reserve_in() == 1000);
        REQUIRE(pool.reserve_out() == 2000);
        REQUIRE(pool.fee_multiplier() == 9970);
        REQUIRE(pool.is_liquid());
    }

    SECTION("Zero fee is allowed") {
        PoolState pool(1, 1, 0, 1);
        REQUIRE(pool.fee_multiplier() == 1);
    }

    SECTION("Zero denominator") {
        REQUIRE_THROWS_AS(PoolState(1000, 1000, 0, 0), invalid_pool_config);
    }

    SECTION("Numerator equal to denominator") {
        REQUIRE_THROWS_AS(PoolState(1000, 1000, 10000, 10000), invalid_pool_config);
    }

    SECTION("Numerator above denominator") {
        REQUIRE_THROWS_AS(PoolState(1000, 1000, 10001, 10000), invalid_pool_config);
    }

    SECTION("Empty reserves construct but are not liquid") {
        PoolState pool(0, 1000, 3, 1000);
        REQUIRE_FALSE(pool.is_liquid());
        REQUIRE_FALSE(PoolState(1000, 0, 3, 1000).is_liquid());
    }
}

TEST_CASE("Signed construction rejects negatives", "[pool_state]") {
    REQUIRE(make_pool_state(10, 20, 3, 1000) == PoolState(10, 20, 3, 1000));
    REQUIRE_THROWS_AS(make_pool_state(-1, 20, 3, 1000), invalid_pool_config);
    REQUIRE_THROWS_AS(make_pool_state(10, -20, 3, 1000), invalid_pool_config);
    REQUIRE_THROWS_AS(make_pool_state(10, 20, -3, 1000), invalid_pool_config);
    REQUIRE_THROWS_AS(make_pool_state(10, 20, 3, -1000), invalid_pool_config);

    SECTION("Full 256-bit magnitude is accepted") {
        int256 big = int256(ConstantProductMath::max_uint256());
        PoolState pool = make_pool_state(big, big, 0, 1);
        REQUIRE(pool.reserve_in() == ConstantProductMath::max_uint256());
    }
}

TEST_CASE("Decimal amounts parse exactly", "[pool_state][parse]") {
    REQUIRE(parse_amount("0") == 0);
    REQUIRE(parse_amount("000") == 0);
    REQUIRE(parse_amount("010") == 10);
    REQUIRE(parse_amount("500000000000000000000") == uint256("500000000000000000000"));
    REQUIRE(parse_amount(ConstantProductMath::max_uint256().str()) == ConstantProductMath::max_uint256());

    SECTION("Rejected inputs") {
        REQUIRE_THROWS_AS(parse_amount(""), invalid_pool_config);
        REQUIRE_THROWS_AS(parse_amount("-5"), invalid_pool_config);
        REQUIRE_THROWS_AS(parse_amount("12a"), invalid_pool_config);
        REQUIRE_THROWS_AS(parse_amount("0x10"), invalid_pool_config);
        REQUIRE_THROWS_AS(parse_amount(" 1"), invalid_pool_config);
        // 2^256
        REQUIRE_THROWS_AS(
            parse_amount("115792089237316195423570985008687907853269984665640564039457584007913129639936"),
            invalid_pool_config);
    }

    SECTION("Whole pool from strings") {
        PoolState pool = parse_pool_state("1000000000000", "500000000000000000000", "30", "10000");
        REQUIRE(pool == PoolState(uint256("1000000000000"), uint256("500000000000000000000"), 30, 10000));
        REQUIRE_THROWS_AS(parse_pool_state("1", "1", "5", "5"), invalid_pool_config);
    }
}

TEST_CASE("Reversed view swaps reserves only", "[pool_state]") {
    PoolState pool(1000, 2000, 3, 1000);
    PoolState rev = pool.reversed();
    REQUIRE(rev.reserve_in() == 2000);
    REQUIRE(rev.reserve_out() == 1000);
    REQUIRE(rev.fee_numerator() == 3);
    REQUIRE(rev.fee_denominator() == 1000);
    REQUIRE(rev.reversed() == pool);
    REQUIRE(pool != rev);
}

TEST_CASE("Constant product is exact at full width", "[pool_state]") {
    const uint256 max = ConstantProductMath::max_uint256();
    PoolState pool(max, max, 0, 1);
    wide_uint k = pool.invariant_k();
    REQUIRE(k == ConstantProductMath::widen(max) * ConstantProductMath::widen(max));
    REQUIRE(PoolState(1000, 2000, 3, 1000).invariant_k() == 2000000);
}
