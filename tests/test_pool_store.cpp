// cpamm - Pool Store Tests

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"
#include <cpamm/errors.hpp>
#include <cpamm/pool_store.hpp>

#include <stdexcept>
#include <utility>

using namespace cpamm;

namespace {

const Asset kTokenA{addresses::from_id(0x1001)};
const Asset kTokenB{addresses::from_id(0x2002)};
const Asset kTokenC{addresses::from_id(0x3003)};

Pool make_pool(const Asset& a, const Asset& b, U128 r0, U128 r1) {
    AssetPair pair = PoolStore::canonical_pair(a, b);
    Pool pool{};
    pool.id = PoolStore::derive_id(pair);
    pool.asset0 = pair.asset0;
    pool.asset1 = pair.asset1;
    pool.reserve0 = r0;
    pool.reserve1 = r1;
    pool.fee_bps = 30;
    pool.total_shares = 100;
    pool.share_balances[addresses::from_id(1)] = 100;
    return pool;
}

} // anonymous namespace

TEST_CASE("Canonical pair ordering", "[pool_store]") {
    SECTION("Order independent") {
        AssetPair ab = PoolStore::canonical_pair(kTokenA, kTokenB);
        AssetPair ba = PoolStore::canonical_pair(kTokenB, kTokenA);
        REQUIRE(ab == ba);
        REQUIRE(ab.asset0 == kTokenA);
        REQUIRE(ab.asset1 == kTokenB);
    }

    SECTION("Identical assets rejected") {
        try {
            PoolStore::canonical_pair(kTokenA, kTokenA);
            FAIL("expected AmmError");
        } catch (const AmmError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidToken);
        }
    }
}

TEST_CASE("Pool identifier derivation", "[pool_store]") {
    SECTION("Symmetric in the pair") {
        REQUIRE(PoolStore::pool_id_for(kTokenA, kTokenB) ==
                PoolStore::pool_id_for(kTokenB, kTokenA));
    }

    SECTION("Distinct pairs get distinct ids") {
        PoolId ab = PoolStore::pool_id_for(kTokenA, kTokenB);
        PoolId ac = PoolStore::pool_id_for(kTokenA, kTokenC);
        PoolId bc = PoolStore::pool_id_for(kTokenB, kTokenC);
        REQUIRE(ab != ac);
        REQUIRE(ab != bc);
        REQUIRE(ac != bc);
    }

    SECTION("Deterministic") {
        AssetPair pair = PoolStore::canonical_pair(kTokenA, kTokenB);
        REQUIRE(PoolStore::derive_id(pair) == PoolStore::derive_id(pair));
    }
}

TEST_CASE("Pool registry", "[pool_store]") {
    PoolStore store;
    Pool& inserted = store.insert(make_pool(kTokenA, kTokenB, 1000, 2000));
    PoolId id = inserted.id;

    SECTION("Lookup by id and pair") {
        REQUIRE(store.size() == 1);
        REQUIRE(store.contains(id));
        REQUIRE(store.find(PoolStore::canonical_pair(kTokenB, kTokenA)) == id);
        REQUIRE_FALSE(store.find(PoolStore::canonical_pair(kTokenA, kTokenC)).has_value());
    }

    SECTION("Snapshot") {
        PoolInfo info = store.info(id);
        REQUIRE(info.asset0 == kTokenA);
        REQUIRE(info.asset1 == kTokenB);
        REQUIRE(info.reserve0 == U128(1000));
        REQUIRE(info.reserve1 == U128(2000));
        REQUIRE(info.fee_bps == 30);
        REQUIRE(info.total_shares == U128(100));
    }

    SECTION("Share balances") {
        REQUIRE(store.share_balance(id, addresses::from_id(1)) == U128(100));
        REQUIRE(store.share_balance(id, addresses::from_id(2)) == U128(0));
    }

    SECTION("Duplicate pair rejected") {
        try {
            store.insert(make_pool(kTokenB, kTokenA, 5, 5));
            FAIL("expected AmmError");
        } catch (const AmmError& e) {
            REQUIRE(e.code() == ErrorCode::PoolExists);
        }
        REQUIRE(store.size() == 1);
        REQUIRE(store.info(id).reserve0 == U128(1000));
    }

    SECTION("Unknown id") {
        PoolId missing = PoolStore::pool_id_for(kTokenA, kTokenC);
        try {
            (void)store.info(missing);
            FAIL("expected AmmError");
        } catch (const AmmError& e) {
            REQUIRE(e.code() == ErrorCode::PoolNotFound);
        }
        REQUIRE_THROWS_AS(store.share_balance(missing, addresses::from_id(1)), AmmError);
    }

    SECTION("Id must match the pair") {
        Pool pool = make_pool(kTokenA, kTokenC, 1, 1);
        pool.id += 1;
        REQUIRE_THROWS_AS(store.insert(std::move(pool)), std::logic_error);
        REQUIRE(store.size() == 1);
    }

    SECTION("Unsorted assets rejected") {
        Pool pool = make_pool(kTokenA, kTokenC, 1, 1);
        std::swap(pool.asset0, pool.asset1);
        REQUIRE_THROWS_AS(store.insert(std::move(pool)), AmmError);
    }
}
