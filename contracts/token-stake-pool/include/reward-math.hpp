#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

#include <tokenstake.hpp>

#include <limits>

namespace tokenstake {

   using eosio::check;

   static constexpr uint64_t seconds_per_day = TOKENSTAKE_SECONDS_PER_DAY;
   static constexpr uint64_t max_uint64 = std::numeric_limits<uint64_t>::max();

   inline uint64_t checked_add( const uint64_t a, const uint64_t b ) {
      const uint128_t r = uint128_t(a) + b;
      check( r <= max_uint64, "arithmetic error" );
      return uint64_t(r);
   }

   inline uint64_t checked_sub( const uint64_t a, const uint64_t b ) {
      check( a >= b, "arithmetic error" );
      return a - b;
   }

   inline uint64_t checked_mul( const uint64_t a, const uint64_t b ) {
      const uint128_t r = uint128_t(a) * b;
      check( r <= max_uint64, "arithmetic error" );
      return uint64_t(r);
   }

   /**
    * @brief Converts an unsigned ledger quantity into an asset amount
    *
    * asset amounts are limited to 2^62 - 1 (`asset::max_amount`)
    */
   inline int64_t to_asset_amount( const uint64_t v ) {
      check( v <= uint64_t(eosio::asset::max_amount), "arithmetic error" );
      return int64_t(v);
   }

   /**
    * @brief Calculates reward accrued by `stake_amount` over `elapsed_sec` seconds, without failing
    *
    * Whole days accrue `stake_amount * reward_rate` each. The remaining seconds of a partial day
    * are pro-rated and truncated: floor(stake_amount * reward_rate * remainder / 86400).
    * Every product and sum must fit in 64 bits.
    *
    * @param stake_amount - staked token amount
    * @param reward_rate - reward token units per day per staked token unit
    * @param elapsed_sec - seconds since last settlement, zero or negative accrues nothing
    * @param reward - accrued reward token amount, set only on success
    *
    * @return false on overflow
    */
   inline bool accrue_reward( const uint64_t stake_amount, const uint64_t reward_rate, const int64_t elapsed_sec,
                              uint64_t& reward ) {
      if ( elapsed_sec <= 0 || stake_amount == 0 ) {
         reward = 0;
         return true;
      }

      const uint64_t days      = uint64_t(elapsed_sec) / seconds_per_day;
      const uint64_t remainder = uint64_t(elapsed_sec) % seconds_per_day;

      const uint128_t daily_reward = uint128_t(stake_amount) * reward_rate;
      if ( daily_reward > max_uint64 ) return false;

      const uint128_t full_days_reward = daily_reward * days;
      if ( full_days_reward > max_uint64 ) return false;

      const uint128_t partial_product = daily_reward * remainder;
      if ( partial_product > max_uint64 ) return false;

      const uint128_t total = full_days_reward + partial_product / seconds_per_day;
      if ( total > max_uint64 ) return false;

      reward = uint64_t(total);
      return true;
   }

   /**
    * @brief Calculates reward accrued by `stake_amount` over `elapsed_sec` seconds
    *
    * Same accrual as `accrue_reward`. An overflow fails the action instead of wrapping.
    *
    * @return accrued reward token amount
    */
   inline uint64_t calc_pending_reward( const uint64_t stake_amount, const uint64_t reward_rate, const int64_t elapsed_sec ) {
      uint64_t reward = 0;
      check( accrue_reward( stake_amount, reward_rate, elapsed_sec, reward ), "arithmetic error" );
      return reward;
   }

} // namespace tokenstake
