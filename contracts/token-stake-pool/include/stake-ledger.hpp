#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/multi_index.hpp>
#include <eosio/time.hpp>
#include <eosio/print.hpp>

#include <reward-math.hpp>

#include <algorithm>

namespace tokenstake {

   using namespace eosio;

   /**
    * admin - account allowed to change the reward rate
    * reward_rate - reward token units accrued per day per staked token unit
    * total_staked - symbol:(stake token), sum of the `staked` of every position
    * total_claimed - symbol:(reward token), accumulated reward amount paid out by claims
    * last_update_time - last pool settlement time
    * stake_token - stake token contract and symbol
    * reward_token - reward token contract and symbol
    * stake_vault - account holding the staked tokens
    * reward_vault - account holding the reward tokens to be paid out
    * rate_change_time - time the current `reward_rate` took effect
    * prev_reward_rate - rate in effect before `rate_change_time`, kept until every position has been settled past it
    * rate_settling - true while positions settled before `rate_change_time` remain
    * settle_cursor - primary key of the next position to be settled for the rate change
    */
   struct [[eosio::table("stakepool"), eosio::contract("token-stake-pool")]] stake_pool {
      name             admin;
      uint64_t         reward_rate = 0;
      asset            total_staked;
      asset            total_claimed;
      time_point_sec   last_update_time;
      extended_symbol  stake_token;
      extended_symbol  reward_token;
      name             stake_vault;
      name             reward_vault;
      time_point_sec   rate_change_time;
      uint64_t         prev_reward_rate = 0;
      bool             rate_settling = false;
      uint64_t         settle_cursor = 0;

      uint64_t primary_key() const { return 0; }
   };

   typedef eosio::multi_index< "stakepool"_n, stake_pool > stake_pool_global;

   /**
    * owner - position owner account
    * staked - symbol:(stake token), currently staked amount
    * reward_debt - symbol:(reward token), settled but unclaimed reward
    * last_stake_time - last settlement time of this position
    */
   struct [[eosio::table("positions"), eosio::contract("token-stake-pool")]] stake_position {
      name             owner;
      asset            staked;
      asset            reward_debt;
      time_point_sec   last_stake_time;

      uint64_t primary_key() const { return owner.value; }
   };

   typedef eosio::multi_index< "positions"_n, stake_position > stake_positions;


   inline int64_t elapsed_seconds( const time_point_sec& from, const time_point_sec& to ) {
      return int64_t(to.sec_since_epoch()) - int64_t(from.sec_since_epoch());
   }

   inline stake_pool make_stake_pool( const name&            admin,
                                      const extended_symbol& stake_token,
                                      const extended_symbol& reward_token,
                                      const name&            stake_vault,
                                      const name&            reward_vault,
                                      const uint64_t         reward_rate,
                                      const time_point_sec&  now ) {
      stake_pool sp;
      sp.admin            = admin;
      sp.reward_rate      = reward_rate;
      sp.total_staked     = asset( 0, stake_token.get_symbol() );
      sp.total_claimed    = asset( 0, reward_token.get_symbol() );
      sp.last_update_time = now;
      sp.stake_token      = stake_token;
      sp.reward_token     = reward_token;
      sp.stake_vault      = stake_vault;
      sp.reward_vault     = reward_vault;
      sp.rate_change_time = now;
      sp.prev_reward_rate = reward_rate;
      return sp;
   }

   inline stake_position make_position( const stake_pool& sp, const name& owner, const time_point_sec& now ) {
      stake_position pos;
      pos.owner           = owner;
      pos.staked          = asset( 0, sp.total_staked.symbol );
      pos.reward_debt     = asset( 0, sp.total_claimed.symbol );
      pos.last_stake_time = now;
      return pos;
   }

   /**
    * @brief Computes the reward debt `pos` would have after settlement at `now`, without failing
    *
    * Accrual uses the stake amount currently recorded, i.e. as it stood before the operation
    * being applied. While a rate change is being settled, a position last settled before the
    * change accrues the previous rate up to `rate_change_time` and the current rate after it.
    *
    * @return false if the debt does not fit in an asset amount
    */
   inline bool try_pending_reward( const stake_pool& sp, const stake_position& pos, const time_point_sec& now,
                                   uint64_t& debt ) {
      const uint64_t staked = uint64_t(pos.staked.amount);
      uint64_t accrued = 0;

      if ( sp.rate_settling && pos.last_stake_time < sp.rate_change_time ) {
         const time_point_sec until = std::min( now, sp.rate_change_time );
         uint64_t before_change = 0;
         uint64_t after_change = 0;
         if ( !accrue_reward( staked, sp.prev_reward_rate, elapsed_seconds( pos.last_stake_time, until ), before_change ) ||
              !accrue_reward( staked, sp.reward_rate, elapsed_seconds( sp.rate_change_time, now ), after_change ) ) {
            return false;
         }
         if ( uint128_t(before_change) + after_change > max_uint64 ) return false;
         accrued = before_change + after_change;
      } else if ( !accrue_reward( staked, sp.reward_rate, elapsed_seconds( pos.last_stake_time, now ), accrued ) ) {
         return false;
      }

      const uint128_t total = uint128_t(pos.reward_debt.amount) + accrued;
      if ( total > uint64_t(asset::max_amount) ) return false;

      debt = uint64_t(total);
      return true;
   }

   inline asset pending_reward( const stake_pool& sp, const stake_position& pos, const time_point_sec& now ) {
      uint64_t debt = 0;
      check( try_pending_reward( sp, pos, now, debt ), "arithmetic error" );
      return asset( int64_t(debt), pos.reward_debt.symbol );
   }

   /// pool settlement only records the time; accrual is tracked per position
   inline void settle_pool( stake_pool& sp, const time_point_sec& now ) {
      sp.last_update_time = now;
   }

   inline void settle_position( const stake_pool& sp, stake_position& pos, const time_point_sec& now ) {
      pos.reward_debt     = pending_reward( sp, pos, now );
      pos.last_stake_time = now;
   }

   /**
    * @brief Settles position and stamps the pool, then adds `quantity` to both
    *
    * New balances are computed before anything is written, so a failed check leaves
    * `sp` and `pos` untouched.
    */
   inline void apply_stake( stake_pool& sp, stake_position& pos, const asset& quantity, const time_point_sec& now ) {
      check( quantity.symbol == sp.total_staked.symbol, "stake symbol mismatch" );
      check( quantity.amount > 0, "invalid stake amount" );

      const asset settled_debt = pending_reward( sp, pos, now );
      const int64_t staked = to_asset_amount( checked_add( uint64_t(pos.staked.amount), uint64_t(quantity.amount) ) );
      const int64_t total_staked = to_asset_amount( checked_add( uint64_t(sp.total_staked.amount), uint64_t(quantity.amount) ) );

      settle_pool( sp, now );
      pos.reward_debt         = settled_debt;
      pos.last_stake_time     = now;
      pos.staked.amount       = staked;
      sp.total_staked.amount  = total_staked;
   }

   /**
    * @brief Settles position and stamps the pool, then subtracts `quantity` from both
    *
    * @pre 0 < quantity <= pos.staked
    */
   inline void apply_unstake( stake_pool& sp, stake_position& pos, const asset& quantity, const time_point_sec& now ) {
      check( quantity.symbol == sp.total_staked.symbol, "stake symbol mismatch" );
      check( quantity.amount > 0 && quantity.amount <= pos.staked.amount, "insufficient stake amount" );

      const asset settled_debt = pending_reward( sp, pos, now );
      const uint64_t staked = checked_sub( uint64_t(pos.staked.amount), uint64_t(quantity.amount) );
      const uint64_t total_staked = checked_sub( uint64_t(sp.total_staked.amount), uint64_t(quantity.amount) );

      settle_pool( sp, now );
      pos.reward_debt         = settled_debt;
      pos.last_stake_time     = now;
      pos.staked.amount       = int64_t(staked);
      sp.total_staked.amount  = int64_t(total_staked);
   }

   /**
    * @brief Settles position and zeroes its reward debt
    *
    * @return claimed reward, always positive
    */
   inline asset apply_claim( stake_pool& sp, stake_position& pos, const time_point_sec& now ) {
      const asset claimed = pending_reward( sp, pos, now );
      check( claimed.amount > 0, "no rewards to claim" );

      const int64_t total_claimed = to_asset_amount( checked_add( uint64_t(sp.total_claimed.amount), uint64_t(claimed.amount) ) );

      settle_pool( sp, now );
      pos.reward_debt         = asset( 0, claimed.symbol );
      pos.last_stake_time     = now;
      sp.total_claimed.amount = total_claimed;

      return claimed;
   }

   inline void check_admin( const stake_pool& sp, const name& caller ) {
      check( caller == sp.admin, "unauthorized" );
   }

   /**
    * @brief Starts a reward rate change at `now`
    *
    * `new_rate` applies from `now` on. Accrual before `now` keeps the previous rate, both for
    * positions settled by `settle_rate_change_batch` and for positions settled lazily by their
    * own operations. Only one rate change can be in progress.
    */
   inline void start_reward_rate_change( stake_pool& sp, const name& caller, const uint64_t new_rate,
                                         const time_point_sec& now ) {
      check_admin( sp, caller );
      check( !sp.rate_settling, "reward rate update in progress" );

      settle_pool( sp, now );
      sp.prev_reward_rate = sp.reward_rate;
      sp.reward_rate      = new_rate;
      sp.rate_change_time = now;
      sp.rate_settling    = true;
      sp.settle_cursor    = 0;
   }

   /**
    * @brief Settles `pos` up to the rate change with the previous rate
    *
    * Positions already settled at or after `rate_change_time` are left as they are.
    *
    * @return false if the accrued debt overflows, `pos` is then left untouched
    */
   inline bool settle_rate_change( const stake_pool& sp, stake_position& pos ) {
      if ( !sp.rate_settling || pos.last_stake_time >= sp.rate_change_time ) {
         return true;
      }

      uint64_t debt = 0;
      if ( !try_pending_reward( sp, pos, sp.rate_change_time, debt ) ) {
         return false;
      }
      pos.reward_debt.amount = int64_t(debt);
      pos.last_stake_time    = sp.rate_change_time;
      return true;
   }

   inline void finish_reward_rate_change( stake_pool& sp ) {
      sp.prev_reward_rate = sp.reward_rate;
      sp.rate_settling    = false;
      sp.settle_cursor    = 0;
   }

   /**
    * @brief Settles at most `max` positions of [first, last) for the rate change in progress
    *
    * `save( itr, pos )` stores each settled position. A position whose settlement overflows is
    * skipped and left as it is, so it cannot hold back the rest of the pool.
    * When the range is exhausted the rate change is finished, otherwise `settle_cursor` is
    * moved to the first position not visited.
    *
    * @return number of positions visited
    */
   template<typename Iterator, typename SavePosition>
   uint32_t settle_rate_change_batch( stake_pool& sp, Iterator first, const Iterator last, const uint16_t max,
                                      SavePosition&& save ) {
      uint32_t visited = 0;
      for ( ; first != last && visited < max; ++first, ++visited ) {
         stake_position pos = *first;
         if ( pos.last_stake_time >= sp.rate_change_time ) {
            continue;
         }
         if ( settle_rate_change( sp, pos ) ) {
            save( first, pos );
         } else {
            print( "position of ", pos.owner, " left unsettled: arithmetic error\n" );
         }
      }

      if ( first == last ) {
         finish_reward_rate_change( sp );
      } else {
         sp.settle_cursor = first->primary_key();
      }
      return visited;
   }

} // namespace tokenstake
