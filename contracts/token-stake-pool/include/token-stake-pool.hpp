#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/print.hpp>
#include <eosio/system.hpp>

#include <tokenstake.hpp>
#include <stake-ledger.hpp>

#include <string>

using namespace eosio;

namespace tokenstake {

   using std::string;

   /**
    * token-stake-pool contract defines the actions that implement a single token staking pool.
    * Participants stake a stake token into the pool vault and accrue a reward token at a per-day
    * rate pro-rated to the second. Accrued rewards are paid out of the reward vault on claim.
    */
   class [[eosio::contract("token-stake-pool")]] stake_pool_contract : public contract {
   public:
      using contract::contract;

      stake_pool_contract( name s, name code, datastream<const char*> ds );

      /**
       * @brief [Admin] Initialize the stake pool.
       *
       * only the contract account owner can initialize.
       * Stake pool records the reward rate and the two tokens and vaults it operates on.
       * Token and vault settings cannot be changed afterwards.
       *
       * @param admin - the account allowed to update the reward rate,
       * @param stake_token - token contract and symbol of the token being staked,
       * @param reward_token - token contract and symbol of the reward token,
       * @param stake_vault - the account holding staked tokens,
       * @param reward_vault - the account holding reward tokens to be paid out,
       * @param reward_rate - reward token units accrued per day per staked token unit.
       *
       * @pre stake pool must not be already initialized
       * @pre `active` permissions of both vault accounts must be delegated to this contract's `eosio.code` permission
       */
      [[eosio::action]]
      void init( const name&            admin,
                 const extended_symbol& stake_token,
                 const extended_symbol& reward_token,
                 const name&            stake_vault,
                 const name&            reward_vault,
                 const uint64_t         reward_rate );

      /**
       * @brief Stake tokens on the stake pool
       *
       * {{owner}} stakes {{quantity}}. Rewards accrued by {{owner}}'s previous stake amount are settled first,
       * then the staked balance of {{owner}} and the pool total increase by {{quantity}}.
       * The tokens are transferred from {{owner}} to the stake vault by an inline transfer action.
       *
       * @param owner - account staking tokens,
       * @param quantity - amount of stake tokens to be staked.
       *
       * @pre `active` permission of `owner` must be delegated to this contract's `eosio.code` permission
       */
      [[eosio::action]]
      void stake( const name& owner, const asset& quantity );

      /**
       * @brief Unstake tokens from the stake pool
       *
       * Rewards are settled first, then {{quantity}} is moved from the stake vault back to {{owner}}.
       *
       * @param owner - account unstaking its staked tokens,
       * @param quantity - amount of stake tokens to be unstaked.
       *
       * @pre quantity must be positive and equal or less than the owner's staked amount
       */
      [[eosio::action]]
      void unstake( const name& owner, const asset& quantity );

      /**
       * @brief Claim accrued rewards
       *
       * The whole settled reward debt of {{owner}} is paid out from the reward vault.
       * Claiming with no accrued reward fails.
       *
       * @param owner - account claiming its rewards.
       */
      [[eosio::action]]
      void claim( const name& owner );

      /**
       * @brief [Admin] Set Reward Rate
       *
       * {{new_rate}} applies from now on. Rewards accrued up to now by every position are settled with
       * the old rate, in batches: this action settles the first batch of positions, `settlerate`
       * settles the rest. Positions not yet settled keep the old rate up to the change time
       * whenever they are settled. Another rate change is refused until every position is settled.
       *
       * @param caller - the stake pool admin account,
       * @param new_rate - reward token units accrued per day per staked token unit.
       */
      [[eosio::action]]
      void setrate( const name& caller, const uint64_t new_rate );

      /**
       * @brief Settle positions for the reward rate change in progress
       *
       * Processes at most {{max}} positions. Any account can execute this action.
       *
       * @param user - account executing the action,
       * @param max - maximum number of positions to be processed.
       */
      [[eosio::action]]
      void settlerate( const name& user, const uint16_t max );


   private:

      stake_pool_global _stake_pool_db;

      bool stake_pool_initialized() const { return _stake_pool_db.begin() != _stake_pool_db.end(); }

      static time_point_sec current_time_sec() { return time_point_sec( current_time_point() ); }

      void check_staking_allowed_account( const name& account, const stake_pool& sp ) const;

      void save_stake_pool( const stake_pool_global::const_iterator& sp_itr, const stake_pool& sp );

      void save_position( stake_positions& positions_db, const stake_positions::const_iterator& pos_itr,
                          const stake_position& pos, const name& ram_payer );

      void settle_positions_for_rate_change( stake_pool& sp, const uint16_t max );
   };

}
