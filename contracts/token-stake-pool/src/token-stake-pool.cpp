#include <token-stake-pool.hpp>

#include <eosio-token-interface.hpp>

using namespace eosio;

namespace tokenstake {

   using namespace tokenstake::eosiotoken;

   stake_pool_contract::stake_pool_contract( name s, name code, datastream<const char*> ds )
   : contract(s, code, ds),
     _stake_pool_db(get_self(), get_self().value) {
   }

   // [[eosio::action]]
   void stake_pool_contract::init( const name&            admin,
                                   const extended_symbol& stake_token,
                                   const extended_symbol& reward_token,
                                   const name&            stake_vault,
                                   const name&            reward_vault,
                                   const uint64_t         reward_rate ) {
      check( !stake_pool_initialized(), "stake pool already initialized" );
      require_auth( get_self() );

      check( is_account( admin ), "admin account does not exist" );
      check( is_account( stake_vault ) && is_account( reward_vault ), "vault account does not exist" );

      check_token_exists( stake_token );
      check_token_exists( reward_token );

      const time_point_sec now = current_time_sec();

      /// initialize stake pool
      _stake_pool_db.emplace( get_self(), [&]( auto& sp ) {
         sp = make_stake_pool( admin, stake_token, reward_token, stake_vault, reward_vault, reward_rate, now );
      });

      print( "stake pool initialized with reward rate ", reward_rate, "\n" );
   }

   // [[eosio::action]]
   void stake_pool_contract::stake( const name& owner, const asset& quantity ) {
      check( stake_pool_initialized(), "stake pool not initialized" );

      require_auth( owner );

      auto sp_itr = _stake_pool_db.begin();
      stake_pool sp = *sp_itr;
      check_staking_allowed_account( owner, sp );

      const time_point_sec now = current_time_sec();

      stake_positions positions_db( get_self(), get_self().value );
      auto pos_itr = positions_db.find( owner.value );
      stake_position pos = ( pos_itr == positions_db.end() ) ? make_position( sp, owner, now ) : *pos_itr;

      apply_stake( sp, pos, quantity, now );

      save_stake_pool( sp_itr, sp );
      save_position( positions_db, pos_itr, pos, owner );

      // (inline action) move staked tokens from owner to the stake vault, after the ledger is updated
      send_transfer( sp.stake_token, owner, owner, sp.stake_vault, quantity, TOKENSTAKE_STAKE_MEMO );

      print( "staked ", quantity, " by ", owner, "\n" );
   }

   // [[eosio::action]]
   void stake_pool_contract::unstake( const name& owner, const asset& quantity ) {
      check( stake_pool_initialized(), "stake pool not initialized" );

      require_auth( owner );

      auto sp_itr = _stake_pool_db.begin();
      stake_pool sp = *sp_itr;

      const time_point_sec now = current_time_sec();

      stake_positions positions_db( get_self(), get_self().value );
      auto pos_itr = positions_db.find( owner.value );
      check( pos_itr != positions_db.end(), "insufficient stake amount" );
      stake_position pos = *pos_itr;

      apply_unstake( sp, pos, quantity, now );

      asset vault_balance = get_token_balance_from_contract( sp.stake_token.get_contract(), sp.stake_vault, quantity.symbol );
      check( quantity <= vault_balance, "not enough stake vault balance" );

      save_stake_pool( sp_itr, sp );
      save_position( positions_db, pos_itr, pos, owner );

      // (inline action) return staked tokens, authorized by the vault permission delegated to this contract
      send_transfer( sp.stake_token, sp.stake_vault, sp.stake_vault, owner, quantity, TOKENSTAKE_UNSTAKE_MEMO );

      print( "unstaked ", quantity, " by ", owner, "\n" );
   }

   // [[eosio::action]]
   void stake_pool_contract::claim( const name& owner ) {
      check( stake_pool_initialized(), "stake pool not initialized" );

      require_auth( owner );

      auto sp_itr = _stake_pool_db.begin();
      stake_pool sp = *sp_itr;

      const time_point_sec now = current_time_sec();

      stake_positions positions_db( get_self(), get_self().value );
      auto pos_itr = positions_db.find( owner.value );
      check( pos_itr != positions_db.end(), "no rewards to claim" );
      stake_position pos = *pos_itr;

      // reward debt is zeroed here, before the transfer is sent
      const asset claimed = apply_claim( sp, pos, now );

      asset vault_balance = get_token_balance_from_contract( sp.reward_token.get_contract(), sp.reward_vault, claimed.symbol );
      check( claimed <= vault_balance, "not enough reward vault balance" );

      save_stake_pool( sp_itr, sp );
      save_position( positions_db, pos_itr, pos, owner );

      send_transfer( sp.reward_token, sp.reward_vault, sp.reward_vault, owner, claimed, TOKENSTAKE_CLAIM_MEMO );

      print( "claimed ", claimed, " by ", owner, "\n" );
   }

   // [[eosio::action]]
   void stake_pool_contract::setrate( const name& caller, const uint64_t new_rate ) {
      check( stake_pool_initialized(), "stake pool not initialized" );

      require_auth( caller );

      auto sp_itr = _stake_pool_db.begin();
      stake_pool sp = *sp_itr;

      // accrual up to now belongs to the old rate
      start_reward_rate_change( sp, caller, new_rate, current_time_sec() );
      print( "reward rate updated to ", new_rate, "\n" );

      settle_positions_for_rate_change( sp, TOKENSTAKE_SETTLE_BATCH_MAX );

      save_stake_pool( sp_itr, sp );
   }

   // [[eosio::action]]
   void stake_pool_contract::settlerate( const name& user, const uint16_t max ) {
      check( stake_pool_initialized(), "stake pool not initialized" );

      require_auth( user );

      auto sp_itr = _stake_pool_db.begin();
      stake_pool sp = *sp_itr;
      check( sp.rate_settling, "no reward rate update in progress" );
      check( max > 0, "max must be positive" );

      settle_positions_for_rate_change( sp, max );

      save_stake_pool( sp_itr, sp );
   }


   /////////////////////////////////////////////////////////////////////////

   void stake_pool_contract::check_staking_allowed_account( const name& account, const stake_pool& sp ) const {
      check( account != get_self() && account != sp.stake_vault && account != sp.reward_vault,
             "staking not allowed for this account" );
   }

   void stake_pool_contract::save_stake_pool( const stake_pool_global::const_iterator& sp_itr, const stake_pool& sp ) {
      _stake_pool_db.modify( sp_itr, same_payer, [&]( auto& s ) {
         s = sp;
      });
   }

   void stake_pool_contract::save_position( stake_positions& positions_db, const stake_positions::const_iterator& pos_itr,
                                            const stake_position& pos, const name& ram_payer ) {
      if ( pos_itr == positions_db.end() ) {
         positions_db.emplace( ram_payer, [&]( auto& p ) {
            p = pos;
         });
      } else {
         positions_db.modify( pos_itr, same_payer, [&]( auto& p ) {
            p = pos;
         });
      }
   }

   /**
    * @brief Settles at most `max` positions from the rate change cursor of `sp`
    *
    * Positions are visited in primary key order, so the cursor stays valid across actions.
    */
   void stake_pool_contract::settle_positions_for_rate_change( stake_pool& sp, const uint16_t max ) {
      stake_positions positions_db( get_self(), get_self().value );
      const uint32_t visited = settle_rate_change_batch( sp, positions_db.lower_bound( sp.settle_cursor ), positions_db.end(), max,
         [&]( const stake_positions::const_iterator& itr, const stake_position& pos ) {
            positions_db.modify( itr, same_payer, [&]( auto& p ) {
               p = pos;
            });
         });

      if ( sp.rate_settling ) {
         print( "settled ", visited, " positions for the reward rate change, more remain\n" );
      } else {
         print( "settled ", visited, " positions, reward rate change complete\n" );
      }
   }

} /// namespace tokenstake

extern "C" {
   void apply(uint64_t receiver, uint64_t code, uint64_t action) {
      if ( code == receiver ) {
         switch (action) {
            EOSIO_DISPATCH_HELPER(tokenstake::stake_pool_contract, (init)(stake)(unstake)(claim)(setrate)(settlerate) )
         }
      }
      eosio_exit(0);
   }
}
