#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

#include <tokenstake.hpp>

#include <string>

namespace tokenstake::eosiotoken {

   using namespace eosio;
   using std::string;

   ///////////////////////////////////////////////////////
   /// standard token contract (`eosio.token` compatible)

   struct account {
      asset    balance;

      uint64_t primary_key()const { return balance.symbol.code().raw(); }
   };

   typedef eosio::multi_index< "accounts"_n, account > accounts_table;

   struct currency_stats {
      asset    supply;
      asset    max_supply;
      name     issuer;

      uint64_t primary_key()const { return supply.symbol.code().raw(); }
   };

   typedef eosio::multi_index< "stat"_n, currency_stats > stats_table;

   class token_contract_action_interface {
   public:

      /**
       * Allows `from` account to transfer to `to` account the `quantity` tokens.
       * One account is debited and the other is credited with quantity tokens.
       *
       * @param from - the account to transfer from,
       * @param to - the account to be transferred to,
       * @param quantity - the quantity of tokens to be transferred,
       * @param memo - the memo string to accompany the transaction.
       */
      virtual void transfer( const name&    from,
                             const name&    to,
                             const asset&   quantity,
                             const string&  memo );
   };

   using token_transfer_action = eosio::action_wrapper<"transfer"_n, &token_contract_action_interface::transfer>;

   inline asset get_token_balance_from_contract( const name& contract, const name& account, const symbol& symbol ) {
      accounts_table accounts( contract, account.value );
      auto itr = accounts.find( symbol.code().raw() );
      if ( itr == accounts.end() ) {
         return asset( 0, symbol );
      }
      return itr->balance;
   }

   /**
    * @brief Checks that `token` is a token created on its token contract
    *
    * The `stat` table of the token contract is scoped by symbol code. The symbol precision
    * recorded there must match the precision of `token`.
    *
    * @param token - token contract and symbol
    */
   inline void check_token_exists( const extended_symbol& token ) {
      const symbol& sym = token.get_symbol();
      check( sym.is_valid(), "invalid symbol" );
      check( is_account( token.get_contract() ), "token contract account does not exist" );

      stats_table stats( token.get_contract(), sym.code().raw() );
      auto itr = stats.find( sym.code().raw() );
      check( itr != stats.end(), "token symbol not found" );
      check( itr->supply.symbol == sym, "token symbol precision mismatch" );
   }

   /**
    * @brief Sends inline token transfer on the token contract of `token`
    *
    * @param token - token contract and symbol of the transferred quantity
    * @param authority - account whose `active` permission authorizes the transfer
    */
   inline void send_transfer( const extended_symbol& token, const name& authority,
                              const name& from, const name& to, const asset& quantity, const string& memo ) {
      token_transfer_action transfer_act{ token.get_contract(), { { authority, TOKENSTAKE_ACTIVE_PERMISSION } } };
      transfer_act.send( from, to, quantity, memo );
   }

} // namespace tokenstake::eosiotoken
