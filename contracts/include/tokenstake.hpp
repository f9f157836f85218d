#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

///////////////////////////////////
/// Chain

#define TOKENSTAKE_ACTIVE_PERMISSION "active"_n


///////////////////////////////////
/// Reward accrual

#define TOKENSTAKE_SECONDS_PER_DAY 86400

/// positions settled by `setrate` itself, `settlerate` settles the rest
#define TOKENSTAKE_SETTLE_BATCH_MAX 20


///////////////////////////////////
/// Token transfer memos

#define TOKENSTAKE_STAKE_MEMO "token stake pool: stake"
#define TOKENSTAKE_UNSTAKE_MEMO "token stake pool: unstake"
#define TOKENSTAKE_CLAIM_MEMO "token stake pool: claim rewards"
