#pragma once

// Key and digest sizes
#define TIGER_PUBKEY_LEN 32
#define TIGER_SHA_256_LEN 32

// Scoring
#define TIGER_BASE_SCORE 300
#define TIGER_REPAYMENT_POINTS 60
#define TIGER_HUMAN_VERIFIED_POINTS 80
#define TIGER_WALLET_AGE_POINTS 40
#define TIGER_WALLET_AGE_MIN_MONTHS 6
#define TIGER_TRANSACTION_POINTS 40
#define TIGER_TRANSACTION_MIN_COUNT 100
#define TIGER_NFT_POINTS 20
#define TIGER_CREDENTIAL_POINTS 10
#define TIGER_CREDENTIAL_MAX_POINTS 30
#define TIGER_INCOME_VERIFIED_POINTS 110
#define TIGER_MAX_ACTIVITY_REGULARITY 40
#define TIGER_MAX_OVERRIDE_SCORE 660
#define TIGER_MAX_TIER 5

// Address derivation
#define TIGER_DEFAULT_PROFILE_SEED "user_profile"
#define TIGER_ADDRESS_MARKER "ProgramDerivedAddress"

// Requests
#define TIGER_MAX_REQUEST_LEN 4096
