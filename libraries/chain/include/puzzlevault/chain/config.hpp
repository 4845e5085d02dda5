/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once
#include <cstdint>

namespace puzzlevault { namespace chain { namespace config {

static constexpr uint64_t _KB = 1024;
static constexpr uint64_t _MB = _KB * 1024;

const static auto default_state_dir_name      = "state";
const static auto default_state_size          = 8*_MB;
const static auto default_vault_account_name  = "puzzle.vault";
const static auto default_actor_name          = "anyone";

/// hex characters in the textual form of a committed digest
const static uint32_t digest_hex_length       = 64;

const static auto correct_guess_message       = "You guessed right!";
const static auto incorrect_guess_message     = "Try again.";

} } } // namespace puzzlevault::chain::config
