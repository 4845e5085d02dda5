/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once
#include <puzzlevault/chain/types.hpp>

namespace puzzlevault { namespace chain {

   class committed_solution_object;

   /**
    *  @brief Commit/verify state machine of a puzzle vault
    *
    *  The vault is either uninitialized (no committed_solution_object in the database) or
    *  committed.  initialize() is the only transition; guess() never writes.
    *
    *  The vault does not own its state; it operates on the database handed to it, which is
    *  expected to be wrapped in an undo session by the caller.
    */
   class puzzle_vault {
      public:
         explicit puzzle_vault( chainbase::database& db );

         /**
          *  Commits the hex encoded SHA-256 digest of the solution.  It is not hashed again.
          *
          *  The value is not kept verbatim: it is decoded to the 32 digest bytes, so an
          *  upper case digest reads back in lower case from get_solution().  A string that is
          *  not a digest could never match a guess and is rejected instead of stored.
          *
          *  @throws invalid_digest_exception if solution_hex is not 64 hex characters
          *  @throws already_initialized_exception if a digest was committed before
          */
         const committed_solution_object& initialize( const string& solution_hex );

         /**
          *  @return true if the SHA-256 of the candidate equals the committed digest
          *  @throws not_initialized_exception before initialize
          */
         bool guess( const string& candidate_solution )const;

         /// @throws not_initialized_exception before initialize
         const digest_type& get_solution()const;

         bool is_initialized()const;

         static digest_type hash_solution( const string& solution );
         static digest_type parse_digest( const string& solution_hex );

      private:
         const committed_solution_object& get_committed()const;

         chainbase::database& _db;
   };

} } // puzzlevault::chain
