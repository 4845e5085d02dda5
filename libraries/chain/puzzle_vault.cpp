#include <puzzlevault/chain/puzzle_vault.hpp>
#include <puzzlevault/chain/committed_solution_object.hpp>
#include <puzzlevault/chain/config.hpp>
#include <puzzlevault/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

#include <cctype>

namespace puzzlevault { namespace chain {

puzzle_vault::puzzle_vault( chainbase::database& db )
:_db(db)
{
}

digest_type puzzle_vault::hash_solution( const string& solution ) {
   return fc::sha256::hash( solution.data(), solution.size() );
}

digest_type puzzle_vault::parse_digest( const string& solution_hex ) {
   PV_ASSERT( solution_hex.size() == config::digest_hex_length, invalid_digest_exception,
              "solution digest must be ${n} hex characters, got ${s}",
              ("n", config::digest_hex_length)("s", solution_hex.size()) );
   for( const char c : solution_hex ) {
      PV_ASSERT( std::isxdigit( static_cast<unsigned char>(c) ), invalid_digest_exception,
                 "solution digest contains a non-hex character" );
   }
   return digest_type( solution_hex );
}

bool puzzle_vault::is_initialized()const {
   return _db.find<committed_solution_object>() != nullptr;
}

const committed_solution_object& puzzle_vault::get_committed()const {
   const auto* committed = _db.find<committed_solution_object>();
   PV_ASSERT( committed != nullptr, not_initialized_exception,
              "puzzle vault has no committed solution" );
   return *committed;
}

const committed_solution_object& puzzle_vault::initialize( const string& solution_hex ) {
   auto digest = parse_digest( solution_hex );

   const auto* existing = _db.find<committed_solution_object>();
   PV_ASSERT( existing == nullptr, already_initialized_exception,
              "puzzle vault already holds committed solution ${h}", ("h", existing->solution_hash) );

   const auto& committed = _db.create<committed_solution_object>( [&]( auto& o ) {
      o.solution_hash = digest;
   });

   ilog( "committed puzzle solution digest ${h}", ("h", committed.solution_hash) );
   return committed;
}

bool puzzle_vault::guess( const string& candidate_solution )const {
   const auto& committed = get_committed();
   return hash_solution( candidate_solution ) == committed.solution_hash;
}

const digest_type& puzzle_vault::get_solution()const {
   return get_committed().solution_hash;
}

} } // puzzlevault::chain
