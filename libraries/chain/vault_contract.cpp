#include <puzzlevault/chain/vault_contract.hpp>
#include <puzzlevault/chain/apply_context.hpp>
#include <puzzlevault/chain/contract_types.hpp>
#include <puzzlevault/chain/puzzle_vault.hpp>
#include <puzzlevault/chain/config.hpp>
#include <puzzlevault/chain/exceptions.hpp>

namespace puzzlevault { namespace chain {

/**
 *  Both entry points take a single string argument named "solution".  fc reflection fills
 *  missing members with defaults, so presence and type are checked before unpacking.
 */
template<typename Action>
static Action unpack_solution_action( const apply_context& context ) {
   const auto& data = context.get_action().data;
   PV_ASSERT( data.is_object(), action_data_exception,
              "${n} action data must be an object", ("n", Action::get_name()) );
   const auto& args = data.get_object();
   auto itr = args.find( "solution" );
   PV_ASSERT( itr != args.end(), action_data_exception,
              "${n} action requires a 'solution' argument", ("n", Action::get_name()) );
   PV_ASSERT( itr->value().is_string(), action_data_exception,
              "'solution' argument of ${n} action must be a string", ("n", Action::get_name()) );
   return context.get_action().data_as<Action>();
}

void apply_vault_initialize( apply_context& context ) {
   auto init = unpack_solution_action<initialize>( context );
   const auto& actor = context.get_action().actor;
   try {
      context.require_write();

      puzzle_vault vault( context.db );
      vault.initialize( init.solution );
   } FC_CAPTURE_AND_RETHROW( (actor)(init) )
}

/**
 *  The candidate is a plaintext answer, so it is kept out of captured exception context.
 */
void apply_vault_guess( apply_context& context ) {
   auto candidate = unpack_solution_action<guess>( context );
   const auto& actor = context.get_action().actor;
   try {
      puzzle_vault vault( context.db );
      bool correct = vault.guess( candidate.solution );

      context.console_append( correct ? config::correct_guess_message : config::incorrect_guess_message );
      context.set_return_value( correct );
   } FC_CAPTURE_AND_RETHROW( (actor) )
}

void apply_vault_get_solution( apply_context& context ) {
   const puzzle_vault vault( context.db );
   context.set_return_value( vault.get_solution() );
}

} } // namespace puzzlevault::chain
