#pragma once
#include <puzzlevault/chain/controller.hpp>
#include <puzzlevault/chain/contract_types.hpp>
#include <puzzlevault/chain/exceptions.hpp>

#include <fc/filesystem.hpp>

namespace puzzlevault { namespace testing {

   using namespace puzzlevault::chain;

   /// plaintext answer of the reference puzzle, "near nomicon ref finance"
   extern const char* const reference_solution;
   /// hex encoded SHA-256 of reference_solution
   extern const char* const reference_solution_hash;

   /**
    *  Hosts a controller over a private temporary state directory.  Helpers push actions
    *  to the vault account and rethrow the exception of a failed trace.
    */
   class tester {
      public:
         typedef string action_result;

         explicit tester( bool contracts_console = false );
         explicit tester( const controller::config& cfg );
         virtual ~tester();

         static controller::config default_config( const fc::temp_directory& tempdir );

         void open();
         void close();
         /// closes and reopens the controller over the same state directory
         void reopen( bool read_only = false );

         action_trace_ptr push_action( const action_name& acttype, const account_name& actor,
                                       const fc::variant_object& data );
         action_trace_ptr push_action( action act );

         /// @return success() or the top message of the exception of a failed action
         action_result push_action_result( const action_name& acttype, const account_name& actor,
                                           const fc::variant_object& data );

         action_trace_ptr initialize( const string& solution_hex, const account_name& actor = "deployer" );
         bool             guess( const string& solution, const account_name& actor = "alice" );
         digest_type      get_solution( const account_name& actor = "alice" );

         static action_result success() { return string(); }
         static action_result error( const string& msg ) { return msg; }

         fc::temp_directory                tempdir;
         controller::config                cfg;
         unique_ptr<controller>            control;
   };

} } /// puzzlevault::testing
