#pragma once

#include <fc/exception/exception.hpp>
#include <boost/interprocess/exceptions.hpp>


#define PV_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

/**
 * Macro inspired from FC_RETHROW_EXCEPTIONS
 * The main difference here is that if the exception caught isn't of type "puzzlevault::chain::vault_exception"
 * This macro will rethrow the exception as the specified "exception_type"
 */
#define PV_RETHROW_EXCEPTIONS(exception_type, FORMAT, ... ) \
   catch( const std::bad_alloc& ) {\
      throw;\
   } catch( const boost::interprocess::bad_alloc& ) {\
      throw;\
   } catch (puzzlevault::chain::vault_exception& e) { \
      FC_RETHROW_EXCEPTION( e, warn, FORMAT, __VA_ARGS__ ); \
   } catch (fc::exception& e) { \
      exception_type new_exception(FC_LOG_MESSAGE( warn, FORMAT, __VA_ARGS__ )); \
      for (const auto& log: e.get_log()) { \
         new_exception.append_log(log); \
      } \
      throw new_exception; \
   } catch( const std::exception& e ) {  \
      exception_type fce(FC_LOG_MESSAGE( warn, FORMAT" (${what})" ,__VA_ARGS__("what",e.what()))); \
      throw fce;\
   }

namespace puzzlevault { namespace chain {

   FC_DECLARE_DERIVED_EXCEPTION( vault_exception, fc::exception,
                                 4000000, "puzzle vault exception" )
   /**
    *  vault_exception
    *   |- vault_state_exception
    *   |- action_validate_exception
    *   |- database_exception
    *   |- controller_exception
    */

   FC_DECLARE_DERIVED_EXCEPTION( vault_state_exception, vault_exception,
                                 4010000, "Puzzle vault state exception" )

      FC_DECLARE_DERIVED_EXCEPTION( already_initialized_exception, vault_state_exception,
                                    4010001, "Puzzle vault is already initialized" )
      FC_DECLARE_DERIVED_EXCEPTION( not_initialized_exception,     vault_state_exception,
                                    4010002, "Puzzle vault is not initialized" )


   FC_DECLARE_DERIVED_EXCEPTION( action_validate_exception, vault_exception,
                                 4020000, "Action validation exception" )

      FC_DECLARE_DERIVED_EXCEPTION( invalid_digest_exception,  action_validate_exception,
                                    4020001, "Invalid solution digest" )
      FC_DECLARE_DERIVED_EXCEPTION( unknown_action_exception,  action_validate_exception,
                                    4020002, "No handler for action" )
      FC_DECLARE_DERIVED_EXCEPTION( action_data_exception,     action_validate_exception,
                                    4020003, "Malformed action data" )


   FC_DECLARE_DERIVED_EXCEPTION( database_exception, vault_exception,
                                 4030000, "Database exception" )

      FC_DECLARE_DERIVED_EXCEPTION( database_read_only_exception, database_exception,
                                    4030001, "Database is in read-only mode" )


   FC_DECLARE_DERIVED_EXCEPTION( controller_exception, vault_exception,
                                 4040000, "Controller exception" )

      FC_DECLARE_DERIVED_EXCEPTION( controller_config_exception, controller_exception,
                                    4040001, "Invalid controller configuration" )

} } // puzzlevault::chain
