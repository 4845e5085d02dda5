/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once
#include <puzzlevault/chain/types.hpp>
#include <puzzlevault/chain/multi_index_includes.hpp>

namespace puzzlevault { namespace chain {

   /**
    * @class committed_solution_object
    * @brief The single persisted record of a puzzle vault: the digest the deployer committed to
    *
    * At most one instance exists per database.  It is created by the initialize action and
    * never modified or removed afterwards.
    */
   class committed_solution_object : public chainbase::object<committed_solution_object_type, committed_solution_object>
   {
      OBJECT_CTOR(committed_solution_object)

      id_type        id;
      digest_type    solution_hash;
   };

   using committed_solution_multi_index = chainbase::shared_multi_index_container<
      committed_solution_object,
      indexed_by<
         ordered_unique<tag<by_id>,
            BOOST_MULTI_INDEX_MEMBER(committed_solution_object, committed_solution_object::id_type, id)
         >
      >
   >;

} } // puzzlevault::chain

CHAINBASE_SET_INDEX_TYPE(puzzlevault::chain::committed_solution_object, puzzlevault::chain::committed_solution_multi_index)

FC_REFLECT(puzzlevault::chain::committed_solution_object, (solution_hash))
