/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once
#include <chainbase/chainbase.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>
#include <fc/time.hpp>
#include <fc/filesystem.hpp>
#include <fc/reflect/reflect.hpp>

#include <memory>
#include <string>
#include <optional>
#include <cstdint>

#define OBJECT_CTOR(NAME) \
    NAME() = delete; \
    public: \
    template<typename Constructor, typename Allocator> \
    NAME(Constructor&& c, chainbase::allocator<Allocator>) \
    { c(*this); }

namespace puzzlevault { namespace chain {
   using                               std::string;
   using                               std::shared_ptr;
   using                               std::unique_ptr;
   using                               std::optional;
   using                               std::make_shared;

   using                               fc::variant;
   using                               fc::mutable_variant_object;

   using                               fc::path;

   using digest_type      = fc::sha256;
   using account_name     = string;
   using action_name      = string;

   /**
    * List all object types from this namespace here so they can be
    * used as chainbase type ids.  Values must not change once a state
    * file has been written.
    */
   enum object_type
   {
      null_object_type = 0,
      committed_solution_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

} }  // puzzlevault::chain
