/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once

#include <puzzlevault/chain/types.hpp>

namespace puzzlevault { namespace chain {

   /**
    *  An action is a call to an entry point of the contract deployed on `account`.
    *  `actor` identifies the caller; anyone may call any action.  `data` holds the
    *  named arguments as a JSON object.
    */
   struct action {
      account_name     account;
      action_name      name;
      account_name     actor;
      variant          data;

      action(){}

      action( account_name account, action_name name, account_name actor, variant data )
      :account(std::move(account)), name(std::move(name)), actor(std::move(actor)), data(std::move(data))
      {}

      template<typename T>
      action( account_name account, account_name actor, const T& value )
      :account(std::move(account)), name(T::get_name()), actor(std::move(actor)), data(value)
      {}

      template<typename T>
      T data_as()const {
         return data.as<T>();
      }
   };

} } /// namespace puzzlevault::chain

FC_REFLECT( puzzlevault::chain::action, (account)(name)(actor)(data) )
