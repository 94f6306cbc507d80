#pragma once

#include <fc/reflect/reflect.hpp>

namespace covenant { namespace contract {

   /** the argument envelope of a contract that declares no updatable pathways */
   struct no_arguments
   {
   };

   inline bool operator == ( const no_arguments&, const no_arguments& ) { return true; }

   namespace detail {

      template<typename Contract>
      struct has_stateful_arguments
      {
         template<typename C> static char test( typename C::stateful_arguments* );
         template<typename C> static long test( ... );
         enum { value = sizeof( test<Contract>( nullptr ) ) == sizeof(char) };
      };

      template<typename Contract, bool Declared>
      struct stateful_arguments_of_impl
      {
         typedef no_arguments type;
      };

      template<typename Contract>
      struct stateful_arguments_of_impl<Contract,true>
      {
         typedef typename Contract::stateful_arguments type;
      };

   } // detail

   /**
    *  Every updatable pathway of a contract narrows its argument out of one
    *  shared envelope, Contract::stateful_arguments.  Contracts without
    *  updatable pathways may leave it undeclared.
    */
   template<typename Contract>
   struct stateful_arguments_of
   {
      typedef typename detail::stateful_arguments_of_impl< Contract,
                          detail::has_stateful_arguments<Contract>::value != 0 >::type type;
   };

} } // covenant::contract

FC_REFLECT( covenant::contract::no_arguments, BOOST_PP_SEQ_NIL )
