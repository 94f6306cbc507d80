#pragma once

#include <covenant/contract/types.hpp>

#include <fc/io/enum_type.hpp>
#include <fc/reflect/reflect.hpp>

namespace covenant { namespace contract {

   enum compile_decision_type
   {
      no_constraint = 0, ///< the gate has no opinion, the pathway is included
      required      = 1, ///< the pathway must be included
      skippable     = 2, ///< the compiler may leave the pathway out
      never         = 3, ///< the pathway must be left out
      fail          = 4  ///< the contract cannot be compiled, see errors
   };

   /**
    *  What a compile gate reports about static inclusion of its pathway.
    *  How the compiler acts on required/skippable is up to the compiler.
    */
   struct compile_decision
   {
      compile_decision():type(no_constraint){}
      compile_decision( compile_decision_type t ):type(t){}

      static compile_decision failure( const string& error );

      /** true when the pathway must not be compiled in */
      bool excludes()const { return type == never || type == fail; }

      fc::enum_type<uint8_t,compile_decision_type>  type;
      vector<string>                                errors;
   };

   /**
    *  Combines two gate decisions.  fail dominates and accumulates errors,
    *  never together with required is a failure, otherwise the precedence is
    *  never, required, skippable, no_constraint.
    */
   compile_decision merge( const compile_decision& a, const compile_decision& b );

} } // covenant::contract

FC_REFLECT_ENUM( covenant::contract::compile_decision_type,
        (no_constraint)
        (required)
        (skippable)
        (never)
        (fail)
        )
FC_REFLECT( covenant::contract::compile_decision, (type)(errors) )
