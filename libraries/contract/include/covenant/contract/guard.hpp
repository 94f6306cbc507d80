#pragma once

#include <covenant/contract/clause.hpp>
#include <covenant/contract/compile_decision.hpp>
#include <covenant/contract/context.hpp>

namespace covenant { namespace contract {

   enum guard_policy
   {
      fresh_guard  = 0, ///< the body runs every time the compiler asks
      cached_guard = 1  ///< the body runs at most once per contract instance per session
   };

   enum compile_gate_policy
   {
      fresh_compile_gate = 0
   };

   /**
    *  A named unlocking condition of a contract.  The policy is only a tag,
    *  memoizing cached guards is done by the compilation_session.
    */
   template<typename Contract>
   struct guard
   {
      typedef function<clause( const Contract&, const context& )> body_type;

      guard():policy(fresh_guard){}
      guard( const string& name_arg, guard_policy policy_arg, body_type body_arg )
      :name(name_arg),policy(policy_arg),body( std::move(body_arg) ){}

      bool   is_cached()const { return policy == cached_guard; }

      clause operator()( const Contract& self, const context& ctx )const
      {
         return body( self, ctx );
      }

      string        name;
      guard_policy  policy;
      body_type     body;
   };

   /**
    *  A named predicate deciding at compile time whether the pathways that
    *  reference it are compiled in at all.
    */
   template<typename Contract>
   struct compile_gate
   {
      typedef function<compile_decision( const Contract&, const context& )> body_type;

      compile_gate():policy(fresh_compile_gate){}
      compile_gate( const string& name_arg, body_type body_arg )
      :name(name_arg),policy(fresh_compile_gate),body( std::move(body_arg) ){}

      compile_decision operator()( const Contract& self, const context& ctx )const
      {
         return body( self, ctx );
      }

      string               name;
      compile_gate_policy  policy;
      body_type            body;
   };

} } // covenant::contract

FC_REFLECT_ENUM( covenant::contract::guard_policy, (fresh_guard)(cached_guard) )
FC_REFLECT_ENUM( covenant::contract::compile_gate_policy, (fresh_compile_gate) )
