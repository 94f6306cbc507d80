#pragma once

#include <covenant/contract/types.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/reflect/reflect.hpp>

namespace covenant { namespace contract {

   enum clause_type_enum
   {
      trivial_clause        = 0,
      unsatisfiable_clause  = 1,
      key_clause            = 2,
      after_clause          = 3,
      older_clause          = 4,
      sha256_clause         = 5,
      threshold_clause      = 6
   };

   /**
    *  A spending condition produced by a guard.  The pathway layer only builds
    *  and combines clauses, satisfying them is left to the script layer.
    *
    *  all_of/any_of fold away trivial and unsatisfiable members so that an
    *  empty guard list collapses to a trivial clause.
    */
   struct clause
   {
      clause():type(trivial_clause),threshold(0),lock(0){}

      static clause trivial();
      static clause unsatisfiable();
      static clause key( const string& public_key );
      static clause after( uint32_t absolute_lock );
      static clause older( uint32_t relative_lock );
      static clause sha256( const fc::sha256& digest );
      static clause threshold_of( uint32_t k, vector<clause> subclauses );
      static clause all_of( const vector<clause>& subclauses );
      static clause any_of( const vector<clause>& subclauses );

      bool   is_trivial()const       { return type == trivial_clause; }
      bool   is_unsatisfiable()const { return type == unsatisfiable_clause; }

      string to_string()const;

      fc::enum_type<uint8_t,clause_type_enum>  type;
      uint32_t                                 threshold;
      uint32_t                                 lock;
      string                                   public_key;
      optional<fc::sha256>                     digest;
      vector<clause>                           subclauses;
   };

   bool operator == ( const clause& a, const clause& b );
   bool operator != ( const clause& a, const clause& b );

} } // covenant::contract

FC_REFLECT_ENUM( covenant::contract::clause_type_enum,
        (trivial_clause)
        (unsatisfiable_clause)
        (key_clause)
        (after_clause)
        (older_clause)
        (sha256_clause)
        (threshold_clause)
        )
FC_REFLECT( covenant::contract::clause,
        (type)
        (threshold)
        (lock)
        (public_key)
        (digest)
        (subclauses)
        )
