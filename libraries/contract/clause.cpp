#include <covenant/contract/clause.hpp>
#include <covenant/contract/exceptions.hpp>

#include <fc/string.hpp>

namespace covenant { namespace contract {

   clause clause::trivial()
   {
      return clause();
   }

   clause clause::unsatisfiable()
   {
      clause c;
      c.type = unsatisfiable_clause;
      return c;
   }

   clause clause::key( const string& public_key )
   {
      if( public_key.empty() )
         FC_THROW_EXCEPTION( invalid_clause, "a key clause requires a public key" );
      clause c;
      c.type = key_clause;
      c.public_key = public_key;
      return c;
   }

   clause clause::after( uint32_t absolute_lock )
   {
      clause c;
      c.type = after_clause;
      c.lock = absolute_lock;
      return c;
   }

   clause clause::older( uint32_t relative_lock )
   {
      clause c;
      c.type = older_clause;
      c.lock = relative_lock;
      return c;
   }

   clause clause::sha256( const fc::sha256& digest )
   {
      clause c;
      c.type = sha256_clause;
      c.digest = digest;
      return c;
   }

   clause clause::threshold_of( uint32_t k, vector<clause> subclauses )
   {
      if( k == 0 || k > subclauses.size() )
         FC_THROW_EXCEPTION( invalid_clause, "threshold out of range", ("k",k)("n",subclauses.size()) );
      clause c;
      c.type = threshold_clause;
      c.threshold = k;
      c.subclauses = std::move( subclauses );
      return c;
   }

   clause clause::all_of( const vector<clause>& subclauses )
   {
      vector<clause> required;
      for( const auto& sub : subclauses )
      {
         if( sub.is_unsatisfiable() )
            return unsatisfiable();
         if( !sub.is_trivial() )
            required.push_back( sub );
      }

      if( required.empty() )
         return trivial();
      if( required.size() == 1 )
         return required.front();
      const uint32_t n = uint32_t(required.size());
      return threshold_of( n, std::move(required) );
   }

   clause clause::any_of( const vector<clause>& subclauses )
   {
      vector<clause> options;
      for( const auto& sub : subclauses )
      {
         if( sub.is_trivial() )
            return trivial();
         if( !sub.is_unsatisfiable() )
            options.push_back( sub );
      }

      if( options.empty() )
         return unsatisfiable();
      if( options.size() == 1 )
         return options.front();
      return threshold_of( 1, std::move(options) );
   }

   string clause::to_string()const
   {
      switch( clause_type_enum(type) )
      {
         case trivial_clause:
            return "TRIVIAL";
         case unsatisfiable_clause:
            return "UNSATISFIABLE";
         case key_clause:
            return "pk(" + public_key + ")";
         case after_clause:
            return "after(" + fc::to_string( uint64_t(lock) ) + ")";
         case older_clause:
            return "older(" + fc::to_string( uint64_t(lock) ) + ")";
         case sha256_clause:
            return "sha256(" + (digest.valid() ? digest->str() : string()) + ")";
         case threshold_clause:
         {
            string inner;
            for( uint32_t i = 0; i < subclauses.size(); ++i )
            {
               if( i ) inner += ",";
               inner += subclauses[i].to_string();
            }
            if( threshold == subclauses.size() )
               return "and(" + inner + ")";
            if( threshold == 1 )
               return "or(" + inner + ")";
            return "thresh(" + fc::to_string( uint64_t(threshold) ) + "," + inner + ")";
         }
      }
      FC_THROW_EXCEPTION( invalid_clause, "unknown clause type", ("type",type) );
   }

   bool operator == ( const clause& a, const clause& b )
   {
      return a.type == b.type
          && a.threshold == b.threshold
          && a.lock == b.lock
          && a.public_key == b.public_key
          && a.digest.valid() == b.digest.valid()
          && (!a.digest.valid() || *a.digest == *b.digest)
          && a.subclauses == b.subclauses;
   }

   bool operator != ( const clause& a, const clause& b )
   {
      return !(a == b);
   }

} } // covenant::contract
