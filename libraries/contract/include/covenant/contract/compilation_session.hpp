#pragma once

#include <covenant/contract/guard.hpp>
#include <covenant/contract/schema_cache.hpp>

#include <fc/thread/mutex.hpp>

#include <tuple>
#include <typeindex>
#include <typeinfo>

namespace covenant { namespace contract {

   /**
    * @class compilation_session
    *
    *  State owned by one compilation: the schema cache it reads argument
    *  schemas from and the results of cached guards.
    *
    *  A cached guard is evaluated at most once per contract instance and
    *  guard name for the lifetime of the session, or until forget() is called
    *  for that instance.  Instances are identified by address and contract
    *  type, so an instance must be forgotten before its storage is reused
    *  within one session.
    *  Guard bodies run outside the lock; when two threads race on the same
    *  cached guard the first stored result wins.
    */
   class compilation_session
   {
      public:
         explicit compilation_session( schema_cache& cache = schema_cache::instance() );
         ~compilation_session();

         schema_cache& schemas()const { return _schemas; }

         template<typename Contract>
         clause evaluate_guard( const guard<Contract>& g, const Contract& self, const context& ctx )
         {
            if( !g.is_cached() )
               return g( self, ctx );

            const guard_key key( static_cast<const void*>( &self ), std::type_index( typeid(Contract) ), g.name );
            optional<clause> cached = find_cached_guard( key );
            if( cached.valid() )
               return *cached;

            return store_cached_guard( key, g( self, ctx ) );
         }

         /** the clause every guard of a pathway requires, trivial for no guards */
         template<typename Contract>
         clause guard_clause( const vector< guard<Contract> >& guards, const Contract& self, const context& ctx )
         {
            vector<clause> clauses;
            clauses.reserve( guards.size() );
            for( const auto& g : guards )
               clauses.push_back( evaluate_guard( g, self, ctx ) );
            return clause::all_of( clauses );
         }

         /** merges every gate decision, no_constraint for no gates */
         template<typename Contract>
         compile_decision evaluate_gates( const vector< compile_gate<Contract> >& gates, const Contract& self, const context& ctx )const
         {
            compile_decision result;
            for( const auto& gate : gates )
               result = merge( result, gate( self, ctx ) );
            return result;
         }

         /**
          *  @return false when a gate says never
          *  @throws compile_gate_failure when a gate fails
          */
         template<typename Contract>
         bool is_included( const string& pathway, const vector< compile_gate<Contract> >& gates,
                           const Contract& self, const context& ctx )const
         {
            return check_decision( pathway, evaluate_gates( gates, self, ctx ) );
         }

         /** drops every cached guard result stored at the address of instance */
         void   forget( const void* instance );
         size_t cached_guard_count()const;

      private:
         struct guard_key
         {
            guard_key( const void* instance_arg, const std::type_index& type_arg, const string& name_arg )
            :instance(instance_arg),type(type_arg),name(name_arg){}

            const void*      instance;
            std::type_index  type;
            string           name;

            friend bool operator < ( const guard_key& a, const guard_key& b )
            {
               return std::tie( a.instance, a.type, a.name ) < std::tie( b.instance, b.type, b.name );
            }
         };

         optional<clause> find_cached_guard( const guard_key& key )const;
         clause           store_cached_guard( const guard_key& key, const clause& result );
         bool             check_decision( const string& pathway, const compile_decision& decision )const;

         schema_cache&              _schemas;
         mutable fc::mutex          _guard_lock;
         map<guard_key,clause>      _cached_guards;
   };

} } // covenant::contract
