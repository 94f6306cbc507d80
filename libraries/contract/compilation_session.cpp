#include <covenant/contract/compilation_session.hpp>
#include <covenant/contract/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/thread/scoped_lock.hpp>

namespace covenant { namespace contract {

   compilation_session::compilation_session( schema_cache& cache )
   :_schemas(cache){}

   compilation_session::~compilation_session(){}

   void compilation_session::forget( const void* instance )
   {
      fc::scoped_lock<fc::mutex> lock( _guard_lock );
      for( auto itr = _cached_guards.begin(); itr != _cached_guards.end(); )
      {
         if( itr->first.instance == instance )
            itr = _cached_guards.erase( itr );
         else
            ++itr;
      }
   }

   size_t compilation_session::cached_guard_count()const
   {
      fc::scoped_lock<fc::mutex> lock( _guard_lock );
      return _cached_guards.size();
   }

   optional<clause> compilation_session::find_cached_guard( const guard_key& key )const
   {
      fc::scoped_lock<fc::mutex> lock( _guard_lock );
      auto itr = _cached_guards.find( key );
      if( itr == _cached_guards.end() )
         return optional<clause>();
      return itr->second;
   }

   clause compilation_session::store_cached_guard( const guard_key& key, const clause& result )
   {
      fc::scoped_lock<fc::mutex> lock( _guard_lock );
      auto inserted = _cached_guards.insert( std::make_pair( key, result ) );
      if( inserted.second )
         dlog( "cached guard ${name}: ${clause}", ("name",key.name)("type",key.type.name())("clause",result.to_string()) );
      return inserted.first->second;
   }

   bool compilation_session::check_decision( const string& pathway, const compile_decision& decision )const
   {
      if( decision.type == fail )
         FC_THROW_EXCEPTION( compile_gate_failure, "${pathway} failed its compile gates", ("pathway",pathway)("errors",decision.errors) );
      if( decision.type == never )
      {
         dlog( "${pathway} excluded by its compile gates", ("pathway",pathway) );
         return false;
      }
      return true;
   }

} } // covenant::contract
