#include <covenant/contract/schema_cache.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>
#include <fc/thread/scoped_lock.hpp>

namespace covenant { namespace contract {

   schema_cache& schema_cache::instance()
   {
      static schema_cache _cache;
      return _cache;
   }

   schema_cache::schema_cache(){}
   schema_cache::~schema_cache(){}

   schema_ptr schema_cache::get_or_generate( const std::type_index& type, const generator_type& generator )
   { try {
      FC_ASSERT( generator, "a schema generator is required", ("type",type.name()) );

      fc::scoped_lock<fc::mutex> lock( _lock );
      auto itr = _schemas.find( type );
      if( itr != _schemas.end() )
         return itr->second;

      schema_ptr generated = std::make_shared<root_schema>( generator() );
      dlog( "generated argument schema ${title} for ${type}", ("title",generated->title)("type",type.name()) );
      _schemas[type] = generated;
      return generated;
   } FC_CAPTURE_AND_RETHROW( (type.name()) ) }

   schema_ptr schema_cache::find( const std::type_index& type )const
   {
      fc::scoped_lock<fc::mutex> lock( _lock );
      auto itr = _schemas.find( type );
      if( itr == _schemas.end() )
         return schema_ptr();
      return itr->second;
   }

   size_t schema_cache::size()const
   {
      fc::scoped_lock<fc::mutex> lock( _lock );
      return _schemas.size();
   }

} } // covenant::contract
