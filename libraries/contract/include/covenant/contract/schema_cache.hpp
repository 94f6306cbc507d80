#pragma once

#include <covenant/contract/schema.hpp>

#include <fc/thread/mutex.hpp>

#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace covenant { namespace contract {

   /**
    * @class schema_cache
    *
    *  Maps a type identity to the schema generated for it.  Generation is
    *  expensive and the result can be large, so each type is generated at
    *  most once per cache and every caller shares the same instance.
    *
    *  The lock is held across lookup, generation and insertion so that
    *  concurrent first requests for the same type generate only once.
    */
   class schema_cache
   {
      public:
         typedef function<root_schema()> generator_type;

         /** the process wide cache used by statically declared contracts */
         static schema_cache& instance();

         schema_cache();
         ~schema_cache();

         template<typename T>
         schema_ptr get_schema_for()
         {
            return get_or_generate( std::type_index( typeid(T) ), &generate_schema<T> );
         }

         schema_ptr get_or_generate( const std::type_index& type, const generator_type& generator );

         /** returns null when no schema was generated for type yet */
         schema_ptr find( const std::type_index& type )const;
         size_t     size()const;

      private:
         schema_cache( const schema_cache& );
         schema_cache& operator=( const schema_cache& );

         mutable fc::mutex                                  _lock;
         std::unordered_map<std::type_index, schema_ptr>    _schemas;
   };

   /** returns the process wide cached schema for T */
   template<typename T>
   schema_ptr get_schema_for()
   {
      return schema_cache::instance().get_schema_for<T>();
   }

} } // covenant::contract
