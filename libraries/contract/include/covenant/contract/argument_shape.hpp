#pragma once

#include <covenant/contract/exceptions.hpp>
#include <covenant/contract/schema.hpp>

namespace covenant { namespace contract {

   /**
    *  argument_shape<T>::check() rejects an externally supplied value that
    *  does not have the shape schema_of<T> describes: a reflected struct must
    *  be an object holding every non-optional member and nothing else, arrays
    *  and maps are checked element by element.  Scalars are left to fc's
    *  conversion.
    *
    *  @throws coercion_failure naming the offending member path
    */
   template<typename T,
            typename IsDefined = typename fc::reflector<T>::is_defined,
            typename IsEnum    = typename fc::reflector<T>::is_enum>
   struct argument_shape
   {
      static void check( const variant&, const string& ) {}
   };

   template<typename Class>
   class member_shape_visitor
   {
      public:
         member_shape_visitor( const variant_object& obj, const string& path, set<string>& known )
         :_obj(obj),_path(path),_known(known){}

         template<typename Member, class C, Member (C::*member)>
         void operator()( const char* name )const
         {
            _known.insert( name );
            auto itr = _obj.find( name );
            if( itr == _obj.end() )
            {
               if( !detail::is_optional<Member>::value )
                  FC_THROW_EXCEPTION( coercion_failure, "missing member ${member}", ("member",_path + name) );
               return;
            }
            argument_shape<Member>::check( itr->value(), _path + name + "." );
         }

      private:
         const variant_object&  _obj;
         const string&          _path;
         set<string>&           _known;
   };

   template<typename T>
   struct argument_shape<T, fc::true_type, fc::false_type>
   {
      static void check( const variant& v, const string& path )
      {
         if( !v.is_object() )
            FC_THROW_EXCEPTION( coercion_failure, "expected an object", ("member",path)("type",fc::get_typename<T>::name()) );

         const variant_object& obj = v.get_object();
         set<string> known;
         fc::reflector<T>::visit( member_shape_visitor<T>( obj, path, known ) );

         for( const auto& entry : obj )
            if( known.find( entry.key() ) == known.end() )
               FC_THROW_EXCEPTION( coercion_failure, "unknown member ${member}", ("member",path + entry.key()) );
      }
   };

   /** raw bytes travel as a hex string */
   template<>
   struct argument_shape<vector<char>, fc::false_type, fc::false_type>
   {
      static void check( const variant&, const string& ) {}
   };

   template<typename T>
   struct argument_shape<vector<T>, fc::false_type, fc::false_type>
   {
      static void check( const variant& v, const string& path )
      {
         if( !v.is_array() )
            FC_THROW_EXCEPTION( coercion_failure, "expected an array", ("member",path) );
         for( const auto& item : v.get_array() )
            argument_shape<T>::check( item, path );
      }
   };

   template<typename T>
   struct argument_shape<set<T>, fc::false_type, fc::false_type>
   {
      static void check( const variant& v, const string& path )
      {
         argument_shape< vector<T> >::check( v, path );
      }
   };

   template<typename T>
   struct argument_shape<map<string,T>, fc::false_type, fc::false_type>
   {
      static void check( const variant& v, const string& path )
      {
         if( !v.is_object() )
            FC_THROW_EXCEPTION( coercion_failure, "expected an object", ("member",path) );
         for( const auto& entry : v.get_object() )
            argument_shape<T>::check( entry.value(), path + entry.key() + "." );
      }
   };

   /** null and absent both mean an empty optional */
   template<typename T>
   struct argument_shape<optional<T>, fc::false_type, fc::false_type>
   {
      static void check( const variant& v, const string& path )
      {
         if( !v.is_null() )
            argument_shape<T>::check( v, path );
      }
   };

   template<typename T>
   void check_argument_shape( const variant& external )
   {
      argument_shape<T>::check( external, string() );
   }

} } // covenant::contract
