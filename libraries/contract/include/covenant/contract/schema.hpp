#pragma once

#include <covenant/contract/config.hpp>
#include <covenant/contract/types.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/typename.hpp>
#include <fc/time.hpp>

namespace covenant { namespace contract {

   /**
    *  A structural description of a pathway argument type, in the shape of a
    *  JSON schema document.  Generated once per type and shared read-only.
    */
   struct root_schema
   {
      string          schema;
      string          title;
      variant_object  definition;
   };

   typedef std::shared_ptr<const root_schema> schema_ptr;

   namespace detail {

      template<typename T>
      struct is_optional { enum { value = 0 }; };

      template<typename T>
      struct is_optional< fc::optional<T> > { enum { value = 1 }; };

      inline variant_object integer_schema( const char* format, bool is_unsigned )
      {
         mutable_variant_object obj( "type", "integer" );
         obj( "format", format );
         if( is_unsigned )
            obj( "minimum", 0 );
         return variant_object( obj );
      }

   } // detail

   /**
    *  schema_of<T>::describe() produces the definition for T.  Reflected
    *  structs and enums are handled by the primary template, every other
    *  supported type has a specialization below.  A type that is neither
    *  reflected nor specialized does not compile.
    */
   template<typename T, typename IsEnum = typename fc::reflector<T>::is_enum>
   struct schema_of;

   template<typename Class>
   class property_visitor
   {
      public:
         property_visitor( mutable_variant_object& properties, fc::variants& required_names )
         :_properties(properties),_required(required_names){}

         template<typename Member, class C, Member (C::*member)>
         void operator()( const char* name )const
         {
            _properties( name, schema_of<Member>::describe() );
            if( !detail::is_optional<Member>::value )
               _required.push_back( variant( name ) );
         }

      private:
         mutable_variant_object& _properties;
         fc::variants&           _required;
   };

   template<typename T>
   struct schema_of<T, fc::false_type>
   {
      static variant_object describe()
      {
         mutable_variant_object properties;
         fc::variants           required_names;
         fc::reflector<T>::visit( property_visitor<T>( properties, required_names ) );

         mutable_variant_object obj( "type", "object" );
         obj( "title", fc::get_typename<T>::name() )
            ( "properties", variant_object( properties ) )
            ( "required", required_names )
            ( "additionalProperties", false );
         return variant_object( obj );
      }
   };

   /** enums serialize as their reflected name, or as the underlying integer */
   template<typename T>
   struct schema_of<T, fc::true_type>
   {
      static variant_object describe()
      {
         fc::variants alternatives;
         alternatives.push_back( variant( mutable_variant_object( "type", "string" ) ) );
         alternatives.push_back( variant( mutable_variant_object( "type", "integer" ) ) );
         return variant_object( mutable_variant_object( "anyOf", alternatives ) );
      }
   };

#define COVENANT_SCHEMA_INTEGER( TYPE, FORMAT, UNSIGNED ) \
   template<> struct schema_of<TYPE, fc::false_type> \
   { \
      static variant_object describe() { return detail::integer_schema( FORMAT, UNSIGNED ); } \
   };

   COVENANT_SCHEMA_INTEGER( int8_t,   "int8",   false )
   COVENANT_SCHEMA_INTEGER( int16_t,  "int16",  false )
   COVENANT_SCHEMA_INTEGER( int32_t,  "int32",  false )
   COVENANT_SCHEMA_INTEGER( int64_t,  "int64",  false )
   COVENANT_SCHEMA_INTEGER( uint8_t,  "uint8",  true  )
   COVENANT_SCHEMA_INTEGER( uint16_t, "uint16", true  )
   COVENANT_SCHEMA_INTEGER( uint32_t, "uint32", true  )
   COVENANT_SCHEMA_INTEGER( uint64_t, "uint64", true  )

#undef COVENANT_SCHEMA_INTEGER

   template<> struct schema_of<bool, fc::false_type>
   {
      static variant_object describe() { return variant_object( mutable_variant_object( "type", "boolean" ) ); }
   };

   template<> struct schema_of<float, fc::false_type>
   {
      static variant_object describe() { return variant_object( mutable_variant_object( "type", "number" ) ); }
   };

   template<> struct schema_of<double, fc::false_type>
   {
      static variant_object describe() { return variant_object( mutable_variant_object( "type", "number" ) ); }
   };

   template<> struct schema_of<string, fc::false_type>
   {
      static variant_object describe() { return variant_object( mutable_variant_object( "type", "string" ) ); }
   };

   /** any json value */
   template<> struct schema_of<variant, fc::false_type>
   {
      static variant_object describe() { return variant_object(); }
   };

   template<> struct schema_of<fc::sha256, fc::false_type>
   {
      static variant_object describe()
      {
         mutable_variant_object obj( "type", "string" );
         obj( "pattern", "^[0-9a-f]{64}$" );
         return variant_object( obj );
      }
   };

   template<> struct schema_of<fc::time_point_sec, fc::false_type>
   {
      static variant_object describe()
      {
         mutable_variant_object obj( "type", "string" );
         obj( "format", "date-time" );
         return variant_object( obj );
      }
   };

   /** fc packs raw bytes as a hex string */
   template<> struct schema_of<vector<char>, fc::false_type>
   {
      static variant_object describe()
      {
         mutable_variant_object obj( "type", "string" );
         obj( "pattern", "^([0-9a-f]{2})*$" );
         return variant_object( obj );
      }
   };

   template<typename T>
   struct schema_of<vector<T>, fc::false_type>
   {
      static variant_object describe()
      {
         mutable_variant_object obj( "type", "array" );
         obj( "items", schema_of<T>::describe() );
         return variant_object( obj );
      }
   };

   template<typename T>
   struct schema_of<set<T>, fc::false_type>
   {
      static variant_object describe()
      {
         mutable_variant_object obj( "type", "array" );
         obj( "items", schema_of<T>::describe() )
            ( "uniqueItems", true );
         return variant_object( obj );
      }
   };

   template<typename T>
   struct schema_of<map<string,T>, fc::false_type>
   {
      static variant_object describe()
      {
         mutable_variant_object obj( "type", "object" );
         obj( "additionalProperties", schema_of<T>::describe() );
         return variant_object( obj );
      }
   };

   template<typename T>
   struct schema_of<optional<T>, fc::false_type>
   {
      static variant_object describe() { return schema_of<T>::describe(); }
   };

   template<typename IntType, typename EnumType>
   struct schema_of<fc::enum_type<IntType,EnumType>, fc::false_type>
   {
      static variant_object describe() { return schema_of<EnumType>::describe(); }
   };

   template<typename T>
   root_schema generate_schema()
   {
      root_schema result;
      result.schema     = COVENANT_SCHEMA_DIALECT;
      result.title      = fc::get_typename<T>::name();
      result.definition = schema_of<T>::describe();
      return result;
   }

} } // covenant::contract

FC_REFLECT( covenant::contract::root_schema, (schema)(title)(definition) )
