#include <covenant/contract/compile_decision.hpp>

namespace covenant { namespace contract {

   compile_decision compile_decision::failure( const string& error )
   {
      compile_decision d( fail );
      d.errors.push_back( error );
      return d;
   }

   compile_decision merge( const compile_decision& a, const compile_decision& b )
   {
      if( a.type == fail || b.type == fail )
      {
         compile_decision result( fail );
         if( a.type == fail ) result.errors.insert( result.errors.end(), a.errors.begin(), a.errors.end() );
         if( b.type == fail ) result.errors.insert( result.errors.end(), b.errors.begin(), b.errors.end() );
         return result;
      }

      if( (a.type == never && b.type == required) || (a.type == required && b.type == never) )
         return compile_decision::failure( "never and required are incompatible" );

      if( a.type == never || b.type == never )
         return compile_decision( never );
      if( a.type == required || b.type == required )
         return compile_decision( required );
      if( a.type == skippable || b.type == skippable )
         return compile_decision( skippable );
      return compile_decision();
   }

} } // covenant::contract
