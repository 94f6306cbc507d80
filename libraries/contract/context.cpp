#include <covenant/contract/context.hpp>
#include <covenant/contract/exceptions.hpp>

namespace covenant { namespace contract {

   context::context( const string& network )
   :_network(network)
   {
      FC_ASSERT( !_network.empty(), "a context requires a network" );
   }

   context context::derive( const string& segment )const
   { try {
      if( !is_valid_pathway_name( segment ) )
         FC_THROW_EXCEPTION( invalid_pathway_name, "invalid context segment", ("segment",segment) );
      if( depth() >= COVENANT_MAX_CONTEXT_DEPTH )
         FC_THROW_EXCEPTION( context_too_deep, "", ("path",path_string())("max",COVENANT_MAX_CONTEXT_DEPTH) );

      context child( *this );
      child._path.push_back( segment );
      return child;
   } FC_CAPTURE_AND_RETHROW( (segment) ) }

   string context::path_string()const
   {
      string result;
      for( uint32_t i = 0; i < _path.size(); ++i )
      {
         if( i ) result += COVENANT_CONTEXT_PATH_SEPARATOR;
         result += _path[i];
      }
      return result;
   }

   bool operator == ( const context& a, const context& b )
   {
      return a._network == b._network && a._path == b._path;
   }

   bool operator != ( const context& a, const context& b )
   {
      return !(a == b);
   }

} } // covenant::contract
