#include <covenant/contract/config.hpp>
#include <covenant/contract/types.hpp>

namespace covenant { namespace contract {

   bool is_valid_pathway_name( const string& name )
   {
      if( name.empty() || name.size() > COVENANT_MAX_PATHWAY_NAME_LENGTH )
         return false;

      if( name[0] < 'a' || name[0] > 'z' )
         return false;

      for( const char c : name )
      {
         const bool lower = c >= 'a' && c <= 'z';
         const bool digit = c >= '0' && c <= '9';
         if( !lower && !digit && c != '_' )
            return false;
      }
      return true;
   }

} } // covenant::contract
