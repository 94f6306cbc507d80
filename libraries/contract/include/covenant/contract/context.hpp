#pragma once

#include <covenant/contract/config.hpp>
#include <covenant/contract/types.hpp>

namespace covenant { namespace contract {

   /**
    * @class context
    *
    *  The compile time environment handed to every pathway, guard and compile
    *  gate body.  The pathway layer never inspects it, it only forwards it and
    *  derives child contexts for nested pathways.
    */
   class context
   {
      public:
         explicit context( const string& network = COVENANT_DEFAULT_NETWORK );

         /** returns a child context one segment deeper, the segment must be a valid pathway name */
         context               derive( const string& segment )const;

         const string&         network()const { return _network; }
         const vector<string>& path()const    { return _path;    }
         string                path_string()const;
         uint32_t              depth()const   { return uint32_t(_path.size()); }

         friend bool operator == ( const context& a, const context& b );
         friend bool operator != ( const context& a, const context& b );

      private:
         string          _network;
         vector<string>  _path;
   };

} } // covenant::contract
