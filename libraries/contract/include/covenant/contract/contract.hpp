#pragma once

#include <covenant/contract/compilation_session.hpp>
#include <covenant/contract/pathway_registry.hpp>

namespace covenant { namespace contract {

   /**
    *  Returns the pathway registry of Contract, built once per process from
    *
    *     static void Contract::declare_pathways( registry_builder<Contract>& );
    *
    *  against the process wide schema cache.  A contract with updatable
    *  pathways also declares
    *
    *     typedef ... stateful_arguments;
    *
    *  which must be reflected with FC_REFLECT so external arguments can be read.
    */
   template<typename Contract>
   const pathway_registry<Contract>& pathways_of()
   {
      static const pathway_registry<Contract> registry = []() -> pathway_registry<Contract>
      {
         registry_builder<Contract> builder( schema_cache::instance() );
         Contract::declare_pathways( builder );
         return builder.build();
      }();
      return registry;
   }

} } // covenant::contract
