#pragma once

#include <covenant/contract/pathways.hpp>

#include <fc/log/logger.hpp>

#include <typeinfo>

namespace covenant { namespace contract {

   template<typename Contract> class registry_builder;

   /** a named, nil-able factory in one of the registry's ordered lists */
   template<typename Factory>
   struct registry_entry
   {
      registry_entry(){}
      registry_entry( const string& name_arg, Factory factory_arg )
      :name(name_arg),factory( std::move(factory_arg) ){}

      string   name;
      Factory  factory;
   };

   /**
    * @class pathway_registry
    *
    *  The pathways one contract type declares, as three ordered lists of
    *  factories (then, finish and updatable) plus the declared guards and
    *  compile gates.  A factory returns an empty value when the contract
    *  does not implement that pathway; the compiler skips those.
    *
    *  Registries are built by registry_builder and never change afterwards.
    *  A registry may outlive its builder, but not the schema_cache the
    *  builder was given: updatable factories read argument schemas from it
    *  when invoked.  pathways_of() uses the process wide cache, which lives
    *  until exit.
    */
   template<typename Contract>
   class pathway_registry
   {
      public:
         typedef then_func<Contract>                          then_type;
         typedef guard<Contract>                              guard_type;
         typedef compile_gate<Contract>                       compile_gate_type;
         typedef updatable_ptr<Contract>                      updatable_type;

         typedef function<optional<then_type>()>              then_factory;
         typedef function<optional<guard_type>()>             finish_factory;
         typedef function<updatable_type()>                   updatable_factory;
         typedef function<optional<guard_type>()>             guard_factory;
         typedef function<optional<compile_gate_type>()>      compile_gate_factory;

         typedef registry_entry<then_factory>                 then_entry;
         typedef registry_entry<finish_factory>               finish_entry;
         typedef registry_entry<updatable_factory>            updatable_entry;
         typedef registry_entry<guard_factory>                guard_entry;
         typedef registry_entry<compile_gate_factory>         compile_gate_entry;

         const vector<then_entry>&          then_fns()const      { return _then_fns;      }
         const vector<finish_entry>&        finish_fns()const    { return _finish_fns;    }
         const vector<updatable_entry>&     updatable_fns()const { return _updatable_fns; }
         const vector<guard_entry>&         guards()const        { return _guards;        }
         const vector<compile_gate_entry>&  compile_gates()const { return _compile_gates; }

         optional<then_type> find_then( const string& name )const
         {
            const then_entry* entry = find_entry( _then_fns, name );
            return entry ? entry->factory() : optional<then_type>();
         }

         optional<guard_type> find_finish( const string& name )const
         {
            const finish_entry* entry = find_entry( _finish_fns, name );
            return entry ? entry->factory() : optional<guard_type>();
         }

         /** null when name is unknown or not implemented */
         updatable_type find_updatable( const string& name )const
         {
            const updatable_entry* entry = find_entry( _updatable_fns, name );
            return entry ? entry->factory() : updatable_type();
         }

         optional<guard_type> find_guard( const string& name )const
         {
            const guard_entry* entry = find_entry( _guards, name );
            return entry ? entry->factory() : optional<guard_type>();
         }

         optional<compile_gate_type> find_compile_gate( const string& name )const
         {
            const compile_gate_entry* entry = find_entry( _compile_gates, name );
            return entry ? entry->factory() : optional<compile_gate_type>();
         }

         then_type get_then( const string& name )const
         {
            auto result = find_then( name );
            if( !result.valid() )
               FC_THROW_EXCEPTION( unknown_pathway, "no then pathway ${name}", ("name",name) );
            return *result;
         }

         guard_type get_finish( const string& name )const
         {
            auto result = find_finish( name );
            if( !result.valid() )
               FC_THROW_EXCEPTION( unknown_pathway, "no finish pathway ${name}", ("name",name) );
            return *result;
         }

         updatable_type get_updatable( const string& name )const
         {
            auto result = find_updatable( name );
            if( !result )
               FC_THROW_EXCEPTION( unknown_pathway, "no updatable pathway ${name}", ("name",name) );
            return result;
         }

         /** invokes every then factory once, in declaration order, keeping the present ones */
         vector<then_type> present_then_fns()const
         {
            vector<then_type> result;
            for( const auto& entry : _then_fns )
            {
               auto fn = entry.factory();
               if( fn.valid() ) result.push_back( *fn );
            }
            return result;
         }

         vector<guard_type> present_finish_fns()const
         {
            vector<guard_type> result;
            for( const auto& entry : _finish_fns )
            {
               auto fn = entry.factory();
               if( fn.valid() ) result.push_back( *fn );
            }
            return result;
         }

         vector<updatable_type> present_updatable_fns()const
         {
            vector<updatable_type> result;
            for( const auto& entry : _updatable_fns )
            {
               auto fn = entry.factory();
               if( fn ) result.push_back( fn );
            }
            return result;
         }

      private:
         friend class registry_builder<Contract>;

         template<typename Entry>
         static const Entry* find_entry( const vector<Entry>& entries, const string& name )
         {
            for( const auto& entry : entries )
               if( entry.name == name )
                  return &entry;
            return nullptr;
         }

         vector<then_entry>          _then_fns;
         vector<finish_entry>        _finish_fns;
         vector<updatable_entry>     _updatable_fns;
         vector<guard_entry>         _guards;
         vector<compile_gate_entry>  _compile_gates;
   };

   enum schema_exposure
   {
      internal_only = 0, ///< usable by the compiler, not described to external callers
      web_exposed   = 1  ///< the argument schema is generated and cached
   };

   /**
    * @class registry_builder
    *
    *  Collects the declarations of one contract type and validates them as a
    *  whole in build():
    *
    *  - names are valid and unique within their list
    *  - every guard and compile gate a pathway references is declared
    *  - every implemented declaration has a body, and every implemented
    *    updatable pathway has a coercion function
    *
    *  A declaration given only a name is not implemented, its factory yields
    *  an empty value and guard/gate references to it are dropped.
    */
   template<typename Contract>
   class registry_builder
   {
      public:
         typedef pathway_registry<Contract>                       registry_type;
         typedef typename stateful_arguments_of<Contract>::type   stateful_arguments;
         typedef typename then_func<Contract>::body_type          then_body_type;
         typedef typename guard<Contract>::body_type              guard_body_type;
         typedef typename compile_gate<Contract>::body_type       compile_gate_body_type;

         /** cache must outlive every registry this builder builds */
         explicit registry_builder( schema_cache& cache = schema_cache::instance() )
         :_cache(&cache){}

         registry_builder& declare_guard( const string& name, guard_body_type body, guard_policy policy = fresh_guard )
         {
            _guards.push_back( guard_declaration( name, true, guard<Contract>( name, policy, std::move(body) ) ) );
            return *this;
         }

         /** declares a guard this contract does not implement */
         registry_builder& declare_guard( const string& name )
         {
            _guards.push_back( guard_declaration( name, false, guard<Contract>() ) );
            return *this;
         }

         registry_builder& declare_compile_gate( const string& name, compile_gate_body_type body )
         {
            _compile_gates.push_back( compile_gate_declaration( name, true, compile_gate<Contract>( name, std::move(body) ) ) );
            return *this;
         }

         registry_builder& declare_compile_gate( const string& name )
         {
            _compile_gates.push_back( compile_gate_declaration( name, false, compile_gate<Contract>() ) );
            return *this;
         }

         registry_builder& then( const string& name, const name_list& guarded_by, const name_list& compile_if, then_body_type body )
         {
            then_declaration decl;
            decl.name        = name;
            decl.implemented = true;
            decl.guarded_by  = guarded_by;
            decl.compile_if  = compile_if;
            decl.body        = std::move(body);
            _then_fns.push_back( std::move(decl) );
            return *this;
         }

         registry_builder& then( const string& name, then_body_type body )
         {
            return then( name, name_list(), name_list(), std::move(body) );
         }

         /** declares a then pathway this contract does not implement */
         registry_builder& then( const string& name )
         {
            then_declaration decl;
            decl.name        = name;
            decl.implemented = false;
            _then_fns.push_back( std::move(decl) );
            return *this;
         }

         /** binds a declared guard into the finish list, it alone suffices to spend */
         registry_builder& finish( const string& guard_name )
         {
            _finish_fns.push_back( guard_name );
            return *this;
         }

         template<typename Arg>
         registry_builder& updatable( const string& name,
                                      const name_list& guarded_by,
                                      const name_list& compile_if,
                                      typename updatable_func<Contract,Arg>::coerce_type coerce_args,
                                      typename updatable_func<Contract,Arg>::body_type body,
                                      schema_exposure exposure = internal_only )
         {
            updatable_declaration decl;
            decl.name         = name;
            decl.implemented  = true;
            decl.guarded_by   = guarded_by;
            decl.compile_if   = compile_if;
            decl.has_body     = bool(body);
            decl.has_coercion = bool(coerce_args);

            schema_cache* cache = _cache;
            decl.make = [name,coerce_args,body,exposure,cache]( const vector< guard<Contract> >& guards,
                                                                const vector< compile_gate<Contract> >& gates ) -> updatable_ptr<Contract>
            {
               schema_ptr schema;
               if( exposure == web_exposed )
                  schema = cache->get_schema_for<Arg>();
               return std::make_shared< updatable_func<Contract,Arg> >( name, guards, gates, coerce_args, body, schema );
            };
            _updatable_fns.push_back( std::move(decl) );
            return *this;
         }

         /** declares an updatable pathway this contract does not implement */
         registry_builder& updatable( const string& name )
         {
            updatable_declaration decl;
            decl.name        = name;
            decl.implemented = false;
            _updatable_fns.push_back( std::move(decl) );
            return *this;
         }

         registry_type build()const
         { try {
            registry_type registry;

            check_names( _guards, "guard" );
            check_names( _compile_gates, "compile gate" );
            check_names( _then_fns, "then" );
            check_names( _updatable_fns, "updatable" );
            check_finish_names();

            for( const auto& decl : _guards )
            {
               if( decl.implemented && !decl.value.body )
                  FC_THROW_EXCEPTION( missing_pathway_body, "guard ${name} has no body", ("name",decl.name) );
               optional< guard<Contract> > value;
               if( decl.implemented ) value = decl.value;
               registry._guards.push_back( typename registry_type::guard_entry( decl.name, constant_factory( value ) ) );
            }

            for( const auto& decl : _compile_gates )
            {
               if( decl.implemented && !decl.value.body )
                  FC_THROW_EXCEPTION( missing_pathway_body, "compile gate ${name} has no body", ("name",decl.name) );
               optional< compile_gate<Contract> > value;
               if( decl.implemented ) value = decl.value;
               registry._compile_gates.push_back( typename registry_type::compile_gate_entry( decl.name, constant_factory( value ) ) );
            }

            for( const auto& decl : _then_fns )
            {
               optional< then_func<Contract> > value;
               if( decl.implemented )
               {
                  if( !decl.body )
                     FC_THROW_EXCEPTION( missing_pathway_body, "then pathway ${name} has no body", ("name",decl.name) );
                  then_func<Contract> fn;
                  fn.name          = decl.name;
                  fn.guards        = resolve_guards( decl.name, decl.guarded_by );
                  fn.compile_gates = resolve_compile_gates( decl.name, decl.compile_if );
                  fn.body          = decl.body;
                  value = fn;
               }
               registry._then_fns.push_back( typename registry_type::then_entry( decl.name, constant_factory( value ) ) );
            }

            for( const auto& guard_name : _finish_fns )
            {
               const guard_declaration* decl = find_declaration( _guards, guard_name );
               if( decl == nullptr )
                  FC_THROW_EXCEPTION( unknown_guard, "finish references undeclared guard ${name}", ("name",guard_name) );
               optional< guard<Contract> > value;
               if( decl->implemented )
                  value = decl->value;
               else
                  wlog( "finish pathway ${name} is bound to a guard that is not implemented", ("name",guard_name) );
               registry._finish_fns.push_back( typename registry_type::finish_entry( guard_name, constant_factory( value ) ) );
            }

            for( const auto& decl : _updatable_fns )
            {
               typename registry_type::updatable_factory factory;
               if( decl.implemented )
               {
                  if( !decl.has_body )
                     FC_THROW_EXCEPTION( missing_pathway_body, "updatable pathway ${name} has no body", ("name",decl.name) );
                  if( !decl.has_coercion )
                     FC_THROW_EXCEPTION( missing_coercion, "updatable pathway ${name} has no coerce_args", ("name",decl.name) );

                  const vector< guard<Contract> >        guards = resolve_guards( decl.name, decl.guarded_by );
                  const vector< compile_gate<Contract> > gates  = resolve_compile_gates( decl.name, decl.compile_if );
                  const auto make = decl.make;
                  factory = [make,guards,gates]() { return make( guards, gates ); };
               }
               else
               {
                  factory = []() { return updatable_ptr<Contract>(); };
               }
               registry._updatable_fns.push_back( typename registry_type::updatable_entry( decl.name, factory ) );
            }

            ilog( "declared pathways of ${contract}: ${then} then, ${finish} finish, ${updatable} updatable",
                  ("contract",typeid(Contract).name())
                  ("then",registry._then_fns.size())
                  ("finish",registry._finish_fns.size())
                  ("updatable",registry._updatable_fns.size()) );
            return registry;
         } FC_CAPTURE_AND_RETHROW( (typeid(Contract).name()) ) }

      private:
         template<typename T>
         struct declaration
         {
            declaration():implemented(false){}
            declaration( const string& name_arg, bool implemented_arg, T value_arg )
            :name(name_arg),implemented(implemented_arg),value( std::move(value_arg) ){}

            string  name;
            bool    implemented;
            T       value;
         };

         typedef declaration< guard<Contract> >          guard_declaration;
         typedef declaration< compile_gate<Contract> >   compile_gate_declaration;

         struct then_declaration
         {
            then_declaration():implemented(false){}

            string          name;
            bool            implemented;
            name_list       guarded_by;
            name_list       compile_if;
            then_body_type  body;
         };

         struct updatable_declaration
         {
            typedef function<updatable_ptr<Contract>( const vector< guard<Contract> >&,
                                                      const vector< compile_gate<Contract> >& )> make_type;

            updatable_declaration():implemented(false),has_body(false),has_coercion(false){}

            string     name;
            bool       implemented;
            bool       has_body;
            bool       has_coercion;
            name_list  guarded_by;
            name_list  compile_if;
            make_type  make;
         };

         template<typename T>
         static function<optional<T>()> constant_factory( const optional<T>& value )
         {
            return [value]() { return value; };
         }

         template<typename Declaration>
         static const Declaration* find_declaration( const vector<Declaration>& decls, const string& name )
         {
            for( const auto& decl : decls )
               if( decl.name == name )
                  return &decl;
            return nullptr;
         }

         template<typename Declaration>
         static void check_names( const vector<Declaration>& decls, const char* list_name )
         {
            set<string> seen;
            for( const auto& decl : decls )
            {
               if( !is_valid_pathway_name( decl.name ) )
                  FC_THROW_EXCEPTION( invalid_pathway_name, "invalid ${list} name", ("list",list_name)("name",decl.name) );
               if( !seen.insert( decl.name ).second )
                  FC_THROW_EXCEPTION( duplicate_pathway_name, "${list} ${name} declared twice", ("list",list_name)("name",decl.name) );
            }
         }

         void check_finish_names()const
         {
            set<string> seen;
            for( const auto& name : _finish_fns )
            {
               if( !is_valid_pathway_name( name ) )
                  FC_THROW_EXCEPTION( invalid_pathway_name, "invalid finish name", ("name",name) );
               if( !seen.insert( name ).second )
                  FC_THROW_EXCEPTION( duplicate_pathway_name, "finish ${name} declared twice", ("name",name) );
            }
         }

         vector< guard<Contract> > resolve_guards( const string& pathway, const name_list& names )const
         {
            vector< guard<Contract> > result;
            for( const auto& name : names )
            {
               const guard_declaration* decl = find_declaration( _guards, name );
               if( decl == nullptr )
                  FC_THROW_EXCEPTION( unknown_guard, "${pathway} is guarded by undeclared guard ${name}",
                                      ("pathway",pathway)("name",name) );
               if( !decl->implemented )
               {
                  wlog( "${pathway} is guarded by ${name} which is not implemented, dropping it", ("pathway",pathway)("name",name) );
                  continue;
               }
               result.push_back( decl->value );
            }
            return result;
         }

         vector< compile_gate<Contract> > resolve_compile_gates( const string& pathway, const name_list& names )const
         {
            vector< compile_gate<Contract> > result;
            for( const auto& name : names )
            {
               const compile_gate_declaration* decl = find_declaration( _compile_gates, name );
               if( decl == nullptr )
                  FC_THROW_EXCEPTION( unknown_compile_gate, "${pathway} is gated by undeclared compile gate ${name}",
                                      ("pathway",pathway)("name",name) );
               if( !decl->implemented )
               {
                  wlog( "${pathway} is gated by ${name} which is not implemented, dropping it", ("pathway",pathway)("name",name) );
                  continue;
               }
               result.push_back( decl->value );
            }
            return result;
         }

         schema_cache*                        _cache;
         vector<guard_declaration>            _guards;
         vector<compile_gate_declaration>     _compile_gates;
         vector<then_declaration>             _then_fns;
         name_list                            _finish_fns;
         vector<updatable_declaration>        _updatable_fns;
   };

} } // covenant::contract

FC_REFLECT_ENUM( covenant::contract::schema_exposure, (internal_only)(web_exposed) )
