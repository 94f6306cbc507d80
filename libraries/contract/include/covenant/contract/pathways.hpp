#pragma once

#include <covenant/contract/argument_shape.hpp>
#include <covenant/contract/arguments.hpp>
#include <covenant/contract/exceptions.hpp>
#include <covenant/contract/guard.hpp>
#include <covenant/contract/schema_cache.hpp>
#include <covenant/contract/transaction_template.hpp>

#include <fc/reflect/variant.hpp>

namespace covenant { namespace contract {

   /**
    *  A transition of the contract: given the contract and the compile
    *  context it yields the transaction templates that move the funds.
    */
   template<typename Contract>
   struct then_func
   {
      typedef function<template_sequence( const Contract&, const context& )> body_type;

      template_sequence operator()( const Contract& self, const context& ctx )const
      {
         return body( self, ctx );
      }

      string                              name;
      vector< guard<Contract> >           guards;
      vector< compile_gate<Contract> >    compile_gates;
      body_type                           body;
   };

   /**
    * @class updatable_func_base
    *
    *  The part of an updatable pathway that does not depend on its argument
    *  type.  The compiler and external argument sources only see this
    *  interface, so every updatable pathway of a contract is reachable through
    *  the contract's stateful_arguments envelope.
    */
   template<typename Contract>
   class updatable_func_base
   {
      public:
         typedef typename stateful_arguments_of<Contract>::type stateful_arguments;

         virtual ~updatable_func_base(){}

         const string&                           name()const          { return _name; }
         const vector< guard<Contract> >&        guards()const        { return _guards; }
         const vector< compile_gate<Contract> >& compile_gates()const { return _compile_gates; }

         /** null unless the pathway is exposed to external argument sources */
         schema_ptr                              schema()const        { return _schema; }
         bool                                    is_web_exposed()const { return bool(_schema); }

         virtual template_sequence call( const Contract& self, const context& ctx, const stateful_arguments& args )const = 0;

         /** reads the envelope out of an externally supplied value and calls the pathway */
         template_sequence call_external( const Contract& self, const context& ctx, const variant& external )const
         {
            return call( self, ctx, read_arguments( external ) );
         }

         /** the value must have exactly the shape of stateful_arguments, optional members may be left out */
         stateful_arguments read_arguments( const variant& external )const
         {
            try {
               check_argument_shape<stateful_arguments>( external );
               return external.as<stateful_arguments>();
            }
            catch( coercion_failure& e )
            {
               FC_RETHROW_EXCEPTION( e, warn, "unable to read arguments of ${pathway}", ("pathway",_name) );
            }
            catch( const fc::exception& e )
            {
               FC_THROW_EXCEPTION( coercion_failure, "unable to read arguments of ${pathway}: ${error}",
                                   ("pathway",_name)("error",e.to_string()) );
            }
            catch( const std::exception& e )
            {
               FC_THROW_EXCEPTION( coercion_failure, "unable to read arguments of ${pathway}: ${error}",
                                   ("pathway",_name)("error",string(e.what())) );
            }
         }

      protected:
         updatable_func_base( const string& name_arg,
                              vector< guard<Contract> > guards_arg,
                              vector< compile_gate<Contract> > gates_arg,
                              schema_ptr schema_arg )
         :_name(name_arg),
          _guards( std::move(guards_arg) ),
          _compile_gates( std::move(gates_arg) ),
          _schema( std::move(schema_arg) ){}

         string                             _name;
         vector< guard<Contract> >          _guards;
         vector< compile_gate<Contract> >   _compile_gates;
         schema_ptr                         _schema;
   };

   template<typename Contract>
   using updatable_ptr = shared_ptr< const updatable_func_base<Contract> >;

   /**
    *  An updatable pathway taking an Arg that is narrowed out of the
    *  contract's envelope by an explicit coercion function.
    */
   template<typename Contract, typename Arg>
   class updatable_func : public updatable_func_base<Contract>
   {
      public:
         typedef updatable_func_base<Contract>                                   base_type;
         typedef typename base_type::stateful_arguments                          stateful_arguments;
         typedef function<Arg( const stateful_arguments& )>                      coerce_type;
         typedef function<template_sequence( const Contract&, const context&, Arg )> body_type;

         updatable_func( const string& name_arg,
                         vector< guard<Contract> > guards_arg,
                         vector< compile_gate<Contract> > gates_arg,
                         coerce_type coerce_arg,
                         body_type body_arg,
                         schema_ptr schema_arg )
         :base_type( name_arg, std::move(guards_arg), std::move(gates_arg), std::move(schema_arg) ),
          _coerce( std::move(coerce_arg) ),
          _body( std::move(body_arg) ){}

         /** narrows the envelope, any failure is reported as coercion_failure */
         Arg coerce_args( const stateful_arguments& args )const
         {
            try {
               return _coerce( args );
            }
            catch( const coercion_failure& )
            {
               throw;
            }
            catch( const fc::exception& e )
            {
               FC_THROW_EXCEPTION( coercion_failure, "unable to coerce arguments of ${pathway}: ${error}",
                                   ("pathway",this->_name)("error",e.to_string()) );
            }
            catch( const std::exception& e )
            {
               FC_THROW_EXCEPTION( coercion_failure, "unable to coerce arguments of ${pathway}: ${error}",
                                   ("pathway",this->_name)("error",string(e.what())) );
            }
         }

         Arg coerce_external( const variant& external )const
         {
            return coerce_args( this->read_arguments( external ) );
         }

         virtual template_sequence call( const Contract& self, const context& ctx, const stateful_arguments& args )const
         {
            return _body( self, ctx, coerce_args( args ) );
         }

         /** calls the body with an already typed argument */
         template_sequence call_with( const Contract& self, const context& ctx, Arg arg )const
         {
            return _body( self, ctx, std::move(arg) );
         }

      private:
         coerce_type  _coerce;
         body_type    _body;
   };

} } // covenant::contract
