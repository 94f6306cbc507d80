#pragma once

#include <covenant/contract/types.hpp>

#include <fc/reflect/reflect.hpp>

namespace covenant { namespace contract {

   struct template_output
   {
      template_output():amount(0){}
      template_output( share_type amount_arg, const string& label_arg )
      :amount(amount_arg),contract_label(label_arg){}

      share_type   amount;
      string       contract_label;
   };

   /**
    *  A transaction the compiler is asked to emit when a pathway is taken.
    *  Its outputs are opaque to the pathway layer.
    */
   struct transaction_template
   {
      transaction_template():lock_time(0){}
      explicit transaction_template( const string& label_arg, uint32_t lock_time_arg = 0 )
      :label(label_arg),lock_time(lock_time_arg){}

      transaction_template& add_output( share_type amount, const string& contract_label );
      share_type            total_amount()const;

      string                   label;
      uint32_t                 lock_time;
      vector<template_output>  outputs;
   };

   bool operator == ( const template_output& a, const template_output& b );
   bool operator == ( const transaction_template& a, const transaction_template& b );

   /**
    * @class template_sequence
    *
    *  A lazy, finite sequence of transaction templates returned by a pathway
    *  body.  It is consumed once: after next() returns an empty optional every
    *  later call does too.  Calling the body again produces a new sequence.
    */
   class template_sequence
   {
      public:
         typedef function<optional<transaction_template>()> generator_type;

         template_sequence();
         explicit template_sequence( generator_type generator );

         template_sequence( template_sequence&& other );
         template_sequence& operator=( template_sequence&& other );

         template_sequence( const template_sequence& ) = delete;
         template_sequence& operator=( const template_sequence& ) = delete;

         static template_sequence from_vector( vector<transaction_template> templates );
         static template_sequence single( transaction_template tmpl );

         optional<transaction_template> next();
         bool                           exhausted()const { return _exhausted; }

         /** drains every remaining template */
         vector<transaction_template>   collect();

      private:
         generator_type _generator;
         bool           _exhausted;
   };

} } // covenant::contract

FC_REFLECT( covenant::contract::template_output, (amount)(contract_label) )
FC_REFLECT( covenant::contract::transaction_template, (label)(lock_time)(outputs) )
