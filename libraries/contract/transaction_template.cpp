#include <covenant/contract/transaction_template.hpp>
#include <covenant/contract/exceptions.hpp>

#include <stdint.h>

namespace covenant { namespace contract {

   transaction_template& transaction_template::add_output( share_type amount, const string& contract_label )
   {
      FC_ASSERT( amount >= 0, "negative output amount", ("amount",amount)("label",contract_label) );
      outputs.push_back( template_output( amount, contract_label ) );
      return *this;
   }

   share_type transaction_template::total_amount()const
   {
      share_type total = 0;
      for( const auto& out : outputs )
      {
         if( out.amount > 0 && total > INT64_MAX - out.amount )
            FC_THROW_EXCEPTION( amount_overflow, "output total of ${label} overflows", ("label",label)("total",total)("amount",out.amount) );
         total += out.amount;
      }
      return total;
   }

   bool operator == ( const template_output& a, const template_output& b )
   {
      return a.amount == b.amount && a.contract_label == b.contract_label;
   }

   bool operator == ( const transaction_template& a, const transaction_template& b )
   {
      return a.label == b.label && a.lock_time == b.lock_time && a.outputs == b.outputs;
   }

   template_sequence::template_sequence()
   :_exhausted(true){}

   template_sequence::template_sequence( generator_type generator )
   :_generator( std::move(generator) ),_exhausted(!_generator){}

   template_sequence::template_sequence( template_sequence&& other )
   :_generator( std::move(other._generator) ),_exhausted(other._exhausted)
   {
      other._generator = generator_type();
      other._exhausted = true;
   }

   template_sequence& template_sequence::operator=( template_sequence&& other )
   {
      if( this == &other ) return *this;
      _generator = std::move(other._generator);
      _exhausted = other._exhausted;
      other._generator = generator_type();
      other._exhausted = true;
      return *this;
   }

   template_sequence template_sequence::from_vector( vector<transaction_template> templates )
   {
      auto remaining = std::make_shared< vector<transaction_template> >( std::move(templates) );
      auto position  = std::make_shared<size_t>( 0 );
      return template_sequence( [remaining,position]() -> optional<transaction_template>
      {
         if( *position >= remaining->size() )
            return optional<transaction_template>();
         return (*remaining)[(*position)++];
      } );
   }

   template_sequence template_sequence::single( transaction_template tmpl )
   {
      vector<transaction_template> templates;
      templates.push_back( std::move(tmpl) );
      return from_vector( std::move(templates) );
   }

   optional<transaction_template> template_sequence::next()
   {
      if( _exhausted )
         return optional<transaction_template>();

      optional<transaction_template> result = _generator();
      if( !result.valid() )
      {
         _exhausted = true;
         _generator = generator_type();
      }
      return result;
   }

   vector<transaction_template> template_sequence::collect()
   {
      vector<transaction_template> result;
      for( auto tmpl = next(); tmpl.valid(); tmpl = next() )
         result.push_back( *tmpl );
      return result;
   }

} } // covenant::contract
