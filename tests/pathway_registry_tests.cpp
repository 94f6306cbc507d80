#define BOOST_TEST_MODULE PathwayRegistryTests
#include <boost/test/unit_test.hpp>

#include "contract_fixture.hpp"

#include <fc/io/json.hpp>

#include <type_traits>

static_assert( std::is_same< stateful_arguments_of<escrow_contract>::type, escrow_arguments >::value,
               "escrow_contract declares its envelope" );
static_assert( std::is_same< stateful_arguments_of<vault_contract>::type, no_arguments >::value,
               "vault_contract falls back to the empty envelope" );

struct registry_fixture
{
   registry_fixture()
   {
      escrow_contract::declare_pathways( escrow_builder );
      vault_contract::declare_pathways( vault_builder );
   }

   schema_cache                         cache;
   registry_builder<escrow_contract>    escrow_builder{ cache };
   registry_builder<vault_contract>     vault_builder{ cache };
   escrow_contract                      escrow;
   vault_contract                       vault;
   context                              ctx;
};

template<typename Entry>
static std::vector<std::string> names_of( const std::vector<Entry>& entries )
{
   std::vector<std::string> names;
   for( const auto& entry : entries )
      names.push_back( entry.name );
   return names;
}

BOOST_FIXTURE_TEST_CASE( single_transition_and_cached_finish, registry_fixture )
{
   const auto registry = vault_builder.build();

   BOOST_REQUIRE_EQUAL( registry.then_fns().size(), 1u );
   auto a = registry.then_fns()[0].factory();
   BOOST_REQUIRE( a.valid() );
   BOOST_CHECK_EQUAL( a->name, "a" );
   BOOST_CHECK( a->guards.empty() );
   BOOST_CHECK( a->compile_gates.empty() );

   auto templates = (*a)( vault, ctx ).collect();
   BOOST_REQUIRE_EQUAL( templates.size(), 1u );
   BOOST_CHECK_EQUAL( templates[0].label, "sweep" );
   BOOST_CHECK_EQUAL( templates[0].total_amount(), 5000 );

   BOOST_REQUIRE_EQUAL( registry.finish_fns().size(), 1u );
   auto b = registry.finish_fns()[0].factory();
   BOOST_REQUIRE( b.valid() );
   BOOST_CHECK_EQUAL( b->name, "b" );
   BOOST_CHECK( b->policy == cached_guard );
   BOOST_CHECK( (*b)( vault, ctx ) == clause::key( "cold" ) );

   BOOST_CHECK( registry.updatable_fns().empty() );
   BOOST_CHECK( registry.present_updatable_fns().empty() );
}

BOOST_FIXTURE_TEST_CASE( declaration_order_is_preserved, registry_fixture )
{
   const auto registry = escrow_builder.build();

   const std::vector<std::string> then_names      = { "release", "refund", "dispute" };
   const std::vector<std::string> finish_names    = { "arbiter_signed", "oracle_attested" };
   const std::vector<std::string> updatable_names = { "update_terms", "rekey", "split" };
   const std::vector<std::string> guard_names     = { "both_signed", "timed_out", "arbiter_signed", "oracle_attested" };

   for( uint32_t pass = 0; pass < 2; ++pass )
   {
      BOOST_CHECK( names_of( registry.then_fns() ) == then_names );
      BOOST_CHECK( names_of( registry.finish_fns() ) == finish_names );
      BOOST_CHECK( names_of( registry.updatable_fns() ) == updatable_names );
      BOOST_CHECK( names_of( registry.guards() ) == guard_names );
   }

   const auto present = registry.present_then_fns();
   BOOST_REQUIRE_EQUAL( present.size(), 2u );
   BOOST_CHECK_EQUAL( present[0].name, "release" );
   BOOST_CHECK_EQUAL( present[1].name, "refund" );

   const auto updatable = registry.present_updatable_fns();
   BOOST_REQUIRE_EQUAL( updatable.size(), 2u );
   BOOST_CHECK_EQUAL( updatable[0]->name(), "update_terms" );
   BOOST_CHECK_EQUAL( updatable[1]->name(), "rekey" );
}

BOOST_FIXTURE_TEST_CASE( unimplemented_declarations_are_absent, registry_fixture )
{
   const auto registry = escrow_builder.build();

   BOOST_CHECK( !registry.then_fns()[2].factory().valid() );
   BOOST_CHECK( !registry.find_then( "dispute" ).valid() );
   BOOST_CHECK( !registry.find_then( "never_declared" ).valid() );
   BOOST_CHECK_THROW( registry.get_then( "dispute" ), unknown_pathway );

   // a finish bound to an unimplemented guard is absent too
   BOOST_CHECK( !registry.finish_fns()[1].factory().valid() );
   BOOST_CHECK( !registry.find_finish( "oracle_attested" ).valid() );
   BOOST_CHECK_EQUAL( registry.present_finish_fns().size(), 1u );

   BOOST_CHECK( !registry.updatable_fns()[2].factory() );
   BOOST_CHECK( !registry.find_updatable( "split" ) );
   BOOST_CHECK_THROW( registry.get_updatable( "split" ), unknown_pathway );

   BOOST_CHECK( !registry.find_guard( "oracle_attested" ).valid() );
   BOOST_CHECK( registry.find_guard( "both_signed" ).valid() );
   BOOST_CHECK( !registry.find_compile_gate( "mainnet_only" ).valid() );
   BOOST_CHECK( registry.find_compile_gate( "is_funded" ).valid() );
}

BOOST_FIXTURE_TEST_CASE( unimplemented_guards_and_gates_are_dropped, registry_fixture )
{
   const auto registry = escrow_builder.build();

   const auto release = registry.get_then( "release" );
   BOOST_REQUIRE_EQUAL( release.guards.size(), 1u );
   BOOST_CHECK_EQUAL( release.guards[0].name, "both_signed" );
   BOOST_CHECK( release.guards[0].policy == fresh_guard );
   BOOST_REQUIRE_EQUAL( release.compile_gates.size(), 1u );
   BOOST_CHECK_EQUAL( release.compile_gates[0].name, "is_funded" );

   const auto refund = registry.get_then( "refund" );
   BOOST_REQUIRE_EQUAL( refund.guards.size(), 1u );
   BOOST_CHECK( refund.guards[0].is_cached() );
   BOOST_REQUIRE_EQUAL( refund.compile_gates.size(), 1u );
   BOOST_CHECK( refund.compile_gates[0].policy == fresh_compile_gate );

   auto templates = refund( escrow, ctx ).collect();
   BOOST_REQUIRE_EQUAL( templates.size(), 2u );
   BOOST_CHECK_EQUAL( templates[0].total_amount(), escrow.amount );
   BOOST_CHECK_EQUAL( templates[1].label, "refund_fee_bump" );
}

BOOST_FIXTURE_TEST_CASE( bodies_are_restartable_only_by_reinvoking, registry_fixture )
{
   const auto release = escrow_builder.build().get_then( "release" );
   template_sequence first = release( escrow, ctx.derive( "escrow" ) );
   auto tmpl = first.next();
   BOOST_REQUIRE( tmpl.valid() );
   BOOST_CHECK_EQUAL( tmpl->outputs[0].contract_label, "escrowseller" );
   BOOST_CHECK( !first.next().valid() );

   template_sequence second = release( escrow, ctx );
   BOOST_CHECK_EQUAL( second.collect().size(), 1u );
}

BOOST_FIXTURE_TEST_CASE( updatable_coercion, registry_fixture )
{
   const auto registry = escrow_builder.build();
   const auto update = registry.get_updatable( "update_terms" );
   BOOST_CHECK_EQUAL( update->guards().size(), 1u );
   BOOST_CHECK( update->compile_gates().empty() );

   terms_update expected( 750, "partial delivery" );
   expected.deadline = 800000;

   const fc::variant external = fc::json::from_string(
      R"({"terms":{"new_amount":750,"memo":"partial delivery","deadline":800000}})" );

   auto typed = std::dynamic_pointer_cast< const updatable_func<escrow_contract,terms_update> >( update );
   BOOST_REQUIRE( typed );
   BOOST_CHECK( typed->coerce_external( external ) == expected );

   escrow_arguments envelope;
   envelope.terms = expected;
   BOOST_CHECK( typed->coerce_args( envelope ) == expected );

   auto templates = update->call_external( escrow, ctx, external ).collect();
   BOOST_REQUIRE_EQUAL( templates.size(), 1u );
   BOOST_CHECK_EQUAL( templates[0].total_amount(), 750 );

   auto direct = typed->call_with( escrow, ctx, expected ).collect();
   BOOST_REQUIRE_EQUAL( direct.size(), 1u );
   BOOST_CHECK( direct[0] == templates[0] );
}

BOOST_FIXTURE_TEST_CASE( coercion_failures_are_reported, registry_fixture )
{
   const auto registry = escrow_builder.build();
   const auto update = registry.get_updatable( "update_terms" );
   const auto rekey  = registry.get_updatable( "rekey" );

   // envelope without the pathway's member
   const fc::variant only_rekey = fc::json::from_string( R"({"rekey":{"new_key":"fresh"}})" );
   BOOST_CHECK_THROW( update->call_external( escrow, ctx, only_rekey ), coercion_failure );
   BOOST_CHECK_EQUAL( rekey->call_external( escrow, ctx, only_rekey ).collect().size(), 1u );

   // FC_ASSERT inside coerce_args surfaces as a coercion failure
   const fc::variant zero = fc::json::from_string( R"({"terms":{"new_amount":0,"memo":""}})" );
   BOOST_CHECK_THROW( update->call_external( escrow, ctx, zero ), coercion_failure );

   // value that is not an envelope at all
   BOOST_CHECK_THROW( update->call_external( escrow, ctx, fc::variant( "not an object" ) ), coercion_failure );
   BOOST_CHECK_THROW( update->read_arguments( fc::variant( 42 ) ), coercion_failure );

   // required members must be present
   const fc::variant empty_rekey = fc::json::from_string( R"({"rekey":{}})" );
   BOOST_CHECK_THROW( rekey->call_external( escrow, ctx, empty_rekey ), coercion_failure );
   const fc::variant no_amount = fc::json::from_string( R"({"terms":{"memo":"x"}})" );
   BOOST_CHECK_THROW( update->read_arguments( no_amount ), coercion_failure );

   // members the type does not declare are rejected, at any depth
   const fc::variant extra_member = fc::json::from_string( R"({"terms":{"memo":"x","new_amount":5,"bogus":1}})" );
   BOOST_CHECK_THROW( update->call_external( escrow, ctx, extra_member ), coercion_failure );
   const fc::variant extra_envelope = fc::json::from_string( R"({"rekey":{"new_key":"k"},"split":{}})" );
   BOOST_CHECK_THROW( rekey->call_external( escrow, ctx, extra_envelope ), coercion_failure );

   // optional members may be left out or null
   const fc::variant null_terms = fc::json::from_string( R"({"terms":null,"rekey":{"new_key":"k"}})" );
   BOOST_CHECK_EQUAL( rekey->call_external( escrow, ctx, null_terms ).collect().size(), 1u );
   const fc::variant no_deadline = fc::json::from_string( R"({"terms":{"new_amount":5,"memo":"x"}})" );
   BOOST_CHECK_EQUAL( update->call_external( escrow, ctx, no_deadline ).collect().size(), 1u );
}

BOOST_FIXTURE_TEST_CASE( schema_only_for_exposed_pathways, registry_fixture )
{
   BOOST_CHECK_EQUAL( cache.size(), 0u );
   const auto registry = escrow_builder.build();

   // building does not generate, invoking the factory does
   BOOST_CHECK_EQUAL( cache.size(), 0u );

   const auto update = registry.get_updatable( "update_terms" );
   BOOST_REQUIRE( update->is_web_exposed() );
   BOOST_CHECK_EQUAL( update->schema()->title, "terms_update" );
   BOOST_CHECK( update->schema().get() == cache.find( std::type_index( typeid(terms_update) ) ).get() );
   BOOST_CHECK( registry.get_updatable( "update_terms" )->schema().get() == update->schema().get() );

   const auto rekey = registry.get_updatable( "rekey" );
   BOOST_CHECK( !rekey->is_web_exposed() );
   BOOST_CHECK( !rekey->schema() );
   BOOST_CHECK( !cache.find( std::type_index( typeid(rekey_args) ) ) );
   BOOST_CHECK_EQUAL( cache.size(), 1u );
}

BOOST_AUTO_TEST_CASE( registry_outlives_its_builder )
{
   schema_cache cache;
   pathway_registry<escrow_contract> registry;
   {
      registry_builder<escrow_contract> builder( cache );
      escrow_contract::declare_pathways( builder );
      registry = builder.build();
   }

   const auto update = registry.get_updatable( "update_terms" );
   BOOST_REQUIRE( update->schema() );
   BOOST_CHECK( update->schema().get() == cache.find( std::type_index( typeid(terms_update) ) ).get() );
   BOOST_CHECK_EQUAL( registry.present_then_fns().size(), 2u );
}

struct broken_contract
{
   typedef no_arguments stateful_arguments;

   clause signer( const context& )const { return clause::key( "signer" ); }
   compile_decision always( const context& )const { return compile_decision(); }
   template_sequence noop( const context& )const { return template_sequence(); }
   template_sequence with_arg( const context&, uint64_t )const { return template_sequence(); }
   static uint64_t to_number( const no_arguments& ) { return 1; }
};

BOOST_AUTO_TEST_CASE( builder_rejects_inconsistent_declarations )
{
   schema_cache cache;
   typedef registry_builder<broken_contract> builder;

   {
      builder b( cache );
      b.then( "Bad Name", &broken_contract::noop );
      BOOST_CHECK_THROW( b.build(), invalid_pathway_name );
   }
   {
      builder b( cache );
      b.then( "twice", &broken_contract::noop ).then( "twice" );
      BOOST_CHECK_THROW( b.build(), duplicate_pathway_name );
   }
   {
      builder b( cache );
      b.declare_guard( "signer", &broken_contract::signer ).declare_guard( "signer" );
      BOOST_CHECK_THROW( b.build(), duplicate_pathway_name );
   }
   {
      builder b( cache );
      b.declare_guard( "signer", &broken_contract::signer ).finish( "signer" ).finish( "signer" );
      BOOST_CHECK_THROW( b.build(), duplicate_pathway_name );
   }
   {
      builder b( cache );
      b.then( "spend", { "nobody" }, {}, &broken_contract::noop );
      BOOST_CHECK_THROW( b.build(), unknown_guard );
   }
   {
      builder b( cache );
      b.then( "spend", {}, { "nothing" }, &broken_contract::noop );
      BOOST_CHECK_THROW( b.build(), unknown_compile_gate );
   }
   {
      builder b( cache );
      b.finish( "nobody" );
      BOOST_CHECK_THROW( b.build(), unknown_guard );
   }
   {
      builder b( cache );
      b.then( "spend", builder::then_body_type() );
      BOOST_CHECK_THROW( b.build(), missing_pathway_body );
   }
   {
      builder b( cache );
      b.declare_guard( "signer", builder::guard_body_type() );
      BOOST_CHECK_THROW( b.build(), missing_pathway_body );
   }
   {
      builder b( cache );
      b.declare_compile_gate( "always", builder::compile_gate_body_type() );
      BOOST_CHECK_THROW( b.build(), missing_pathway_body );
   }
   {
      builder b( cache );
      b.updatable<uint64_t>( "bump", {}, {}, &broken_contract::to_number, nullptr );
      BOOST_CHECK_THROW( b.build(), missing_pathway_body );
   }
   {
      builder b( cache );
      b.updatable<uint64_t>( "bump", {}, {}, nullptr, &broken_contract::with_arg );
      BOOST_CHECK_THROW( b.build(), missing_coercion );
   }
   {
      builder b( cache );
      b.declare_guard( "signer", &broken_contract::signer )
       .declare_compile_gate( "always", &broken_contract::always )
       .then( "spend", { "signer" }, { "always" }, &broken_contract::noop )
       .finish( "signer" )
       .updatable<uint64_t>( "bump", { "signer" }, { "always" }, &broken_contract::to_number, &broken_contract::with_arg, web_exposed );
      const auto registry = b.build();
      BOOST_CHECK_EQUAL( registry.get_updatable( "bump" )->schema()->definition["format"].as_string(), "uint64" );
      BOOST_CHECK_EQUAL( registry.get_then( "spend" ).guards.size(), 1u );
   }
}

BOOST_AUTO_TEST_CASE( contract_registry_is_built_once )
{
   const pathway_registry<escrow_contract>& first  = pathways_of<escrow_contract>();
   const pathway_registry<escrow_contract>& second = pathways_of<escrow_contract>();
   BOOST_CHECK( &first == &second );
   BOOST_CHECK_EQUAL( first.then_fns().size(), 3u );

   const auto update = first.get_updatable( "update_terms" );
   BOOST_CHECK( update->schema().get() == get_schema_for<terms_update>().get() );

   BOOST_CHECK_EQUAL( pathways_of<vault_contract>().present_then_fns().size(), 1u );
}
