#pragma once

#include <fc/exception/exception.hpp>

namespace covenant { namespace contract {

FC_DECLARE_EXCEPTION(         contract_exception,                                                   40000, "Contract Exception" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_pathway_name,         covenant::contract::contract_exception, 40001, "invalid pathway name" );
FC_DECLARE_DERIVED_EXCEPTION( duplicate_pathway_name,       covenant::contract::contract_exception, 40002, "duplicate pathway name" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_guard,                covenant::contract::contract_exception, 40003, "unknown guard" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_compile_gate,         covenant::contract::contract_exception, 40004, "unknown compile gate" );
FC_DECLARE_DERIVED_EXCEPTION( missing_pathway_body,         covenant::contract::contract_exception, 40005, "missing pathway body" );
FC_DECLARE_DERIVED_EXCEPTION( missing_coercion,             covenant::contract::contract_exception, 40006, "missing argument coercion" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_clause,               covenant::contract::contract_exception, 40007, "invalid clause" );
FC_DECLARE_DERIVED_EXCEPTION( context_too_deep,             covenant::contract::contract_exception, 40008, "context too deep" );
FC_DECLARE_DERIVED_EXCEPTION( amount_overflow,              covenant::contract::contract_exception, 40009, "amount overflow" );

FC_DECLARE_EXCEPTION(         pathway_error,                                                        41000, "Pathway Error" );
FC_DECLARE_DERIVED_EXCEPTION( coercion_failure,             covenant::contract::pathway_error,      41001, "argument coercion failed" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_pathway,              covenant::contract::pathway_error,      41002, "unknown pathway" );
FC_DECLARE_DERIVED_EXCEPTION( compile_gate_failure,         covenant::contract::pathway_error,      41003, "compile gate failure" );

} } // covenant::contract
