#pragma once

#include <fc/optional.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace covenant { namespace contract {

    typedef int64_t                     share_type;

    using std::string;
    using std::function;
    using std::map;
    using std::set;
    using std::vector;
    using std::pair;
    using std::shared_ptr;
    using fc::variant;
    using fc::variant_object;
    using fc::mutable_variant_object;
    using fc::optional;

    typedef vector<string>              name_list;

    /** pathway names are [a-z][a-z0-9_]* and at most COVENANT_MAX_PATHWAY_NAME_LENGTH long */
    bool is_valid_pathway_name( const string& name );

} } // covenant::contract
