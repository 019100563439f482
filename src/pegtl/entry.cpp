#include "lmm/header.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions/header.hpp"
#include <tao/pegtl.hpp>

namespace lmm {
using namespace lmm::pegtl_front;

std::optional<block_header> parse_block_header(std::string_view header){
    tao::pegtl::memory_input in(header.data(), header.size(), "block-header");
    header_state st;
    // Only the '@' and the name can fail; everything after them is optional.
    if(!tao::pegtl::parse< grammar::header_rule, actions::action >(in, st))
        return std::nullopt;
    return std::move(st.header);
}

} // namespace lmm
