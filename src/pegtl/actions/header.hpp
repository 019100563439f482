#pragma once
#include "../prelude.hpp"
#include "../grammar.hpp"
#include <tao/pegtl.hpp>

namespace lmm::pegtl_front::actions {
using namespace tao::pegtl;
using lmm::pegtl_front::header_state;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::block_name > {
    template<typename Input>
    static void apply(const Input& in, header_state& st){ st.header.name = in.string(); }
};

template<> struct action< grammar::name_at_end > {
    static void apply0(header_state& st){ st.header.missing_space = true; }
};

template<> struct action< grammar::arg > {
    template<typename Input>
    static void apply(const Input& in, header_state& st){ st.header.args.push_back(in.string()); }
};

template<> struct action< grammar::param_token > {
    template<typename Input>
    static void apply(const Input& in, header_state& st){ st.pending = in.string(); st.has_pending = true; }
};

template<> struct action< grammar::param_sep > {
    static void apply0(header_state& st){ commit_pending(st); }
};

template<> struct action< grammar::param_close > {
    static void apply0(header_state& st){ commit_pending(st); }
};

template<> struct action< grammar::plus_mark > {
    static void apply0(header_state& st){ ++st.header.plus_count; }
};

} // namespace lmm::pegtl_front::actions
