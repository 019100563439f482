#pragma once
#include "lmm/header.hpp"
#include "lmm/text.hpp"
#include <string>
#include <string_view>
#include <utility>

namespace lmm::pegtl_front {

// State threaded through the header grammar actions.
struct header_state {
    block_header header;
    std::string pending;      // last bracket token, committed on ',' or ']'
    bool has_pending{false};
};

// "k=v" splits on the first '='; a bare token becomes (token, "").
inline std::pair<std::string,std::string> split_param(std::string_view token){
    token = detail::trim(token);
    auto eq = token.find('=');
    if(eq == std::string_view::npos) return { std::string(token), std::string() };
    return { std::string(detail::trim(token.substr(0, eq))), std::string(detail::trim(token.substr(eq + 1))) };
}

inline void commit_pending(header_state& st){
    if(st.has_pending && !detail::trim(st.pending).empty())
        st.header.params.push_back(split_param(st.pending));
    st.pending.clear();
    st.has_pending = false;
}

} // namespace lmm::pegtl_front
