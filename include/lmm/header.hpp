// Block header grammar: "@name arg ... [k=v, ...] +++"
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lmm
{

    struct block_header
    {
        std::string name;
        std::vector<std::string> args;
        std::vector<std::pair<std::string, std::string>> params;
        size_t plus_count = 0;
        bool missing_space = false; // name ran straight into '{'
    };

    // Parse the folded header text, from '@' up to (not including) the opening
    // '{'. Returns nullopt when no name characters follow the '@'.
    std::optional<block_header> parse_block_header(std::string_view header);

} // namespace lmm
